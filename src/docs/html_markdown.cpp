#include <docgate/docs/html_markdown.hpp>
#include <docgate/docs/url.hpp>
#include <docgate/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <vector>

namespace docgate {

namespace {

struct Tag {
    std::string name;       // lower-case
    bool closing;
    bool self_closing;
    std::map<std::string, std::string> attrs;

    Tag() : closing(false), self_closing(false) {}

    std::string attr(const std::string& key) const {
        std::map<std::string, std::string>::const_iterator it = attrs.find(key);
        return it != attrs.end() ? it->second : std::string();
    }
};

void append_utf8(std::string& out, unsigned long cp) {
    if (cp == 0 || cp > 0x10FFFF) cp = 0xFFFD;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::map<std::string, const char*> build_entity_table() {
    std::map<std::string, const char*> table;
    table["amp"] = "&";
    table["lt"] = "<";
    table["gt"] = ">";
    table["quot"] = "\"";
    table["apos"] = "'";
    table["nbsp"] = " ";
    table["ndash"] = "\xE2\x80\x93";
    table["mdash"] = "\xE2\x80\x94";
    table["hellip"] = "\xE2\x80\xA6";
    table["lsquo"] = "\xE2\x80\x98";
    table["rsquo"] = "\xE2\x80\x99";
    table["ldquo"] = "\xE2\x80\x9C";
    table["rdquo"] = "\xE2\x80\x9D";
    table["copy"] = "\xC2\xA9";
    table["reg"] = "\xC2\xAE";
    table["trade"] = "\xE2\x84\xA2";
    table["rarr"] = "\xE2\x86\x92";
    table["larr"] = "\xE2\x86\x90";
    table["times"] = "\xC3\x97";
    return table;
}

const char* named_entity(const std::string& name) {
    static const std::map<std::string, const char*> table = build_entity_table();
    std::map<std::string, const char*>::const_iterator it = table.find(name);
    return it != table.end() ? it->second : NULL;
}

bool is_raw_text_element(const std::string& name) {
    return name == "script" || name == "style" || name == "head" ||
           name == "noscript" || name == "svg" || name == "template" ||
           name == "iframe";
}

bool is_block_element(const std::string& name) {
    static const char* const blocks[] = {
        "p", "div", "section", "article", "main", "header", "footer", "nav",
        "aside", "figure", "figcaption", "dl", "dt", "dd", "form", "fieldset",
        "address", "details", "summary", "body", "html", NULL
    };
    for (size_t i = 0; blocks[i]; ++i) {
        if (name == blocks[i]) return true;
    }
    return false;
}

int heading_level(const std::string& name) {
    if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6') {
        return name[1] - '0';
    }
    return 0;
}

// Parses the tag starting at html[lt] == '<'. `end` receives the index just
// past the closing '>'.
bool parse_tag(const std::string& html, size_t lt, size_t& end, Tag& tag) {
    size_t i = lt + 1;
    if (i < html.size() && html[i] == '/') {
        tag.closing = true;
        ++i;
    }
    if (i >= html.size() || !std::isalpha(static_cast<unsigned char>(html[i]))) {
        return false;
    }

    size_t name_start = i;
    while (i < html.size() && (std::isalnum(static_cast<unsigned char>(html[i])) ||
                               html[i] == '-' || html[i] == ':')) {
        ++i;
    }
    tag.name = to_lower(html.substr(name_start, i - name_start));

    while (i < html.size()) {
        while (i < html.size() && std::isspace(static_cast<unsigned char>(html[i]))) ++i;
        if (i >= html.size()) break;
        if (html[i] == '>') {
            end = i + 1;
            return true;
        }
        if (html[i] == '/') {
            tag.self_closing = true;
            ++i;
            continue;
        }

        size_t key_start = i;
        while (i < html.size() && !std::isspace(static_cast<unsigned char>(html[i])) &&
               html[i] != '=' && html[i] != '>' && html[i] != '/') {
            ++i;
        }
        std::string key = to_lower(html.substr(key_start, i - key_start));
        while (i < html.size() && std::isspace(static_cast<unsigned char>(html[i]))) ++i;

        std::string value;
        if (i < html.size() && html[i] == '=') {
            ++i;
            while (i < html.size() && std::isspace(static_cast<unsigned char>(html[i]))) ++i;
            if (i < html.size() && (html[i] == '"' || html[i] == '\'')) {
                char quote = html[i++];
                size_t close = html.find(quote, i);
                if (close == std::string::npos) return false;
                value = html.substr(i, close - i);
                i = close + 1;
            } else {
                size_t v_start = i;
                while (i < html.size() && !std::isspace(static_cast<unsigned char>(html[i])) &&
                       html[i] != '>') {
                    ++i;
                }
                value = html.substr(v_start, i - v_start);
            }
        }
        if (!key.empty()) {
            tag.attrs[key] = decode_html_entities(value);
        }
    }
    return false;
}

struct ListState {
    bool ordered;
    int counter;
    ListState(bool o) : ordered(o), counter(0) {}
};

struct AnchorState {
    std::string href;
    size_t start;
    AnchorState(const std::string& h, size_t s) : href(h), start(s) {}
};

struct TableState {
    int rows;
    int header_cells;
    bool row_has_header;
    TableState() : rows(0), header_cells(0), row_has_header(false) {}
};

class MarkdownWriter {
public:
    explicit MarkdownWriter(const std::string& base_url)
        : base_url_(is_http_url(base_url) ? base_url : std::string())
        , pre_depth_(0) {}

    void text(const std::string& raw) {
        std::string decoded = decode_html_entities(raw);
        if (pre_depth_ > 0) {
            out_ += decoded;
            return;
        }
        for (size_t i = 0; i < decoded.size(); ++i) {
            char c = decoded[i];
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (!out_.empty() && !ends_in_space()) out_ += ' ';
            } else {
                out_ += c;
            }
        }
    }

    void open(const Tag& tag) {
        const std::string& n = tag.name;
        int level = heading_level(n);

        if (level > 0) {
            block_break();
            out_ += std::string(static_cast<size_t>(level), '#') + " ";
        } else if (n == "br") {
            trim_trailing_spaces();
            out_ += "\n";
        } else if (n == "hr") {
            block_break();
            out_ += "---";
            block_break();
        } else if (n == "a") {
            anchors_.push_back(AnchorState(tag.attr("href"), out_.size()));
        } else if (n == "img") {
            std::string src = resolve(tag.attr("src"));
            if (!src.empty()) {
                out_ += "![" + tag.attr("alt") + "](" + src + ")";
            }
        } else if (n == "strong" || n == "b") {
            out_ += "**";
        } else if (n == "em" || n == "i") {
            out_ += "*";
        } else if (n == "code" || n == "kbd" || n == "tt") {
            if (pre_depth_ == 0) out_ += "`";
        } else if (n == "pre") {
            block_break();
            out_ += "```\n";
            ++pre_depth_;
        } else if (n == "blockquote") {
            block_break();
            quotes_.push_back(out_.size());
        } else if (n == "ul" || n == "ol") {
            if (lists_.empty()) block_break(); else line_break();
            lists_.push_back(ListState(n == "ol"));
        } else if (n == "li") {
            line_break();
            if (lists_.empty()) lists_.push_back(ListState(false));
            ListState& list = lists_.back();
            out_ += std::string((lists_.size() - 1) * 2, ' ');
            if (list.ordered) {
                out_ += std::to_string(++list.counter) + ". ";
            } else {
                out_ += "- ";
            }
        } else if (n == "table") {
            block_break();
            tables_.push_back(TableState());
        } else if (n == "tr") {
            line_break();
            out_ += "|";
            if (!tables_.empty()) {
                tables_.back().row_has_header = false;
                tables_.back().header_cells = 0;
            }
        } else if (n == "td" || n == "th") {
            out_ += " ";
            if (n == "th" && !tables_.empty()) {
                tables_.back().row_has_header = true;
                ++tables_.back().header_cells;
            }
        } else if (is_block_element(n)) {
            block_break();
        }
    }

    void close(const Tag& tag) {
        const std::string& n = tag.name;

        if (heading_level(n) > 0) {
            block_break();
        } else if (n == "a") {
            close_anchor();
        } else if (n == "strong" || n == "b") {
            out_ += "**";
        } else if (n == "em" || n == "i") {
            out_ += "*";
        } else if (n == "code" || n == "kbd" || n == "tt") {
            if (pre_depth_ == 0) out_ += "`";
        } else if (n == "pre") {
            if (pre_depth_ > 0) {
                if (!out_.empty() && out_[out_.size() - 1] != '\n') out_ += "\n";
                out_ += "```";
                --pre_depth_;
                block_break();
            }
        } else if (n == "blockquote") {
            close_quote();
        } else if (n == "ul" || n == "ol") {
            if (!lists_.empty()) lists_.pop_back();
            if (lists_.empty()) block_break(); else line_break();
        } else if (n == "td" || n == "th") {
            trim_trailing_spaces();
            out_ += " |";
        } else if (n == "tr") {
            if (!tables_.empty()) {
                TableState& t = tables_.back();
                if (t.rows == 0 && t.row_has_header) {
                    out_ += "\n|";
                    for (int c = 0; c < t.header_cells; ++c) out_ += " --- |";
                }
                ++t.rows;
            }
        } else if (n == "table") {
            if (!tables_.empty()) tables_.pop_back();
            block_break();
        } else if (is_block_element(n)) {
            block_break();
        }
    }

    std::string finish() {
        while (!anchors_.empty()) close_anchor();
        while (!quotes_.empty()) close_quote();
        if (pre_depth_ > 0) {
            out_ += "\n```";
            pre_depth_ = 0;
        }

        // Strip trailing spaces per line and collapse runs of blank lines
        std::vector<std::string> lines = split_lines(out_);
        std::string result;
        int blank_run = 0;
        for (size_t i = 0; i < lines.size(); ++i) {
            std::string line = rtrim(lines[i]);
            if (line.empty()) {
                if (++blank_run > 1) continue;
            } else {
                blank_run = 0;
            }
            result += line + "\n";
        }
        return trim(result);
    }

private:
    std::string out_;
    std::string base_url_;
    int pre_depth_;
    std::vector<ListState> lists_;
    std::vector<AnchorState> anchors_;
    std::vector<size_t> quotes_;
    std::vector<TableState> tables_;

    bool ends_in_space() const {
        char last = out_[out_.size() - 1];
        return last == ' ' || last == '\n';
    }

    // Output before this offset belongs to an enclosing anchor or quote
    // whose start was recorded; trimming must not reach below it.
    size_t open_floor() const {
        size_t floor = 0;
        for (size_t i = 0; i < anchors_.size(); ++i) floor = std::max(floor, anchors_[i].start);
        for (size_t i = 0; i < quotes_.size(); ++i) floor = std::max(floor, quotes_[i]);
        return floor;
    }

    void trim_trailing_spaces() {
        size_t floor = open_floor();
        while (out_.size() > floor && out_[out_.size() - 1] == ' ') out_.erase(out_.size() - 1);
    }

    void line_break() {
        trim_trailing_spaces();
        if (!out_.empty() && out_[out_.size() - 1] != '\n') out_ += "\n";
    }

    void block_break() {
        if (pre_depth_ > 0) return;
        trim_trailing_spaces();
        if (out_.empty()) return;
        if (out_[out_.size() - 1] != '\n') out_ += "\n";
        if (out_.size() < 2 || out_[out_.size() - 2] != '\n') out_ += "\n";
    }

    std::string resolve(const std::string& target) const {
        std::string t = trim(target);
        if (t.empty() || base_url_.empty() || is_http_url(t) || t[0] == '#') return t;
        std::string lower = to_lower(t);
        if (starts_with(lower, "mailto:") || starts_with(lower, "javascript:") ||
            starts_with(lower, "data:")) {
            return t;
        }
        std::string resolved = resolve_url(base_url_, t);
        return resolved.empty() ? t : resolved;
    }

    void close_anchor() {
        if (anchors_.empty()) return;
        AnchorState a = anchors_.back();
        anchors_.pop_back();

        // A closed quote may have rewritten output below this anchor
        size_t start = std::min(a.start, out_.size());
        std::string label = trim(out_.substr(start));
        out_.erase(start);

        std::string href = trim(a.href);
        std::string lower = to_lower(href);
        if (href.empty() || href[0] == '#' || starts_with(lower, "javascript:")) {
            out_ += label;
            return;
        }
        href = resolve(href);
        out_ += "[" + (label.empty() ? href : label) + "](" + href + ")";
    }

    void close_quote() {
        if (quotes_.empty()) return;
        size_t start = std::min(quotes_.back(), out_.size());
        quotes_.pop_back();

        std::string body = trim(out_.substr(start));
        out_.erase(start);

        std::vector<std::string> lines = split_lines(body);
        for (size_t i = 0; i < lines.size(); ++i) {
            out_ += lines[i].empty() ? ">" : "> " + lines[i];
            out_ += "\n";
        }
        block_break();
    }
};

// Index just past "</name ... >", or npos
size_t find_closing_tag(const std::string& html, const std::string& lower_html,
                        const std::string& name, size_t from) {
    size_t pos = lower_html.find("</" + name, from);
    if (pos == std::string::npos) return std::string::npos;
    size_t gt = html.find('>', pos);
    return gt == std::string::npos ? std::string::npos : gt + 1;
}

} // namespace

std::string decode_html_entities(const std::string& text) {
    if (text.find('&') == std::string::npos) return text;

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out += text[i];
            continue;
        }
        size_t semi = text.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 12) {
            out += '&';
            continue;
        }
        std::string entity = text.substr(i + 1, semi - i - 1);
        if (!entity.empty() && entity[0] == '#') {
            bool hex = entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X');
            std::string digits = entity.substr(hex ? 2 : 1);
            char* endp = NULL;
            unsigned long cp = std::strtoul(digits.c_str(), &endp, hex ? 16 : 10);
            if (!digits.empty() && endp && *endp == '\0') {
                append_utf8(out, cp);
                i = semi;
                continue;
            }
        } else {
            const char* decoded = named_entity(entity);
            if (decoded) {
                out += decoded;
                i = semi;
                continue;
            }
        }
        out += '&';
    }
    return out;
}

bool looks_like_html(const std::string& content_type, const std::string& body) {
    std::string ct = to_lower(content_type);
    if (ct.find("html") != std::string::npos) return true;
    if (!ct.empty() && ct.find("octet-stream") == std::string::npos) return false;

    std::string head = to_lower(ltrim(body.substr(0, 512)));
    return starts_with(head, "<!doctype html") || starts_with(head, "<html");
}

std::string html_to_markdown(const std::string& html, const std::string& base_url) {
    MarkdownWriter writer(base_url);
    std::string lower_html = to_lower(html);

    size_t i = 0;
    size_t text_start = 0;
    while (i < html.size()) {
        if (html[i] != '<') {
            ++i;
            continue;
        }

        if (i > text_start) {
            writer.text(html.substr(text_start, i - text_start));
        }

        // Comments, doctype, processing instructions
        if (html.compare(i, 4, "<!--") == 0) {
            size_t end = html.find("-->", i + 4);
            i = end == std::string::npos ? html.size() : end + 3;
            text_start = i;
            continue;
        }
        if (html.compare(i, 2, "<!") == 0 || html.compare(i, 2, "<?") == 0) {
            size_t end = html.find('>', i);
            i = end == std::string::npos ? html.size() : end + 1;
            text_start = i;
            continue;
        }

        Tag tag;
        size_t end = 0;
        if (!parse_tag(html, i, end, tag)) {
            // Stray '<' is text
            writer.text("<");
            ++i;
            text_start = i;
            continue;
        }

        if (!tag.closing && !tag.self_closing && is_raw_text_element(tag.name)) {
            size_t after = find_closing_tag(html, lower_html, tag.name, end);
            i = after == std::string::npos ? html.size() : after;
            text_start = i;
            continue;
        }

        if (tag.closing) {
            writer.close(tag);
        } else {
            writer.open(tag);
            if (tag.self_closing && tag.name != "br" && tag.name != "hr" && tag.name != "img") {
                writer.close(tag);
            }
        }
        i = end;
        text_start = i;
    }

    if (text_start < html.size()) {
        writer.text(html.substr(text_start));
    }

    return writer.finish();
}

} // namespace docgate
