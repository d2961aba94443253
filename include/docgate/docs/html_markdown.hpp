#ifndef DOCGATE_DOCS_HTML_MARKDOWN_HPP
#define DOCGATE_DOCS_HTML_MARKDOWN_HPP

#include <string>

namespace docgate {

// Converts an HTML document to markdown. Pure function: no I/O, no state.
//
// Handled: headings, paragraphs, line breaks, links, images, emphasis,
// inline code, pre blocks, ordered/unordered lists (nested), blockquotes,
// horizontal rules and simple tables. <script>, <style>, <head>, <noscript>,
// <svg> and comments are dropped. Unknown tags keep their text.
// Relative link and image targets are resolved when `base_url` is an
// absolute http(s) URL and left untouched otherwise.
std::string html_to_markdown(const std::string& html, const std::string& base_url = "");

// Decodes named (common subset) and numeric character references
std::string decode_html_entities(const std::string& text);

// True when the content type names HTML, or when there is no usable
// content type and the body starts like an HTML document.
bool looks_like_html(const std::string& content_type, const std::string& body);

} // namespace docgate

#endif // DOCGATE_DOCS_HTML_MARKDOWN_HPP
