#include <docgate/docs/html_markdown.hpp>
#include <gtest/gtest.h>

using namespace docgate;

TEST(HtmlMarkdownTest, HeadingsParagraphsAndLinks) {
    std::string md = html_to_markdown(
        "<h1>Title</h1><p>Hello <a href=\"/x\">world</a></p>",
        "https://docs.example/docs/page.html");
    EXPECT_EQ("# Title\n\nHello [world](https://docs.example/x)", md);
}

TEST(HtmlMarkdownTest, RelativeLinksStayWithoutBase) {
    std::string md = html_to_markdown("<p><a href=\"page.html\">Next</a></p>");
    EXPECT_EQ("[Next](page.html)", md);
}

TEST(HtmlMarkdownTest, DropsScriptsStylesAndComments) {
    std::string md = html_to_markdown(
        "<html><head><title>T</title><style>p{}</style></head>"
        "<body><script>alert('x')</script><!-- hidden --><p>Visible</p>"
        "<noscript>no</noscript></body></html>");
    EXPECT_EQ("Visible", md);
}

TEST(HtmlMarkdownTest, EmphasisAndInlineCode) {
    std::string md = html_to_markdown("<p><strong>bold</strong> <em>it</em> <code>x()</code></p>");
    EXPECT_EQ("**bold** *it* `x()`", md);
}

TEST(HtmlMarkdownTest, PreBlocksKeepWhitespace) {
    std::string md = html_to_markdown("<p>Run:</p><pre><code>make\n  install</code></pre>");
    EXPECT_EQ("Run:\n\n```\nmake\n  install\n```", md);
}

TEST(HtmlMarkdownTest, NestedLists) {
    std::string md = html_to_markdown(
        "<ul><li>One</li><li>Two<ol><li>A</li><li>B</li></ol></li></ul>");
    EXPECT_EQ("- One\n- Two\n  1. A\n  2. B", md);
}

TEST(HtmlMarkdownTest, Blockquote) {
    std::string md = html_to_markdown("<blockquote><p>Quoted</p><p>Twice</p></blockquote>");
    EXPECT_EQ("> Quoted\n>\n> Twice", md);
}

TEST(HtmlMarkdownTest, TableWithHeader) {
    std::string md = html_to_markdown(
        "<table><tr><th>Name</th><th>Type</th></tr><tr><td>url</td><td>string</td></tr></table>");
    EXPECT_EQ("| Name | Type |\n| --- | --- |\n| url | string |", md);
}

TEST(HtmlMarkdownTest, ImagesAndBreaks) {
    std::string md = html_to_markdown("<p>a<br/>b<img src=\"i.png\" alt=\"pic\"></p>",
                                      "https://docs.example/d/");
    EXPECT_EQ("a\nb![pic](https://docs.example/d/i.png)", md);
}

TEST(HtmlMarkdownTest, CollapsesWhitespace) {
    std::string md = html_to_markdown("<p>  lots   of\n\n spaces </p>");
    EXPECT_EQ("lots of spaces", md);
}

TEST(HtmlMarkdownTest, StrayAngleBracketIsText) {
    EXPECT_EQ("a < b", html_to_markdown("<p>a < b</p>"));
}

TEST(HtmlMarkdownTest, DecodesEntities) {
    EXPECT_EQ("a & b <c> \"d\" \xC2\xA9 \xE2\x82\xAC A",
              decode_html_entities("a &amp; b &lt;c&gt; &quot;d&quot; &copy; &#8364; &#x41;"));
    EXPECT_EQ("&unknown; & alone", decode_html_entities("&unknown; & alone"));
}

TEST(HtmlMarkdownTest, LooksLikeHtml) {
    EXPECT_TRUE(looks_like_html("text/html; charset=utf-8", ""));
    EXPECT_TRUE(looks_like_html("application/xhtml+xml", ""));
    EXPECT_FALSE(looks_like_html("text/markdown", "<html>"));
    EXPECT_TRUE(looks_like_html("", "  <!DOCTYPE html><html></html>"));
    EXPECT_TRUE(looks_like_html("application/octet-stream", "<html><body></body></html>"));
    EXPECT_FALSE(looks_like_html("", "# Markdown"));
}

TEST(HtmlMarkdownTest, LineBreakInsideCellAnchor) {
    EXPECT_EQ("[https://docs.example/y](https://docs.example/y)",
              html_to_markdown("<td><td><a href=\"/y\"><br></a>", "https://docs.example/page.html"));
}

TEST(HtmlMarkdownTest, MismatchedBlocksInsideAnchor) {
    std::string md;
    ASSERT_NO_THROW(md = html_to_markdown("<p>x</p><td><a href=\"/y\"></ul></a>",
                                          "https://docs.example/page.html"));
    EXPECT_NE(std::string::npos, md.find("(https://docs.example/y)"));

    ASSERT_NO_THROW(md = html_to_markdown("<p>x</p><th><a href=\"/y\"><blockquote></a>",
                                          "https://docs.example/page.html"));
    EXPECT_NE(std::string::npos, md.find("https://docs.example/y"));

    ASSERT_NO_THROW(md = html_to_markdown("<blockquote><a href=\"/z\">in <br></blockquote> out</a>"));
    EXPECT_NE(std::string::npos, md.find("out"));
}
