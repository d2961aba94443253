#include <docgate/docs/url.hpp>
#include <gtest/gtest.h>

using namespace docgate;

TEST(UrlTest, ParsesComponents) {
    Url u;
    ASSERT_TRUE(parse_url("HTTPS://User:pw@Docs.Example.COM:8443/a/b.md?x=1#frag", u));
    EXPECT_EQ("https", u.scheme);
    EXPECT_EQ("docs.example.com", u.host);
    EXPECT_EQ("8443", u.port);
    EXPECT_EQ("/a/b.md", u.path);
    EXPECT_EQ("x=1", u.query);
    EXPECT_EQ("frag", u.fragment);
    EXPECT_EQ("https://docs.example.com:8443", u.origin());
}

TEST(UrlTest, DefaultsPathToSlash) {
    Url u;
    ASSERT_TRUE(parse_url("http://docs.example", u));
    EXPECT_EQ("/", u.path);
    EXPECT_EQ("http://docs.example/", u.str());
}

TEST(UrlTest, HostIsTakenAfterLastAt) {
    Url u;
    ASSERT_TRUE(parse_url("https://allowed.example@evil.example/page", u));
    EXPECT_EQ("evil.example", u.host);
}

TEST(UrlTest, HandlesIpv6Literals) {
    Url u;
    ASSERT_TRUE(parse_url("http://[::1]:8080/x", u));
    EXPECT_EQ("::1", u.host);
    EXPECT_EQ("8080", u.port);
    EXPECT_EQ("http://[::1]:8080", u.origin());
}

TEST(UrlTest, RejectsInvalidInput) {
    Url u;
    EXPECT_FALSE(parse_url("ftp://docs.example/file", u));
    EXPECT_FALSE(parse_url("https:///path-only", u));
    EXPECT_FALSE(parse_url("https://bad host/", u));
    EXPECT_FALSE(parse_url("https://host\\evil.example/", u));
    EXPECT_FALSE(parse_url("https://host:80a/", u));
    EXPECT_FALSE(parse_url("docs.example/page", u));
}

TEST(UrlTest, NormalizeHostStripsPortCaseAndTrailingDot) {
    EXPECT_EQ("docs.example", normalize_host("Docs.Example."));
    EXPECT_EQ("docs.example", normalize_host("docs.example:443"));
    EXPECT_EQ("::1", normalize_host("[::1]"));
}

TEST(UrlTest, IsHttpUrl) {
    EXPECT_TRUE(is_http_url("http://a"));
    EXPECT_TRUE(is_http_url("HTTPS://a"));
    EXPECT_FALSE(is_http_url("file:///etc/passwd"));
    EXPECT_FALSE(is_http_url("/local/llms.txt"));
}

TEST(UrlTest, ResolvesRelativeReferences) {
    const std::string base = "https://docs.example/guide/llms.txt";
    EXPECT_EQ("https://docs.example/guide/intro.md", resolve_url(base, "intro.md"));
    EXPECT_EQ("https://docs.example/guide/sub/page.md", resolve_url(base, "./sub/page.md"));
    EXPECT_EQ("https://docs.example/api/ref.md", resolve_url(base, "../api/ref.md"));
    EXPECT_EQ("https://docs.example/root.md", resolve_url(base, "/root.md"));
    EXPECT_EQ("https://cdn.example/x.md", resolve_url(base, "//cdn.example/x.md"));
    EXPECT_EQ("https://other.example/y", resolve_url(base, "https://other.example/y"));
    EXPECT_EQ("https://docs.example/guide/llms.txt?v=2", resolve_url(base, "?v=2"));
    EXPECT_EQ("https://docs.example/guide/llms.txt#top", resolve_url(base, "#top"));
}

TEST(UrlTest, DotSegmentsCannotEscapeRoot) {
    EXPECT_EQ("https://docs.example/etc/passwd",
              resolve_url("https://docs.example/a/", "../../../etc/passwd"));
}

TEST(UrlTest, ResolveWithUnparseableBaseIsEmpty) {
    EXPECT_EQ("", resolve_url("/local/llms.txt", "page.md"));
}
