#include <docgate/docs/fetcher.hpp>
#include <gtest/gtest.h>
#include "test_support.hpp"
#include <unistd.h>

using namespace docgate;

namespace {

class FetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        sources_.push_back(DocSource("Docs", "https://docs.example/llms.txt"));
        policy_ = AllowlistPolicy::build(sources_, std::vector<std::string>());
    }

    FetchResult fetch(const std::string& target, const FetchOptions& options = FetchOptions()) {
        ResourceFetcher fetcher(policy_, sources_, transport_, options);
        return fetcher.fetch(target);
    }

    std::vector<DocSource> sources_;
    AllowlistPolicy policy_;
    test::FakeTransport transport_;
};

} // namespace

TEST_F(FetcherTest, FetchesAllowedMarkdown) {
    transport_.respond("https://docs.example/page.md", 200, "# Page\n\nBody", "text/markdown");

    FetchResult r = fetch("https://docs.example/page.md");
    ASSERT_TRUE(r.success) << r.error_text();
    EXPECT_EQ("# Page\n\nBody", r.content);
    EXPECT_FALSE(r.truncated);
    EXPECT_EQ("text/markdown", r.content_type);
    EXPECT_EQ(1u, transport_.call_count());
}

TEST_F(FetcherTest, DisallowedHostFailsWithoutNetworkCall) {
    transport_.respond("https://other.example/page.md", 200, "secret");

    FetchResult r = fetch("https://other.example/page.md");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(FetchError::DOMAIN_NOT_ALLOWED, r.code);
    EXPECT_NE(std::string::npos, r.message.find("other.example"));
    EXPECT_EQ(0u, transport_.call_count());
    EXPECT_EQ(0u, r.error_text().find("DomainNotAllowed: "));
}

TEST_F(FetcherTest, SubdomainIsNotAllowed) {
    FetchResult r = fetch("https://api.docs.example/page.md");
    EXPECT_EQ(FetchError::DOMAIN_NOT_ALLOWED, r.code);
    EXPECT_EQ(0u, transport_.call_count());
}

TEST_F(FetcherTest, UserinfoDoesNotFoolTheAllowlist) {
    FetchResult r = fetch("https://docs.example@evil.example/page.md");
    EXPECT_EQ(FetchError::DOMAIN_NOT_ALLOWED, r.code);
    EXPECT_EQ(0u, transport_.call_count());
}

TEST_F(FetcherTest, WildcardAllowsArbitraryHost) {
    std::vector<std::string> extra;
    extra.push_back("*");
    policy_ = AllowlistPolicy::build(sources_, extra);
    transport_.respond("https://anywhere.example/x.txt", 200, "ok");

    FetchResult r = fetch("https://anywhere.example/x.txt");
    ASSERT_TRUE(r.success) << r.error_text();
    EXPECT_EQ("ok", r.content);
}

TEST_F(FetcherTest, HtmlIsConvertedToMarkdown) {
    transport_.respond("https://docs.example/page.html", 200,
                       "<html><body><h2>Setup</h2><p>See <a href=\"next.html\">next</a></p></body></html>",
                       "text/html; charset=utf-8");

    FetchResult r = fetch("https://docs.example/page.html");
    ASSERT_TRUE(r.success) << r.error_text();
    EXPECT_EQ("## Setup\n\nSee [next](https://docs.example/next.html)", r.content);
    EXPECT_EQ("text/markdown", r.content_type);
}

TEST_F(FetcherTest, MalformedHtmlStillConverts) {
    transport_.respond("https://docs.example/page.html", 200,
                       "<td><td><a href=\"/y\"><br></a>", "text/html");

    FetchResult r;
    ASSERT_NO_THROW(r = fetch("https://docs.example/page.html"));
    ASSERT_TRUE(r.success) << r.error_text();
    EXPECT_EQ("[https://docs.example/y](https://docs.example/y)", r.content);
}

TEST_F(FetcherTest, OversizeContentIsTruncated) {
    transport_.respond("https://docs.example/big.md", 200, std::string(500, 'x'));

    FetchOptions options;
    options.max_content_length = 100;
    FetchResult r = fetch("https://docs.example/big.md", options);

    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.truncated);
    EXPECT_LE(r.content.size(), 100u);
    EXPECT_EQ(500u, r.original_length);
}

TEST_F(FetcherTest, TruncationRespectsUtf8Boundaries) {
    // Each "é" is two bytes; a cut at an odd offset must back up
    std::string body;
    for (int i = 0; i < 50; ++i) body += "\xC3\xA9";
    transport_.respond("https://docs.example/utf8.md", 200, body);

    FetchOptions options;
    options.max_content_length = 11;
    FetchResult r = fetch("https://docs.example/utf8.md", options);

    ASSERT_TRUE(r.truncated);
    EXPECT_EQ(10u, r.content.size());
}

TEST_F(FetcherTest, FailPolicyReturnsTooLarge) {
    transport_.respond("https://docs.example/big.md", 200, std::string(500, 'x'));

    FetchOptions options;
    options.max_content_length = 100;
    options.overflow = OverflowPolicy::FAIL;
    FetchResult r = fetch("https://docs.example/big.md", options);

    EXPECT_FALSE(r.success);
    EXPECT_EQ(FetchError::TOO_LARGE, r.code);
}

TEST_F(FetcherTest, ZeroMaxContentLengthMeansUnlimited) {
    transport_.respond("https://docs.example/big.md", 200, std::string(500, 'x'));

    FetchOptions options;
    options.max_content_length = 0;
    FetchResult r = fetch("https://docs.example/big.md", options);
    ASSERT_TRUE(r.success);
    EXPECT_FALSE(r.truncated);
    EXPECT_EQ(500u, r.content.size());
}

TEST_F(FetcherTest, MissingPageIsNotFound) {
    FetchResult r = fetch("https://docs.example/missing.md");
    EXPECT_EQ(FetchError::NOT_FOUND, r.code);

    transport_.respond("https://docs.example/gone.md", 410, "");
    EXPECT_EQ(FetchError::NOT_FOUND, fetch("https://docs.example/gone.md").code);
}

TEST_F(FetcherTest, ServerErrorIsUpstreamError) {
    transport_.respond("https://docs.example/down.md", 503, "unavailable");
    FetchResult r = fetch("https://docs.example/down.md");
    EXPECT_EQ(FetchError::UPSTREAM_ERROR, r.code);
    EXPECT_NE(std::string::npos, r.message.find("503"));
}

TEST_F(FetcherTest, TimeoutIsUpstreamError) {
    HttpResponse timeout;
    timeout.error = "Timeout was reached";
    timeout.timed_out = true;
    transport_.respond_raw("https://docs.example/slow.md", timeout);

    FetchOptions options;
    options.timeout_ms = 1500;
    FetchResult r = fetch("https://docs.example/slow.md", options);
    EXPECT_EQ(FetchError::UPSTREAM_ERROR, r.code);
    EXPECT_NE(std::string::npos, r.message.find("timed out"));
    EXPECT_EQ(1500, transport_.last_options().timeout_ms);
}

TEST_F(FetcherTest, DownloadCeilingIsTooLarge) {
    HttpResponse huge;
    huge.error = "response exceeds 1024 bytes";
    huge.too_large = true;
    transport_.respond_raw("https://docs.example/huge.md", huge);

    FetchOptions options;
    options.max_download_bytes = 1024;
    FetchResult r = fetch("https://docs.example/huge.md", options);
    EXPECT_EQ(FetchError::TOO_LARGE, r.code);
    EXPECT_EQ(1024u, transport_.last_options().max_body_bytes);
}

TEST_F(FetcherTest, RedirectsAreNotFollowedByDefault) {
    transport_.redirect("https://docs.example/old.md", 301, "/new.md");
    transport_.respond("https://docs.example/new.md", 200, "new");

    FetchResult r = fetch("https://docs.example/old.md");
    EXPECT_EQ(FetchError::UPSTREAM_ERROR, r.code);
    EXPECT_EQ(1u, transport_.call_count());
}

TEST_F(FetcherTest, FollowedRedirectIsChecked) {
    transport_.redirect("https://docs.example/old.md", 302, "/new.md");
    transport_.respond("https://docs.example/new.md", 200, "new");
    transport_.redirect("https://docs.example/escape.md", 302, "https://evil.example/x.md");

    FetchOptions options;
    options.follow_redirects = true;

    FetchResult ok = fetch("https://docs.example/old.md", options);
    ASSERT_TRUE(ok.success) << ok.error_text();
    EXPECT_EQ("new", ok.content);
    EXPECT_EQ("https://docs.example/new.md", ok.location);

    FetchResult blocked = fetch("https://docs.example/escape.md", options);
    EXPECT_EQ(FetchError::DOMAIN_NOT_ALLOWED, blocked.code);

    std::vector<std::string> calls = transport_.calls();
    for (size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(std::string::npos, calls[i].find("evil.example"));
    }
}

TEST_F(FetcherTest, RedirectLoopStops) {
    transport_.redirect("https://docs.example/a", 302, "/b");
    transport_.redirect("https://docs.example/b", 302, "/a");

    FetchOptions options;
    options.follow_redirects = true;
    options.max_redirects = 3;
    FetchResult r = fetch("https://docs.example/a", options);
    EXPECT_EQ(FetchError::UPSTREAM_ERROR, r.code);
    EXPECT_EQ(4u, transport_.call_count());
}

TEST_F(FetcherTest, CancelledBeforeRequest) {
    ResourceFetcher fetcher(policy_, sources_, transport_, FetchOptions());
    std::atomic<bool> cancelled(true);
    FetchResult r = fetcher.fetch("https://docs.example/page.md", &cancelled);
    EXPECT_EQ(FetchError::UPSTREAM_ERROR, r.code);
    EXPECT_EQ(0u, transport_.call_count());
}

TEST_F(FetcherTest, UnsupportedSchemeIsRejected) {
    FetchResult r = fetch("ftp://docs.example/file.md");
    EXPECT_EQ(FetchError::DOMAIN_NOT_ALLOWED, r.code);
    EXPECT_EQ(0u, transport_.call_count());
}

// ---------------------------------------------------------------------------
// Local files
// ---------------------------------------------------------------------------

class LocalFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        docs_ = dir_.mkdir("docs");
        index_ = dir_.write("docs/llms.txt", "- [Guide](guide.md)\n");
        dir_.write("docs/guide.md", "# Guide\n");
        dir_.write("docs/page.html", "<h1>Html</h1><p>text</p>");
        dir_.write("outside.md", "secret");
        sources_.push_back(DocSource("Local", index_));
    }

    FetchResult fetch(const std::string& target, const FetchOptions& options = FetchOptions()) {
        ResourceFetcher fetcher(policy_, sources_, transport_, options);
        return fetcher.fetch(target);
    }

    test::TempDir dir_;
    std::string docs_;
    std::string index_;
    std::vector<DocSource> sources_;
    AllowlistPolicy policy_;
    test::FakeTransport transport_;
};

TEST_F(LocalFetcherTest, ReadsFileInsideIndexDirectory) {
    FetchResult r = fetch(docs_ + "/guide.md");
    ASSERT_TRUE(r.success) << r.error_text();
    EXPECT_EQ("# Guide\n", r.content);
    EXPECT_EQ(0u, transport_.call_count());
}

TEST_F(LocalFetcherTest, AcceptsFileScheme) {
    FetchResult r = fetch("file://" + docs_ + "/guide.md");
    ASSERT_TRUE(r.success) << r.error_text();
}

TEST_F(LocalFetcherTest, HtmlFileIsConverted) {
    FetchResult r = fetch(docs_ + "/page.html");
    ASSERT_TRUE(r.success) << r.error_text();
    EXPECT_EQ("# Html\n\ntext", r.content);
}

TEST_F(LocalFetcherTest, PathOutsideRootsIsRejected) {
    FetchResult r = fetch(dir_.file("outside.md"));
    EXPECT_EQ(FetchError::PATH_NOT_ALLOWED, r.code);

    FetchResult traversal = fetch(docs_ + "/../outside.md");
    EXPECT_EQ(FetchError::PATH_NOT_ALLOWED, traversal.code);

    EXPECT_EQ(FetchError::PATH_NOT_ALLOWED, fetch("/etc/passwd").code);
}

TEST_F(LocalFetcherTest, SymlinkEscapingRootIsRejected) {
    std::string link = docs_ + "/link.md";
    ASSERT_EQ(0, symlink(dir_.file("outside.md").c_str(), link.c_str()));

    FetchResult r = fetch(link);
    EXPECT_EQ(FetchError::PATH_NOT_ALLOWED, r.code);
}

TEST_F(LocalFetcherTest, MissingFileIsNotFound) {
    EXPECT_EQ(FetchError::NOT_FOUND, fetch(docs_ + "/nope.md").code);
    EXPECT_EQ(FetchError::NOT_FOUND, fetch(docs_).code);
}

TEST_F(LocalFetcherTest, AllowedLocalDirsExtendTheRoots) {
    std::string extra = dir_.mkdir("extra");
    dir_.write("extra/notes.md", "notes");

    EXPECT_EQ(FetchError::PATH_NOT_ALLOWED, fetch(extra + "/notes.md").code);

    FetchOptions options;
    options.allowed_local_dirs.push_back(extra);
    FetchResult r = fetch(extra + "/notes.md", options);
    ASSERT_TRUE(r.success) << r.error_text();
    EXPECT_EQ("notes", r.content);
}

TEST_F(LocalFetcherTest, RawFetchSkipsConversion) {
    ResourceFetcher fetcher(policy_, sources_, transport_, FetchOptions());
    RawResource raw;
    FetchResult r = fetcher.fetch_raw(docs_ + "/page.html", raw);
    ASSERT_TRUE(r.success);
    EXPECT_EQ("<h1>Html</h1><p>text</p>", raw.body);
    EXPECT_EQ("text/html", raw.content_type);
    EXPECT_TRUE(raw.local);
}

TEST_F(LocalFetcherTest, IndexAtFilesystemRootGrantsOnlyItself) {
    std::vector<DocSource> sources;
    sources.push_back(DocSource("Root", "/llms.txt"));
    ResourceFetcher fetcher(policy_, sources, transport_, FetchOptions());

    EXPECT_TRUE(fetcher.local_roots().empty());
    EXPECT_EQ(FetchError::PATH_NOT_ALLOWED, fetcher.fetch("/etc/passwd").code);
    EXPECT_EQ(FetchError::PATH_NOT_ALLOWED, fetcher.fetch("/llms.md").code);
    // The index itself stays readable, so only existence is checked
    FetchResult index = fetcher.fetch("/llms.txt");
    EXPECT_NE(FetchError::PATH_NOT_ALLOWED, index.code);
}

TEST_F(LocalFetcherTest, FileOverDownloadCeilingIsTooLarge) {
    dir_.write("docs/big.md", std::string(4096, 'x'));
    FetchOptions options;
    options.max_download_bytes = 1024;
    EXPECT_EQ(FetchError::TOO_LARGE, fetch(docs_ + "/big.md", options).code);
}

TEST(FetchErrorTest, NamesAndOverflowParsing) {
    EXPECT_STREQ("DomainNotAllowed", fetch_error_name(FetchError::DOMAIN_NOT_ALLOWED));
    EXPECT_STREQ("NotFound", fetch_error_name(FetchError::NOT_FOUND));
    EXPECT_STREQ("UpstreamError", fetch_error_name(FetchError::UPSTREAM_ERROR));
    EXPECT_STREQ("TooLarge", fetch_error_name(FetchError::TOO_LARGE));
    EXPECT_STREQ("PathNotAllowed", fetch_error_name(FetchError::PATH_NOT_ALLOWED));

    OverflowPolicy policy = OverflowPolicy::TRUNCATE;
    EXPECT_TRUE(parse_overflow_policy("FAIL", policy));
    EXPECT_EQ(OverflowPolicy::FAIL, policy);
    EXPECT_FALSE(parse_overflow_policy("drop", policy));
}
