#include <docgate/docs/source_registry.hpp>
#include <gtest/gtest.h>
#include "test_support.hpp"

using namespace docgate;

class SourceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        sources_.push_back(DocSource("Docs", "https://docs.example/llms.txt", "Example docs"));
        policy_ = AllowlistPolicy::build(sources_, std::vector<std::string>());
    }

    std::vector<DocSource> sources_;
    AllowlistPolicy policy_;
    test::FakeTransport transport_;
};

TEST_F(SourceRegistryTest, LoadsRemoteIndex) {
    transport_.respond("https://docs.example/llms.txt", 200,
                       "# Docs\n- [Intro](intro.md): Start\n- [bad](\n", "text/plain");

    ResourceFetcher fetcher(policy_, sources_, transport_, FetchOptions());
    SourceRegistry registry(sources_, fetcher);

    IndexResult r = registry.load_index(sources_[0]);
    ASSERT_TRUE(r.success) << r.error_text();
    ASSERT_EQ(1u, r.entries.size());
    EXPECT_EQ("https://docs.example/intro.md", r.entries[0].target);
    EXPECT_EQ(1u, r.skipped);
}

TEST_F(SourceRegistryTest, IndexIsReadOnEveryCall) {
    transport_.respond("https://docs.example/llms.txt", 200, "- [A](a.md)\n");
    ResourceFetcher fetcher(policy_, sources_, transport_, FetchOptions());
    SourceRegistry registry(sources_, fetcher);

    ASSERT_TRUE(registry.load_index(sources_[0]).success);
    transport_.respond("https://docs.example/llms.txt", 200, "- [A](a.md)\n- [B](b.md)\n");
    IndexResult r = registry.load_index(sources_[0]);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(2u, r.entries.size());
    EXPECT_EQ(2u, transport_.call_count());
}

TEST_F(SourceRegistryTest, UnreachableIndexIsUnavailable) {
    ResourceFetcher fetcher(policy_, sources_, transport_, FetchOptions());
    SourceRegistry registry(sources_, fetcher);

    IndexResult r = registry.load_index(sources_[0]);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(IndexError::INDEX_UNAVAILABLE, r.code);
    EXPECT_EQ(0u, r.error_text().find("IndexUnavailable: "));
    EXPECT_NE(std::string::npos, r.message.find("NotFound"));
}

TEST_F(SourceRegistryTest, IndexWithoutLinksIsParseError) {
    transport_.respond("https://docs.example/llms.txt", 200, "# Nothing here\n\nJust text.\n");
    ResourceFetcher fetcher(policy_, sources_, transport_, FetchOptions());
    SourceRegistry registry(sources_, fetcher);

    IndexResult r = registry.load_index(sources_[0]);
    EXPECT_EQ(IndexError::INDEX_PARSE_ERROR, r.code);
}

TEST_F(SourceRegistryTest, IndexIsNotTruncated) {
    std::string index;
    for (int i = 0; i < 200; ++i) {
        index += "- [Page " + std::to_string(i) + "](page" + std::to_string(i) + ".md)\n";
    }
    transport_.respond("https://docs.example/llms.txt", 200, index);

    FetchOptions options;
    options.max_content_length = 100;
    ResourceFetcher fetcher(policy_, sources_, transport_, options);
    SourceRegistry registry(sources_, fetcher);

    IndexResult r = registry.load_index(sources_[0]);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(200u, r.entries.size());
}

TEST_F(SourceRegistryTest, LocalIndexIsReadFromDisk) {
    test::TempDir dir;
    std::string path = dir.write("llms.txt", "- [Guide](guide.md)\n");
    std::vector<DocSource> sources;
    sources.push_back(DocSource("Local", path));

    ResourceFetcher fetcher(policy_, sources, transport_, FetchOptions());
    SourceRegistry registry(sources, fetcher);

    IndexResult r = registry.load_index(sources[0]);
    ASSERT_TRUE(r.success) << r.error_text();
    EXPECT_EQ(dir.file("guide.md"), r.entries[0].target);
    EXPECT_EQ(0u, transport_.call_count());
}

TEST_F(SourceRegistryTest, FindAndDescribe) {
    sources_.push_back(DocSource("Local", "/srv/docs/llms.txt"));
    ResourceFetcher fetcher(policy_, sources_, transport_, FetchOptions());
    SourceRegistry registry(sources_, fetcher);

    ASSERT_TRUE(registry.find("Docs") != NULL);
    EXPECT_EQ("https://docs.example/llms.txt", registry.find("Docs")->location);
    EXPECT_TRUE(registry.find("docs") == NULL);

    std::string text = registry.describe();
    EXPECT_NE(std::string::npos, text.find("- Docs (remote): https://docs.example/llms.txt"));
    EXPECT_NE(std::string::npos, text.find("Example docs"));
    EXPECT_NE(std::string::npos, text.find("- Local (local): /srv/docs/llms.txt"));
}
