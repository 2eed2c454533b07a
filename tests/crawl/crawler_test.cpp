#include "mirror/crawl/crawler.hpp"
#include "mirror/events/event_bus.hpp"
#include "mirror/events/events.hpp"

#include "support/fake_remote_source.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using mirror::ErrorKind;
using mirror::crawl::FileEntry;
using mirror::crawl::TreeCrawler;
using mirror::test_support::FakeRemoteSource;
using mirror::test_support::listing_page;

namespace {

const std::string kRoot = "https://mirror.test/files/";

std::set<std::string> relative_paths(const std::vector<FileEntry>& entries) {
    std::set<std::string> paths;
    for (const auto& entry : entries) {
        paths.insert(entry.relative_path);
    }
    return paths;
}

// root -> a/, b/ with three files each; a and b link to each other
void add_cross_linked_tree(FakeRemoteSource& remote) {
    remote.add_page(kRoot, listing_page({"a/", "b/"}));
    remote.add_page(kRoot + "a/", listing_page({"1.bin", "2.bin", "3.bin", "../b/"}));
    remote.add_page(kRoot + "b/", listing_page({"x.bin", "y.bin", "z.bin", "../a/", "./"}));
}

} // namespace

TEST(TreeCrawler, WalksNestedTreeOnce) {
    FakeRemoteSource remote;
    add_cross_linked_tree(remote);

    TreeCrawler crawler(remote, kRoot);
    const auto entries = crawler.discover_all();

    ASSERT_EQ(entries.size(), 6u);
    EXPECT_EQ(relative_paths(entries), (std::set<std::string>{
        "a/1.bin", "a/2.bin", "a/3.bin", "b/x.bin", "b/y.bin", "b/z.bin"}));
    EXPECT_EQ(remote.requests_for(kRoot), 1u);
    EXPECT_EQ(remote.requests_for(kRoot + "a/"), 1u);
    EXPECT_EQ(remote.requests_for(kRoot + "b/"), 1u);
    EXPECT_EQ(crawler.directories_visited(), 3u);
    EXPECT_TRUE(crawler.failures().empty());

    for (const auto& entry : entries) {
        EXPECT_FALSE(entry.is_directory);
        EXPECT_EQ(entry.location, kRoot + entry.relative_path);
    }
}

TEST(TreeCrawler, BreadthFirstOrder) {
    FakeRemoteSource remote;
    remote.add_page(kRoot, listing_page({"sub/", "top.bin"}));
    remote.add_page(kRoot + "sub/", listing_page({"deep.bin"}));

    TreeCrawler crawler(remote, kRoot);
    auto first = crawler.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->relative_path, "top.bin");
    // Subdirectory is fetched lazily
    EXPECT_EQ(remote.requests_for(kRoot + "sub/"), 0u);

    auto second = crawler.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->relative_path, "sub/deep.bin");
    EXPECT_FALSE(crawler.next().has_value());
}

TEST(TreeCrawler, FailingSubdirectoryIsPartialError) {
    FakeRemoteSource remote;
    remote.add_page(kRoot, listing_page({"good/", "bad/"}));
    remote.add_page(kRoot + "good/", listing_page({"kept.bin"}));
    remote.fail(kRoot + "bad/", mirror::Error{ErrorKind::Transfer, "HTTP 500"});

    TreeCrawler crawler(remote, kRoot);
    const auto entries = crawler.discover_all();

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].relative_path, "good/kept.bin");
    ASSERT_EQ(crawler.failures().size(), 1u);
    EXPECT_EQ(crawler.failures()[0].location, kRoot + "bad/");
    EXPECT_EQ(crawler.failures()[0].error.kind, ErrorKind::Crawl);
    EXPECT_NE(crawler.failures()[0].error.message.find("HTTP 500"), std::string::npos);
}

TEST(TreeCrawler, UnreachableRootYieldsNothing) {
    FakeRemoteSource remote;
    TreeCrawler crawler(remote, kRoot);

    EXPECT_TRUE(crawler.discover_all().empty());
    EXPECT_EQ(crawler.failures().size(), 1u);
}

TEST(TreeCrawler, IgnoresLinksOutsideRoot) {
    FakeRemoteSource remote;
    remote.add_page(kRoot, listing_page({
        "https://elsewhere.test/file.bin", "/other/file.bin", "../sibling.bin", "inside.bin"}));

    TreeCrawler crawler(remote, kRoot);
    const auto entries = crawler.discover_all();

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].relative_path, "inside.bin");
    EXPECT_TRUE(crawler.failures().empty());
}

TEST(TreeCrawler, DecodesNamesAndRejectsEncodedTraversal) {
    FakeRemoteSource remote;
    remote.add_page(kRoot, listing_page({"Game%20%28Europe%29.zip", "%2E%2E/escape.bin"}));

    TreeCrawler crawler(remote, kRoot);
    const auto entries = crawler.discover_all();

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].relative_path, "Game (Europe).zip");
    EXPECT_EQ(entries[0].location, kRoot + "Game%20%28Europe%29.zip");
    ASSERT_EQ(crawler.failures().size(), 1u);
    EXPECT_NE(crawler.failures()[0].error.message.find("unsafe"), std::string::npos);
}

TEST(TreeCrawler, DuplicateFileLinksEmittedOnce) {
    FakeRemoteSource remote;
    remote.add_page(kRoot, listing_page({"same.bin", "./same.bin", "same.bin#frag"}));

    TreeCrawler crawler(remote, kRoot);
    EXPECT_EQ(crawler.discover_all().size(), 1u);
}

TEST(TreeCrawler, LocationsDecodingToSamePathGetOneEntry) {
    FakeRemoteSource remote;
    remote.add_page(kRoot, listing_page({"a%20b.bin", "a b.bin", "x%2Fy.bin", "x/"}));
    remote.add_page(kRoot + "x/", listing_page({"y.bin"}));

    TreeCrawler crawler(remote, kRoot);
    const auto entries = crawler.discover_all();

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].location, kRoot + "a%20b.bin");
    EXPECT_EQ(entries[0].relative_path, "a b.bin");
    EXPECT_EQ(entries[1].location, kRoot + "x/y.bin");
    EXPECT_EQ(entries[1].relative_path, "x/y.bin");

    ASSERT_EQ(crawler.failures().size(), 2u);
    EXPECT_EQ(crawler.failures()[0].location, kRoot + "a b.bin");
    EXPECT_EQ(crawler.failures()[0].error.kind, ErrorKind::Crawl);
    EXPECT_NE(crawler.failures()[0].error.message.find("already taken"), std::string::npos);
    EXPECT_EQ(crawler.failures()[1].location, kRoot + "x%2Fy.bin");
    EXPECT_NE(crawler.failures()[1].error.message.find("encoded path separator"), std::string::npos);
}

TEST(TreeCrawler, StopFlagEndsCrawl) {
    FakeRemoteSource remote;
    add_cross_linked_tree(remote);
    std::atomic<bool> stop{true};

    TreeCrawler crawler(remote, kRoot, nullptr, &stop);
    EXPECT_FALSE(crawler.next().has_value());
    EXPECT_EQ(remote.requests_for(kRoot), 0u);
}

TEST(TreeCrawler, EmitsScanAndFailureEvents) {
    FakeRemoteSource remote;
    remote.add_page(kRoot, listing_page({"ok/", "missing/", "top.bin"}));
    remote.add_page(kRoot + "ok/", listing_page({"f.bin"}));

    mirror::events::EventBus bus;
    std::vector<mirror::events::DirectoryScannedEvent> scanned;
    std::vector<mirror::events::CrawlFailedEvent> failed;
    bus.subscribe<mirror::events::DirectoryScannedEvent>(
        [&](const mirror::events::DirectoryScannedEvent& e) { scanned.push_back(e); });
    bus.subscribe<mirror::events::CrawlFailedEvent>(
        [&](const mirror::events::CrawlFailedEvent& e) { failed.push_back(e); });

    TreeCrawler crawler(remote, kRoot, &bus);
    crawler.discover_all();

    ASSERT_EQ(scanned.size(), 2u);
    EXPECT_EQ(scanned[0].location, kRoot);
    EXPECT_EQ(scanned[0].files, 1u);
    EXPECT_EQ(scanned[0].subdirectories, 2u);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].location, kRoot + "missing/");
}

TEST(TreeCrawler, RootWithoutTrailingSlash) {
    FakeRemoteSource remote;
    remote.add_page(kRoot, listing_page({"a.bin"}));

    TreeCrawler crawler(remote, "https://mirror.test/files");
    EXPECT_EQ(crawler.root_url(), kRoot);
    EXPECT_EQ(crawler.discover_all().size(), 1u);
}
