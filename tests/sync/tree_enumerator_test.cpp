#include "sync_fixture.hpp"

#include "dsync/cache/keys.hpp"
#include "dsync/events/events.hpp"
#include "dsync/sync/tree_enumerator.hpp"

#include <string>
#include <vector>

using dsync::events::EnumerationPageEvent;
using dsync::events::SubtreeSkippedEvent;
using dsync::remote::RemoteError;
using dsync::sync::EnumeratorOptions;
using dsync::sync::TreeEnumerator;
using dsync::testing::Op;

class TreeEnumeratorTest : public dsync::testing::SyncFixture {
protected:
    void build_sample_tree() {
        const auto docs = service.add_folder(source_root, "docs");
        const auto deep = service.add_folder(docs, "deep");
        service.add_file(source_root, "top.txt", 5, "T");
        service.add_file(docs, "a.txt", 100, "A");
        service.add_file(docs, "b.txt", 0, std::nullopt);
        service.add_file(docs, "c.txt", 7, "C");
        service.add_file(deep, "z.bin", 42, "Z");
        service.add_folder(source_root, "empty");
    }
};

TEST_F(TreeEnumeratorTest, ProducesFlatPathMaps) {
    build_sample_tree();
    TreeEnumerator enumerator(ops, bus);

    auto result = enumerator.enumerate(source_root);
    ASSERT_TRUE(result.is_ok());
    const auto& snapshot = *result.value();

    EXPECT_TRUE(snapshot.complete);
    EXPECT_EQ(snapshot.root_id, source_root);
    EXPECT_EQ(snapshot.folders.size(), 3u);
    EXPECT_EQ(snapshot.files.size(), 5u);
    ASSERT_EQ(snapshot.files.count("docs/deep/z.bin"), 1u);
    EXPECT_EQ(snapshot.files.at("docs/deep/z.bin").size, 42u);
    EXPECT_EQ(snapshot.files.at("docs/b.txt").size, 0u);
    EXPECT_FALSE(snapshot.files.at("docs/b.txt").content_hash.has_value());
    EXPECT_EQ(snapshot.folders.count("empty"), 1u);
}

TEST_F(TreeEnumeratorTest, EveryFileHasItsAncestorFolders) {
    build_sample_tree();
    TreeEnumerator enumerator(ops, bus);

    auto result = enumerator.enumerate(source_root);
    ASSERT_TRUE(result.is_ok());
    for (const auto& [path, entry] : result.value()->files) {
        for (auto parent = dsync::sync::parent_path(path); !parent.empty(); parent = dsync::sync::parent_path(parent)) {
            EXPECT_EQ(result.value()->folders.count(parent), 1u) << path;
        }
    }
}

TEST_F(TreeEnumeratorTest, CachedSnapshotCostsNoRemoteCalls) {
    build_sample_tree();
    TreeEnumerator enumerator(ops, bus);

    auto first = enumerator.enumerate(source_root);
    ASSERT_TRUE(first.is_ok());
    service.reset_call_counts();

    auto second = enumerator.enumerate(source_root);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(service.total_calls(), 0u);
    EXPECT_EQ(second.value().get(), first.value().get());

    enumerator.invalidate(source_root);
    ASSERT_TRUE(enumerator.enumerate(source_root).is_ok());
    EXPECT_GT(service.total_calls(), 0u);
}

TEST_F(TreeEnumeratorTest, PagesAreFollowedUntilNoToken) {
    for (int i = 0; i < 9; ++i) {
        service.add_file(source_root, "f" + std::to_string(i), 1, std::nullopt);
    }
    TreeEnumerator enumerator(ops, bus, EnumeratorOptions{false, false});

    auto result = enumerator.enumerate(source_root);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()->files.size(), 9u);
    EXPECT_EQ(service.call_count(Op::ListChildren), 5u);
}

TEST_F(TreeEnumeratorTest, ProgressIsMonotonicAndReachesTotal) {
    build_sample_tree();
    std::vector<EnumerationPageEvent> pages;
    auto sub = bus.subscribe<EnumerationPageEvent>([&](const EnumerationPageEvent& e) { pages.push_back(e); });
    TreeEnumerator enumerator(ops, bus);

    ASSERT_TRUE(enumerator.enumerate(source_root).is_ok());
    ASSERT_FALSE(pages.empty());
    for (std::size_t i = 1; i < pages.size(); ++i) {
        EXPECT_GE(pages[i].processed, pages[i - 1].processed);
        EXPECT_GE(pages[i].percent, pages[i - 1].percent);
    }
    EXPECT_EQ(pages.back().total, 8u);
    EXPECT_DOUBLE_EQ(pages.back().percent, 100.0);
}

TEST_F(TreeEnumeratorTest, InvalidateRecountsAfterNestedChange) {
    build_sample_tree();
    TreeEnumerator enumerator(ops, bus);
    ASSERT_TRUE(enumerator.enumerate(source_root).is_ok());

    const auto deep = *service.resolve_path(source_root, "docs/deep");
    auto created = ops.ensure_folder("added", deep);
    ASSERT_TRUE(created.is_ok());
    ASSERT_TRUE(created.value().created);

    std::vector<EnumerationPageEvent> pages;
    auto sub = bus.subscribe<EnumerationPageEvent>([&](const EnumerationPageEvent& e) { pages.push_back(e); });
    enumerator.invalidate(source_root);
    ASSERT_TRUE(enumerator.enumerate(source_root).is_ok());

    ASSERT_FALSE(pages.empty());
    EXPECT_EQ(pages.front().total, 9u);
    EXPECT_EQ(pages.back().processed, 9u);
}

TEST_F(TreeEnumeratorTest, UnknownTotalReportsZeroPercent) {
    build_sample_tree();
    std::vector<double> percents;
    auto sub = bus.subscribe<EnumerationPageEvent>([&](const EnumerationPageEvent& e) { percents.push_back(e.percent); });
    TreeEnumerator enumerator(ops, bus, EnumeratorOptions{false, true});

    ASSERT_TRUE(enumerator.enumerate(source_root).is_ok());
    for (double p : percents) {
        EXPECT_DOUBLE_EQ(p, 0.0);
    }
}

TEST_F(TreeEnumeratorTest, UnreadableSubtreeLeavesPartialSnapshot) {
    build_sample_tree();
    const auto docs = *service.resolve_path(source_root, "docs");
    service.fail_for_id(Op::ListChildren, docs, RemoteError::permanent(403, "insufficientFilePermissions", "denied"));

    std::vector<std::string> skipped;
    auto sub = bus.subscribe<SubtreeSkippedEvent>([&](const SubtreeSkippedEvent& e) { skipped.push_back(e.folder_path); });
    TreeEnumerator enumerator(ops, bus, EnumeratorOptions{false, true});

    auto result = enumerator.enumerate(source_root);
    ASSERT_TRUE(result.is_ok());
    const auto& snapshot = *result.value();
    EXPECT_FALSE(snapshot.complete);
    EXPECT_EQ(snapshot.failed_folders, (std::vector<std::string>{"docs"}));
    EXPECT_EQ(skipped, (std::vector<std::string>{"docs"}));
    EXPECT_EQ(snapshot.folders.count("docs"), 1u);
    EXPECT_EQ(snapshot.files.count("docs/a.txt"), 0u);
    EXPECT_EQ(snapshot.files.count("top.txt"), 1u);

    // Incomplete snapshots are not cached
    service.clear_failures();
    auto again = enumerator.enumerate(source_root);
    ASSERT_TRUE(again.is_ok());
    EXPECT_TRUE(again.value()->complete);
}

TEST_F(TreeEnumeratorTest, NameWithSlashIsLeftOutAndMarksIncomplete) {
    const auto docs = service.add_folder(source_root, "docs");
    service.add_file(docs, "Q1/Q2 report.pdf", 10, "H");
    service.add_folder(source_root, "a/b");
    service.add_file(docs, "plain.txt", 1, "P");

    std::vector<std::string> skipped;
    auto sub = bus.subscribe<SubtreeSkippedEvent>([&](const SubtreeSkippedEvent& e) { skipped.push_back(e.folder_path); });

    TreeEnumerator enumerator(ops, bus);
    auto result = enumerator.enumerate(source_root);
    ASSERT_TRUE(result.is_ok());
    const auto& snapshot = *result.value();

    EXPECT_FALSE(snapshot.complete);
    EXPECT_EQ(snapshot.files.count("docs/Q1/Q2 report.pdf"), 0u);
    EXPECT_EQ(snapshot.folders.count("a/b"), 0u);
    EXPECT_EQ(snapshot.files.count("docs/plain.txt"), 1u);
    EXPECT_EQ(snapshot.folders.size(), 1u);
    EXPECT_EQ(snapshot.failed_folders.size(), 2u);
    EXPECT_EQ(skipped.size(), 2u);

    // Incomplete snapshots are not cached
    EXPECT_FALSE(cache.get(dsync::cache::keys::tree(source_root)).has_value());
}

TEST_F(TreeEnumeratorTest, UnreadableRootFailsEnumeration) {
    service.fail_for_id(Op::ListChildren, source_root, RemoteError::not_found(source_root));
    TreeEnumerator enumerator(ops, bus, EnumeratorOptions{false, true});

    auto result = enumerator.enumerate(source_root);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is_not_found());
}

TEST_F(TreeEnumeratorTest, TransientListingErrorsAreRetriedByTheGovernor) {
    build_sample_tree();
    service.fail_next(Op::ListChildren, 2, RemoteError::retriable(429, "rateLimitExceeded", "slow down"));
    TreeEnumerator enumerator(ops, bus, EnumeratorOptions{false, false});

    auto result = enumerator.enumerate(source_root);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value()->complete);
    EXPECT_EQ(result.value()->files.size(), 5u);
    EXPECT_EQ(governor.total_retries(), 2u);
}
