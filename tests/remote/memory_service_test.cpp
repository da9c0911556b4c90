#include "dsync/remote/memory_service.hpp"

#include <gtest/gtest.h>

using dsync::remote::ErrorClass;
using dsync::remote::MemoryRemoteService;
using dsync::remote::NodeKind;
using dsync::remote::RemoteError;
using Op = dsync::remote::MemoryRemoteService::Operation;

TEST(MemoryRemoteServiceTest, ListsChildrenPageByPage) {
    MemoryRemoteService service(2);
    const auto root = service.add_root("root");
    for (int i = 0; i < 5; ++i) {
        service.add_file(root, "f" + std::to_string(i) + ".txt", 10, "h");
    }

    std::vector<std::string> names;
    std::optional<std::string> token;
    std::size_t pages = 0;
    do {
        auto page = service.list_children(root, token);
        ASSERT_TRUE(page.is_ok());
        for (const auto& item : page.value().items) {
            names.push_back(item.name);
        }
        token = page.value().next_page_token;
        ++pages;
    } while (token);

    EXPECT_EQ(pages, 3u);
    EXPECT_EQ(names, (std::vector<std::string>{"f0.txt", "f1.txt", "f2.txt", "f3.txt", "f4.txt"}));
    EXPECT_EQ(service.call_count(Op::ListChildren), 3u);
}

TEST(MemoryRemoteServiceTest, RejectsUnknownPageToken) {
    MemoryRemoteService service;
    const auto root = service.add_root("root");

    auto page = service.list_children(root, std::string("bogus"));
    ASSERT_TRUE(page.is_error());
    EXPECT_EQ(page.error().error_class, ErrorClass::Permanent);
    EXPECT_EQ(page.error().reason, "invalidPageToken");
}

TEST(MemoryRemoteServiceTest, FindByNameHonoursKind) {
    MemoryRemoteService service;
    const auto root = service.add_root("root");
    const auto folder = service.add_folder(root, "docs");
    const auto file = service.add_file(root, "docs", 3, std::nullopt);

    auto as_folder = service.find_by_name(root, "docs", NodeKind::Folder);
    ASSERT_TRUE(as_folder.is_ok());
    EXPECT_EQ(as_folder.value().id, folder);

    auto as_file = service.find_by_name(root, "docs", NodeKind::File);
    ASSERT_TRUE(as_file.is_ok());
    EXPECT_EQ(as_file.value().id, file);

    auto missing = service.find_by_name(root, "nope", std::nullopt);
    ASSERT_TRUE(missing.is_error());
    EXPECT_TRUE(missing.error().is_not_found());
}

TEST(MemoryRemoteServiceTest, FindByNameReturnsNewestSibling) {
    MemoryRemoteService service;
    const auto root = service.add_root("root");
    service.add_file(root, "report.pdf", 3, std::string("OLD"));
    const auto newer = service.add_file(root, "report.pdf", 7, std::string("NEW"));

    auto found = service.find_by_name(root, "report.pdf", NodeKind::File);
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().id, newer);
    EXPECT_EQ(found.value().size, 7u);
}

TEST(MemoryRemoteServiceTest, CopyKeepsContentMetadata) {
    MemoryRemoteService service;
    const auto src = service.add_root("src");
    const auto dst = service.add_root("dst");
    const auto file = service.add_file(src, "a.bin", 512, "abc123", "image/png");

    auto copied = service.copy_file(file, dst, "b.bin");
    ASSERT_TRUE(copied.is_ok());

    auto node = service.node(copied.value());
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "b.bin");
    EXPECT_EQ(node->size, 512u);
    EXPECT_EQ(node->content_hash, std::optional<std::string>("abc123"));
    EXPECT_EQ(node->mime_type, "image/png");
    EXPECT_EQ(service.resolve_path(dst, "b.bin"), copied.value());
}

TEST(MemoryRemoteServiceTest, InjectedFailuresAreConsumedInOrder) {
    MemoryRemoteService service;
    const auto root = service.add_root("root");
    service.fail_next(Op::GetMetadata, 2, RemoteError::retriable(503, "backendError", "busy"));

    EXPECT_TRUE(service.get_metadata(root).is_error());
    EXPECT_TRUE(service.get_metadata(root).is_error());
    EXPECT_TRUE(service.get_metadata(root).is_ok());
    EXPECT_EQ(service.call_count(Op::GetMetadata), 3u);
}

TEST(MemoryRemoteServiceTest, IdFailuresPersistUntilCleared) {
    MemoryRemoteService service;
    const auto root = service.add_root("root");
    const auto sub = service.add_folder(root, "sub");
    service.fail_for_id(Op::ListChildren, sub, RemoteError::permanent(403, "forbidden", "no access"));

    EXPECT_TRUE(service.list_children(root, std::nullopt).is_ok());
    EXPECT_TRUE(service.list_children(sub, std::nullopt).is_error());
    EXPECT_TRUE(service.list_children(sub, std::nullopt).is_error());

    service.clear_failures();
    EXPECT_TRUE(service.list_children(sub, std::nullopt).is_ok());
}

TEST(MemoryRemoteServiceTest, RemoveDropsSubtree) {
    MemoryRemoteService service;
    const auto root = service.add_root("root");
    const auto sub = service.add_folder(root, "sub");
    const auto file = service.add_file(sub, "x", 1, std::nullopt);

    EXPECT_TRUE(service.remove(sub));
    EXPECT_FALSE(service.node(file).has_value());
    EXPECT_TRUE(service.children(root).empty());
    EXPECT_FALSE(service.remove(sub));
}
