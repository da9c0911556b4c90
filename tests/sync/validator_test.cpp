#include "sync_fixture.hpp"

#include "dsync/events/events.hpp"
#include "dsync/sync/validator.hpp"

#include <algorithm>

using dsync::events::ValidationFinishedEvent;
using dsync::remote::RemoteError;
using dsync::sync::DiscrepancyKind;
using dsync::sync::FileEntry;
using dsync::sync::TreeEnumerator;
using dsync::sync::TreeSnapshot;
using dsync::sync::Validator;
using dsync::testing::Op;

class ValidatorTest : public dsync::testing::SyncFixture {};

TEST(ValidatorCompareTest, CategorisesDiscrepancies) {
    TreeSnapshot source;
    source.folders["a"] = "sa";
    source.folders["b"] = "sb";
    source.files["a/missing.txt"] = FileEntry{"1", 10, std::string("M"), ""};
    source.files["a/size.txt"] = FileEntry{"2", 10, std::nullopt, ""};
    source.files["a/hash.txt"] = FileEntry{"3", 10, std::string("H1"), ""};
    source.files["a/same.txt"] = FileEntry{"4", 10, std::string("S"), ""};

    TreeSnapshot dest;
    dest.folders["a"] = "da";
    dest.folders["extra"] = "dx";
    dest.files["a/size.txt"] = FileEntry{"5", 9, std::nullopt, ""};
    dest.files["a/hash.txt"] = FileEntry{"6", 10, std::string("H2"), ""};
    dest.files["a/same.txt"] = FileEntry{"7", 10, std::string("S"), ""};

    const auto found = Validator::compare(source, dest);
    ASSERT_EQ(found.size(), 4u);

    auto count = [&](DiscrepancyKind kind) {
        return std::count_if(found.begin(), found.end(), [&](const auto& d) { return d.kind == kind; });
    };
    EXPECT_EQ(count(DiscrepancyKind::MissingFolder), 1);
    EXPECT_EQ(count(DiscrepancyKind::MissingFile), 1);
    EXPECT_EQ(count(DiscrepancyKind::SizeMismatch), 1);
    EXPECT_EQ(count(DiscrepancyKind::HashMismatch), 1);
}

TEST_F(ValidatorTest, PassesForIdenticalTrees) {
    service.add_file(source_root, "a.txt", 3, "A");
    service.add_file(dest_root, "a.txt", 3, "A");
    service.add_file(dest_root, "only-here.txt", 3, "X");

    bool passed = false;
    auto sub = bus.subscribe<ValidationFinishedEvent>([&](const ValidationFinishedEvent& e) { passed = e.passed; });

    Validator validator(ops, bus);
    auto report = validator.validate(source_root, dest_root);
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().passed);
    EXPECT_TRUE(report.value().discrepancies.empty());
    EXPECT_TRUE(passed);
}

TEST_F(ValidatorTest, AlwaysRelistsBothTrees) {
    service.add_file(source_root, "a.txt", 3, "A");
    TreeEnumerator enumerator(ops, bus);
    ASSERT_TRUE(enumerator.enumerate(source_root).is_ok());
    ASSERT_TRUE(enumerator.enumerate(dest_root).is_ok());

    // The destination changed after it was cached
    service.add_file(dest_root, "a.txt", 3, "A");

    Validator validator(ops, bus);
    auto report = validator.validate(source_root, dest_root);
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().passed);
}

TEST_F(ValidatorTest, ReportsMissingFileAndBuildsRepairPlan) {
    const auto file = service.add_file(source_root, "a.txt", 3, "A");
    service.add_file(source_root, "b.txt", 4, "B");
    service.add_file(dest_root, "b.txt", 4, "B");

    Validator validator(ops, bus);
    auto report = validator.validate(source_root, dest_root);
    ASSERT_TRUE(report.is_ok());
    EXPECT_FALSE(report.value().passed);

    const auto plan = report.value().repair_plan();
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].source_id, file);
    EXPECT_EQ(plan[0].relative_path, "a.txt");
}

TEST_F(ValidatorTest, IncompleteListingCannotPass) {
    const auto sub = service.add_folder(dest_root, "sub");
    service.fail_for_id(Op::ListChildren, sub, RemoteError::permanent(403, "forbidden", "denied"));

    Validator validator(ops, bus);
    auto report = validator.validate(source_root, dest_root);
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().discrepancies.empty());
    EXPECT_FALSE(report.value().passed);
}

TEST_F(ValidatorTest, MissingFilesListsPresenceOnly) {
    service.add_file(source_root, "a.txt", 3, "A");
    service.add_file(source_root, "b.txt", 4, "B");
    service.add_file(dest_root, "b.txt", 99, "different");

    Validator validator(ops, bus);
    auto missing = validator.missing_files(source_root, dest_root);
    ASSERT_TRUE(missing.is_ok());
    EXPECT_EQ(missing.value(), (std::vector<std::string>{"a.txt"}));
}
