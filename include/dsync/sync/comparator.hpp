#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/sync/remote_ops.hpp"
#include "dsync/sync/tree_enumerator.hpp"
#include "dsync/sync/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dsync::sync {

struct SideStats {
    std::size_t total_files = 0;
    std::size_t total_folders = 0;
    std::uint64_t total_size = 0;
};

struct ExtensionStats {
    std::size_t count = 0;
    std::uint64_t total_size = 0;
};

struct DepthStats {
    std::size_t max_depth = 0;
    double average_depth = 0.0;
    std::map<std::size_t, std::size_t> distribution; ///< depth -> number of folders
};

/// Per-path lists, filled only in detailed mode
struct ComparisonDetails {
    std::vector<std::string> matching_files;
    std::vector<Discrepancy> different_files;
    std::vector<std::string> missing_files;
    std::vector<std::string> matching_folders;
    std::vector<std::string> missing_folders;
    std::vector<std::string> extra_folders;
};

/**
 * @brief Audit-mode comparison of two trees
 */
struct ComparisonReport {
    SideStats source;
    SideStats dest;
    std::map<std::string, ExtensionStats> file_types; ///< Source files by lower-cased extension
    DepthStats depth;                                 ///< Source folder depths

    std::vector<Discrepancy> missing_files;
    std::vector<Discrepancy> size_mismatches;
    std::vector<Discrepancy> hash_mismatches;
    std::vector<std::string> missing_folders;
    std::vector<std::string> extra_folders;

    double completion_percentage = 100.0;
    bool complete_listing = true; ///< false when either tree had an unreadable subtree

    std::optional<ComparisonDetails> details;

    double elapsed_seconds = 0.0;
    double files_per_second = 0.0;

    [[nodiscard]] bool has_discrepancies() const;
};

/**
 * @brief Read-only comparison of a source and a destination tree
 *
 * Never mutates either tree. Uses cached snapshots when present.
 */
class Comparator {
public:
    Comparator(RemoteOperations& ops, events::EventBus& bus);

    RemoteResult<ComparisonReport> compare(const std::string& source_root,
                                           const std::string& dest_root,
                                           bool detailed = false);

    /// Pure part of compare(): statistics and discrepancies of two snapshots
    static ComparisonReport build(const TreeSnapshot& source, const TreeSnapshot& dest, bool detailed);

    /// "pdf" for "a/Report.PDF", "no_extension" for "a/README"
    static std::string extension_of(const std::string& path);

private:
    TreeEnumerator enumerator_;
};

/// Human-readable report (top 5 file types, first 10 entries per category)
std::string format_report(const ComparisonReport& report);

nlohmann::json to_json(const ComparisonReport& report);

} // namespace dsync::sync
