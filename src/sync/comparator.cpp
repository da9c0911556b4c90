#include "dsync/sync/comparator.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace dsync::sync {
namespace {

constexpr std::size_t kListLimit = 10;
constexpr std::size_t kTopFileTypes = 5;
constexpr double kMiB = 1024.0 * 1024.0;
constexpr double kGiB = kMiB * 1024.0;

DepthStats depth_stats(const FolderMap& folders) {
    DepthStats stats;
    if (folders.empty()) {
        return stats;
    }
    std::size_t sum = 0;
    for (const auto& [path, id] : folders) {
        const auto depth = path_depth(path);
        stats.max_depth = std::max(stats.max_depth, depth);
        stats.distribution[depth]++;
        sum += depth;
    }
    stats.average_depth = static_cast<double>(sum) / static_cast<double>(folders.size());
    return stats;
}

SideStats side_stats(const TreeSnapshot& snapshot) {
    SideStats stats;
    stats.total_files = snapshot.files.size();
    stats.total_folders = snapshot.folders.size();
    for (const auto& [path, entry] : snapshot.files) {
        stats.total_size += entry.size;
    }
    return stats;
}

nlohmann::json discrepancy_json(const Discrepancy& d) {
    return {
        {"path", d.path},
        {"source_size", d.source_size},
        {"dest_size", d.dest_size},
        {"detail", d.detail}
    };
}

nlohmann::json discrepancy_array(const std::vector<Discrepancy>& list) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& d : list) {
        array.push_back(discrepancy_json(d));
    }
    return array;
}

} // namespace

bool ComparisonReport::has_discrepancies() const {
    return !missing_files.empty() || !size_mismatches.empty() || !hash_mismatches.empty()
        || !missing_folders.empty() || !extra_folders.empty();
}

Comparator::Comparator(RemoteOperations& ops, events::EventBus& bus)
    : enumerator_(ops, bus) {}

RemoteResult<ComparisonReport> Comparator::compare(const std::string& source_root,
                                                   const std::string& dest_root,
                                                   bool detailed) {
    const auto started = std::chrono::steady_clock::now();

    spdlog::info("Analyzing source folder {}", source_root);
    auto source = enumerator_.enumerate(source_root);
    if (source.is_error()) {
        return dsync::Err(source.error());
    }

    spdlog::info("Analyzing destination folder {}", dest_root);
    auto dest = enumerator_.enumerate(dest_root);
    if (dest.is_error()) {
        return dsync::Err(dest.error());
    }

    auto report = build(*source.value(), *dest.value(), detailed);

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    report.elapsed_seconds = elapsed.count();
    const auto file_ops = report.source.total_files + report.dest.total_files;
    report.files_per_second = report.elapsed_seconds > 0.0
        ? static_cast<double>(file_ops) / report.elapsed_seconds
        : 0.0;
    return dsync::Ok(std::move(report));
}

ComparisonReport Comparator::build(const TreeSnapshot& source, const TreeSnapshot& dest, bool detailed) {
    ComparisonReport report;
    report.source = side_stats(source);
    report.dest = side_stats(dest);
    report.depth = depth_stats(source.folders);
    report.complete_listing = source.complete && dest.complete;

    ComparisonDetails details;

    for (const auto& [path, entry] : source.files) {
        auto& type = report.file_types[extension_of(path)];
        type.count++;
        type.total_size += entry.size;

        auto it = dest.files.find(path);
        if (it == dest.files.end()) {
            report.missing_files.push_back(Discrepancy{DiscrepancyKind::MissingFile, path, entry.size, 0, {}});
            details.missing_files.push_back(path);
            continue;
        }

        const auto& other = it->second;
        if (other.size != entry.size) {
            Discrepancy d{DiscrepancyKind::SizeMismatch, path, entry.size, other.size, {}};
            report.size_mismatches.push_back(d);
            details.different_files.push_back(std::move(d));
            continue;
        }
        details.matching_files.push_back(path);
        if (entry.content_hash && other.content_hash && *entry.content_hash != *other.content_hash) {
            report.hash_mismatches.push_back(Discrepancy{DiscrepancyKind::HashMismatch, path, entry.size, other.size,
                                                         *entry.content_hash + " != " + *other.content_hash});
        }
    }

    for (const auto& [path, id] : source.folders) {
        if (dest.folders.count(path) == 0) {
            report.missing_folders.push_back(path);
        } else {
            details.matching_folders.push_back(path);
        }
    }
    for (const auto& [path, id] : dest.folders) {
        if (source.folders.count(path) == 0) {
            report.extra_folders.push_back(path);
        }
    }

    report.completion_percentage = source.files.empty()
        ? 100.0
        : static_cast<double>(dest.files.size()) / static_cast<double>(source.files.size()) * 100.0;

    if (detailed) {
        details.missing_folders = report.missing_folders;
        details.extra_folders = report.extra_folders;
        report.details = std::move(details);
    }
    return report;
}

std::string Comparator::extension_of(const std::string& path) {
    const auto name = leaf_name(path);
    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) {
        return "no_extension";
    }
    auto ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string format_report(const ComparisonReport& report) {
    std::string out;
    auto line = [&out](const std::string& text) {
        out += text;
        out += '\n';
    };

    line("Folder Comparison Report");
    line("========================");
    line("");
    line("Overall Statistics:");
    line(fmt::format("Source: {} files, {} folders, {:.2f} GB", report.source.total_files,
                     report.source.total_folders, static_cast<double>(report.source.total_size) / kGiB));
    line(fmt::format("Destination: {} files, {} folders, {:.2f} GB", report.dest.total_files,
                     report.dest.total_folders, static_cast<double>(report.dest.total_size) / kGiB));
    if (!report.complete_listing) {
        line("Warning: some folders could not be listed; results may under-report the destination");
    }

    line("");
    line("Performance Metrics:");
    line(fmt::format("Elapsed Time: {:.2f} seconds", report.elapsed_seconds));
    line(fmt::format("Processing Speed: {:.2f} files/second", report.files_per_second));

    line("");
    line(fmt::format("Completion: {:.1f}%", report.completion_percentage));

    line("");
    line("Directory Structure:");
    line(fmt::format("Maximum Depth: {} levels", report.depth.max_depth));
    line(fmt::format("Average Depth: {:.1f} levels", report.depth.average_depth));

    std::vector<std::pair<std::string, ExtensionStats>> types(report.file_types.begin(), report.file_types.end());
    std::stable_sort(types.begin(), types.end(), [](const auto& a, const auto& b) {
        return a.second.count > b.second.count;
    });
    if (types.size() > kTopFileTypes) {
        types.resize(kTopFileTypes);
    }
    line("");
    line("Top File Types:");
    for (const auto& [ext, stats] : types) {
        line(fmt::format("  .{}: {} files, {:.2f} MB", ext, stats.count, static_cast<double>(stats.total_size) / kMiB));
    }

    if (!report.has_discrepancies()) {
        line("");
        line("No discrepancies found - folders are identical!");
        return out;
    }

    line("");
    line("Discrepancies Found:");

    if (!report.missing_files.empty()) {
        std::uint64_t missing_size = 0;
        for (const auto& d : report.missing_files) {
            missing_size += d.source_size;
        }
        line("");
        line(fmt::format("Missing Files ({}):", report.missing_files.size()));
        line(fmt::format("Total size of missing files: {:.2f} MB", static_cast<double>(missing_size) / kMiB));
        for (std::size_t i = 0; i < report.missing_files.size() && i < kListLimit; ++i) {
            const auto& d = report.missing_files[i];
            line(fmt::format("  {} ({:.2f} MB)", d.path, static_cast<double>(d.source_size) / kMiB));
        }
        if (report.missing_files.size() > kListLimit) {
            line(fmt::format("  ...and {} more files", report.missing_files.size() - kListLimit));
        }
    }

    if (!report.size_mismatches.empty()) {
        line("");
        line(fmt::format("Size Mismatches ({}):", report.size_mismatches.size()));
        for (std::size_t i = 0; i < report.size_mismatches.size() && i < kListLimit; ++i) {
            const auto& d = report.size_mismatches[i];
            line(fmt::format("  {}", d.path));
            line(fmt::format("    Source: {} bytes", d.source_size));
            line(fmt::format("    Destination: {} bytes", d.dest_size));
        }
        if (report.size_mismatches.size() > kListLimit) {
            line(fmt::format("  ...and {} more mismatches", report.size_mismatches.size() - kListLimit));
        }
    }

    if (!report.hash_mismatches.empty()) {
        line("");
        line(fmt::format("Checksum Mismatches ({}):", report.hash_mismatches.size()));
        for (std::size_t i = 0; i < report.hash_mismatches.size() && i < kListLimit; ++i) {
            line(fmt::format("  {}", report.hash_mismatches[i].path));
        }
        if (report.hash_mismatches.size() > kListLimit) {
            line(fmt::format("  ...and {} more mismatches", report.hash_mismatches.size() - kListLimit));
        }
    }

    auto folder_list = [&](const char* title, const std::vector<std::string>& folders) {
        if (folders.empty()) {
            return;
        }
        line("");
        line(fmt::format("{} ({}):", title, folders.size()));
        for (std::size_t i = 0; i < folders.size() && i < kListLimit; ++i) {
            line(fmt::format("  {}", folders[i]));
        }
        if (folders.size() > kListLimit) {
            line(fmt::format("  ...and {} more folders", folders.size() - kListLimit));
        }
    };
    folder_list("Missing Folders", report.missing_folders);
    folder_list("Extra Folders", report.extra_folders);

    return out;
}

nlohmann::json to_json(const ComparisonReport& report) {
    nlohmann::json file_types = nlohmann::json::object();
    for (const auto& [ext, stats] : report.file_types) {
        file_types[ext] = {{"count", stats.count}, {"total_size", stats.total_size}};
    }

    nlohmann::json distribution = nlohmann::json::object();
    for (const auto& [depth, count] : report.depth.distribution) {
        distribution[std::to_string(depth)] = count;
    }

    nlohmann::json result = {
        {"source_stats", {
            {"total_files", report.source.total_files},
            {"total_folders", report.source.total_folders},
            {"total_size", report.source.total_size},
            {"file_types", file_types},
            {"depth_stats", {
                {"max_depth", report.depth.max_depth},
                {"average_depth", report.depth.average_depth},
                {"depth_distribution", distribution}
            }}
        }},
        {"dest_stats", {
            {"total_files", report.dest.total_files},
            {"total_folders", report.dest.total_folders},
            {"total_size", report.dest.total_size}
        }},
        {"discrepancies", {
            {"missing_files", discrepancy_array(report.missing_files)},
            {"size_mismatches", discrepancy_array(report.size_mismatches)},
            {"checksum_mismatches", discrepancy_array(report.hash_mismatches)},
            {"missing_folders", report.missing_folders},
            {"extra_folders", report.extra_folders}
        }},
        {"completion_percentage", report.completion_percentage},
        {"complete_listing", report.complete_listing},
        {"performance", {
            {"elapsed_time", report.elapsed_seconds},
            {"files_per_second", report.files_per_second}
        }}
    };

    if (report.details) {
        const auto& d = *report.details;
        result["file_details"] = {
            {"matching_files", d.matching_files},
            {"different_files", discrepancy_array(d.different_files)},
            {"missing_files", d.missing_files}
        };
        result["folder_details"] = {
            {"matching_folders", d.matching_folders},
            {"missing_folders", d.missing_folders},
            {"extra_folders", d.extra_folders}
        };
    }
    return result;
}

} // namespace dsync::sync
