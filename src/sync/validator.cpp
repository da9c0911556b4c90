#include "dsync/sync/validator.hpp"

#include "dsync/events/events.hpp"

#include <spdlog/spdlog.h>

namespace dsync::sync {

DiffPlan ValidationReport::repair_plan() const {
    DiffPlan plan;
    if (!source) {
        return plan;
    }
    for (const auto& d : discrepancies) {
        if (d.kind != DiscrepancyKind::MissingFile && d.kind != DiscrepancyKind::SizeMismatch
            && d.kind != DiscrepancyKind::HashMismatch) {
            continue;
        }
        auto it = source->files.find(d.path);
        if (it != source->files.end()) {
            plan.push_back(CopyAction{it->second.id, d.path});
        }
    }
    return plan;
}

Validator::Validator(RemoteOperations& ops, events::EventBus& bus)
    : ops_(ops), bus_(bus), enumerator_(ops, bus, EnumeratorOptions{false, true}) {}

RemoteResult<ValidationReport> Validator::validate(const std::string& source_root, const std::string& dest_root) {
    spdlog::info("Performing final validation");
    enumerator_.invalidate(source_root);
    enumerator_.invalidate(dest_root);

    auto source = enumerator_.enumerate(source_root);
    if (source.is_error()) {
        return dsync::Err(source.error());
    }
    auto dest = enumerator_.enumerate(dest_root);
    if (dest.is_error()) {
        return dsync::Err(dest.error());
    }

    ValidationReport report;
    report.source = source.value();
    report.dest = dest.value();
    report.discrepancies = compare(*report.source, *report.dest);
    report.passed = report.discrepancies.empty() && report.source->complete && report.dest->complete;

    for (const auto& d : report.discrepancies) {
        spdlog::warn("Validation: {} '{}' {}", to_string(d.kind), d.path, d.detail);
    }
    if (!report.source->complete || !report.dest->complete) {
        spdlog::warn("Validation ran on an incomplete listing; the result cannot pass");
    }

    bus_.emit(events::ValidationFinishedEvent{report.passed, report.discrepancies.size()});
    return dsync::Ok(std::move(report));
}

RemoteResult<std::vector<std::string>> Validator::missing_files(const std::string& source_root,
                                                                const std::string& dest_root) {
    auto source = enumerator_.enumerate(source_root);
    if (source.is_error()) {
        return dsync::Err(source.error());
    }
    auto dest = enumerator_.enumerate(dest_root);
    if (dest.is_error()) {
        return dsync::Err(dest.error());
    }

    std::vector<std::string> missing;
    for (const auto& [path, entry] : source.value()->files) {
        if (dest.value()->files.count(path) == 0) {
            missing.push_back(path);
        }
    }
    return dsync::Ok(std::move(missing));
}

std::vector<Discrepancy> Validator::compare(const TreeSnapshot& source, const TreeSnapshot& dest) {
    std::vector<Discrepancy> found;

    for (const auto& [path, entry] : source.folders) {
        if (dest.folders.count(path) == 0) {
            found.push_back(Discrepancy{DiscrepancyKind::MissingFolder, path, 0, 0, "folder missing"});
        }
    }

    for (const auto& [path, entry] : source.files) {
        auto it = dest.files.find(path);
        if (it == dest.files.end()) {
            found.push_back(Discrepancy{DiscrepancyKind::MissingFile, path, entry.size, 0, "file missing"});
            continue;
        }
        const auto& other = it->second;
        if (other.size != entry.size) {
            found.push_back(Discrepancy{DiscrepancyKind::SizeMismatch, path, entry.size, other.size,
                                        "source " + std::to_string(entry.size) + " bytes, destination "
                                            + std::to_string(other.size) + " bytes"});
        } else if (entry.content_hash && other.content_hash && *entry.content_hash != *other.content_hash) {
            found.push_back(Discrepancy{DiscrepancyKind::HashMismatch, path, entry.size, other.size,
                                        "source " + *entry.content_hash + ", destination " + *other.content_hash});
        }
    }
    return found;
}

} // namespace dsync::sync
