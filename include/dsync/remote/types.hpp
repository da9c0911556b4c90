#pragma once

/**
 * @file types.hpp
 * @brief Value types exchanged with the remote file store
 *
 * WHY THIS FILE EXISTS:
 * The sync core never talks to a concrete storage API directly. Every
 * backend (the Drive REST adapter, the in-memory store used by tests)
 * produces these snapshots and errors, and the core only reasons about them.
 *
 * DESIGN DECISIONS:
 * - RemoteNode is a plain snapshot: it is never mutated locally, only re-fetched
 * - Errors carry an explicit ErrorClass decided by the adapter, so the
 *   Rate Governor never has to inspect transport details to decide on a retry
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dsync {
namespace remote {

enum class NodeKind {
    File,
    Folder
};

/// Mime type prefix shared by native documents (Docs, Sheets, ...) which have no byte checksum
inline constexpr const char* kNativeDocumentPrefix = "application/vnd.google-apps.";
inline constexpr const char* kFolderMimeType = "application/vnd.google-apps.folder";

/**
 * @brief Point-in-time metadata for one item in the remote store
 */
struct RemoteNode {
    std::string id;
    std::string name;
    NodeKind kind = NodeKind::File;
    std::uint64_t size = 0;                  ///< Always 0 for folders and native documents
    std::optional<std::string> content_hash; ///< Absent when the backend has no byte checksum
    std::string mime_type;

    bool is_folder() const { return kind == NodeKind::Folder; }

    bool is_native_document() const {
        return kind == NodeKind::File && mime_type.rfind(kNativeDocumentPrefix, 0) == 0;
    }
};

/**
 * @brief One page of a folder listing
 */
struct ListPage {
    std::vector<RemoteNode> items;
    std::optional<std::string> next_page_token; ///< Absent on the last page
};

/**
 * @brief Retry classification attached to every remote failure
 *
 * Retriable: overload, rate limit, momentary server fault, broken transport.
 * Permanent: not found, invalid argument, quota exhausted for good.
 */
enum class ErrorClass {
    Retriable,
    Permanent
};

struct RemoteError {
    ErrorClass error_class = ErrorClass::Permanent;
    int status = 0;      ///< HTTP status when the failure came from a response, 0 otherwise
    std::string reason;  ///< Machine readable reason, e.g. "rateLimitExceeded", "notFound"
    std::string message;

    bool is_retriable() const { return error_class == ErrorClass::Retriable; }
    bool is_not_found() const { return reason == "notFound"; }

    std::string describe() const {
        std::string text = is_retriable() ? "retriable" : "permanent";
        if (status != 0) {
            text += " status=" + std::to_string(status);
        }
        if (!reason.empty()) {
            text += " reason=" + reason;
        }
        if (!message.empty()) {
            text += ": " + message;
        }
        return text;
    }

    static RemoteError retriable(int status, std::string reason, std::string message) {
        return RemoteError{ErrorClass::Retriable, status, std::move(reason), std::move(message)};
    }

    static RemoteError permanent(int status, std::string reason, std::string message) {
        return RemoteError{ErrorClass::Permanent, status, std::move(reason), std::move(message)};
    }

    static RemoteError not_found(const std::string& what) {
        return RemoteError{ErrorClass::Permanent, 404, "notFound", "Not found: " + what};
    }
};

const char* to_string(NodeKind kind);

const char* to_string(ErrorClass error_class);

} // namespace remote
} // namespace dsync
