#pragma once

#include "dsync/remote/http_client.hpp"
#include "dsync/remote/service.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace dsync::remote {

struct DriveConfig {
    std::string host = "www.googleapis.com";
    std::string port = "443";
    std::size_t page_size = 1000; ///< Items per listing page, at most 1000
};

/**
 * @brief RemoteService over the Google Drive v3 REST API
 *
 * Shared drives are supported (supportsAllDrives on every call). Calls are
 * serialized on one HTTPS client; throughput is bounded by the rate
 * governor in front of this object anyway.
 */
class DriveRestService : public RemoteService {
public:
    DriveRestService(std::string access_token, DriveConfig config = {});

    RemoteResult<RemoteNode> get_metadata(const std::string& id) override;
    RemoteResult<ListPage> list_children(const std::string& parent_id,
                                         const std::optional<std::string>& page_token) override;
    RemoteResult<RemoteNode> find_by_name(const std::string& parent_id,
                                          const std::string& name,
                                          std::optional<NodeKind> kind) override;
    RemoteResult<std::string> create_folder(const std::string& name, const std::string& parent_id) override;
    RemoteResult<std::string> copy_file(const std::string& source_id,
                                        const std::string& dest_parent_id,
                                        const std::string& dest_name) override;

private:
    RemoteResult<std::string> call(boost::beast::http::verb method,
                                   const std::string& target,
                                   const std::optional<nlohmann::json>& body = std::nullopt);

    std::string access_token_;
    DriveConfig config_;
    std::mutex mutex_;
    HttpsClient client_;
};

// Wire format helpers. Pure functions, no network.
namespace drive {

/// Retriable for 403 (except quota exhaustion), 429, 500, 502, 503, 504; notFound for 404
RemoteError classify_status(unsigned status, const std::string& body);

/// One entry of a "files" array or a files.get response
RemoteResult<RemoteNode> parse_node(const nlohmann::json& json);

/// files.list response: {"files": [...], "nextPageToken": "..."}
RemoteResult<ListPage> parse_list_page(const std::string& body);

/// Escapes backslashes and single quotes for a quoted query literal
std::string escape_query_literal(const std::string& value);

/// Percent-encodes everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& value);

/// "'<parent>' in parents and trashed=false"
std::string children_query(const std::string& parent_id);

/// children_query() narrowed to one name and, optionally, to folders or non-folders
std::string name_query(const std::string& parent_id, const std::string& name, std::optional<NodeKind> kind);

/// files.list request for one page of children, oldest first so the newest same-named sibling is listed last
std::string list_children_target(const std::string& parent_id,
                                 const std::optional<std::string>& page_token,
                                 std::size_t page_size);

/// files.list request for the newest child called `name`
std::string find_by_name_target(const std::string& parent_id, const std::string& name, std::optional<NodeKind> kind);

} // namespace drive

} // namespace dsync::remote
