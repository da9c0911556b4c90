#include "dsync/remote/drive_service.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <stdexcept>

namespace dsync::remote {

namespace http = boost::beast::http;

namespace {

constexpr const char* kFilesPath = "/drive/v3/files";
constexpr const char* kNodeFields = "id,name,mimeType,size,md5Checksum";
constexpr std::size_t kMaxPageSize = 1000;

RemoteError invalid_response(const std::string& what) {
    return RemoteError::permanent(0, "invalidResponse", what);
}

} // namespace

namespace drive {

RemoteError classify_status(unsigned status, const std::string& body) {
    std::string reason;
    std::string message;

    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("error") && json["error"].is_object()) {
        const auto& error = json["error"];
        message = error.value("message", "");
        if (error.contains("errors") && error["errors"].is_array() && !error["errors"].empty()
            && error["errors"][0].is_object()) {
            reason = error["errors"][0].value("reason", "");
        }
    }
    if (message.empty()) {
        message = body.substr(0, 200);
    }
    if (reason.empty()) {
        reason = "http" + std::to_string(status);
    }

    const int code = static_cast<int>(status);
    switch (status) {
        case 404:
            return RemoteError::permanent(code, "notFound", message);
        case 403:
            if (reason == "dailyLimitExceeded" || reason == "storageQuotaExceeded") {
                return RemoteError::permanent(code, reason, message);
            }
            return RemoteError::retriable(code, reason, message);
        case 429:
        case 500:
        case 502:
        case 503:
        case 504:
            return RemoteError::retriable(code, reason, message);
        default:
            return RemoteError::permanent(code, reason, message);
    }
}

RemoteResult<RemoteNode> parse_node(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("id") || !json["id"].is_string()) {
        return dsync::Err(invalid_response("file entry without id"));
    }

    RemoteNode node;
    node.id = json["id"].get<std::string>();
    node.name = json.value("name", "");
    node.mime_type = json.value("mimeType", "");
    node.kind = node.mime_type == kFolderMimeType ? NodeKind::Folder : NodeKind::File;

    // int64 values are sent as JSON strings
    if (json.contains("size")) {
        const auto& size = json["size"];
        if (size.is_string()) {
            const auto text = size.get<std::string>();
            if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
                return dsync::Err(invalid_response("bad size for " + node.id + ": " + text));
            }
            try {
                node.size = std::stoull(text);
            } catch (const std::out_of_range& e) {
                return dsync::Err(invalid_response("size out of range for " + node.id + ": " + e.what()));
            }
        } else if (size.is_number_unsigned()) {
            node.size = size.get<std::uint64_t>();
        }
    }
    if (json.contains("md5Checksum") && json["md5Checksum"].is_string()) {
        node.content_hash = json["md5Checksum"].get<std::string>();
    }
    return dsync::Ok(std::move(node));
}

RemoteResult<ListPage> parse_list_page(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return dsync::Err(invalid_response("listing is not a JSON object"));
    }

    ListPage page;
    if (json.contains("files")) {
        if (!json["files"].is_array()) {
            return dsync::Err(invalid_response("'files' is not an array"));
        }
        for (const auto& entry : json["files"]) {
            auto node = parse_node(entry);
            if (node.is_error()) {
                return dsync::Err(node.error());
            }
            page.items.push_back(std::move(node.value()));
        }
    }
    if (json.contains("nextPageToken") && json["nextPageToken"].is_string()) {
        auto token = json["nextPageToken"].get<std::string>();
        if (!token.empty()) {
            page.next_page_token = std::move(token);
        }
    }
    return dsync::Ok(std::move(page));
}

std::string escape_query_literal(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '\'') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string url_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            encoded += hex;
        }
    }
    return encoded;
}

std::string children_query(const std::string& parent_id) {
    return "'" + escape_query_literal(parent_id) + "' in parents and trashed=false";
}

std::string name_query(const std::string& parent_id, const std::string& name, std::optional<NodeKind> kind) {
    std::string query = "name = '" + escape_query_literal(name) + "' and " + children_query(parent_id);
    if (kind == NodeKind::Folder) {
        query += std::string(" and mimeType = '") + kFolderMimeType + "'";
    } else if (kind == NodeKind::File) {
        query += std::string(" and mimeType != '") + kFolderMimeType + "'";
    }
    return query;
}

std::string list_children_target(const std::string& parent_id,
                                 const std::optional<std::string>& page_token,
                                 std::size_t page_size) {
    auto target = std::string(kFilesPath)
        + "?q=" + url_encode(children_query(parent_id))
        + "&fields=" + url_encode(std::string("nextPageToken,files(") + kNodeFields + ")")
        + "&orderBy=" + url_encode("createdTime")
        + "&pageSize=" + std::to_string(page_size)
        + "&supportsAllDrives=true&includeItemsFromAllDrives=true";
    if (page_token) {
        target += "&pageToken=" + url_encode(*page_token);
    }
    return target;
}

std::string find_by_name_target(const std::string& parent_id, const std::string& name, std::optional<NodeKind> kind) {
    return std::string(kFilesPath)
        + "?q=" + url_encode(name_query(parent_id, name, kind))
        + "&fields=" + url_encode(std::string("files(") + kNodeFields + ")")
        + "&orderBy=" + url_encode("createdTime desc")
        + "&pageSize=1&supportsAllDrives=true&includeItemsFromAllDrives=true";
}

} // namespace drive

DriveRestService::DriveRestService(std::string access_token, DriveConfig config)
    : access_token_(std::move(access_token)),
      config_(std::move(config)),
      client_(config_.host, config_.port) {
    if (config_.page_size == 0 || config_.page_size > kMaxPageSize) {
        config_.page_size = kMaxPageSize;
    }
}

RemoteResult<std::string> DriveRestService::call(http::verb method,
                                                 const std::string& target,
                                                 const std::optional<nlohmann::json>& body) {
    std::optional<std::string> payload;
    if (body) {
        payload = body->dump();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = client_.send(method, target, access_token_, payload);
    if (reply.is_error()) {
        return dsync::Err(reply.error());
    }
    if (reply.value().status < 200 || reply.value().status >= 300) {
        auto error = drive::classify_status(reply.value().status, reply.value().body);
        spdlog::debug("{} {} -> {}", std::string(http::to_string(method)), target, error.describe());
        return dsync::Err(std::move(error));
    }
    return dsync::Ok(std::move(reply.value().body));
}

RemoteResult<RemoteNode> DriveRestService::get_metadata(const std::string& id) {
    const auto target = std::string(kFilesPath) + "/" + drive::url_encode(id)
        + "?supportsAllDrives=true&fields=" + drive::url_encode(kNodeFields);
    auto body = call(http::verb::get, target);
    if (body.is_error()) {
        return dsync::Err(body.error());
    }
    const auto json = nlohmann::json::parse(body.value(), nullptr, false);
    if (json.is_discarded()) {
        return dsync::Err(invalid_response("metadata is not JSON"));
    }
    return drive::parse_node(json);
}

RemoteResult<ListPage> DriveRestService::list_children(const std::string& parent_id,
                                                       const std::optional<std::string>& page_token) {
    const auto target = drive::list_children_target(parent_id, page_token, config_.page_size);

    auto body = call(http::verb::get, target);
    if (body.is_error()) {
        return dsync::Err(body.error());
    }
    return drive::parse_list_page(body.value());
}

RemoteResult<RemoteNode> DriveRestService::find_by_name(const std::string& parent_id,
                                                        const std::string& name,
                                                        std::optional<NodeKind> kind) {
    const auto target = drive::find_by_name_target(parent_id, name, kind);

    auto body = call(http::verb::get, target);
    if (body.is_error()) {
        return dsync::Err(body.error());
    }
    auto page = drive::parse_list_page(body.value());
    if (page.is_error()) {
        return dsync::Err(page.error());
    }
    if (page.value().items.empty()) {
        return dsync::Err(RemoteError::not_found("'" + name + "' in " + parent_id));
    }
    return dsync::Ok(std::move(page.value().items.front()));
}

RemoteResult<std::string> DriveRestService::create_folder(const std::string& name, const std::string& parent_id) {
    const nlohmann::json request = {
        {"name", name},
        {"mimeType", kFolderMimeType},
        {"parents", nlohmann::json::array({parent_id})}
    };
    auto body = call(http::verb::post, std::string(kFilesPath) + "?supportsAllDrives=true&fields=id", request);
    if (body.is_error()) {
        return dsync::Err(body.error());
    }
    auto node = drive::parse_node(nlohmann::json::parse(body.value(), nullptr, false));
    if (node.is_error()) {
        return dsync::Err(node.error());
    }
    return dsync::Ok(node.value().id);
}

RemoteResult<std::string> DriveRestService::copy_file(const std::string& source_id,
                                                      const std::string& dest_parent_id,
                                                      const std::string& dest_name) {
    const nlohmann::json request = {
        {"name", dest_name},
        {"parents", nlohmann::json::array({dest_parent_id})}
    };
    const auto target = std::string(kFilesPath) + "/" + drive::url_encode(source_id)
        + "/copy?supportsAllDrives=true&fields=id";
    auto body = call(http::verb::post, target, request);
    if (body.is_error()) {
        return dsync::Err(body.error());
    }
    auto node = drive::parse_node(nlohmann::json::parse(body.value(), nullptr, false));
    if (node.is_error()) {
        return dsync::Err(node.error());
    }
    return dsync::Ok(node.value().id);
}

} // namespace dsync::remote
