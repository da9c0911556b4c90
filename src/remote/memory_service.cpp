#include "dsync/remote/memory_service.hpp"

#include <algorithm>
#include <sstream>

namespace dsync::remote {
namespace {

constexpr const char* kPageTokenPrefix = "offset:";

std::string make_page_token(std::size_t offset) {
    return std::string(kPageTokenPrefix) + std::to_string(offset);
}

std::optional<std::size_t> parse_page_token(const std::string& token) {
    const std::string prefix(kPageTokenPrefix);
    if (token.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    const auto digits = token.substr(prefix.size());
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::stoull(digits));
}

} // namespace

MemoryRemoteService::MemoryRemoteService(std::size_t page_size)
    : page_size_(std::max<std::size_t>(page_size, 1)) {}

std::string MemoryRemoteService::add_root(const std::string& name) {
    std::lock_guard lock(mutex_);
    RemoteNode node;
    node.name = name;
    node.kind = NodeKind::Folder;
    node.mime_type = kFolderMimeType;
    return insert({}, std::move(node));
}

std::string MemoryRemoteService::add_folder(const std::string& parent_id, const std::string& name) {
    std::lock_guard lock(mutex_);
    RemoteNode node;
    node.name = name;
    node.kind = NodeKind::Folder;
    node.mime_type = kFolderMimeType;
    return insert(parent_id, std::move(node));
}

std::string MemoryRemoteService::add_file(const std::string& parent_id,
                                          const std::string& name,
                                          std::uint64_t size,
                                          std::optional<std::string> content_hash,
                                          std::string mime_type) {
    std::lock_guard lock(mutex_);
    RemoteNode node;
    node.name = name;
    node.kind = NodeKind::File;
    node.size = size;
    node.content_hash = std::move(content_hash);
    node.mime_type = std::move(mime_type);
    return insert(parent_id, std::move(node));
}

bool MemoryRemoteService::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    const auto parent_id = it->second.parent_id;
    if (auto parent = entries_.find(parent_id); parent != entries_.end()) {
        auto& siblings = parent->second.children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
    }
    erase_subtree(id);
    return true;
}

void MemoryRemoteService::set_page_size(std::size_t page_size) {
    std::lock_guard lock(mutex_);
    page_size_ = std::max<std::size_t>(page_size, 1);
}

void MemoryRemoteService::fail_next(Operation op, std::size_t count, RemoteError error) {
    std::lock_guard lock(mutex_);
    counted_failures_[op].push_back(CountedFailure{count, std::move(error)});
}

void MemoryRemoteService::fail_for_id(Operation op, const std::string& id, RemoteError error) {
    std::lock_guard lock(mutex_);
    id_failures_[op][id] = std::move(error);
}

void MemoryRemoteService::clear_failures() {
    std::lock_guard lock(mutex_);
    counted_failures_.clear();
    id_failures_.clear();
}

std::size_t MemoryRemoteService::call_count(Operation op) const {
    std::lock_guard lock(mutex_);
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

std::size_t MemoryRemoteService::total_calls() const {
    std::lock_guard lock(mutex_);
    std::size_t total = 0;
    for (const auto& [_, count] : calls_) {
        total += count;
    }
    return total;
}

void MemoryRemoteService::reset_call_counts() {
    std::lock_guard lock(mutex_);
    calls_.clear();
}

std::optional<RemoteNode> MemoryRemoteService::node(const std::string& id) const {
    std::lock_guard lock(mutex_);
    if (const auto* entry = find_entry(id)) {
        return entry->node;
    }
    return std::nullopt;
}

std::vector<RemoteNode> MemoryRemoteService::children(const std::string& parent_id) const {
    std::lock_guard lock(mutex_);
    std::vector<RemoteNode> result;
    if (const auto* entry = find_entry(parent_id)) {
        for (const auto& child_id : entry->children) {
            result.push_back(entries_.at(child_id).node);
        }
    }
    return result;
}

std::optional<std::string> MemoryRemoteService::resolve_path(const std::string& root_id,
                                                             const std::string& path) const {
    std::lock_guard lock(mutex_);
    std::string current = root_id;
    if (!find_entry(current)) {
        return std::nullopt;
    }

    std::istringstream segments(path);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty()) {
            continue;
        }
        const auto* entry = find_entry(current);
        auto it = std::find_if(entry->children.begin(), entry->children.end(),
            [&](const std::string& child_id) { return entries_.at(child_id).node.name == segment; });
        if (it == entry->children.end()) {
            return std::nullopt;
        }
        current = *it;
    }
    return current;
}

RemoteResult<RemoteNode> MemoryRemoteService::get_metadata(const std::string& id) {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure(Operation::GetMetadata, id)) {
        return dsync::Err(*failure);
    }
    const auto* entry = find_entry(id);
    if (!entry) {
        return dsync::Err(RemoteError::not_found(id));
    }
    return dsync::Ok(entry->node);
}

RemoteResult<ListPage> MemoryRemoteService::list_children(const std::string& parent_id,
                                                          const std::optional<std::string>& page_token) {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure(Operation::ListChildren, parent_id)) {
        return dsync::Err(*failure);
    }
    const auto* entry = find_entry(parent_id);
    if (!entry) {
        return dsync::Err(RemoteError::not_found(parent_id));
    }
    if (!entry->node.is_folder()) {
        return dsync::Err(RemoteError::permanent(400, "invalidArgument", "Not a folder: " + parent_id));
    }

    std::size_t offset = 0;
    if (page_token) {
        auto parsed = parse_page_token(*page_token);
        if (!parsed) {
            return dsync::Err(RemoteError::permanent(400, "invalidPageToken", "Invalid page token: " + *page_token));
        }
        offset = *parsed;
    }

    ListPage page;
    const auto end = std::min(entry->children.size(), offset + page_size_);
    for (std::size_t i = offset; i < end; ++i) {
        page.items.push_back(entries_.at(entry->children[i]).node);
    }
    if (end < entry->children.size()) {
        page.next_page_token = make_page_token(end);
    }
    return dsync::Ok(std::move(page));
}

RemoteResult<RemoteNode> MemoryRemoteService::find_by_name(const std::string& parent_id,
                                                           const std::string& name,
                                                           std::optional<NodeKind> kind) {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure(Operation::FindByName, parent_id)) {
        return dsync::Err(*failure);
    }
    const auto* entry = find_entry(parent_id);
    if (!entry) {
        return dsync::Err(RemoteError::not_found(parent_id));
    }
    // Newest same-named sibling wins, matching the listing order
    for (auto it = entry->children.rbegin(); it != entry->children.rend(); ++it) {
        const auto& child = entries_.at(*it).node;
        if (child.name == name && (!kind || child.kind == *kind)) {
            return dsync::Ok(child);
        }
    }
    return dsync::Err(RemoteError::not_found(name + " in " + parent_id));
}

RemoteResult<std::string> MemoryRemoteService::create_folder(const std::string& name,
                                                             const std::string& parent_id) {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure(Operation::CreateFolder, parent_id)) {
        return dsync::Err(*failure);
    }
    const auto* parent = find_entry(parent_id);
    if (!parent) {
        return dsync::Err(RemoteError::not_found(parent_id));
    }
    if (!parent->node.is_folder()) {
        return dsync::Err(RemoteError::permanent(400, "invalidArgument", "Parent is not a folder: " + parent_id));
    }
    RemoteNode node;
    node.name = name;
    node.kind = NodeKind::Folder;
    node.mime_type = kFolderMimeType;
    return dsync::Ok(insert(parent_id, std::move(node)));
}

RemoteResult<std::string> MemoryRemoteService::copy_file(const std::string& source_id,
                                                         const std::string& dest_parent_id,
                                                         const std::string& dest_name) {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure(Operation::CopyFile, source_id)) {
        return dsync::Err(*failure);
    }
    const auto* source = find_entry(source_id);
    if (!source) {
        return dsync::Err(RemoteError::not_found(source_id));
    }
    if (source->node.is_folder()) {
        return dsync::Err(RemoteError::permanent(400, "invalidArgument", "Cannot copy a folder: " + source_id));
    }
    const auto* parent = find_entry(dest_parent_id);
    if (!parent) {
        return dsync::Err(RemoteError::not_found(dest_parent_id));
    }
    if (!parent->node.is_folder()) {
        return dsync::Err(RemoteError::permanent(400, "invalidArgument", "Parent is not a folder: " + dest_parent_id));
    }

    RemoteNode copy = source->node;
    copy.name = dest_name;
    return dsync::Ok(insert(dest_parent_id, std::move(copy)));
}

std::optional<RemoteError> MemoryRemoteService::take_failure(Operation op, const std::string& id) {
    ++calls_[op];

    if (auto by_op = id_failures_.find(op); by_op != id_failures_.end()) {
        if (auto it = by_op->second.find(id); it != by_op->second.end()) {
            return it->second;
        }
    }

    auto queue = counted_failures_.find(op);
    if (queue == counted_failures_.end() || queue->second.empty()) {
        return std::nullopt;
    }
    auto& front = queue->second.front();
    RemoteError error = front.error;
    if (--front.remaining == 0) {
        queue->second.pop_front();
    }
    return error;
}

std::string MemoryRemoteService::insert(const std::string& parent_id, RemoteNode node) {
    const auto id = "node-" + std::to_string(next_id_++);
    node.id = id;
    if (!parent_id.empty()) {
        if (auto parent = entries_.find(parent_id); parent != entries_.end()) {
            parent->second.children.push_back(id);
        }
    }
    entries_.emplace(id, Entry{std::move(node), parent_id, {}});
    return id;
}

void MemoryRemoteService::erase_subtree(const std::string& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return;
    }
    const auto children = it->second.children;
    for (const auto& child_id : children) {
        erase_subtree(child_id);
    }
    entries_.erase(id);
}

const MemoryRemoteService::Entry* MemoryRemoteService::find_entry(const std::string& id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

const char* to_string(MemoryRemoteService::Operation op) {
    switch (op) {
        case MemoryRemoteService::Operation::GetMetadata: return "get_metadata";
        case MemoryRemoteService::Operation::ListChildren: return "list_children";
        case MemoryRemoteService::Operation::FindByName: return "find_by_name";
        case MemoryRemoteService::Operation::CreateFolder: return "create_folder";
        case MemoryRemoteService::Operation::CopyFile: return "copy_file";
    }
    return "unknown";
}

} // namespace dsync::remote
