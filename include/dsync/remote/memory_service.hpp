#pragma once

#include "dsync/remote/service.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dsync::remote {

/**
 * @brief Thread-safe in-process remote store
 *
 * Implements the full capability contract on an in-memory tree. Besides the
 * contract it exposes seeding helpers, per-operation call counters and fault
 * injection so that retry, partial enumeration and per-item failure paths can
 * be exercised deterministically.
 */
class MemoryRemoteService : public RemoteService {
public:
    enum class Operation {
        GetMetadata,
        ListChildren,
        FindByName,
        CreateFolder,
        CopyFile
    };

    explicit MemoryRemoteService(std::size_t page_size = 100);

    // Seeding ----------------------------------------------------------------

    std::string add_root(const std::string& name);

    std::string add_folder(const std::string& parent_id, const std::string& name);

    std::string add_file(const std::string& parent_id,
                         const std::string& name,
                         std::uint64_t size,
                         std::optional<std::string> content_hash,
                         std::string mime_type = "application/octet-stream");

    /// Removes an item and its subtree; false if unknown
    bool remove(const std::string& id);

    void set_page_size(std::size_t page_size);

    // Fault injection --------------------------------------------------------

    /// The next `count` calls of `op` fail with `error`
    void fail_next(Operation op, std::size_t count, RemoteError error);

    /// Every call of `op` whose primary id argument equals `id` fails with `error`
    void fail_for_id(Operation op, const std::string& id, RemoteError error);

    void clear_failures();

    // Inspection -------------------------------------------------------------

    std::size_t call_count(Operation op) const;
    std::size_t total_calls() const;
    void reset_call_counts();

    std::optional<RemoteNode> node(const std::string& id) const;
    std::vector<RemoteNode> children(const std::string& parent_id) const;

    /// Id of the item reached by walking `path` ("a/b/c") from root_id
    std::optional<std::string> resolve_path(const std::string& root_id, const std::string& path) const;

    // RemoteService ----------------------------------------------------------

    RemoteResult<RemoteNode> get_metadata(const std::string& id) override;

    RemoteResult<ListPage> list_children(const std::string& parent_id,
                                         const std::optional<std::string>& page_token) override;

    RemoteResult<RemoteNode> find_by_name(const std::string& parent_id,
                                          const std::string& name,
                                          std::optional<NodeKind> kind) override;

    RemoteResult<std::string> create_folder(const std::string& name,
                                            const std::string& parent_id) override;

    RemoteResult<std::string> copy_file(const std::string& source_id,
                                        const std::string& dest_parent_id,
                                        const std::string& dest_name) override;

private:
    struct Entry {
        RemoteNode node;
        std::string parent_id;
        std::vector<std::string> children; ///< Insertion order
    };

    struct CountedFailure {
        std::size_t remaining = 0;
        RemoteError error;
    };

    std::optional<RemoteError> take_failure(Operation op, const std::string& id);
    std::string insert(const std::string& parent_id, RemoteNode node);
    void erase_subtree(const std::string& id);
    const Entry* find_entry(const std::string& id) const;

    mutable std::mutex mutex_;
    std::size_t page_size_;
    std::uint64_t next_id_ = 1;
    std::unordered_map<std::string, Entry> entries_;

    std::map<Operation, std::deque<CountedFailure>> counted_failures_;
    std::map<Operation, std::unordered_map<std::string, RemoteError>> id_failures_;
    std::map<Operation, std::size_t> calls_;
};

const char* to_string(MemoryRemoteService::Operation op);

} // namespace dsync::remote
