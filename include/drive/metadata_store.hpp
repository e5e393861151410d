#pragma once

#include "drive/types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace tgdrive {

/// Fields of a delete failure reported by a deletion flow
struct DeleteFailureReport {
    std::optional<std::string> item_id;
    std::string item_path;
    std::string chat_id;
    int64_t message_id{0};
    std::string error_message;
};

/// SQLite store for items, chunks, upload sessions and delete failures
///
/// All methods are thread-safe. Multi-row changes run inside one
/// transaction. Chunks and sessions cascade when their item is deleted.
class MetadataStore {
public:
    explicit MetadataStore(const std::string& db_path);
    ~MetadataStore();

    // Disable copy
    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // Items
    Item create_folder(const std::string& name, const std::optional<std::string>& parent_id, Timestamp now);
    std::optional<Item> get_item(const std::string& id);
    std::optional<Item> find_child(const std::optional<std::string>& parent_id, const std::string& name);

    /// Delete an item and every item below its path
    /// @return Number of item rows removed
    int delete_item_tree(const Item& item);

    // Upload sessions

    /// Insert a placeholder file item and its session in one transaction
    ///
    /// `item` must carry name, parent_id and mime_type. Its id, path and
    /// timestamps are filled in. A name already used by a finished file gets a
    /// " (n)" suffix before the extension.
    /// @throws AlreadyInProgressException when the name belongs to an item with an open session
    void create_upload(Item& item, UploadSession& session, Timestamp now);

    std::optional<UploadSession> get_session(const std::string& id);
    std::optional<UploadSession> get_session_by_item(const std::string& item_id);
    void set_session_status(const std::string& id, SessionStatus status, Timestamp now);
    bool delete_session(const std::string& id);

    /// Open sessions of an item and of every item below its path
    std::vector<UploadSession> list_sessions_in_tree(const Item& item);

    /// Remove sessions last touched before `cutoff`
    /// @return The removed sessions, status set to EXPIRED
    std::vector<UploadSession> delete_sessions_updated_before(Timestamp cutoff);

    /// Persist an accepted chunk and advance its session in one transaction
    /// @return false if a chunk with the same (item, index) already exists
    bool record_chunk(const Chunk& chunk, const std::string& session_id, Timestamp now);

    /// Mark a staged (not yet sent) chunk as accepted on the session
    void touch_session(const std::string& id, Timestamp now);

    /// Set the item size, optionally insert a merged chunk, delete the session
    Item finalize_upload(const UploadSession& session, const std::optional<Chunk>& merged_chunk, Timestamp now);

    // Chunks
    std::vector<Chunk> list_chunks(const std::string& item_id);
    std::optional<Chunk> get_chunk(const std::string& item_id, int chunk_index);

    /// Chunks of an item and of every item below its path
    std::vector<OwnedChunk> list_chunks_in_tree(const Item& item);

    // Delete failures

    /// Insert, or on (chat_id, message_id) conflict bump retry_count and refresh the error
    void upsert_delete_failure(const DeleteFailureReport& report, Timestamp now);

    /// Unresolved records, least recently tried first
    std::vector<DeleteFailureRecord> list_unresolved_delete_failures();
    std::optional<DeleteFailureRecord> get_delete_failure(int64_t id);
    std::optional<DeleteFailureRecord> find_delete_failure(const std::string& chat_id, int64_t message_id);

    /// @return false if no record has this id
    bool mark_delete_failure_resolved(int64_t id, Timestamp now);

private:
    void init_database();
    void create_tables();

    /// Pick a free name among the siblings (caller holds mutex_)
    std::string resolve_available_name(const std::optional<std::string>& parent_id, const std::string& desired);

    /// Load an item (caller holds mutex_)
    std::optional<Item> load_item(const std::string& id);

    sqlite3* db_;
    std::mutex mutex_;
};

}  // namespace tgdrive
