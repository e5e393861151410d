#include "drive/metadata_store.hpp"

#include "drive/errors.hpp"

#include <fmt/format.h>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace tgdrive {

namespace {

// Helper to execute SQL with error handling
void exec_sql(sqlite3* db, const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "Unknown error";
        sqlite3_free(err_msg);
        throw DatabaseException("Failed to execute SQL: " + error);
    }
}

/// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw DatabaseException(fmt::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    // Disable copy
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind(int index, int64_t value) { sqlite3_bind_int64(stmt_, index, value); }

    void bind(int index, const std::optional<std::string>& value) {
        if (value) {
            bind(index, *value);
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    void bind(int index, Timestamp value) { bind(index, to_unix_millis(value)); }

    /// @return true while rows are available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw DatabaseException(sqlite3_errmsg(db_));
    }

    /// Execute a statement that must not violate a constraint
    void run(const char* what) {
        if (sqlite3_step(stmt_) != SQLITE_DONE) {
            throw DatabaseException(fmt::format("Failed to {}: {}", what, sqlite3_errmsg(db_)));
        }
    }

    /// Execute an insert
    /// @return false on a UNIQUE/PRIMARY KEY conflict
    bool insert(const char* what) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE) {
            return true;
        }
        int extended = sqlite3_extended_errcode(db_);
        if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
            return false;
        }
        throw DatabaseException(fmt::format("Failed to {}: {}", what, sqlite3_errmsg(db_)));
    }

    std::string text(int col) const {
        const auto* value = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return value ? value : "";
    }

    std::optional<std::string> optional_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return text(col);
    }

    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

    Timestamp time(int col) const { return from_unix_millis(int64(col)); }

    std::optional<Timestamp> optional_time(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return time(col);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

/// BEGIN IMMEDIATE ... COMMIT, rolled back unless committed
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec_sql(db_, "BEGIN IMMEDIATE;"); }

    ~Transaction() {
        if (committed_) {
            return;
        }
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::warn("MetadataStore: rollback failed: {}", err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
        }
    }

    // Disable copy
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_sql(db_, "COMMIT;");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_{false};
};

constexpr const char* kItemColumns = "id, type, name, parent_id, path, size, mime_type, created_at, updated_at";

constexpr const char* kSessionColumns =
    "id, item_id, file_name, mime_type, file_size, chunk_size, total_chunks, staging, status, created_at, updated_at";

constexpr const char* kFailureColumns =
    "id, item_id, item_path, chat_id, message_id, error_message, retry_count, resolved, failed_at, last_retry_at, "
    "resolved_at";

Item read_item(const Statement& stmt) {
    Item item;
    item.id = stmt.text(0);
    item.type = item_type_from_string(stmt.text(1));
    item.name = stmt.text(2);
    item.parent_id = stmt.optional_text(3);
    item.path = stmt.text(4);
    item.size = stmt.int64(5);
    item.mime_type = stmt.optional_text(6);
    item.created_at = stmt.time(7);
    item.updated_at = stmt.time(8);
    return item;
}

// Column order: item_id, chunk_index, chunk_size, chat_id, message_id, file_id, file_unique_id, content_hash, created_at
Chunk read_chunk(const Statement& stmt) {
    Chunk chunk;
    chunk.item_id = stmt.text(0);
    chunk.chunk_index = static_cast<int>(stmt.int64(1));
    chunk.chunk_size = stmt.int64(2);
    chunk.chat_id = stmt.text(3);
    chunk.message_id = stmt.int64(4);
    chunk.file_id = stmt.text(5);
    chunk.file_unique_id = stmt.text(6);
    chunk.content_hash = stmt.optional_text(7);
    chunk.created_at = stmt.time(8);
    return chunk;
}

UploadSession read_session(const Statement& stmt) {
    UploadSession session;
    session.id = stmt.text(0);
    session.item_id = stmt.text(1);
    session.file_name = stmt.text(2);
    session.mime_type = stmt.text(3);
    session.file_size = stmt.int64(4);
    session.chunk_size = stmt.int64(5);
    session.total_chunks = static_cast<int>(stmt.int64(6));
    session.staging = staging_from_string(stmt.text(7));
    session.status = session_status_from_string(stmt.text(8));
    session.created_at = stmt.time(9);
    session.updated_at = stmt.time(10);
    return session;
}

DeleteFailureRecord read_failure(const Statement& stmt) {
    DeleteFailureRecord record;
    record.id = stmt.int64(0);
    record.item_id = stmt.optional_text(1);
    record.item_path = stmt.text(2);
    record.chat_id = stmt.text(3);
    record.message_id = stmt.int64(4);
    record.error_message = stmt.text(5);
    record.retry_count = static_cast<int>(stmt.int64(6));
    record.resolved = stmt.int64(7) != 0;
    record.failed_at = stmt.time(8);
    record.last_retry_at = stmt.optional_time(9);
    record.resolved_at = stmt.optional_time(10);
    return record;
}

void insert_chunk(sqlite3* db, const Chunk& chunk, bool& inserted) {
    Statement stmt(db, R"(
        INSERT INTO chunks
        (item_id, chunk_index, chunk_size, chat_id, message_id, file_id, file_unique_id, content_hash, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    stmt.bind(1, chunk.item_id);
    stmt.bind(2, static_cast<int64_t>(chunk.chunk_index));
    stmt.bind(3, chunk.chunk_size);
    stmt.bind(4, chunk.chat_id);
    stmt.bind(5, chunk.message_id);
    stmt.bind(6, chunk.file_id);
    stmt.bind(7, chunk.file_unique_id);
    stmt.bind(8, chunk.content_hash);
    stmt.bind(9, chunk.created_at);
    inserted = stmt.insert("insert chunk");
}

/// Split "name.ext" into ("name", ".ext"); dotfiles have no extension
std::pair<std::string, std::string> split_extension(const std::string& name) {
    auto pos = name.find_last_of('.');
    if (pos == std::string::npos || pos == 0) {
        return {name, ""};
    }
    return {name.substr(0, pos), name.substr(pos)};
}

std::string child_path(const std::optional<Item>& parent, const std::string& name) {
    if (!parent) {
        return "/" + name;
    }
    return parent->path + "/" + name;
}

}  // namespace

MetadataStore::MetadataStore(const std::string& db_path) : db_(nullptr) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw DatabaseException("Failed to open database: " + error);
    }

    spdlog::info("Opened metadata database: {}", db_path);
    init_database();
}

MetadataStore::~MetadataStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void MetadataStore::init_database() {
    // Enable WAL mode for better concurrency
    exec_sql(db_, "PRAGMA journal_mode=WAL;");
    exec_sql(db_, "PRAGMA synchronous=NORMAL;");
    exec_sql(db_, "PRAGMA foreign_keys=ON;");
    sqlite3_busy_timeout(db_, 5000);

    create_tables();
}

void MetadataStore::create_tables() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS items (
            id TEXT PRIMARY KEY,
            type TEXT NOT NULL,
            name TEXT NOT NULL,
            parent_id TEXT REFERENCES items(id) ON DELETE CASCADE,
            path TEXT NOT NULL,
            size INTEGER NOT NULL DEFAULT 0,
            mime_type TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_items_parent_name ON items(parent_id, name);
        CREATE INDEX IF NOT EXISTS idx_items_path ON items(path);

        CREATE TABLE IF NOT EXISTS chunks (
            item_id TEXT NOT NULL REFERENCES items(id) ON DELETE CASCADE,
            chunk_index INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            chat_id TEXT NOT NULL,
            message_id INTEGER NOT NULL,
            file_id TEXT NOT NULL,
            file_unique_id TEXT NOT NULL,
            content_hash TEXT,
            created_at INTEGER NOT NULL,
            PRIMARY KEY (item_id, chunk_index)
        );

        CREATE TABLE IF NOT EXISTS upload_sessions (
            id TEXT PRIMARY KEY,
            item_id TEXT NOT NULL UNIQUE REFERENCES items(id) ON DELETE CASCADE,
            file_name TEXT NOT NULL,
            mime_type TEXT NOT NULL DEFAULT '',
            file_size INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            total_chunks INTEGER NOT NULL,
            staging TEXT NOT NULL,
            status TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_upload_sessions_updated ON upload_sessions(updated_at);

        CREATE TABLE IF NOT EXISTS delete_failures (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            item_id TEXT,
            item_path TEXT NOT NULL DEFAULT '',
            chat_id TEXT NOT NULL,
            message_id INTEGER NOT NULL,
            error_message TEXT NOT NULL,
            retry_count INTEGER NOT NULL DEFAULT 1,
            resolved INTEGER NOT NULL DEFAULT 0,
            failed_at INTEGER NOT NULL,
            last_retry_at INTEGER,
            resolved_at INTEGER,
            UNIQUE (chat_id, message_id)
        );

        CREATE INDEX IF NOT EXISTS idx_delete_failures_unresolved ON delete_failures(resolved, last_retry_at);
    )";

    exec_sql(db_, schema);
    spdlog::debug("Metadata database schema initialised");
}

//------------------------------------------------------------------------------
// Items
//------------------------------------------------------------------------------

std::optional<Item> MetadataStore::load_item(const std::string& id) {
    Statement stmt(db_, fmt::format("SELECT {} FROM items WHERE id = ?", kItemColumns).c_str());
    stmt.bind(1, id);
    if (stmt.step()) {
        return read_item(stmt);
    }
    return std::nullopt;
}

std::optional<Item> MetadataStore::get_item(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_item(id);
}

std::optional<Item> MetadataStore::find_child(const std::optional<std::string>& parent_id, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, fmt::format("SELECT {} FROM items WHERE parent_id IS ? AND name = ?", kItemColumns).c_str());
    stmt.bind(1, parent_id);
    stmt.bind(2, name);
    if (stmt.step()) {
        return read_item(stmt);
    }
    return std::nullopt;
}

Item MetadataStore::create_folder(const std::string& name, const std::optional<std::string>& parent_id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);

    std::optional<Item> parent;
    if (parent_id) {
        parent = load_item(*parent_id);
        if (!parent) {
            throw ItemNotFoundException(*parent_id);
        }
        if (!parent->is_folder()) {
            throw ValidationException("Parent is not a folder: " + parent->path);
        }
    }

    Item item;
    item.id = generate_id();
    item.type = ItemType::FOLDER;
    item.name = resolve_available_name(parent_id, name);
    item.parent_id = parent_id;
    item.path = child_path(parent, item.name);
    item.created_at = now;
    item.updated_at = now;

    Statement stmt(db_, R"(
        INSERT INTO items (id, type, name, parent_id, path, size, mime_type, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, 0, NULL, ?, ?)
    )");
    stmt.bind(1, item.id);
    stmt.bind(2, to_string(item.type));
    stmt.bind(3, item.name);
    stmt.bind(4, item.parent_id);
    stmt.bind(5, item.path);
    stmt.bind(6, now);
    stmt.bind(7, now);
    stmt.run("insert folder");

    txn.commit();
    return item;
}

int MetadataStore::delete_item_tree(const Item& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);

    std::string prefix = item.path + "/";

    Statement count(db_, "SELECT COUNT(*) FROM items WHERE id = ?1 OR substr(path, 1, length(?2)) = ?2");
    count.bind(1, item.id);
    count.bind(2, prefix);
    int removed = count.step() ? static_cast<int>(count.int64(0)) : 0;

    Statement stmt(db_, "DELETE FROM items WHERE id = ?1 OR substr(path, 1, length(?2)) = ?2");
    stmt.bind(1, item.id);
    stmt.bind(2, prefix);
    stmt.run("delete item tree");

    txn.commit();
    spdlog::debug("MetadataStore: deleted {} item(s) under {}", removed, item.path);
    return removed;
}

std::string MetadataStore::resolve_available_name(const std::optional<std::string>& parent_id, const std::string& desired) {
    auto name_taken = [&](const std::string& name) {
        Statement stmt(db_, "SELECT 1 FROM items WHERE parent_id IS ? AND name = ?");
        stmt.bind(1, parent_id);
        stmt.bind(2, name);
        return stmt.step();
    };

    if (!name_taken(desired)) {
        return desired;
    }

    auto [base, ext] = split_extension(desired);
    for (int i = 1; i < 1000; ++i) {
        auto candidate = fmt::format("{} ({}){}", base, i, ext);
        if (!name_taken(candidate)) {
            return candidate;
        }
    }
    throw ValidationException("No free name for " + desired);
}

//------------------------------------------------------------------------------
// Upload sessions
//------------------------------------------------------------------------------

void MetadataStore::create_upload(Item& item, UploadSession& session, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);

    std::optional<Item> parent;
    if (item.parent_id) {
        parent = load_item(*item.parent_id);
        if (!parent) {
            throw ItemNotFoundException(*item.parent_id);
        }
        if (!parent->is_folder()) {
            throw ValidationException("Parent is not a folder: " + parent->path);
        }
    }

    // A same-named file that is still uploading must be resumed, not shadowed
    {
        Statement stmt(db_, R"(
            SELECT i.id, s.id FROM items i
            JOIN upload_sessions s ON s.item_id = i.id
            WHERE i.parent_id IS ? AND i.name = ?
        )");
        stmt.bind(1, item.parent_id);
        stmt.bind(2, item.name);
        if (stmt.step()) {
            throw AlreadyInProgressException(stmt.text(0), stmt.text(1));
        }
    }

    item.id = generate_id();
    item.type = ItemType::FILE;
    item.name = resolve_available_name(item.parent_id, item.name);
    item.path = child_path(parent, item.name);
    item.size = 0;
    item.created_at = now;
    item.updated_at = now;

    Statement insert_item(db_, R"(
        INSERT INTO items (id, type, name, parent_id, path, size, mime_type, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, 0, ?, ?, ?)
    )");
    insert_item.bind(1, item.id);
    insert_item.bind(2, to_string(item.type));
    insert_item.bind(3, item.name);
    insert_item.bind(4, item.parent_id);
    insert_item.bind(5, item.path);
    insert_item.bind(6, item.mime_type);
    insert_item.bind(7, now);
    insert_item.bind(8, now);
    insert_item.run("insert item");

    session.id = generate_id();
    session.item_id = item.id;
    session.status = SessionStatus::PENDING;
    session.created_at = now;
    session.updated_at = now;

    Statement insert_session(db_, R"(
        INSERT INTO upload_sessions
        (id, item_id, file_name, mime_type, file_size, chunk_size, total_chunks, staging, status, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    insert_session.bind(1, session.id);
    insert_session.bind(2, session.item_id);
    insert_session.bind(3, session.file_name);
    insert_session.bind(4, session.mime_type);
    insert_session.bind(5, session.file_size);
    insert_session.bind(6, session.chunk_size);
    insert_session.bind(7, static_cast<int64_t>(session.total_chunks));
    insert_session.bind(8, to_string(session.staging));
    insert_session.bind(9, to_string(session.status));
    insert_session.bind(10, now);
    insert_session.bind(11, now);
    if (!insert_session.insert("insert upload session")) {
        throw AlreadyInProgressException(item.id, session.id);
    }

    txn.commit();
}

std::optional<UploadSession> MetadataStore::get_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, fmt::format("SELECT {} FROM upload_sessions WHERE id = ?", kSessionColumns).c_str());
    stmt.bind(1, id);
    if (stmt.step()) {
        return read_session(stmt);
    }
    return std::nullopt;
}

std::optional<UploadSession> MetadataStore::get_session_by_item(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, fmt::format("SELECT {} FROM upload_sessions WHERE item_id = ?", kSessionColumns).c_str());
    stmt.bind(1, item_id);
    if (stmt.step()) {
        return read_session(stmt);
    }
    return std::nullopt;
}

void MetadataStore::set_session_status(const std::string& id, SessionStatus status, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "UPDATE upload_sessions SET status = ?, updated_at = ? WHERE id = ?");
    stmt.bind(1, to_string(status));
    stmt.bind(2, now);
    stmt.bind(3, id);
    stmt.run("update session status");
}

bool MetadataStore::delete_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "DELETE FROM upload_sessions WHERE id = ?");
    stmt.bind(1, id);
    stmt.run("delete session");
    return sqlite3_changes(db_) > 0;
}

std::vector<UploadSession> MetadataStore::list_sessions_in_tree(const Item& item) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        SELECT s.id, s.item_id, s.file_name, s.mime_type, s.file_size, s.chunk_size, s.total_chunks, s.staging,
               s.status, s.created_at, s.updated_at
        FROM upload_sessions s JOIN items i ON i.id = s.item_id
        WHERE i.id = ?1 OR substr(i.path, 1, length(?2)) = ?2
    )");
    stmt.bind(1, item.id);
    stmt.bind(2, item.path + "/");

    std::vector<UploadSession> sessions;
    while (stmt.step()) {
        sessions.push_back(read_session(stmt));
    }
    return sessions;
}

std::vector<UploadSession> MetadataStore::delete_sessions_updated_before(Timestamp cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);

    std::vector<UploadSession> expired;
    {
        Statement stmt(db_, fmt::format("SELECT {} FROM upload_sessions WHERE updated_at < ?", kSessionColumns).c_str());
        stmt.bind(1, cutoff);
        while (stmt.step()) {
            auto session = read_session(stmt);
            session.status = SessionStatus::EXPIRED;
            expired.push_back(std::move(session));
        }
    }

    Statement stmt(db_, "DELETE FROM upload_sessions WHERE updated_at < ?");
    stmt.bind(1, cutoff);
    stmt.run("delete expired sessions");

    txn.commit();
    return expired;
}

bool MetadataStore::record_chunk(const Chunk& chunk, const std::string& session_id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);

    bool inserted = false;
    insert_chunk(db_, chunk, inserted);
    if (!inserted) {
        return false;  // Rolled back by txn
    }

    Statement stmt(db_, R"(
        UPDATE upload_sessions
        SET status = CASE WHEN status = 'pending' THEN 'uploading' ELSE status END,
            updated_at = ?
        WHERE id = ?
    )");
    stmt.bind(1, now);
    stmt.bind(2, session_id);
    stmt.run("advance session");

    txn.commit();
    return true;
}

void MetadataStore::touch_session(const std::string& id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        UPDATE upload_sessions
        SET status = CASE WHEN status = 'pending' THEN 'uploading' ELSE status END,
            updated_at = ?
        WHERE id = ?
    )");
    stmt.bind(1, now);
    stmt.bind(2, id);
    stmt.run("touch session");
}

Item MetadataStore::finalize_upload(const UploadSession& session, const std::optional<Chunk>& merged_chunk, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);

    if (merged_chunk) {
        bool inserted = false;
        insert_chunk(db_, *merged_chunk, inserted);
        if (!inserted) {
            throw DatabaseException("merged chunk already recorded for item " + session.item_id);
        }
    }

    {
        Statement stmt(db_, "UPDATE items SET size = ?, updated_at = ? WHERE id = ?");
        stmt.bind(1, session.file_size);
        stmt.bind(2, now);
        stmt.bind(3, session.item_id);
        stmt.run("finalize item size");
        if (sqlite3_changes(db_) == 0) {
            throw ItemNotFoundException(session.item_id);
        }
    }

    {
        Statement stmt(db_, "DELETE FROM upload_sessions WHERE id = ?");
        stmt.bind(1, session.id);
        stmt.run("delete completed session");
    }

    auto item = load_item(session.item_id);
    txn.commit();
    return *item;
}

//------------------------------------------------------------------------------
// Chunks
//------------------------------------------------------------------------------

std::vector<Chunk> MetadataStore::list_chunks(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        SELECT item_id, chunk_index, chunk_size, chat_id, message_id, file_id, file_unique_id, content_hash, created_at
        FROM chunks WHERE item_id = ? ORDER BY chunk_index ASC
    )");
    stmt.bind(1, item_id);

    std::vector<Chunk> chunks;
    while (stmt.step()) {
        chunks.push_back(read_chunk(stmt));
    }
    return chunks;
}

std::optional<Chunk> MetadataStore::get_chunk(const std::string& item_id, int chunk_index) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        SELECT item_id, chunk_index, chunk_size, chat_id, message_id, file_id, file_unique_id, content_hash, created_at
        FROM chunks WHERE item_id = ? AND chunk_index = ?
    )");
    stmt.bind(1, item_id);
    stmt.bind(2, static_cast<int64_t>(chunk_index));
    if (stmt.step()) {
        return read_chunk(stmt);
    }
    return std::nullopt;
}

std::vector<OwnedChunk> MetadataStore::list_chunks_in_tree(const Item& item) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        SELECT c.item_id, c.chunk_index, c.chunk_size, c.chat_id, c.message_id, c.file_id, c.file_unique_id,
               c.content_hash, c.created_at, i.path
        FROM chunks c JOIN items i ON i.id = c.item_id
        WHERE i.id = ?1 OR substr(i.path, 1, length(?2)) = ?2
        ORDER BY i.path ASC, c.chunk_index ASC
    )");
    stmt.bind(1, item.id);
    stmt.bind(2, item.path + "/");

    std::vector<OwnedChunk> chunks;
    while (stmt.step()) {
        chunks.push_back(OwnedChunk{read_chunk(stmt), stmt.text(9)});
    }
    return chunks;
}

//------------------------------------------------------------------------------
// Delete failures
//------------------------------------------------------------------------------

void MetadataStore::upsert_delete_failure(const DeleteFailureReport& report, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        INSERT INTO delete_failures
        (item_id, item_path, chat_id, message_id, error_message, retry_count, resolved, failed_at, last_retry_at)
        VALUES (?1, ?2, ?3, ?4, ?5, 1, 0, ?6, ?6)
        ON CONFLICT (chat_id, message_id) DO UPDATE SET
            item_id = COALESCE(excluded.item_id, delete_failures.item_id),
            item_path = CASE WHEN excluded.item_path = '' THEN delete_failures.item_path ELSE excluded.item_path END,
            error_message = excluded.error_message,
            retry_count = delete_failures.retry_count + 1,
            resolved = 0,
            resolved_at = NULL,
            last_retry_at = excluded.last_retry_at
    )");
    stmt.bind(1, report.item_id);
    stmt.bind(2, report.item_path);
    stmt.bind(3, report.chat_id);
    stmt.bind(4, report.message_id);
    stmt.bind(5, report.error_message);
    stmt.bind(6, now);
    stmt.run("record delete failure");
}

std::vector<DeleteFailureRecord> MetadataStore::list_unresolved_delete_failures() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(
        db_,
        fmt::format(
            "SELECT {} FROM delete_failures WHERE resolved = 0 ORDER BY COALESCE(last_retry_at, failed_at) ASC, id ASC",
            kFailureColumns
        )
            .c_str()
    );

    std::vector<DeleteFailureRecord> records;
    while (stmt.step()) {
        records.push_back(read_failure(stmt));
    }
    return records;
}

std::optional<DeleteFailureRecord> MetadataStore::get_delete_failure(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, fmt::format("SELECT {} FROM delete_failures WHERE id = ?", kFailureColumns).c_str());
    stmt.bind(1, id);
    if (stmt.step()) {
        return read_failure(stmt);
    }
    return std::nullopt;
}

std::optional<DeleteFailureRecord> MetadataStore::find_delete_failure(const std::string& chat_id, int64_t message_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(
        db_, fmt::format("SELECT {} FROM delete_failures WHERE chat_id = ? AND message_id = ?", kFailureColumns).c_str()
    );
    stmt.bind(1, chat_id);
    stmt.bind(2, message_id);
    if (stmt.step()) {
        return read_failure(stmt);
    }
    return std::nullopt;
}

bool MetadataStore::mark_delete_failure_resolved(int64_t id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        UPDATE delete_failures
        SET resolved = 1, resolved_at = COALESCE(resolved_at, ?)
        WHERE id = ?
    )");
    stmt.bind(1, now);
    stmt.bind(2, id);
    stmt.run("resolve delete failure");
    return sqlite3_changes(db_) > 0;
}

}  // namespace tgdrive
