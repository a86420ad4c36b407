#include "database/metadata_store.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <stdexcept>

MetadataStore::MetadataStore(const std::string &db_path, int busy_timeout_ms)
    : db_(nullptr), db_path_(db_path), busy_timeout_ms_(busy_timeout_ms)
{
    Logger::info("Opening metadata store: " + db_path);
    access_queue_ = std::make_unique<DatabaseAccessQueue>(*this);

    auto open_future = access_queue_->enqueueRead([](MetadataStore &store)
                                                  {
        int rc = sqlite3_open(store.db_path_.c_str(), &store.db_);
        if (rc != SQLITE_OK)
        {
            Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(store.db_)));
            sqlite3_close(store.db_);
            store.db_ = nullptr;
            return std::any(false);
        }

        sqlite3_busy_timeout(store.db_, store.busy_timeout_ms_);

        rc = sqlite3_exec(store.db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(store.db_)));
        }
        sqlite3_exec(store.db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
        sqlite3_exec(store.db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);
        return std::any(true); });

    bool open_success = false;
    try
    {
        open_success = std::any_cast<bool>(open_future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Database open failed: " + std::string(e.what()));
    }

    if (!open_success)
    {
        return;
    }

    open_ = true;
    initialize();
}

MetadataStore::~MetadataStore()
{
    if (!access_queue_)
        return;

    auto close_future = access_queue_->enqueueRead([](MetadataStore &store)
                                                   {
        if (store.db_)
        {
            sqlite3_close(store.db_);
            store.db_ = nullptr;
            Logger::info("Database connection closed");
        }
        return std::any(true); });
    try
    {
        close_future.get();
    }
    catch (const std::exception &e)
    {
        Logger::error("Error closing database: " + std::string(e.what()));
    }
    access_queue_->stop();
    access_queue_.reset();
}

void MetadataStore::initialize()
{
    const std::string table_sql = R"(
        CREATE TABLE IF NOT EXISTS media_files (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            file_path TEXT NOT NULL UNIQUE,
            filename TEXT NOT NULL,
            extension TEXT NOT NULL,
            file_type TEXT NOT NULL,
            discovered_at INTEGER NOT NULL,
            file_size INTEGER,
            date_modified INTEGER
        )
    )";
    auto result = executeStatement(table_sql);
    if (!result.success)
    {
        Logger::error("Failed to create media_files table: " + result.error_message);
        open_ = false;
        return;
    }

    result = executeStatement("CREATE INDEX IF NOT EXISTS idx_media_files_discovered ON media_files(discovered_at, id)");
    if (!result.success)
    {
        Logger::warn("Failed to create discovered_at index: " + result.error_message);
    }
    Logger::info("Metadata store ready: " + db_path_);
}

DBOpResult MetadataStore::runWrite(WriteOperation operation)
{
    if (!isOpen())
    {
        return DBOpResult(false, "Database not open: " + db_path_);
    }

    WriteOperationResult result = access_queue_->enqueueWrite(std::move(operation)).get();
    return DBOpResult(result.success, result.error_message, result.rows_affected);
}

DBOpResult MetadataStore::executeStatement(const std::string &sql)
{
    return runWrite([sql](MetadataStore &store)
                    {
        char *err_msg = nullptr;
        int rc = sqlite3_exec(store.db_, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK)
        {
            std::string error = err_msg ? err_msg : sqlite3_errmsg(store.db_);
            sqlite3_free(err_msg);
            return WriteOperationResult::Failure(error);
        }
        return WriteOperationResult::Success(sqlite3_changes(store.db_)); });
}

DBOpResult MetadataStore::upsert(const MediaRecord &record)
{
    if (record.path.empty())
    {
        return DBOpResult(false, "Cannot store a record without a path");
    }

    auto result = runWrite([record](MetadataStore &store)
                           {
        const std::string insert_sql = R"(
            INSERT OR IGNORE INTO media_files
                (file_path, filename, extension, file_type, discovered_at, file_size, date_modified)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, insert_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure("Failed to prepare insert: " + std::string(sqlite3_errmsg(store.db_)));
        }

        const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
        const std::string type_name = MediaTypes::getTypeName(record.type);

        sqlite3_bind_text(stmt, 1, record.path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, record.filename.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, record.extension.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, type_name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(now_ms));
        sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(record.file_size));
        sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(record.modified_at));

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return WriteOperationResult::Failure("Failed to insert " + record.path + ": " + sqlite3_errmsg(store.db_));
        }
        return WriteOperationResult::Success(sqlite3_changes(store.db_)); });

    if (!result.success)
    {
        Logger::error(result.error_message);
    }
    else if (result.rows_affected > 0)
    {
        Logger::debug("Stored new media file: " + record.path);
    }
    return result;
}

MediaRecord MetadataStore::readRecord(sqlite3_stmt *stmt)
{
    auto text = [stmt](int column)
    {
        const unsigned char *value = sqlite3_column_text(stmt, column);
        return value ? std::string(reinterpret_cast<const char *>(value)) : std::string();
    };

    MediaRecord record;
    record.path = text(0);
    record.filename = text(1);
    record.extension = text(2);
    record.type = MediaTypes::fromString(text(3));
    record.discovered_at_ms = sqlite3_column_int64(stmt, 4);
    record.file_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    record.modified_at = sqlite3_column_int64(stmt, 6);
    return record;
}

std::pair<DBOpResult, std::vector<MediaRecord>> MetadataStore::tryQueryRecords(const std::string &sql,
                                                                                const std::vector<std::string> &params)
{
    if (!isOpen())
    {
        return {DBOpResult(false, "Database not open: " + db_path_), {}};
    }

    auto future = access_queue_->enqueueRead([sql, params](MetadataStore &store)
                                             {
        std::vector<MediaRecord> records;
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            throw std::runtime_error("Failed to prepare query: " + std::string(sqlite3_errmsg(store.db_)));
        }
        for (size_t i = 0; i < params.size(); ++i)
        {
            sqlite3_bind_text(stmt, static_cast<int>(i + 1), params[i].c_str(), -1, SQLITE_TRANSIENT);
        }

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            records.push_back(readRecord(stmt));
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw std::runtime_error("Query failed: " + std::string(sqlite3_errmsg(store.db_)));
        }
        return std::any(std::move(records)); });

    try
    {
        return {DBOpResult(true), std::any_cast<std::vector<MediaRecord>>(future.get())};
    }
    catch (const std::exception &e)
    {
        return {DBOpResult(false, e.what()), {}};
    }
}

std::vector<MediaRecord> MetadataStore::queryRecords(const std::string &sql, const std::vector<std::string> &params)
{
    auto result = tryQueryRecords(sql, params);
    if (!result.first.success && isOpen())
    {
        Logger::error("Error reading media records: " + result.first.error_message);
    }
    return std::move(result.second);
}

namespace
{
    const char *kRecordColumns = "file_path, filename, extension, file_type, discovered_at, file_size, date_modified";
}

std::vector<MediaRecord> MetadataStore::loadAll()
{
    return queryRecords(std::string("SELECT ") + kRecordColumns +
                            " FROM media_files ORDER BY discovered_at ASC, id ASC",
                        {});
}

std::optional<MediaRecord> MetadataStore::get(const std::string &file_path)
{
    auto result = lookup(file_path);
    if (!result.first.success && isOpen())
    {
        Logger::error("Error reading " + file_path + ": " + result.first.error_message);
    }
    return result.second;
}

std::pair<DBOpResult, std::optional<MediaRecord>> MetadataStore::lookup(const std::string &file_path)
{
    auto result = tryQueryRecords(std::string("SELECT ") + kRecordColumns +
                                      " FROM media_files WHERE file_path = ?",
                                  {file_path});
    if (!result.first.success || result.second.empty())
    {
        return {result.first, std::nullopt};
    }
    return {result.first, result.second.front()};
}

bool MetadataStore::exists(const std::string &file_path)
{
    return get(file_path).has_value();
}

size_t MetadataStore::count()
{
    size_t total = 0;
    for (const auto &entry : countByType())
    {
        total += entry.second;
    }
    return total;
}

std::map<MediaType, size_t> MetadataStore::countByType()
{
    if (!isOpen())
    {
        return {};
    }

    auto future = access_queue_->enqueueRead([](MetadataStore &store)
                                             {
        std::map<MediaType, size_t> counts;
        const std::string sql = "SELECT file_type, COUNT(*) FROM media_files GROUP BY file_type";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            throw std::runtime_error("Failed to prepare count: " + std::string(sqlite3_errmsg(store.db_)));
        }
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            const unsigned char *type = sqlite3_column_text(stmt, 0);
            MediaType media_type = MediaTypes::fromString(type ? reinterpret_cast<const char *>(type) : "");
            counts[media_type] += static_cast<size_t>(sqlite3_column_int64(stmt, 1));
        }
        sqlite3_finalize(stmt);
        return std::any(std::move(counts)); });

    try
    {
        return std::any_cast<std::map<MediaType, size_t>>(future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Error counting media records: " + std::string(e.what()));
        return {};
    }
}

std::pair<std::string, std::string> MetadataStore::folderRange(const std::string &folder)
{
    // Paths under the folder sort between "<folder>/" and "<folder>0" ('0' follows '/')
    std::string prefix = FileUtils::normalizeFolder(folder);
    if (prefix == "/")
    {
        return {"/", "0"};
    }
    return {prefix + "/", prefix + "0"};
}

std::vector<MediaRecord> MetadataStore::getByFolder(const std::string &folder)
{
    auto range = folderRange(folder);
    return queryRecords(std::string("SELECT ") + kRecordColumns +
                            " FROM media_files WHERE file_path >= ? AND file_path < ?"
                            " ORDER BY discovered_at ASC, id ASC",
                        {range.first, range.second});
}

std::vector<std::string> MetadataStore::folders()
{
    std::set<std::string> unique_folders;
    for (const auto &record : loadAll())
    {
        unique_folders.insert(std::filesystem::path(record.path).parent_path().string());
    }
    return std::vector<std::string>(unique_folders.begin(), unique_folders.end());
}

DBOpResult MetadataStore::removeInFolder(const std::string &folder)
{
    auto range = folderRange(folder);
    auto result = runWrite([range](MetadataStore &store)
                           {
        const std::string delete_sql = "DELETE FROM media_files WHERE file_path >= ? AND file_path < ?";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, delete_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure("Failed to prepare delete: " + std::string(sqlite3_errmsg(store.db_)));
        }
        sqlite3_bind_text(stmt, 1, range.first.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, range.second.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return WriteOperationResult::Failure("Failed to delete folder records: " + std::string(sqlite3_errmsg(store.db_)));
        }
        return WriteOperationResult::Success(sqlite3_changes(store.db_)); });

    if (result.success)
    {
        Logger::info("Removed " + std::to_string(result.rows_affected) + " records under " + folder);
    }
    else
    {
        Logger::error(result.error_message);
    }
    return result;
}

DBOpResult MetadataStore::optimize()
{
    auto result = executeStatement("VACUUM");
    if (!result.success)
    {
        Logger::error("VACUUM failed: " + result.error_message);
    }
    return result;
}

uint64_t MetadataStore::databaseSizeBytes() const
{
    std::error_code ec;
    auto size = std::filesystem::file_size(db_path_, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

void MetadataStore::waitForWrites()
{
    if (access_queue_)
    {
        access_queue_->wait_for_completion();
    }
}
