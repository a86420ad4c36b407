#pragma once

#include "database/database_access_queue.hpp"
#include "core/media_record.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sqlite3.h>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    int rows_affected;
    DBOpResult(bool s = true, const std::string &msg = "", int rows = 0)
        : success(s), error_message(msg), rows_affected(rows) {}
};

/**
 * @brief Durable, path-deduplicated store of indexed media files.
 *
 * Backed by one SQLite table keyed by file path. The sqlite handle is
 * owned by the store and only touched from its access thread, so every
 * public method may be called from any thread.
 */
class MetadataStore
{
public:
    /**
     * @brief Open (creating if needed) the database and its schema
     * @param db_path Path of the SQLite file
     * @param busy_timeout_ms SQLite busy timeout
     */
    explicit MetadataStore(const std::string &db_path, int busy_timeout_ms = 30000);
    ~MetadataStore();

    MetadataStore(const MetadataStore &) = delete;
    MetadataStore &operator=(const MetadataStore &) = delete;

    bool isOpen() const { return open_.load(); }
    const std::string &path() const { return db_path_; }

    /**
     * @brief Insert a record unless its path is already stored.
     *
     * A duplicate path is not an error: the call succeeds with
     * rows_affected == 0 and the stored record is left untouched. The
     * record is durable once this returns successfully.
     * @return DBOpResult with rows_affected 1 for a new path, 0 for a duplicate
     */
    DBOpResult upsert(const MediaRecord &record);

    /**
     * @brief All records, oldest discovery first
     */
    std::vector<MediaRecord> loadAll();

    std::optional<MediaRecord> get(const std::string &file_path);

    /**
     * @brief Like get(), but tells a missing path apart from a failed query
     * @return DBOpResult with success false if the store could not be read;
     * on success the record, or nullopt when the path is not stored
     */
    std::pair<DBOpResult, std::optional<MediaRecord>> lookup(const std::string &file_path);
    bool exists(const std::string &file_path);
    size_t count();
    std::map<MediaType, size_t> countByType();

    /**
     * @brief Records whose path lies under folder (at any depth)
     */
    std::vector<MediaRecord> getByFolder(const std::string &folder);

    /**
     * @brief Sorted distinct parent directories of all stored files
     */
    std::vector<std::string> folders();

    /**
     * @brief Delete every record under folder
     * @return DBOpResult with the number of deleted rows
     */
    DBOpResult removeInFolder(const std::string &folder);

    // Reclaim free pages (VACUUM)
    DBOpResult optimize();

    uint64_t databaseSizeBytes() const;

    // Wait for all queued operations to finish
    void waitForWrites();

private:
    void initialize();
    DBOpResult executeStatement(const std::string &sql);
    DBOpResult runWrite(WriteOperation operation);
    std::vector<MediaRecord> queryRecords(const std::string &sql, const std::vector<std::string> &params);
    std::pair<DBOpResult, std::vector<MediaRecord>> tryQueryRecords(const std::string &sql,
                                                                   const std::vector<std::string> &params);

    static MediaRecord readRecord(sqlite3_stmt *stmt);
    static std::pair<std::string, std::string> folderRange(const std::string &folder);

    sqlite3 *db_;
    std::string db_path_;
    int busy_timeout_ms_;
    std::atomic<bool> open_{false};
    std::unique_ptr<DatabaseAccessQueue> access_queue_;
};
