//
// format_cache.h
// rpyfmt - SQLite-Based Format Cache
//
// Remembers, per file, the content of the last run that left it fully
// formatted, so unchanged files can be skipped without calling the engine.
// An entry is only valid for the options fingerprint it was recorded with.
//

#ifndef RPYFMT_FORMAT_CACHE_H
#define RPYFMT_FORMAT_CACHE_H

#include <string>
#include <sqlite3.h>

namespace RpyFmt {

class FormatCache {
public:
    FormatCache();
    ~FormatCache();

    // sqlite3* is not copyable
    FormatCache(const FormatCache&) = delete;
    FormatCache& operator=(const FormatCache&) = delete;

    // =========================================================================
    // Database Lifecycle
    // =========================================================================

    /// Open the cache database, creating it (and its directory) if needed.
    /// A database with another schema version is rebuilt.
    bool open(const std::string& dbPath);

    void close();
    bool isOpen() const;
    std::string getDatabasePath() const;

    /// $XDG_CACHE_HOME/rpyfmt/cache.db, or ~/.cache/rpyfmt/cache.db
    static std::string getDefaultDatabasePath();

    // =========================================================================
    // Entries
    // =========================================================================

    /// The file was recorded clean with this content and fingerprint
    bool isUnchanged(const std::string& path, const std::string& content,
                     const std::string& fingerprint);

    /// Record that path now holds fully formatted content
    bool recordClean(const std::string& path, const std::string& content,
                     const std::string& fingerprint);

    /// Drop the entry for path
    bool forget(const std::string& path);

    int getEntryCount();

    /// 64-bit FNV-1a of the content, as 16 hex digits
    static std::string contentHash(const std::string& content);

    // =========================================================================
    // Error Handling
    // =========================================================================

    std::string getLastError() const;
    bool hasError() const;

private:
    sqlite3* m_db;
    bool m_isOpen;
    std::string m_dbPath;
    std::string m_lastError;

    bool createSchema();
    bool dropAllTables();
    bool schemaExists();
    std::string getDatabaseSchemaVersion();

    /// Cache key for a file path (absolute when it can be resolved)
    static std::string normalizePath(const std::string& path);

    void setError(const std::string& message);
    void clearError();

    bool execute(const std::string& sql);
    sqlite3_stmt* prepareStatement(const std::string& sql);
    void finalizeStatement(sqlite3_stmt* stmt);
    bool bindText(sqlite3_stmt* stmt, int index, const std::string& value);
    bool bindInt64(sqlite3_stmt* stmt, int index, long long value);
};

} // namespace RpyFmt

#endif // RPYFMT_FORMAT_CACHE_H
