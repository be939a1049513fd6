//
// format_cache.cpp
// rpyfmt - SQLite-Based Format Cache Implementation
//

#include "format_cache.h"
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace RpyFmt {

// =============================================================================
// SQL Schema Constants
// =============================================================================

static const char* SCHEMA_VERSION = "1";

static const char* SQL_CREATE_ENTRIES = R"(
CREATE TABLE IF NOT EXISTS entries (
    path TEXT PRIMARY KEY,
    content_hash TEXT NOT NULL,
    content_size INTEGER NOT NULL,
    fingerprint TEXT NOT NULL,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
)";

static const char* SQL_CREATE_METADATA = R"(
CREATE TABLE IF NOT EXISTS metadata (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
)";

// =============================================================================
// FormatCache Implementation
// =============================================================================

FormatCache::FormatCache()
    : m_db(nullptr)
    , m_isOpen(false) {
}

FormatCache::~FormatCache() {
    close();
}

bool FormatCache::open(const std::string& dbPath) {
    if (m_isOpen) {
        close();
    }

    clearError();

    // Ensure parent directory exists
    std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            m_lastError = "Cannot create cache directory " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    int rc = sqlite3_open(dbPath.c_str(), &m_db);
    if (rc != SQLITE_OK) {
        setError("Failed to open cache database");
        sqlite3_close(m_db);
        m_db = nullptr;
        return false;
    }

    m_isOpen = true;
    m_dbPath = dbPath;

    // Several rpyfmt processes may share one cache
    sqlite3_busy_timeout(m_db, 2000);

    if (!schemaExists() || getDatabaseSchemaVersion() != SCHEMA_VERSION) {
        if (!dropAllTables() || !createSchema()) {
            std::string reason = m_lastError;
            close();
            m_lastError = "Failed to create cache schema: " + reason;
            return false;
        }
    }

    return true;
}

void FormatCache::close() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
    m_isOpen = false;
    m_dbPath.clear();
}

bool FormatCache::isOpen() const {
    return m_isOpen;
}

std::string FormatCache::getDatabasePath() const {
    return m_dbPath;
}

std::string FormatCache::getDefaultDatabasePath() {
    const char* xdg = getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/rpyfmt/cache.db";
    }
#ifdef __APPLE__
    // macOS: ~/Library/Caches/rpyfmt/cache.db
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/Library/Caches/rpyfmt/cache.db";
    }
#else
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/.cache/rpyfmt/cache.db";
    }
#endif

    // Fallback
    return "./.rpyfmt-cache.db";
}

// =============================================================================
// Schema Management
// =============================================================================

bool FormatCache::createSchema() {
    if (!execute("BEGIN TRANSACTION")) {
        return false;
    }

    if (!execute(SQL_CREATE_ENTRIES) || !execute(SQL_CREATE_METADATA)) {
        execute("ROLLBACK");
        return false;
    }

    sqlite3_stmt* stmt = prepareStatement("INSERT OR REPLACE INTO metadata (key, value) VALUES (?, ?)");
    if (!stmt) {
        execute("ROLLBACK");
        return false;
    }
    bindText(stmt, 1, "schema_version");
    bindText(stmt, 2, SCHEMA_VERSION);
    int rc = sqlite3_step(stmt);
    finalizeStatement(stmt);

    if (rc != SQLITE_DONE) {
        setError("Failed to record schema version");
        execute("ROLLBACK");
        return false;
    }

    return execute("COMMIT");
}

bool FormatCache::dropAllTables() {
    return execute("DROP TABLE IF EXISTS entries") &&
           execute("DROP TABLE IF EXISTS metadata");
}

bool FormatCache::schemaExists() {
    sqlite3_stmt* stmt = prepareStatement(
        "SELECT name FROM sqlite_master WHERE type='table' AND name='entries'");
    if (!stmt) {
        return false;
    }

    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    finalizeStatement(stmt);
    return exists;
}

std::string FormatCache::getDatabaseSchemaVersion() {
    sqlite3_stmt* stmt = prepareStatement("SELECT value FROM metadata WHERE key = 'schema_version'");
    if (!stmt) {
        return "";
    }

    std::string version;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* text = (const char*)sqlite3_column_text(stmt, 0);
        if (text) {
            version = text;
        }
    }

    finalizeStatement(stmt);
    return version;
}

// =============================================================================
// Entries
// =============================================================================

std::string FormatCache::contentHash(const std::string& content) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : content) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }

    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return oss.str();
}

std::string FormatCache::normalizePath(const std::string& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path;
    }
    return absolute.lexically_normal().string();
}

bool FormatCache::isUnchanged(const std::string& path, const std::string& content,
                              const std::string& fingerprint) {
    if (!m_isOpen) {
        return false;
    }

    sqlite3_stmt* stmt = prepareStatement(
        "SELECT content_hash, content_size, fingerprint FROM entries WHERE path = ?");
    if (!stmt) {
        return false;
    }

    bindText(stmt, 1, normalizePath(path));

    bool unchanged = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* hash = (const char*)sqlite3_column_text(stmt, 0);
        long long size = sqlite3_column_int64(stmt, 1);
        const char* recorded = (const char*)sqlite3_column_text(stmt, 2);

        unchanged = hash && recorded &&
                    size == static_cast<long long>(content.size()) &&
                    contentHash(content) == hash &&
                    fingerprint == recorded;
    }

    finalizeStatement(stmt);
    return unchanged;
}

bool FormatCache::recordClean(const std::string& path, const std::string& content,
                              const std::string& fingerprint) {
    if (!m_isOpen) {
        setError("Cache not open");
        return false;
    }

    sqlite3_stmt* stmt = prepareStatement(
        "INSERT OR REPLACE INTO entries (path, content_hash, content_size, fingerprint) "
        "VALUES (?, ?, ?, ?)");
    if (!stmt) {
        return false;
    }

    bindText(stmt, 1, normalizePath(path));
    bindText(stmt, 2, contentHash(content));
    bindInt64(stmt, 3, static_cast<long long>(content.size()));
    bindText(stmt, 4, fingerprint);

    int rc = sqlite3_step(stmt);
    finalizeStatement(stmt);

    if (rc != SQLITE_DONE) {
        setError("Failed to record cache entry");
        return false;
    }
    return true;
}

bool FormatCache::forget(const std::string& path) {
    if (!m_isOpen) {
        return false;
    }

    sqlite3_stmt* stmt = prepareStatement("DELETE FROM entries WHERE path = ?");
    if (!stmt) {
        return false;
    }

    bindText(stmt, 1, normalizePath(path));
    int rc = sqlite3_step(stmt);
    finalizeStatement(stmt);
    return rc == SQLITE_DONE;
}

int FormatCache::getEntryCount() {
    if (!m_isOpen) {
        return 0;
    }

    sqlite3_stmt* stmt = prepareStatement("SELECT COUNT(*) FROM entries");
    if (!stmt) {
        return 0;
    }

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    finalizeStatement(stmt);
    return count;
}

// =============================================================================
// Error Handling
// =============================================================================

std::string FormatCache::getLastError() const {
    return m_lastError;
}

bool FormatCache::hasError() const {
    return !m_lastError.empty();
}

void FormatCache::setError(const std::string& message) {
    m_lastError = message;
    if (m_db) {
        m_lastError += ": " + std::string(sqlite3_errmsg(m_db));
    }
}

void FormatCache::clearError() {
    m_lastError.clear();
}

// =============================================================================
// SQL Helpers
// =============================================================================

bool FormatCache::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        m_lastError = "SQL execution failed";
        if (errMsg) {
            m_lastError += ": " + std::string(errMsg);
            sqlite3_free(errMsg);
        }
        return false;
    }

    return true;
}

sqlite3_stmt* FormatCache::prepareStatement(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        setError("Failed to prepare statement");
        return nullptr;
    }

    return stmt;
}

void FormatCache::finalizeStatement(sqlite3_stmt* stmt) {
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

bool FormatCache::bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    return (rc == SQLITE_OK);
}

bool FormatCache::bindInt64(sqlite3_stmt* stmt, int index, long long value) {
    int rc = sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value));
    return (rc == SQLITE_OK);
}

} // namespace RpyFmt
