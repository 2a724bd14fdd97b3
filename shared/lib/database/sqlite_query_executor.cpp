#include "sqlite_query_executor.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <memory>

/**
 * @file sqlite_query_executor.cpp
 * @brief SQLite Query Executor Implementation
 *
 * @date 2026-03-24
 */

namespace common {

namespace {

struct StmtDeleter { void operator()(sqlite3_stmt* s) const { sqlite3_finalize(s); } };
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

void throwIf(int rc, sqlite3* db, const std::string& what) {
    if (rc != SQLITE_OK) {
        throw DatabaseException(what + ": " + sqlite3_errmsg(db));
    }
}

Json::Value columnToJson(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return Json::Value(static_cast<Json::Int64>(sqlite3_column_int64(stmt, col)));
        case SQLITE_FLOAT:
            return Json::Value(sqlite3_column_double(stmt, col));
        case SQLITE_NULL:
            return Json::Value(Json::nullValue);
        case SQLITE_BLOB:
        case SQLITE_TEXT:
        default: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int bytes = sqlite3_column_bytes(stmt, col);
            return Json::Value(std::string(text ? text : "", static_cast<size_t>(bytes)));
        }
    }
}

std::string describeParam(const QueryParam& param) {
    if (std::holds_alternative<std::monostate>(param)) return "NULL";
    if (const auto* i = std::get_if<int64_t>(&param)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&param)) return std::to_string(*d);
    return "'" + std::get<std::string>(param) + "'";
}

} // anonymous namespace

// ============================================================================
// URI parsing
// ============================================================================

SqliteUri SqliteUri::parse(const std::string& uri) {
    SqliteUri result;
    if (uri == "sqlite::memory:" || uri == "sqlite://:memory:") {
        result.path = ":memory:";
        return result;
    }

    const std::string scheme = "sqlite://";
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        throw ConfigException("Unsupported database URI (expected sqlite://<path>): " + uri);
    }

    std::string rest = uri.substr(scheme.size());
    size_t query = rest.find('?');
    result.path = rest.substr(0, query);
    if (result.path.empty()) {
        throw ConfigException("Database URI has no path: " + uri);
    }

    if (query != std::string::npos) {
        std::string options = rest.substr(query + 1);
        if (options == "mode=rwc") {
            result.mode = Mode::ReadWriteCreate;
        } else if (options == "mode=rw") {
            result.mode = Mode::ReadWrite;
        } else if (options == "mode=ro") {
            result.mode = Mode::ReadOnly;
        } else {
            throw ConfigException("Unsupported database URI options: " + options);
        }
    }
    return result;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

SqliteQueryExecutor::SqliteQueryExecutor(const SqliteUri& uri)
    : path_(uri.path)
{
    int flags = SQLITE_OPEN_FULLMUTEX;
    switch (uri.mode) {
        case SqliteUri::Mode::ReadWriteCreate:
            flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case SqliteUri::Mode::ReadWrite:
            flags |= SQLITE_OPEN_READWRITE;
            break;
        case SqliteUri::Mode::ReadOnly:
            flags |= SQLITE_OPEN_READONLY;
            break;
    }

    int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw DatabaseException("Cannot open " + path_ + ": " + msg);
    }

    try {
        if (uri.mode != SqliteUri::Mode::ReadOnly) {
            execLocked("PRAGMA journal_mode=WAL;");
            execLocked("PRAGMA synchronous=NORMAL;");
        }
        // foreign keys are OFF by default in sqlite
        execLocked("PRAGMA foreign_keys=ON;");
        throwIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
    } catch (const DatabaseException&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    spdlog::info("[SqliteQueryExecutor] Opened database {}", path_);
}

SqliteQueryExecutor::~SqliteQueryExecutor() {
    if (db_) {
        sqlite3_close(db_);
    }
}

// ============================================================================
// Public Interface Implementation
// ============================================================================

Json::Value SqliteQueryExecutor::executeQuery(const std::string& query, const QueryParams& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtPtr stmt(prepare(query, params));

    Json::Value rows(Json::arrayValue);
    int columns = sqlite3_column_count(stmt.get());
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Json::Value row(Json::objectValue);
        for (int col = 0; col < columns; ++col) {
            row[sqlite3_column_name(stmt.get(), col)] = columnToJson(stmt.get(), col);
        }
        rows.append(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        throw DatabaseException(sqlite3_errmsg(db_));
    }

    spdlog::debug("[SqliteQueryExecutor] Query returned {} rows", rows.size());
    return rows;
}

int SqliteQueryExecutor::executeCommand(const std::string& query, const QueryParams& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtPtr stmt(prepare(query, params));

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        // Rows of a RETURNING clause are discarded
    }
    if (rc != SQLITE_DONE) {
        throw DatabaseException(sqlite3_errmsg(db_));
    }

    int affectedRows = sqlite3_changes(db_);
    spdlog::debug("[SqliteQueryExecutor] Command executed, affected rows: {}", affectedRows);
    return affectedRows;
}

Json::Value SqliteQueryExecutor::executeScalar(const std::string& query, const QueryParams& params) {
    Json::Value rows = executeQuery(query, params);
    if (rows.empty()) {
        throw DatabaseException("Scalar query returned no rows");
    }
    const Json::Value& row = rows[0];
    if (row.size() != 1) {
        throw DatabaseException("Scalar query must return exactly one column");
    }
    return row[row.getMemberNames().front()];
}

void SqliteQueryExecutor::executeScript(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    execLocked(sql);
}

void SqliteQueryExecutor::transaction(const std::function<void()>& work) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    execLocked("BEGIN IMMEDIATE;");
    try {
        work();
    } catch (const std::exception& e) {
        spdlog::warn("[SqliteQueryExecutor] Rolling back transaction: {}", e.what());
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            spdlog::error("[SqliteQueryExecutor] Rollback failed: {}", err ? err : "unknown");
        }
        sqlite3_free(err);
        throw;
    }
    execLocked("COMMIT;");
}

// ============================================================================
// Private helpers
// ============================================================================

sqlite3_stmt* SqliteQueryExecutor::prepare(const std::string& query, const QueryParams& params) {
    spdlog::debug("[SqliteQueryExecutor] Query: {}", query);

    sqlite3_stmt* raw = nullptr;
    throwIf(sqlite3_prepare_v2(db_, query.c_str(), -1, &raw, nullptr), db_, "prepare");
    StmtPtr stmt(raw);

    if (static_cast<int>(params.size()) != sqlite3_bind_parameter_count(raw)) {
        throw DatabaseException("Parameter count mismatch: query expects " +
                                std::to_string(sqlite3_bind_parameter_count(raw)) +
                                ", got " + std::to_string(params.size()));
    }

    for (size_t i = 0; i < params.size(); ++i) {
        const QueryParam& param = params[i];
        int index = static_cast<int>(i) + 1;
        int rc;
        if (const auto* intValue = std::get_if<int64_t>(&param)) {
            rc = sqlite3_bind_int64(raw, index, *intValue);
        } else if (const auto* doubleValue = std::get_if<double>(&param)) {
            rc = sqlite3_bind_double(raw, index, *doubleValue);
        } else if (const auto* textValue = std::get_if<std::string>(&param)) {
            rc = sqlite3_bind_text(raw, index, textValue->c_str(),
                                   static_cast<int>(textValue->size()), SQLITE_TRANSIENT);
        } else {
            rc = sqlite3_bind_null(raw, index);
        }
        throwIf(rc, db_, "bind");
        spdlog::trace("[SqliteQueryExecutor] Param[{}]: {}", i, describeParam(param));
    }
    return stmt.release();
}

void SqliteQueryExecutor::execLocked(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw DatabaseException(msg);
    }
}

} // namespace common
