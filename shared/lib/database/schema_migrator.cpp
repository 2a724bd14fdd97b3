#include "schema_migrator.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <set>
#include <stdexcept>

/**
 * @file schema_migrator.cpp
 * @brief SchemaMigrator Implementation
 *
 * @date 2026-03-24
 */

namespace common {

namespace {

std::string utcNow() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_time{};
    gmtime_r(&now, &tm_time);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_time);
    return buffer;
}

} // anonymous namespace

SchemaMigrator::SchemaMigrator(SqliteQueryExecutor* executor, std::vector<Migration> migrations)
    : executor_(executor), migrations_(std::move(migrations))
{
    if (!executor_) {
        throw std::invalid_argument("SchemaMigrator: executor cannot be nullptr");
    }
    std::sort(migrations_.begin(), migrations_.end(),
              [](const Migration& a, const Migration& b) { return a.version < b.version; });
}

void SchemaMigrator::ensureMigrationTable() {
    executor_->executeScript(
        "CREATE TABLE IF NOT EXISTS schema_migrations ("
        "  version TEXT NOT NULL PRIMARY KEY,"
        "  applied_at TEXT NOT NULL"
        ");");
}

std::vector<std::string> SchemaMigrator::appliedVersions() {
    ensureMigrationTable();
    Json::Value rows = executor_->executeQuery(
        "SELECT version FROM schema_migrations ORDER BY version");

    std::vector<std::string> versions;
    for (const auto& row : rows) {
        versions.push_back(row["version"].asString());
    }
    return versions;
}

std::vector<std::string> SchemaMigrator::pendingVersions() {
    auto applied = appliedVersions();
    std::set<std::string> appliedSet(applied.begin(), applied.end());

    std::vector<std::string> pending;
    for (const auto& migration : migrations_) {
        if (appliedSet.count(migration.version) == 0) {
            pending.push_back(migration.version);
        }
    }
    return pending;
}

int SchemaMigrator::migrate() {
    auto pending = pendingVersions();
    if (pending.empty()) {
        spdlog::info("[SchemaMigrator] Schema is up to date");
        return 0;
    }

    int applied = 0;
    for (const auto& migration : migrations_) {
        if (std::find(pending.begin(), pending.end(), migration.version) == pending.end()) {
            continue;
        }

        spdlog::info("[SchemaMigrator] Applying migration {}", migration.version);
        try {
            executor_->transaction([&]() {
                executor_->executeScript(migration.sql);
                executor_->executeCommand(
                    "INSERT INTO schema_migrations (version, applied_at) VALUES (?, ?)",
                    {migration.version, utcNow()});
            });
        } catch (const DatabaseException& e) {
            spdlog::error("[SchemaMigrator] Migration {} failed: {}", migration.version, e.what());
            throw;
        }
        ++applied;
    }

    spdlog::info("[SchemaMigrator] Applied {} migration(s)", applied);
    return applied;
}

} // namespace common
