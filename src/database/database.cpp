// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "database.hpp"

#include <spdlog/spdlog.h>

#include "statement.hpp"
#include "transaction.hpp"

namespace beacon::database {

namespace {

// Arm updates are small and frequent; WAL keeps readers off the writer.
constexpr const char* kConnectionPragmas =
    "PRAGMA foreign_keys = ON;"
    "PRAGMA journal_mode = WAL;"
    "PRAGMA synchronous = NORMAL;"
    "PRAGMA busy_timeout = 5000;";

}  // namespace

Database::Database(const std::string& path, int flags) : path_(path) {
    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    db.reset(handle);
    if (rc != SQLITE_OK) {
        std::string reason =
            handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        spdlog::error("store: cannot open {}: {}", path, reason);
        THROW_DATABASE_OPEN_ERROR("cannot open " + path + ": " + reason);
    }

    valid = true;
    try {
        execute(kConnectionPragmas);
    } catch (const SqlExecutionError&) {
        valid = false;
        throw;
    }
    spdlog::info("store: opened {}", path);
}

Database::~Database() {
    if (!valid.exchange(false)) {
        return;
    }
    char* message = nullptr;
    if (sqlite3_exec(db.get(), "PRAGMA optimize;", nullptr, nullptr,
                     &message) != SQLITE_OK) {
        spdlog::warn("store: optimize on close of {} failed: {}", path_,
                     message ? message : "unknown");
    }
    sqlite3_free(message);
}

sqlite3* Database::get() {
    if (!valid) {
        THROW_INVALID_DB_USAGE("connection to " + path_ + " is not usable");
    }
    return db.get();
}

std::unique_ptr<Statement> Database::prepare(const std::string& sql) {
    return std::make_unique<Statement>(*this, sql);
}

std::unique_ptr<Transaction> Database::beginTransaction() {
    return std::make_unique<Transaction>(*this);
}

void Database::execute(const std::string& sql) {
    char* message = nullptr;
    const int rc = sqlite3_exec(get(), sql.c_str(), nullptr, nullptr, &message);
    if (rc == SQLITE_OK) {
        return;
    }
    std::string reason = message ? message : sqlite3_errstr(rc);
    sqlite3_free(message);
    spdlog::error("store: {} failed on {}: {}", sql, path_, reason);
    THROW_SQL_EXECUTION_ERROR(reason);
}

int64_t Database::changes() { return sqlite3_changes(get()); }

bool Database::isValid() const noexcept { return valid; }

}  // namespace beacon::database
