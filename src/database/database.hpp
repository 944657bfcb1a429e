// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_DATABASE_DATABASE_HPP
#define BEACON_DATABASE_DATABASE_HPP

#include <sqlite3.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "types.hpp"

namespace beacon::database {

class Statement;
class Transaction;

/**
 * @brief Owning wrapper of one SQLite connection
 *
 * The connection is not synchronized; callers sharing a Database across
 * threads must serialize access themselves.
 */
class Database {
public:
    /**
     * @brief Open (and create if needed) a database file
     *
     * Enables WAL journaling and foreign keys.
     *
     * @param path File path, or ":memory:" for a private in-memory database
     * @throws DatabaseOpenError if the file cannot be opened
     */
    explicit Database(const std::string& path,
                      int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* get();

    /**
     * @throws StatementPrepareError if the SQL does not compile
     */
    std::unique_ptr<Statement> prepare(const std::string& sql);

    /**
     * @brief Start a transaction that rolls back unless committed
     * @throws TransactionError if BEGIN fails
     */
    std::unique_ptr<Transaction> beginTransaction();

    /**
     * @brief Run one or more statements that return no rows
     * @throws SqlExecutionError on failure
     */
    void execute(const std::string& sql);

    /**
     * @brief Rows modified by the most recent INSERT, UPDATE or DELETE
     */
    [[nodiscard]] int64_t changes();

    [[nodiscard]] bool isValid() const noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db{nullptr,
                                                          sqlite3_close};
    std::atomic<bool> valid{false};
    std::string path_;
};

}  // namespace beacon::database

#endif  // BEACON_DATABASE_DATABASE_HPP
