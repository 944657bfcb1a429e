// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_DATABASE_STATEMENT_HPP
#define BEACON_DATABASE_STATEMENT_HPP

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>

#include "types.hpp"

namespace beacon::database {

class Database;

/**
 * @brief Prepared statement bound to a Database
 *
 * Parameter indices are 1-based, column indices 0-based.
 */
class Statement {
public:
    /**
     * @throws StatementPrepareError if preparation fails
     */
    Statement(Database& db, const std::string& sql);

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, int64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bindNull(int index);

    /**
     * @brief Run to completion, ignoring any rows
     * @throws SqlExecutionError if execution fails
     */
    void execute();

    /**
     * @brief Advance to the next row
     * @return True if a row is available, false when done
     * @throws SqlExecutionError if stepping fails
     */
    bool step();

    /**
     * @brief Reset and clear bindings so the statement can be rerun
     */
    Statement& reset();

    int64_t getInt64(int index) const;
    double getDouble(int index) const;
    std::string getText(int index) const;
    bool isNull(int index) const;

    const std::string& getSql() const noexcept { return sql; }

private:
    Database& db;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt{
        nullptr, sqlite3_finalize};
    std::string sql;

    void validateIndex(int index, bool isParam) const;
    void checkBind(int result, const char* kind);
};

}  // namespace beacon::database

#endif  // BEACON_DATABASE_STATEMENT_HPP
