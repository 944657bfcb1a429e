// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "statement.hpp"

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace beacon::database {

namespace {

std::string describe(sqlite3* handle, const std::string& what,
                     const std::string& sql) {
    return what + " [" + sql + "]: " + sqlite3_errmsg(handle);
}

}  // namespace

Statement::Statement(Database& db, const std::string& sql)
    : db(db), sql(sql) {
    sqlite3_stmt* prepared = nullptr;
    const int rc =
        sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &prepared, nullptr);
    stmt.reset(prepared);
    if (rc != SQLITE_OK) {
        auto message = describe(db.get(), "cannot compile", sql);
        spdlog::error("store: {}", message);
        THROW_STATEMENT_PREPARE_ERROR(message);
    }
}

void Statement::checkBind(int result, const char* kind) {
    if (result == SQLITE_OK) {
        return;
    }
    auto message =
        describe(db.get(), std::string("cannot bind ") + kind + " value", sql);
    spdlog::error("store: {}", message);
    THROW_STATEMENT_PREPARE_ERROR(message);
}

Statement& Statement::bind(int index, int64_t value) {
    validateIndex(index, true);
    checkBind(sqlite3_bind_int64(stmt.get(), index, value), "integer");
    return *this;
}

Statement& Statement::bind(int index, double value) {
    validateIndex(index, true);
    checkBind(sqlite3_bind_double(stmt.get(), index, value), "real");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    validateIndex(index, true);
    checkBind(sqlite3_bind_text(stmt.get(), index, value.data(),
                                static_cast<int>(value.size()),
                                SQLITE_TRANSIENT),
              "text");
    return *this;
}

Statement& Statement::bindNull(int index) {
    validateIndex(index, true);
    checkBind(sqlite3_bind_null(stmt.get(), index), "null");
    return *this;
}

void Statement::execute() {
    while (step()) {
    }
}

bool Statement::step() {
    switch (sqlite3_step(stmt.get())) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default: {
            auto message = describe(db.get(), "statement failed", sql);
            spdlog::error("store: {}", message);
            THROW_SQL_EXECUTION_ERROR(message);
        }
    }
}

Statement& Statement::reset() {
    // sqlite3_reset repeats the error of the last step, which was already
    // reported there.
    (void)sqlite3_reset(stmt.get());
    (void)sqlite3_clear_bindings(stmt.get());
    return *this;
}

int64_t Statement::getInt64(int index) const {
    validateIndex(index, false);
    return sqlite3_column_int64(stmt.get(), index);
}

double Statement::getDouble(int index) const {
    validateIndex(index, false);
    return sqlite3_column_double(stmt.get(), index);
}

std::string Statement::getText(int index) const {
    validateIndex(index, false);
    const auto* bytes = sqlite3_column_text(stmt.get(), index);
    if (bytes == nullptr) {
        return {};
    }
    const int length = sqlite3_column_bytes(stmt.get(), index);
    return {reinterpret_cast<const char*>(bytes),
            static_cast<size_t>(length)};
}

bool Statement::isNull(int index) const {
    validateIndex(index, false);
    return sqlite3_column_type(stmt.get(), index) == SQLITE_NULL;
}

void Statement::validateIndex(int index, bool isParam) const {
    const int lower = isParam ? 1 : 0;
    const int upper = isParam ? sqlite3_bind_parameter_count(stmt.get())
                              : sqlite3_column_count(stmt.get()) - 1;
    if (index < lower || index > upper) {
        THROW_INVALID_DB_USAGE(std::string(isParam ? "parameter" : "column") +
                               " " + std::to_string(index) +
                               " out of range for [" + sql + "]");
    }
}

}  // namespace beacon::database
