// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_DATABASE_TYPES_HPP
#define BEACON_DATABASE_TYPES_HPP

#include "core/exception.hpp"

namespace beacon::database {

// All SQLite failures are store failures to the rest of the engine.
class DatabaseOpenError : public StoreError {
    using StoreError::StoreError;
};

class SqlExecutionError : public StoreError {
    using StoreError::StoreError;
};

class StatementPrepareError : public StoreError {
    using StoreError::StoreError;
};

class TransactionError : public StoreError {
    using StoreError::StoreError;
};

class InvalidUsageError : public StoreError {
    using StoreError::StoreError;
};

#define THROW_DATABASE_OPEN_ERROR(...)         \
    throw beacon::database::DatabaseOpenError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_SQL_EXECUTION_ERROR(...)         \
    throw beacon::database::SqlExecutionError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_STATEMENT_PREPARE_ERROR(...)         \
    throw beacon::database::StatementPrepareError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_TRANSACTION_ERROR(...)          \
    throw beacon::database::TransactionError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_DB_USAGE(...)            \
    throw beacon::database::InvalidUsageError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace beacon::database

#endif  // BEACON_DATABASE_TYPES_HPP
