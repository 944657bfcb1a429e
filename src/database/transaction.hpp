// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_DATABASE_TRANSACTION_HPP
#define BEACON_DATABASE_TRANSACTION_HPP

#include "types.hpp"

namespace beacon::database {

class Database;

/**
 * @brief RAII transaction scope
 *
 * Uses BEGIN IMMEDIATE so that the write lock is taken up front. Rolls back
 * on destruction unless commit() succeeded.
 */
class Transaction {
public:
    /**
     * @throws TransactionError if the transaction cannot be started
     */
    explicit Transaction(Database& db);

    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();

private:
    Database& db;
    bool committed = false;
    bool rolledBack = false;
};

}  // namespace beacon::database

#endif  // BEACON_DATABASE_TRANSACTION_HPP
