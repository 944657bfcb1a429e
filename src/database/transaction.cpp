// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "transaction.hpp"

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace beacon::database {

namespace {

void runControl(Database& db, const char* sql, const char* action) {
    try {
        db.execute(sql);
    } catch (const SqlExecutionError& e) {
        THROW_TRANSACTION_ERROR(std::string("cannot ") + action + " on " +
                                db.path() + ": " + e.what());
    }
}

}  // namespace

Transaction::Transaction(Database& db) : db(db) {
    runControl(db, "BEGIN IMMEDIATE;", "begin");
}

Transaction::~Transaction() {
    if (committed || rolledBack) {
        return;
    }
    try {
        rollback();
    } catch (const TransactionError& e) {
        spdlog::error("store: abandoned transaction left open: {}", e.what());
    }
}

void Transaction::commit() {
    if (committed || rolledBack) {
        THROW_TRANSACTION_ERROR("transaction on " + db.path() +
                                " is already finished");
    }
    runControl(db, "COMMIT;", "commit");
    committed = true;
}

void Transaction::rollback() {
    if (committed || rolledBack) {
        THROW_TRANSACTION_ERROR("transaction on " + db.path() +
                                " is already finished");
    }
    // Marked first so a failed ROLLBACK is not retried by the destructor.
    rolledBack = true;
    runControl(db, "ROLLBACK;", "roll back");
    spdlog::debug("store: rolled back transaction on {}", db.path());
}

}  // namespace beacon::database
