// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for the SQLite wrapper
 */

#include <gtest/gtest.h>

#include "database/database.hpp"
#include "database/statement.hpp"
#include "database/transaction.hpp"

using namespace beacon;
using namespace beacon::database;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<Database>(":memory:");
        db_->execute(
            "CREATE TABLE items (id TEXT PRIMARY KEY, qty INTEGER, "
            "price REAL, note TEXT);");
    }

    void TearDown() override { db_.reset(); }

    auto countRows() -> int64_t {
        auto stmt = db_->prepare("SELECT COUNT(*) FROM items;");
        EXPECT_TRUE(stmt->step());
        return stmt->getInt64(0);
    }

    std::unique_ptr<Database> db_;
};

TEST_F(DatabaseTest, OpensInMemory) {
    EXPECT_TRUE(db_->isValid());
    EXPECT_EQ(db_->path(), ":memory:");
    EXPECT_NE(db_->get(), nullptr);
}

TEST_F(DatabaseTest, BindStepAndRead) {
    auto insert = db_->prepare(
        "INSERT INTO items (id, qty, price, note) VALUES (?, ?, ?, ?);");
    insert->bind(1, std::string("a"))
        .bind(2, int64_t{3})
        .bind(3, 1.25)
        .bindNull(4);
    insert->execute();
    EXPECT_EQ(db_->changes(), 1);

    auto select =
        db_->prepare("SELECT id, qty, price, note FROM items WHERE id = ?;");
    select->bind(1, std::string("a"));
    ASSERT_TRUE(select->step());
    EXPECT_EQ(select->getText(0), "a");
    EXPECT_EQ(select->getInt64(1), 3);
    EXPECT_DOUBLE_EQ(select->getDouble(2), 1.25);
    EXPECT_TRUE(select->isNull(3));
    EXPECT_FALSE(select->step());
}

TEST_F(DatabaseTest, ChangesReportsIgnoredInsert) {
    db_->execute("INSERT INTO items (id, qty) VALUES ('a', 1);");
    db_->execute("INSERT OR IGNORE INTO items (id, qty) VALUES ('a', 2);");
    EXPECT_EQ(db_->changes(), 0);
}

TEST_F(DatabaseTest, ResetAllowsReuse) {
    auto insert = db_->prepare("INSERT INTO items (id, qty) VALUES (?, ?);");
    for (int i = 0; i < 3; ++i) {
        insert->reset();
        insert->bind(1, "id" + std::to_string(i)).bind(2, int64_t{i});
        insert->execute();
    }
    EXPECT_EQ(countRows(), 3);
}

TEST_F(DatabaseTest, InvalidUsageThrows) {
    EXPECT_THROW(db_->prepare("SELECT * FROM missing_table;"),
                 StatementPrepareError);
    EXPECT_THROW(db_->execute("NOT SQL"), SqlExecutionError);

    auto stmt = db_->prepare("SELECT id FROM items WHERE id = ?;");
    EXPECT_THROW(stmt->bind(2, std::string("x")), InvalidUsageError);
    EXPECT_THROW(db_->execute("INSERT INTO items (id) VALUES ('a'), ('a');"),
                 StoreError);
}

TEST_F(DatabaseTest, TransactionCommit) {
    {
        auto tx = db_->beginTransaction();
        db_->execute("INSERT INTO items (id) VALUES ('a');");
        tx->commit();
        EXPECT_THROW(tx->commit(), TransactionError);
    }
    EXPECT_EQ(countRows(), 1);
}

TEST_F(DatabaseTest, TransactionRollsBackOnScopeExit) {
    {
        auto tx = db_->beginTransaction();
        db_->execute("INSERT INTO items (id) VALUES ('a');");
    }
    EXPECT_EQ(countRows(), 0);

    {
        auto tx = db_->beginTransaction();
        db_->execute("INSERT INTO items (id) VALUES ('b');");
        tx->rollback();
    }
    EXPECT_EQ(countRows(), 0);
}
