#pragma once
#include "SqliteDB.hpp"

// BEGIN IMMEDIATE 事务，提前获取写锁；未提交时析构回滚
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDB& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();
    void rollback();
    bool isFinished() const {
        return finished;
    }

private:
    SqliteDB& db;
    bool finished = false;
};
