#pragma once
#include <sqlite3.h>
#include <string>
#include <cstdint>
#include "LedgerError.hpp"

// SQLite结果码转换为账本错误码
LedgerErrorCode translateSqliteError(int rc);

// sqlite3* 的RAII封装
class SqliteDB {
public:
    explicit SqliteDB(const std::string& path);
    ~SqliteDB();

    SqliteDB(const SqliteDB&) = delete;
    SqliteDB& operator=(const SqliteDB&) = delete;

    sqlite3* handle() const {
        return db;
    }

    const std::string& getPath() const {
        return path;
    }

    // 执行不带参数的SQL（pragma、迁移），失败抛出LedgerError
    void exec(const std::string& sql);

    // 最近一条语句影响的行数
    int changes() const;

    int64_t lastInsertId() const;

    [[noreturn]] void raise(int rc, const std::string& what) const;

private:
    // WAL、外键、忙等待
    void configure();

    sqlite3* db = nullptr;
    std::string path;
};

// 预编译语句的RAII封装，析构时finalize
class Statement {
public:
    Statement(SqliteDB& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // 参数下标从1开始
    Statement& bindText(int index, const std::string& value);
    Statement& bindInt64(int index, int64_t value);
    Statement& bindNull(int index);

    // 有结果行返回true，执行结束返回false，出错抛出LedgerError
    bool step();

    // 执行到结束，不期望结果行
    void run();

    void reset();

    // 列下标从0开始
    std::string columnText(int column) const;
    int64_t columnInt64(int column) const;
    int columnInt(int column) const;
    bool isNull(int column) const;

private:
    SqliteDB& db;
    sqlite3_stmt* stmt = nullptr;
};
