#include "SqliteTransaction.hpp"

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db(db) {
    db.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (finished) {
        return;
    }
    // 析构中不抛出异常，直接调用C接口
    sqlite3_exec(db.handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    finished = true;
}

void SqliteTransaction::commit() {
    db.exec("COMMIT;");
    finished = true;
}

void SqliteTransaction::rollback() {
    db.exec("ROLLBACK;");
    finished = true;
}
