#include "SqliteDB.hpp"

std::string toString(LedgerErrorCode code) {
    switch (code) {
        case LedgerErrorCode::NotFound: return "NotFound";
        case LedgerErrorCode::Conflict: return "Conflict";
        case LedgerErrorCode::Busy: return "Busy";
        case LedgerErrorCode::ConstraintViolation: return "ConstraintViolation";
        case LedgerErrorCode::IOError: return "IOError";
        case LedgerErrorCode::Corruption: return "Corruption";
        default: return "InternalError";
    }
}

LedgerErrorCode translateSqliteError(int rc) {
    // 扩展结果码只看低8位
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return LedgerErrorCode::Busy;
        case SQLITE_CONSTRAINT:
            return LedgerErrorCode::ConstraintViolation;
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return LedgerErrorCode::IOError;
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return LedgerErrorCode::Corruption;
        default:
            return LedgerErrorCode::InternalError;
    }
}

SqliteDB::SqliteDB(const std::string& path) : path(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "sqlite open failed";
        if (db) {
            sqlite3_close(db);
        }
        db = nullptr;
        throw LedgerError(translateSqliteError(rc), "Failed to open database " + path + ": " + message);
    }

    try {
        configure();
    } catch (const LedgerError&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

SqliteDB::~SqliteDB() {
    if (db) {
        sqlite3_close(db);
    }
}

void SqliteDB::raise(int rc, const std::string& what) const {
    throw LedgerError(translateSqliteError(rc), what + ": " + sqlite3_errmsg(db));
}

void SqliteDB::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw LedgerError(translateSqliteError(rc), message);
    }
}

int SqliteDB::changes() const {
    return sqlite3_changes(db);
}

int64_t SqliteDB::lastInsertId() const {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db));
}

void SqliteDB::configure() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    // sqlite默认关闭外键，级联删除依赖它
    exec("PRAGMA foreign_keys=ON;");
    int rc = sqlite3_busy_timeout(db, 5000);
    if (rc != SQLITE_OK) {
        raise(rc, "busy_timeout");
    }
}

Statement::Statement(SqliteDB& db, const std::string& sql) : db(db) {
    int rc = sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) {
            sqlite3_finalize(stmt);
            stmt = nullptr;
        }
        db.raise(rc, "sqlite prepare");
    }
}

Statement::~Statement() {
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

Statement& Statement::bindText(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        db.raise(rc, "sqlite bind");
    }
    return *this;
}

Statement& Statement::bindInt64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value));
    if (rc != SQLITE_OK) {
        db.raise(rc, "sqlite bind");
    }
    return *this;
}

Statement& Statement::bindNull(int index) {
    int rc = sqlite3_bind_null(stmt, index);
    if (rc != SQLITE_OK) {
        db.raise(rc, "sqlite bind");
    }
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    db.raise(rc, "sqlite step");
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

std::string Statement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

int64_t Statement::columnInt64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt, column));
}

int Statement::columnInt(int column) const {
    return sqlite3_column_int(stmt, column);
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt, column) == SQLITE_NULL;
}
