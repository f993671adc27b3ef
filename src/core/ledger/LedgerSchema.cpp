#include "Ledger.hpp"
#include "SqliteDB.hpp"
#include "SqliteTransaction.hpp"

namespace {

// 版本1的表结构；之后的版本只追加可空列和索引
const char* const BASE_SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS schema_version (
    version INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS jobs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    sources TEXT NOT NULL,
    include_patterns TEXT,
    exclude_patterns TEXT,
    destination_type TEXT NOT NULL,
    destination_config TEXT,
    conflict_policy TEXT NOT NULL DEFAULT 'rename',
    schedule TEXT,
    is_active INTEGER NOT NULL DEFAULT 1,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS executions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    job_id INTEGER NOT NULL REFERENCES jobs(id) ON DELETE CASCADE,
    status TEXT NOT NULL DEFAULT 'pending',
    started_at INTEGER NOT NULL,
    completed_at INTEGER,
    total_files INTEGER NOT NULL DEFAULT 0,
    processed_files INTEGER NOT NULL DEFAULT 0,
    failed_files INTEGER NOT NULL DEFAULT 0,
    total_bytes INTEGER NOT NULL DEFAULT 0,
    transferred_bytes INTEGER NOT NULL DEFAULT 0,
    error_message TEXT
);
CREATE TABLE IF NOT EXISTS transfers (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    execution_id INTEGER NOT NULL REFERENCES executions(id) ON DELETE CASCADE,
    source_path TEXT NOT NULL,
    destination_path TEXT,
    file_size INTEGER NOT NULL DEFAULT 0,
    checksum TEXT,
    status TEXT NOT NULL DEFAULT 'pending',
    transferred_bytes INTEGER NOT NULL DEFAULT 0,
    error_message TEXT,
    started_at INTEGER,
    completed_at INTEGER
);
CREATE INDEX IF NOT EXISTS idx_executions_job ON executions(job_id, status);
CREATE UNIQUE INDEX IF NOT EXISTS idx_transfers_execution_source ON transfers(execution_id, source_path);
)SQL";

// 版本2追加的列
struct AddedColumn {
    const char* table;
    const char* column;
    const char* definition;
};

const AddedColumn VERSION_2_COLUMNS[] = {
    {"executions", "paused_at", "INTEGER"},
    {"executions", "resumed_at", "INTEGER"},
    {"transfers", "retry_count", "INTEGER NOT NULL DEFAULT 0"},
};

// 每个作业最多一个未结束的执行
const char* const ONE_ACTIVE_EXECUTION_INDEX =
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_executions_one_active ON executions(job_id) "
    "WHERE status IN ('running','paused');";

} // namespace

bool Ledger::hasColumn(const std::string& table, const std::string& column) {
    Statement stmt(*db, "PRAGMA table_info(" + table + ");");
    while (stmt.step()) {
        // 列1为列名
        if (stmt.columnText(1) == column) {
            return true;
        }
    }
    return false;
}

int Ledger::readSchemaVersion() {
    Statement stmt(*db, "SELECT MAX(version) FROM schema_version;");
    if (stmt.step() && !stmt.isNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Ledger::migrate() {
    SqliteTransaction tx(*db);
    db->exec(BASE_SCHEMA);

    int version = readSchemaVersion();
    if (version < SCHEMA_VERSION) {
        for (const auto& added : VERSION_2_COLUMNS) {
            if (!hasColumn(added.table, added.column)) {
                db->exec(std::string("ALTER TABLE ") + added.table + " ADD COLUMN " +
                         added.column + " " + added.definition + ";");
            }
        }
        db->exec(ONE_ACTIVE_EXECUTION_INDEX);

        db->exec("DELETE FROM schema_version;");
        Statement insert(*db, "INSERT INTO schema_version(version) VALUES(?1);");
        insert.bindInt64(1, SCHEMA_VERSION).run();
    }
    tx.commit();
}
