#include <stdexcept>

#include "./resume.hpp"

typedef std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> statement_t;

static statement_t prepare(const std::shared_ptr<sqlite3> &db, const std::string &query) {
    sqlite3_stmt *stmt = nullptr;
    const auto rc = sqlite3_prepare_v2(db.get(), query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    return statement_t(stmt, sqlite3_finalize);
}

static void exec(const std::shared_ptr<sqlite3> &db, const std::string &query, const std::string &what) {
    char *err_msg = nullptr;
    const auto rc = sqlite3_exec(db.get(), query.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        const auto err_msg_str = std::string(err_msg ? err_msg : sqlite3_errstr(rc));
        sqlite3_free(err_msg);
        throw std::runtime_error("Failed to " + what + ": " + err_msg_str);
    }
}

std::string file_identity(const std::filesystem::path &file) {
    return std::filesystem::absolute(file).lexically_normal().string();
}

ResumeLedger::ResumeLedger(std::shared_ptr<sqlite3> db_, bool disabled_) : db {db_}, disabled {disabled_} {
    // never drops existing records
    const auto create_table_query = std::string("CREATE TABLE IF NOT EXISTS ") + UPLOADED_FILES_TABLE_NAME + " (scope TEXT NOT NULL, file TEXT NOT NULL, PRIMARY KEY (scope, file));";
    exec(db, create_table_query, "create table");
}

bool ResumeLedger::is_recorded(upload_scope_t scope, const std::filesystem::path &file) const {
    if (disabled) {
        return false;
    }
    const auto select_query = std::string("SELECT 1 FROM ") + UPLOADED_FILES_TABLE_NAME + " WHERE scope=? AND file=?;";
    const auto stmt = prepare(db, select_query);
    const auto scope_str = scope_name(scope);
    const auto identity = file_identity(file);
    sqlite3_bind_text(stmt.get(), 1, scope_str.c_str(), scope_str.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, identity.c_str(), identity.size(), SQLITE_TRANSIENT);
    const auto rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
    }
    return false;
}

std::vector<std::filesystem::path> ResumeLedger::filter_unrecorded(upload_scope_t scope, const std::vector<std::filesystem::path> &files) const {
    if (disabled) {
        return files;
    }
    std::vector<std::filesystem::path> ret;
    for (const auto &f : files) {
        if (!is_recorded(scope, f)) {
            ret.push_back(f);
        }
    }
    return ret;
}

void ResumeLedger::record(upload_scope_t scope, const std::filesystem::path &file) {
    if (disabled) {
        return;
    }
    // a single statement runs in its own transaction, so the record is either fully written or absent
    const auto insert_query = std::string("INSERT OR IGNORE INTO ") + UPLOADED_FILES_TABLE_NAME + " (scope, file) VALUES (?, ?);";
    const auto stmt = prepare(db, insert_query);
    const auto scope_str = scope_name(scope);
    const auto identity = file_identity(file);
    sqlite3_bind_text(stmt.get(), 1, scope_str.c_str(), scope_str.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, identity.c_str(), identity.size(), SQLITE_TRANSIENT);
    const auto rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
    }
}

void ResumeLedger::clear(std::optional<upload_scope_t> scope) {
    if (!scope.has_value()) {
        exec(db, std::string("DELETE FROM ") + UPLOADED_FILES_TABLE_NAME + ";", "clear resume data");
        return;
    }
    const auto delete_query = std::string("DELETE FROM ") + UPLOADED_FILES_TABLE_NAME + " WHERE scope=?;";
    const auto stmt = prepare(db, delete_query);
    const auto scope_str = scope_name(scope.value());
    sqlite3_bind_text(stmt.get(), 1, scope_str.c_str(), scope_str.size(), SQLITE_TRANSIENT);
    const auto rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
    }
}

size_t ResumeLedger::count(upload_scope_t scope) const {
    const auto select_query = std::string("SELECT COUNT(*) FROM ") + UPLOADED_FILES_TABLE_NAME + " WHERE scope=?;";
    const auto stmt = prepare(db, select_query);
    const auto scope_str = scope_name(scope);
    sqlite3_bind_text(stmt.get(), 1, scope_str.c_str(), scope_str.size(), SQLITE_TRANSIENT);
    const auto rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

bool ResumeLedger::is_disabled() const {
    return disabled;
}
