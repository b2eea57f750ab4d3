#include <filesystem>
#include <system_error>

#include "./sqlite.hpp"

std::variant<std::shared_ptr<sqlite3>, std::string> db_open(const std::string &path) {
    sqlite3 *db_raw = nullptr;
    if (path != ":memory:") {
        const auto fs_path = std::filesystem::path(path);
        const auto parent_path = fs_path.parent_path();
        if (!parent_path.empty() && !std::filesystem::exists(parent_path)) {
            std::error_code ec;
            std::filesystem::create_directories(parent_path, ec);
            if (ec) {
                return std::string("Failed to create directory \"") + parent_path.string() + "\": " + ec.message();
            }
        }
    }
    const auto db_open_ret = sqlite3_open_v2(path.c_str(), &db_raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (db_open_ret != SQLITE_OK) {
        const auto err = std::string(db_raw ? sqlite3_errmsg(db_raw) : sqlite3_errstr(db_open_ret));
        sqlite3_close(db_raw);
        return err;
    }
    std::shared_ptr<sqlite3> db(nullptr);
    db.reset(db_raw, sqlite3_close);

    // every committed record must survive a crash
    char *err_msg = nullptr;
    const auto rc = sqlite3_exec(db.get(), "PRAGMA synchronous=FULL;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        const auto err_msg_str = std::string(err_msg ? err_msg : sqlite3_errstr(rc));
        sqlite3_free(err_msg);
        return err_msg_str;
    }
    return db;
}
