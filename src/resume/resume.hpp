#pragma once

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <sqlite3.h>

#include "../config/config.hpp"

#define UPLOADED_FILES_TABLE_NAME "uploaded_files"

// NOTE: ResumeLedger is not thread-safe.
// Storage errors are thrown as std::runtime_error and are fatal for the run.

class ResumeLedger {
public:
    // disabled ledger never reads or writes the storage
    ResumeLedger(std::shared_ptr<sqlite3> db_, bool disabled_ = false);

    bool is_recorded(upload_scope_t scope, const std::filesystem::path &file) const;
    // returns files which are not recorded for the scope, keeping their order
    std::vector<std::filesystem::path> filter_unrecorded(upload_scope_t scope, const std::vector<std::filesystem::path> &files) const;
    // committed to the storage before returning
    void record(upload_scope_t scope, const std::filesystem::path &file);
    // removes entries of a single scope, or all entries if scope is not set
    void clear(std::optional<upload_scope_t> scope = std::nullopt);

    size_t count(upload_scope_t scope) const;
    bool is_disabled() const;

private:
    std::shared_ptr<sqlite3> db;
    bool disabled;
};

// identity of a file in the ledger
std::string file_identity(const std::filesystem::path &file);
