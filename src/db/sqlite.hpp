#pragma once

#include <memory>
#include <string>
#include <variant>

#include <sqlite3.h>

// opens the database at path, creating the file and its parent directories if absent.
// ":memory:" opens a private in-memory database
std::variant<std::shared_ptr<sqlite3>, std::string> db_open(const std::string &path);
