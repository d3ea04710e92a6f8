#pragma once
#include "pyfind_common.h"
#include <sqlite3.h>

// JSON document backed by SQLite's JSON functions on a private in-memory connection.
// Paths use SQLite JSON path syntax, json_key() quotes names holding dots or dashes.
class JsonDoc {
    sqlite3* db = nullptr;
    std::string text;

    sqlite3_stmt* prepare(const char* sql) const;
    void update(const char* sql, const std::string& path, const std::function<void(sqlite3_stmt*)>& bind_value);
public:
    explicit JsonDoc(std::string json = "{}");
    ~JsonDoc();
    JsonDoc(const JsonDoc&) = delete;
    JsonDoc& operator=(const JsonDoc&) = delete;

    const std::string& str() const { return text; }
    bool has(const std::string& path) const;
    std::optional<std::string> get_text(const std::string& path) const;
    std::optional<int64_t> get_int(const std::string& path) const;
    std::map<std::string, std::optional<std::string>> get_map(const std::string& path) const;
    std::vector<std::string> get_list(const std::string& path) const;

    void set_text(const std::string& path, const std::optional<std::string>& value);
    void set_int(const std::string& path, int64_t value);
    void set_bool(const std::string& path, bool value);
    void set_object(const std::string& path);
    void set_array(const std::string& path);
    void append_text(const std::string& path, const std::string& value);
};

std::string json_key(const std::string& parent, const std::string& name);
