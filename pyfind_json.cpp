#include "pyfind_json.h"

namespace {

struct Stmt {
    sqlite3_stmt* stmt;
    explicit Stmt(sqlite3_stmt* s) : stmt(s) {}
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;
    ~Stmt() { if (stmt) sqlite3_finalize(stmt); }
};

std::optional<std::string> column_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    const unsigned char* t = sqlite3_column_text(stmt, col);
    return t ? std::optional<std::string>(reinterpret_cast<const char*>(t)) : std::nullopt;
}

}  // namespace

std::string json_key(const std::string& parent, const std::string& name) {
    if (name.find('"') != std::string::npos) throw std::runtime_error("json key cannot contain a quote: " + name);
    return parent + ".\"" + name + "\"";
}

JsonDoc::JsonDoc(std::string json) : text(std::move(json)) {
    if (sqlite3_open(":memory:", &db) != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error("failed to open json store: " + err);
    }
    Stmt valid(prepare("SELECT CASE WHEN json_valid(?1) THEN json_type(?1) = 'object' ELSE 0 END;"));
    sqlite3_bind_text(valid.stmt, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(valid.stmt) != SQLITE_ROW || sqlite3_column_int(valid.stmt, 0) != 1) {
        sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error("malformed json document");
    }
}

JsonDoc::~JsonDoc() { if (db) sqlite3_close(db); }

sqlite3_stmt* JsonDoc::prepare(const char* sql) const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("json query failed: ") + sqlite3_errmsg(db));
    }
    return stmt;
}

bool JsonDoc::has(const std::string& path) const {
    Stmt q(prepare("SELECT json_type(?1, ?2) IS NOT NULL;"));
    sqlite3_bind_text(q.stmt, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(q.stmt, 2, path.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(q.stmt) == SQLITE_ROW && sqlite3_column_int(q.stmt, 0) == 1;
}

std::optional<std::string> JsonDoc::get_text(const std::string& path) const {
    Stmt q(prepare("SELECT json_extract(?1, ?2);"));
    sqlite3_bind_text(q.stmt, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(q.stmt, 2, path.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(q.stmt) != SQLITE_ROW) return std::nullopt;
    return column_text(q.stmt, 0);
}

std::optional<int64_t> JsonDoc::get_int(const std::string& path) const {
    Stmt q(prepare("SELECT json_extract(?1, ?2), json_type(?1, ?2);"));
    sqlite3_bind_text(q.stmt, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(q.stmt, 2, path.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(q.stmt) != SQLITE_ROW) return std::nullopt;
    auto type = column_text(q.stmt, 1);
    if (!type || (*type != "integer" && *type != "true" && *type != "false")) return std::nullopt;
    return sqlite3_column_int64(q.stmt, 0);
}

std::map<std::string, std::optional<std::string>> JsonDoc::get_map(const std::string& path) const {
    std::map<std::string, std::optional<std::string>> out;
    Stmt q(prepare("SELECT key, value FROM json_each(?1, ?2);"));
    sqlite3_bind_text(q.stmt, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(q.stmt, 2, path.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(q.stmt) == SQLITE_ROW) {
        auto key = column_text(q.stmt, 0);
        if (key) out[*key] = column_text(q.stmt, 1);
    }
    return out;
}

std::vector<std::string> JsonDoc::get_list(const std::string& path) const {
    std::vector<std::string> out;
    Stmt q(prepare("SELECT value FROM json_each(?1, ?2) ORDER BY key;"));
    sqlite3_bind_text(q.stmt, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(q.stmt, 2, path.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(q.stmt) == SQLITE_ROW) {
        auto v = column_text(q.stmt, 0);
        if (v) out.push_back(*v);
    }
    return out;
}

void JsonDoc::update(const char* sql, const std::string& path, const std::function<void(sqlite3_stmt*)>& bind_value) {
    Stmt q(prepare(sql));
    sqlite3_bind_text(q.stmt, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(q.stmt, 2, path.c_str(), -1, SQLITE_TRANSIENT);
    bind_value(q.stmt);
    if (sqlite3_step(q.stmt) != SQLITE_ROW) {
        throw std::runtime_error(std::string("json update failed: ") + sqlite3_errmsg(db));
    }
    auto updated = column_text(q.stmt, 0);
    if (!updated) throw std::runtime_error("json update failed at " + path);
    text = *updated;
}

void JsonDoc::set_text(const std::string& path, const std::optional<std::string>& value) {
    update("SELECT json_set(?1, ?2, ?3);", path, [&](sqlite3_stmt* s) {
        if (value) sqlite3_bind_text(s, 3, value->c_str(), -1, SQLITE_TRANSIENT);
        else sqlite3_bind_null(s, 3);
    });
}

void JsonDoc::set_int(const std::string& path, int64_t value) {
    update("SELECT json_set(?1, ?2, ?3);", path, [&](sqlite3_stmt* s) { sqlite3_bind_int64(s, 3, value); });
}

void JsonDoc::set_bool(const std::string& path, bool value) {
    update("SELECT json_set(?1, ?2, json(?3));", path, [&](sqlite3_stmt* s) {
        sqlite3_bind_text(s, 3, value ? "true" : "false", -1, SQLITE_STATIC);
    });
}

void JsonDoc::set_object(const std::string& path) {
    update("SELECT json_set(?1, ?2, json('{}'));", path, [](sqlite3_stmt*) {});
}

void JsonDoc::set_array(const std::string& path) {
    update("SELECT json_set(?1, ?2, json('[]'));", path, [](sqlite3_stmt*) {});
}

void JsonDoc::append_text(const std::string& path, const std::string& value) {
    update("SELECT json_insert(?1, ?2 || '[#]', ?3);", path, [&](sqlite3_stmt* s) {
        sqlite3_bind_text(s, 3, value.c_str(), -1, SQLITE_TRANSIENT);
    });
}
