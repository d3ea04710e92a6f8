#include "pyfind_info.h"
#include "pyfind_json.h"

namespace {

using OptField = std::optional<std::string> PythonInfo::*;

// optional string fields, in serialization order
const std::vector<std::pair<const char*, OptField>> OPTIONAL_FIELDS = {
    {"version_nodot", &PythonInfo::version_nodot},
    {"prefix", &PythonInfo::prefix},
    {"base_prefix", &PythonInfo::base_prefix},
    {"real_prefix", &PythonInfo::real_prefix},
    {"base_exec_prefix", &PythonInfo::base_exec_prefix},
    {"exec_prefix", &PythonInfo::exec_prefix},
    {"executable", &PythonInfo::executable},
    {"original_executable", &PythonInfo::original_executable},
    {"system_executable", &PythonInfo::system_executable},
    {"stdout_encoding", &PythonInfo::stdout_encoding},
    {"sysconfig_scheme", &PythonInfo::sysconfig_scheme},
    {"system_stdlib", &PythonInfo::system_stdlib},
    {"system_stdlib_platform", &PythonInfo::system_stdlib_platform},
};

using MapField = std::map<std::string, std::string> PythonInfo::*;

const std::vector<std::pair<const char*, MapField>> MAP_FIELDS = {
    {"sysconfig_paths", &PythonInfo::sysconfig_paths},
    {"distutils_install", &PythonInfo::distutils_install},
    {"sysconfig", &PythonInfo::sysconfig},
};

std::string require_text(const JsonDoc& doc, const std::string& path) {
    auto v = doc.get_text(path);
    if (!v) throw std::runtime_error("interpreter info lacks " + path);
    return *v;
}

int64_t require_int(const JsonDoc& doc, const std::string& path) {
    auto v = doc.get_int(path);
    if (!v) throw std::runtime_error("interpreter info lacks integer " + path);
    return *v;
}

}  // namespace

std::string PythonInfo::to_json() const {
    JsonDoc doc;
    doc.set_text("$.platform", platform);
    doc.set_text("$.implementation", implementation);
    doc.set_object("$.version_info");
    doc.set_int("$.version_info.major", version_info.major);
    doc.set_int("$.version_info.minor", version_info.minor);
    doc.set_int("$.version_info.micro", version_info.micro);
    doc.set_text("$.version_info.releaselevel", version_info.releaselevel);
    doc.set_int("$.version_info.serial", version_info.serial);
    doc.set_int("$.architecture", architecture);
    doc.set_text("$.version", version);
    doc.set_text("$.os", os);
    for (const auto& [name, field] : OPTIONAL_FIELDS) doc.set_text(json_key("$", name), this->*field);
    doc.set_bool("$.has_venv", has_venv);
    doc.set_array("$.path");
    for (const auto& entry : path) doc.append_text("$.path", entry);
    doc.set_text("$.file_system_encoding", file_system_encoding);
    for (const auto& [name, field] : MAP_FIELDS) {
        std::string base = json_key("$", name);
        doc.set_object(base);
        for (const auto& [k, v] : this->*field) doc.set_text(json_key(base, k), v);
    }
    doc.set_object("$.sysconfig_vars");
    for (const auto& [k, v] : sysconfig_vars) doc.set_text(json_key("$.sysconfig_vars", k), v);
    doc.set_int("$.max_size", max_size);
    return doc.str();
}

PythonInfo PythonInfo::from_json(const std::string& payload) {
    JsonDoc doc(payload);
    PythonInfo info;
    info.platform = require_text(doc, "$.platform");
    info.implementation = require_text(doc, "$.implementation");
    if (!doc.has("$.version_info")) throw std::runtime_error("interpreter info lacks $.version_info");
    info.version_info.major = static_cast<int>(require_int(doc, "$.version_info.major"));
    info.version_info.minor = static_cast<int>(require_int(doc, "$.version_info.minor"));
    info.version_info.micro = static_cast<int>(require_int(doc, "$.version_info.micro"));
    info.version_info.releaselevel = require_text(doc, "$.version_info.releaselevel");
    info.version_info.serial = static_cast<int>(require_int(doc, "$.version_info.serial"));
    info.architecture = static_cast<int>(require_int(doc, "$.architecture"));
    info.version = doc.get_text("$.version").value_or("");
    info.os = doc.get_text("$.os").value_or("");
    for (const auto& [name, field] : OPTIONAL_FIELDS) info.*field = doc.get_text(json_key("$", name));
    info.has_venv = doc.get_int("$.has_venv").value_or(0) != 0;
    info.path = doc.get_list("$.path");
    info.file_system_encoding = doc.get_text("$.file_system_encoding").value_or("");
    for (const auto& [name, field] : MAP_FIELDS) {
        for (const auto& [k, v] : doc.get_map(json_key("$", name)))
            if (v) (info.*field)[k] = *v;
    }
    info.sysconfig_vars = doc.get_map("$.sysconfig_vars");
    info.max_size = doc.get_int("$.max_size").value_or(0);
    return info;
}
