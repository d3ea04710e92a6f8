#pragma once
#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include "pyfind_session.h"
#include "pyfind_env.h"
#include "pyfind_log.h"

// The interpreter behind the python found on PATH, probed once per test binary.
inline const std::optional<PythonInfo>& host_info() {
    static const std::optional<PythonInfo> info = []() -> std::optional<PythonInfo> {
        Env env = current_env();
        std::string host = find_host_python(env);
        if (host.empty()) return std::nullopt;
        try {
            return run_probe(host, env);
        } catch (const ProbeFailure& e) {
            std::cerr << "host interpreter unusable: " << e.what() << std::endl;
            return std::nullopt;
        }
    }();
    return info;
}

// The real binary, PATH shims like pyenv's need a shell and their PATH to work.
inline std::string host_exe() {
    return host_info()->original_executable.value_or("");
}

#define REQUIRE_HOST_PYTHON() \
    if (!host_info()) GTEST_SKIP() << "no usable python interpreter on PATH"

// Records everything the pyfind logger emits while in scope.
class LogCapture {
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
    spdlog::level::level_enum previous;
public:
    explicit LogCapture(spdlog::level::level_enum level = spdlog::level::debug)
        : sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8192)), previous(logger()->level()) {
        logger()->sinks().push_back(sink);
        logger()->set_level(level);
    }
    ~LogCapture() {
        auto& sinks = logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
        logger()->set_level(previous);
    }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<std::string> messages(spdlog::level::level_enum at = spdlog::level::trace) const {
        std::vector<std::string> out;
        for (const auto& msg : sink->last_raw()) {
            if (msg.level >= at) out.emplace_back(msg.payload.data(), msg.payload.size());
        }
        return out;
    }
    bool contains(const std::string& needle) const {
        for (const auto& m : messages())
            if (m.find(needle) != std::string::npos) return true;
        return false;
    }
};

// Fresh directory under the system temp dir, removed with the object.
class TempDir {
    fs::path dir;
public:
    TempDir() {
        dir = fs::temp_directory_path() / ("pyfind-test-" + gen_cookie().substr(0, 12));
        fs::create_directories(dir);
        dir = fs::canonical(dir);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    const fs::path& path() const { return dir; }
};

// Restores the working directory on scope exit.
class ScopedCwd {
    fs::path previous;
public:
    explicit ScopedCwd(const fs::path& to) : previous(fs::current_path()) { fs::current_path(to); }
    ~ScopedCwd() {
        std::error_code ec;
        fs::current_path(previous, ec);
    }
};
