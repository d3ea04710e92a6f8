#ifdef _WIN32
#include "pyfind_registry.h"
#include <windows.h>
#include <cstring>

namespace {

class HKeyGuard {
    HKEY h = nullptr;
public:
    HKeyGuard() = default;
    HKeyGuard(const HKeyGuard&) = delete;
    HKeyGuard& operator=(const HKeyGuard&) = delete;
    ~HKeyGuard() { if (h) RegCloseKey(h); }
    HKEY* out() { return &h; }
    HKEY get() const { return h; }
};

HKEY hive_handle(RegistryHive hive) {
    return hive == RegistryHive::CurrentUser ? HKEY_CURRENT_USER : HKEY_LOCAL_MACHINE;
}

REGSAM view_flags(RegistryView view) {
    switch (view) {
        case RegistryView::Bits64: return KEY_WOW64_64KEY;
        case RegistryView::Bits32: return KEY_WOW64_32KEY;
        default: return 0;
    }
}

bool open_key(RegistryHive hive, RegistryView view, const std::string& key, HKeyGuard& guard) {
    return RegOpenKeyExA(hive_handle(hive), key.c_str(), 0, KEY_READ | view_flags(view), guard.out()) == ERROR_SUCCESS;
}

class Win32Registry : public RegistryBackend {
public:
    bool has_key(RegistryHive hive, RegistryView view, const std::string& key) const override {
        HKeyGuard h;
        return open_key(hive, view, key, h);
    }

    std::vector<std::string> subkeys(RegistryHive hive, RegistryView view, const std::string& key) const override {
        std::vector<std::string> names;
        HKeyGuard h;
        if (!open_key(hive, view, key, h)) return names;
        char buf[256];
        for (DWORD index = 0;; ++index) {
            DWORD n = sizeof(buf);
            if (RegEnumKeyExA(h.get(), index, buf, &n, nullptr, nullptr, nullptr, nullptr) != ERROR_SUCCESS) break;
            names.emplace_back(buf, n);
        }
        return names;
    }

    std::optional<RegistryValue> value(RegistryHive hive, RegistryView view, const std::string& key,
                                       const std::string& name) const override {
        HKeyGuard h;
        if (!open_key(hive, view, key, h)) return std::nullopt;
        DWORD type = 0, size = 0;
        const char* value_name = name.empty() ? nullptr : name.c_str();
        if (RegQueryValueExA(h.get(), value_name, nullptr, &type, nullptr, &size) != ERROR_SUCCESS) return std::nullopt;
        std::vector<char> buf(size + 1, '\0');
        if (RegQueryValueExA(h.get(), value_name, nullptr, &type, reinterpret_cast<LPBYTE>(buf.data()), &size) !=
            ERROR_SUCCESS)
            return std::nullopt;
        if (type == REG_DWORD && size >= sizeof(DWORD)) {
            DWORD v = 0;
            std::memcpy(&v, buf.data(), sizeof(v));
            return RegistryValue(static_cast<uint32_t>(v));
        }
        if (type != REG_SZ && type != REG_EXPAND_SZ) return std::nullopt;
        // the stored length may or may not count the terminating NUL
        return RegistryValue(std::string(buf.data()));
    }

    bool file_exists(const std::string& path) const override { return path_exists(path); }
};

}  // namespace

std::unique_ptr<RegistryBackend> make_registry_backend() {
    return std::make_unique<Win32Registry>();
}
#endif
