#pragma once
#include "pyfind_spec.h"

// PEP-514 interpreter registrations under Software\Python.

enum class RegistryHive { CurrentUser, LocalMachine };
enum class RegistryView { Default, Bits64, Bits32 };

using RegistryValue = std::variant<std::string, uint32_t>;

class RegistryBackend {
public:
    virtual ~RegistryBackend() = default;
    virtual bool has_key(RegistryHive hive, RegistryView view, const std::string& key) const = 0;
    virtual std::vector<std::string> subkeys(RegistryHive hive, RegistryView view, const std::string& key) const = 0;
    // an empty `name` reads the default value of the key
    virtual std::optional<RegistryValue> value(RegistryHive hive, RegistryView view, const std::string& key,
                                               const std::string& name) const = 0;
    virtual bool file_exists(const std::string& path) const = 0;
};

// Win32 registry on Windows, an empty registry everywhere else.
std::unique_ptr<RegistryBackend> make_registry_backend();

struct Pep514Entry {
    std::string company;
    int major = 0;
    std::optional<int> minor;
    int architecture = 64;
    std::string exe;
    std::optional<std::string> args;
};

std::vector<Pep514Entry> discover_pythons(const RegistryBackend& backend);

// Entries worth probing for `spec`, best first.
std::vector<Pep514Entry> pep514_proposals(std::vector<Pep514Entry> entries, const PythonSpec& spec);

std::string to_string(const Pep514Entry& entry);
