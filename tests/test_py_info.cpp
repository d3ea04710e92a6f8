#include "test_helpers.h"
#include "pyfind_match.h"
#include "pyfind_json.h"

namespace {

PythonInfo mock_info(const std::string& impl, int arch, VersionInfo version) {
    PythonInfo info;
    info.implementation = impl;
    info.architecture = arch;
    info.version_info = std::move(version);
    return info;
}

PythonInfo scheme_info() {
    PythonInfo info = mock_info("CPython", 64, {3, 11, 7, "final", 0});
    info.prefix = info.exec_prefix = "/usr";
    info.base_prefix = info.base_exec_prefix = "/usr";
    info.sysconfig_paths = {
        {"stdlib", "{installed_base}/lib/python{py_version_short}"},
        {"purelib", "{base}/lib/python{py_version_short}/site-packages"},
        {"scripts", "{base}/bin"},
        {"include", "{installed_base}/include/python{py_version_short}{abiflags}"},
    };
    info.sysconfig_vars = {
        {"base", "/usr"}, {"installed_base", "/usr"}, {"py_version_short", "3.11"}, {"abiflags", ""},
        {"PYTHONFRAMEWORK", std::nullopt},
    };
    return info;
}

std::string sep_to_slash(std::string s) {
    std::replace(s.begin(), s.end(), '\\', '/');
    return s;
}

}  // namespace

TEST(PythonInfoTest, CurrentAsJson) {
    REQUIRE_HOST_PYTHON();
    const PythonInfo& current = *host_info();
    JsonDoc parsed(current.to_json());
    EXPECT_EQ(parsed.get_int("$.version_info.major"), current.version_info.major);
    EXPECT_EQ(parsed.get_int("$.version_info.minor"), current.version_info.minor);
    EXPECT_EQ(parsed.get_int("$.version_info.micro"), current.version_info.micro);
    EXPECT_EQ(parsed.get_text("$.version_info.releaselevel"), current.version_info.releaselevel);
    EXPECT_EQ(parsed.get_int("$.version_info.serial"), current.version_info.serial);
    EXPECT_EQ(PythonInfo::from_json(current.to_json()).version_info, current.version_info);
}

TEST(PythonInfoTest, BadExeRaises) {
    TempDir tmp;
    Session session("");
    std::string exe = tmp.path().string();
    try {
        session.from_exe(exe, current_env());
        FAIL() << "expected ProbeFailure";
    } catch (const ProbeFailure& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("code"), std::string::npos);
        EXPECT_NE(msg.find(exe), std::string::npos);
    }
}

TEST(PythonInfoTest, BadExeNoRaise) {
    TempDir tmp;
    Session session("");
    std::string exe = tmp.path().string();
    LogCapture logs(spdlog::level::trace);
    testing::internal::CaptureStdout();
    auto result = session.from_exe(exe, current_env(), false);
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_FALSE(result);
    EXPECT_TRUE(out.empty());
    auto messages = logs.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_NE(messages[0].find("get interpreter info via cmd: "), std::string::npos);
    EXPECT_NE(messages[1].find(exe), std::string::npos);
    EXPECT_NE(messages[1].find("code"), std::string::npos);
}

TEST(PythonInfoTest, SatisfiesOwnTraits) {
    REQUIRE_HOST_PYTHON();
    const PythonInfo& current = *host_info();
    std::vector<std::string> impls{current.implementation};
    if (current.implementation == "CPython") impls.push_back("python");
    if (to_lower(current.implementation) != current.implementation) impls.push_back(to_lower(current.implementation));
    std::vector<std::string> specs{*current.executable};
    for (const auto& impl : impls) {
        for (int at = 1; at <= 3; ++at) {
            for (const std::string arch : {std::string(), "-" + std::to_string(current.architecture)})
                specs.push_back(impl + current.version_info.str(at) + arch);
        }
    }
    for (const auto& spec : specs) EXPECT_TRUE(satisfies(current, PythonSpec::from_string_spec(spec), true)) << spec;
}

TEST(PythonInfoTest, DoesNotSatisfyOtherArch) {
    PythonInfo info = mock_info("CPython", 64, {3, 11, 7, "final", 0});
    EXPECT_FALSE(satisfies(info, PythonSpec::from_string_spec("CPython-32"), true));
    EXPECT_TRUE(satisfies(info, PythonSpec::from_string_spec("CPython-64"), true));
}

TEST(PythonInfoTest, DoesNotSatisfyOtherVersion) {
    PythonInfo info = mock_info("CPython", 64, {3, 11, 7, "final", 0});
    for (const char* v : {"2", "4", "2.11", "4.11", "3.10", "3.12", "2.11.7", "3.10.7", "3.11.6", "3.11.8"}) {
        EXPECT_FALSE(satisfies(info, PythonSpec::from_string_spec(std::string("CPython") + v), true)) << v;
    }
}

TEST(PythonInfoTest, ImplementationOnlyCountsWhenRequired) {
    PythonInfo info = mock_info("CPython", 64, {3, 11, 7, "final", 0});
    EXPECT_FALSE(satisfies(info, PythonSpec::from_string_spec("pypy3"), true));
    EXPECT_TRUE(satisfies(info, PythonSpec::from_string_spec("pypy3"), false));
    EXPECT_TRUE(satisfies(info, PythonSpec::from_string_spec("cpython3"), true));
}

TEST(PythonInfoTest, AbsolutePathMustMatchExactly) {
    PythonInfo info = mock_info("CPython", 64, {3, 11, 7, "final", 0});
    fs::path bin = fs::temp_directory_path() / "pyfind" / "bin";
    info.executable = info.original_executable = (bin / "python3").string();
    EXPECT_TRUE(satisfies(info, PythonSpec::from_string_spec((bin / "python3").string()), true));
    EXPECT_FALSE(satisfies(info, PythonSpec::from_string_spec((bin / "python").string()), true));
}

TEST(PythonInfoTest, NonSpecNameMatch) {
    PythonInfo info = mock_info("CPython", 64, {3, 11, 7, "final", 0});
    std::string suffixed = "python3.11m";
    fs::path bin = fs::temp_directory_path() / "bin";
    info.executable = (bin / "python3").string();
    info.original_executable = (bin / (suffixed + (kIsWindows ? ".exe" : ""))).string();
    PythonSpec spec = PythonSpec::from_string_spec(suffixed + (kIsWindows ? ".exe" : ""));
    EXPECT_TRUE(satisfies(info, spec, true));
}

TEST(PythonInfoTest, NonSpecNameNotMatch) {
    PythonInfo info = mock_info("CPython", 64, {3, 11, 7, "final", 0});
    std::string suffixed = "python3.11m";
    fs::path bin = fs::temp_directory_path() / "bin";
    info.executable = (bin / "python3").string();
    info.original_executable = (bin / ("e" + suffixed)).string();
    EXPECT_FALSE(satisfies(info, PythonSpec::from_string_spec(suffixed), true));
}

TEST(SelectMostLikelyTest, PrefersImplementationOverMicro) {
    PythonInfo target = mock_info("CPython", 64, {3, 6, 8, "final", 0});
    std::vector<PythonInfo> discovered{mock_info("CPython", 64, {3, 6, 9, "final", 0}),
                                       mock_info("PyPy", 64, {3, 6, 8, "final", 0})};
    EXPECT_EQ(&select_most_likely(discovered, target), &discovered[0]);
}

TEST(SelectMostLikelyTest, PrefersArchitecture) {
    PythonInfo target = mock_info("CPython", 64, {3, 6, 8, "final", 0});
    std::vector<PythonInfo> discovered{mock_info("CPython", 32, {3, 6, 9, "final", 0}),
                                       mock_info("CPython", 64, {3, 6, 9, "final", 0})};
    EXPECT_EQ(&select_most_likely(discovered, target), &discovered[1]);
}

TEST(SelectMostLikelyTest, ImplementationOutweighsEverythingElse) {
    PythonInfo target = mock_info("CPython", 64, {3, 8, 1, "final", 0});
    std::vector<PythonInfo> discovered{mock_info("PyPy", 64, {3, 8, 1, "final", 0}),
                                       mock_info("CPython", 32, {2, 7, 12, "rc", 2})};
    EXPECT_EQ(&select_most_likely(discovered, target), &discovered[1]);
}

TEST(SelectMostLikelyTest, TiesKeepInputOrder) {
    PythonInfo target = mock_info("CPython", 64, {3, 8, 1, "final", 0});
    std::vector<PythonInfo> discovered{mock_info("CPython", 64, {3, 8, 2, "final", 0}),
                                       mock_info("CPython", 64, {3, 8, 3, "final", 0})};
    discovered[0].executable = "first";
    discovered[1].executable = "second";
    for (int i = 0; i < 3; ++i) EXPECT_EQ(select_most_likely(discovered, target).executable, "first");
}

TEST(SelectMostLikelyTest, ExactMatchAlwaysWins) {
    PythonInfo target = mock_info("CPython", 64, {3, 8, 1, "final", 0});
    std::vector<PythonInfo> discovered{mock_info("CPython", 64, {3, 8, 1, "final", 1}),
                                       mock_info("CPython", 64, {3, 8, 1, "beta", 0}),
                                       mock_info("CPython", 64, {3, 8, 1, "final", 0})};
    EXPECT_EQ(&select_most_likely(discovered, target), &discovered[2]);
}

TEST(SelectMostLikelyTest, EmptyListIsAnError) {
    EXPECT_THROW(select_most_likely({}, mock_info("CPython", 64, {3, 8, 1, "final", 0})), std::runtime_error);
}

TEST(PythonInfoTest, DerivedNames) {
    PythonInfo info = mock_info("CPython", 64, {3, 11, 7, "final", 0});
    EXPECT_EQ(info.spec(), "CPython3.11.7.final.0-64");
    EXPECT_EQ(info.version_str(), "3.11.7");
    EXPECT_EQ(info.version_release_str(), "3.11");
    EXPECT_EQ(info.python_name(), "python3.11");
    EXPECT_FALSE(info.is_venv());
    EXPECT_FALSE(info.is_old_virtualenv());
    EXPECT_THROW(info.system_prefix(), std::runtime_error);
    info.prefix = "/venv";
    info.base_prefix = "/usr";
    EXPECT_EQ(info.system_prefix(), "/usr");
    info.real_prefix = "/old";
    EXPECT_EQ(info.system_prefix(), "/old");
    EXPECT_TRUE(info.is_old_virtualenv());
}

TEST(PythonInfoTest, SummaryNamesDistinctExecutables) {
    PythonInfo info = mock_info("CPython", 64, {3, 11, 7, "final", 0});
    info.platform = "linux";
    info.executable = "/venv/bin/python";
    info.original_executable = "/venv/bin/python";
    info.system_executable = "/usr/bin/python3.11";
    info.file_system_encoding = "utf-8";
    info.stdout_encoding = "utf-8";
    std::string text = info.str();
    EXPECT_EQ(text.rfind("PythonInfo(spec=CPython3.11.7.final.0-64, system=/usr/bin/python3.11, exe=/venv/bin/python", 0), 0u)
        << text;
    EXPECT_EQ(text.find("original="), std::string::npos);
    EXPECT_NE(text.find("encoding_fs_io=utf-8-utf-8"), std::string::npos);
}

TEST(PythonInfoTest, CustomVenvInstallSchemeIsPreferred) {
    PythonInfo info = scheme_info();
    EXPECT_EQ(info.install_path("scripts"), "bin");
    EXPECT_EQ(sep_to_slash(info.install_path("purelib")), "lib/python3.11/site-packages");
}

TEST(PythonInfoTest, DistutilsSchemeWinsWhenPresent) {
    PythonInfo info = scheme_info();
    info.distutils_install = {{"scripts", "local/bin"}};
    EXPECT_EQ(info.install_path("scripts"), "local/bin");
    EXPECT_THROW(info.install_path("nonexistent"), std::runtime_error);
}

TEST(PythonInfoTest, SysconfigPathExpandsVariables) {
    PythonInfo info = scheme_info();
    EXPECT_EQ(info.sysconfig_path("stdlib", {}, '/'), "/usr/lib/python3.11");
    EXPECT_EQ(info.sysconfig_path("stdlib", {{"installed_base", std::string("/opt")}}, '/'), "/opt/lib/python3.11");
    info.sysconfig_paths["broken"] = "{nope}/x";
    EXPECT_THROW(info.sysconfig_path("broken"), std::runtime_error);
}

TEST(PythonInfoTest, SystemIncludeFollowsSystemPrefix) {
    TempDir tmp;
    fs::path venv = tmp.path() / "venv";
    fs::path base = tmp.path() / "base";
    fs::create_directories(base / "include" / "python3.11");
    PythonInfo info = scheme_info();
    info.prefix = info.exec_prefix = venv.string();
    info.base_prefix = info.base_exec_prefix = base.string();
    info.sysconfig_vars["base"] = venv.string();
    info.sysconfig_vars["installed_base"] = venv.string();
    EXPECT_EQ(info.system_include(), (base / "include" / "python3.11").string());
}

TEST(PythonInfoTest, SystemIncludeFallsBackToHeadersScheme) {
    TempDir tmp;
    fs::path prefix = tmp.path() / "prefix";
    fs::create_directories(prefix / "include" / "site");
    PythonInfo info = scheme_info();
    info.prefix = info.exec_prefix = info.base_prefix = info.base_exec_prefix = prefix.string();
    info.sysconfig_vars["installed_base"] = (tmp.path() / "missing").string();
    info.distutils_install = {{"headers", (fs::path("include") / "site" / "UNKNOWN").string()}};
    EXPECT_EQ(info.system_include(), (prefix / "include" / "site").string());
}

TEST(PythonInfoTest, ProbeIgnoresDistutilsConfig) {
    REQUIRE_HOST_PYTHON();
    TempDir tmp;
    std::string root = tmp.path().string();
    std::ofstream(tmp.path() / "setup.cfg") << "[install]\nprefix=" << root << "/prefix\ninstall_purelib=" << root
                                            << "/purelib\ninstall_scripts=" << root << "/scripts\n";
    ScopedCwd cwd(tmp.path());
    PythonInfo info = run_probe(host_exe(), current_env());
    for (const auto& [key, value] : info.distutils_install) EXPECT_NE(value.rfind(root, 0), 0u) << key << "=" << value;
}
