#include "pyfind_probe.h"

// Executed by the interpreter under inspection as `python -c <script> <start> <end>`.
// Only the standard library of the target may be used here.
const std::string& probe_script() {
    static const std::string script = R"PY(
import sys

# -c puts the working directory first on sys.path, it must not shadow the stdlib
if sys.path and sys.path[0] == "":
    del sys.path[0]

import json
import os
import platform
import re
import sysconfig
import warnings


def absolute(value):
    return None if value is None else os.path.abspath(value)


def system_executable(info):
    in_venv = info["real_prefix"] or (info["base_prefix"] is not None and info["base_prefix"] != info["prefix"])
    if not in_venv:
        # shims may misreport the executable, trust the interpreter's own view
        return info["original_executable"]
    if info["real_prefix"] is not None:
        return None
    base = getattr(sys, "_base_executable", None)
    if base is None or base == sys.executable:
        return None
    if os.path.exists(base):
        return base
    major, minor = sys.version_info[:2]
    if os.name == "posix" and (major, minor) >= (3, 11):
        folder = os.path.dirname(base)
        for name in ("python{}".format(major), "python{}.{}".format(major, minor)):
            candidate = os.path.join(folder, name)
            if os.path.exists(candidate):
                return candidate
    return None


def distutils_install():
    with warnings.catch_warnings():
        warnings.simplefilter("ignore")
        try:
            from distutils import dist
            from distutils.command.install import SCHEME_KEYS
        except ImportError:
            return {}
    # config files are not read so they cannot redirect the paths
    distribution = dist.Distribution({"script_args": "--no-user-cfg"})
    if hasattr(sys, "_framework"):
        sys._framework = None
    with warnings.catch_warnings():
        warnings.simplefilter("ignore")
        install = distribution.get_command_obj("install", create=True)
    install.prefix = os.sep
    install.finalize_options()
    return {key: getattr(install, "install_" + key)[1:].lstrip(os.sep) for key in SCHEME_KEYS}


def expand(info, key, overrides):
    values = dict(info["sysconfig_vars"])
    values.update(overrides)
    return info["sysconfig_paths"][key].format(**values).replace("/", os.sep)


def collect():
    info = {}
    info["platform"] = sys.platform
    info["implementation"] = platform.python_implementation()
    info["version_info"] = dict(zip(("major", "minor", "micro", "releaselevel", "serial"), tuple(sys.version_info)))
    info["architecture"] = 64 if sys.maxsize > 2 ** 32 else 32
    info["version_nodot"] = sysconfig.get_config_var("py_version_nodot")
    info["version"] = sys.version
    info["os"] = os.name
    info["prefix"] = absolute(getattr(sys, "prefix", None))
    info["base_prefix"] = absolute(getattr(sys, "base_prefix", None))
    info["real_prefix"] = absolute(getattr(sys, "real_prefix", None))
    info["base_exec_prefix"] = absolute(getattr(sys, "base_exec_prefix", None))
    info["exec_prefix"] = absolute(getattr(sys, "exec_prefix", None))
    info["executable"] = absolute(sys.executable)
    info["original_executable"] = info["executable"]
    info["system_executable"] = system_executable(info)
    try:
        __import__("venv")
        info["has_venv"] = True
    except ImportError:
        info["has_venv"] = False
    info["path"] = [p for p in sys.path if isinstance(p, str)]
    info["file_system_encoding"] = sys.getfilesystemencoding()
    info["stdout_encoding"] = getattr(sys.stdout, "encoding", None)

    schemes = sysconfig.get_scheme_names()
    if "venv" in schemes:
        scheme = "venv"
    elif sys.version_info[:2] == (3, 10) and "deb_system" in schemes:
        # debian's default scheme mangles the paths to local/, posix_prefix is the unpatched one
        scheme = "posix_prefix"
    else:
        scheme = None
    info["sysconfig_scheme"] = scheme
    if scheme is None:
        info["sysconfig_paths"] = {i: sysconfig.get_path(i, expand=False) for i in sysconfig.get_path_names()}
        info["distutils_install"] = distutils_install()
    else:
        info["sysconfig_paths"] = {
            i: sysconfig.get_path(i, expand=False, scheme=scheme) for i in sysconfig.get_path_names()
        }
        info["distutils_install"] = {}

    makefile = getattr(sysconfig, "get_makefile_filename", getattr(sysconfig, "_get_makefile_filename", None))
    info["sysconfig"] = {"makefile_filename": makefile()} if makefile is not None else {}

    names = {"PYTHONFRAMEWORK"}
    for pattern in info["sysconfig_paths"].values():
        names.update(m[1:-1] for m in re.findall(r"\{\w+\}", pattern))
    config = {}
    for name in names:
        value = sysconfig.get_config_var(name)
        config[name] = None if value is None else str(value)
    info["sysconfig_vars"] = config

    system_prefix = info["real_prefix"] or info["base_prefix"] or info["prefix"]
    relocated = {
        k: (system_prefix if v is not None and info["prefix"] and v.startswith(info["prefix"]) else v)
        for k, v in config.items()
    }
    info["system_stdlib"] = expand(info, "stdlib", relocated)
    info["system_stdlib_platform"] = expand(info, "platstdlib", relocated)
    info["max_size"] = sys.maxsize
    return info


def main():
    cookies = sys.argv[1:3] + ["", ""]
    start, end = cookies[0], cookies[1]
    sys.argv = sys.argv[:1] + sys.argv[3:]
    payload = json.dumps(collect(), indent=2)
    sys.stdout.write(start[::-1] + payload + end[::-1])


main()
)PY";
    return script;
}
