#pragma once
#include "pyfind_info.h"
#include "pyfind_errors.h"

const std::string& probe_script();

// Returns the text between the reversed cookies, everything outside of them is appended to `noise`.
std::string extract_payload(const std::string& out, const std::string& start_cookie, const std::string& end_cookie,
                            std::string& noise);

// Runs the probe script inside `exe` and decodes what it reports, throws ProbeFailure.
PythonInfo run_probe(const std::string& exe, const Env& env);
