#pragma once
#include "pyfind_info.h"
#include "pyfind_spec.h"

// Can `info` serve a request for `spec`? The implementation only counts when `impl_must_match` is set.
bool satisfies(const PythonInfo& info, const PythonSpec& spec, bool impl_must_match);

// Relaxed choice among non-exact candidates, `candidates` must not be empty.
const PythonInfo& select_most_likely(const std::vector<PythonInfo>& candidates, const PythonInfo& target);
