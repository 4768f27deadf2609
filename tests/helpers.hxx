#pragma once

#include <xxhash.h>

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "vm.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Compiles and runs code on `state`, feeding `input` to `,` and to debugger prompts.
inline std::string run(const std::string& code, ezfuck::ExecutionState& state,
                       const std::string& input = "", bool allowDebugging = false,
                       ezfuck::Status* retOut = nullptr) {
    std::istringstream in(input);
    std::ostringstream out;
    ezfuck::Status ret = ezfuck::execute(state, code, allowDebugging, in, out);
    if (retOut) *retOut = ret;
    return out.str();
}

// Runs with std::cerr silenced, for programs that are expected to fail.
inline ezfuck::Status runQuiet(const std::string& code, ezfuck::ExecutionState& state,
                               const std::string& input = "", std::string* output = nullptr) {
    std::ostringstream err;
    auto* old = std::cerr.rdbuf(err.rdbuf());
    ezfuck::Status ret = ezfuck::Status::OK;
    std::string out = run(code, state, input, false, &ret);
    std::cerr.rdbuf(old);
    if (output) *output = out;
    return ret;
}
