/*
    Ezfuck - An extended brainfuck interpreter
    REPL API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#ifdef EZFUCK_ENABLE_REPL
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "vm.hxx"

namespace ezfuck {

struct ReplConfig {
    bool highlightChanges;
};

// Interactive session on stdin/stdout with linenoise line editing. Returns when the quit
// sentinel is entered or input ends.
int runRepl(ExecutionState& state, ReplConfig& cfg);

/// @brief Handles one REPL line against the persistent state.
/// @param changed Receives the indices of cells modified by the line when highlighting is on.
/// @param in Source for `,` inside the line.
/// @return false when the line ends the session.
bool replLine(ExecutionState& state, ReplConfig& cfg, const std::string& line,
              std::vector<size_t>& changed, std::istream& in = std::cin,
              std::ostream& out = std::cout);

// Indices where `cells` differs from `prev`, plus non-zero cells past the end of `prev`.
std::vector<size_t> changedCells(const std::vector<uint8_t>& prev,
                                 const std::vector<uint8_t>& cells);

}  // namespace ezfuck
#endif  // EZFUCK_ENABLE_REPL
