/*
    Ezfuck - An extended brainfuck interpreter
    Breakpoint stepper
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include <istream>
#include <ostream>
#include <vector>

#include "vm.hxx"

namespace ezfuck {

enum class DebugAction { STEPPED, QUIT };

/// @brief Pauses on the instruction at state.insPtr (the frozen instruction).
///
/// Shows the tape and the surrounding instructions, then reads one line from `in`. A line
/// starting with EZFUCK_QUIT_SENTINEL, or end of input, clears state.debugging and reports QUIT
/// without running anything. Any other non-empty line is compiled without breakpoints and run
/// against the same tape with both cursors saved and restored around it. After that the frozen
/// instruction is executed once with debugging off and STEPPED is reported.
Status debugBreak(const std::vector<Instruction>& program, ExecutionState& state, std::istream& in,
                  std::ostream& out, DebugAction& action);

}  // namespace ezfuck
