/*
    Ezfuck - An extended brainfuck interpreter
    Breakpoint stepper
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "debugger.hxx"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "display.hxx"

namespace ezfuck {

namespace {
// Runs a snippet on the live tape. Tape writes persist, the cursors and the flag do not.
Status runNested(const std::vector<Instruction>& snippet, ExecutionState& state, std::istream& in,
                 std::ostream& out) {
    const size_t savedIns = state.insPtr;
    const size_t savedCell = state.cellPtr;
    const bool savedDebugging = state.debugging;
    state.insPtr = 0;
    state.debugging = false;
    Status ret = interpret(snippet, state, false, in, out);
    state.insPtr = savedIns;
    state.cellPtr = savedCell;
    state.debugging = savedDebugging;
    return ret;
}
}  // namespace

Status debugBreak(const std::vector<Instruction>& program, ExecutionState& state, std::istream& in,
                  std::ostream& out, DebugAction& action) {
    out << '\n';
    dumpTape(state.cells, state.cellPtr, out);
    dumpInstructions(program, state.insPtr, EZFUCK_DEBUG_WINDOW, out);
    out << EZFUCK_PROMPT << std::flush;

    std::string line;
    if (!std::getline(in, line) || (!line.empty() && line[0] == EZFUCK_QUIT_SENTINEL)) {
        state.debugging = false;
        action = DebugAction::QUIT;
        out << '\n';
        return Status::OK;
    }
    action = DebugAction::STEPPED;

    if (!line.empty()) {
        std::vector<Instruction> snippet;
        if (Status ret = compile(line, false, snippet); ret != Status::OK) return ret;
        if (Status ret = runNested(snippet, state, in, out); ret != Status::OK) return ret;
        out << '\n';
    }

    Status ret = step(program[state.insPtr], state, false, in, out);
    out << '\n';
    return ret;
}

}  // namespace ezfuck
