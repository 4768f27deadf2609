/*
    Ezfuck - An extended brainfuck interpreter
    Line-based REPL implementation using linenoise-ng
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#ifdef EZFUCK_ENABLE_REPL
#include "repl.hxx"

#include <linenoise.h>
#include <simde/x86/avx2.h>
#include <simde/x86/sse2.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "display.hxx"

namespace {
constexpr int historyLen = 100;
}

namespace ezfuck {

std::vector<size_t> changedCells(const std::vector<uint8_t>& prev,
                                 const std::vector<uint8_t>& cells) {
    std::vector<size_t> changed;
    const size_t limit = std::min(prev.size(), cells.size());
#if defined(SIMDE_X86_AVX2_NATIVE) || (SIMDE_NATURAL_VECTOR_SIZE >= 256)
    constexpr size_t simdBytes = 32;
#else
    constexpr size_t simdBytes = 16;
#endif
    const size_t vecEnd = (limit / simdBytes) * simdBytes;
    const uint8_t* curr = cells.data();
    const uint8_t* old = prev.data();
    for (size_t off = 0; off < vecEnd; off += simdBytes) {
#if defined(SIMDE_X86_AVX2_NATIVE) || (SIMDE_NATURAL_VECTOR_SIZE >= 256)
        auto a = simde_mm256_loadu_si256(reinterpret_cast<const simde__m256i*>(curr + off));
        auto b = simde_mm256_loadu_si256(reinterpret_cast<const simde__m256i*>(old + off));
        const uint32_t mask = static_cast<uint32_t>(simde_mm256_movemask_epi8(simde_mm256_cmpeq_epi8(a, b)));
        if (mask != 0xFFFFFFFFu) {
#else
        auto a = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(curr + off));
        auto b = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(old + off));
        const uint32_t mask = static_cast<uint32_t>(simde_mm_movemask_epi8(simde_mm_cmpeq_epi8(a, b)));
        if (mask != 0xFFFFu) {
#endif
            for (size_t j = 0; j < simdBytes; ++j) {
                if (!((mask >> j) & 1u)) changed.push_back(off + j);
            }
        }
    }
    for (size_t i = vecEnd; i < limit; ++i) {
        if (cells[i] != prev[i]) changed.push_back(i);
    }
    for (size_t i = limit; i < cells.size(); ++i) {
        if (cells[i]) changed.push_back(i);
    }
    return changed;
}

bool replLine(ExecutionState& state, ReplConfig& cfg, const std::string& line,
              std::vector<size_t>& changed, std::istream& in, std::ostream& out) {
    if (!line.empty() && line[0] == EZFUCK_QUIT_SENTINEL) return false;
    if (!line.empty() && line[0] == EZFUCK_META_PREFIX) {
        std::istringstream iss(line.substr(1));
        std::string cmd;
        iss >> cmd;
        if (cmd == "q" || cmd == "quit") {
            return false;
        } else if (cmd == "help") {
            out << "Commands:\n"
                << ":reset            clear tape and pointer\n"
                << ":highlight on|off highlight cells changed by the last line\n"
                << ":q                quit (same as a line starting with !)" << std::endl;
        } else if (cmd == "reset") {
            state = ExecutionState{};
            changed.clear();
        } else if (cmd == "highlight") {
            std::string val;
            iss >> val;
            if (val == "on") {
                cfg.highlightChanges = true;
            } else if (val == "off") {
                cfg.highlightChanges = false;
                changed.clear();
            } else {
                out << "Expected on or off" << std::endl;
            }
        } else {
            out << "Unknown command" << std::endl;
        }
        return true;
    }

    std::vector<uint8_t> prevCells;
    if (cfg.highlightChanges) prevCells = state.cells;
    out << "Output: ";
    Status ret = execute(state, line, false, in, out);
    state.insPtr = 0;
    out << '\n';
    if (ret != Status::OK) reportError(ret, out);
    if (cfg.highlightChanges) changed = changedCells(prevCells, state.cells);
    return true;
}

int runRepl(ExecutionState& state, ReplConfig& cfg) {
    linenoiseHistorySetMaxLen(historyLen);
    std::vector<size_t> changed;
    while (true) {
        dumpTape(state.cells, state.cellPtr, std::cout, &changed, cfg.highlightChanges);
        char* line = linenoise(EZFUCK_PROMPT);
        if (line == nullptr) {
            std::cout << std::endl;
            break;  // Ctrl-D or Ctrl-C
        }
        std::string input(line);
        linenoiseHistoryAdd(line);
        std::free(line);
        if (!replLine(state, cfg, input, changed)) break;
    }
    return 0;
}

}  // namespace ezfuck
#endif  // EZFUCK_ENABLE_REPL
