#pragma once

#include <cstdint>
#include <iostream>
#include <istream>
#include <ostream>
#include <string_view>
#include <vector>

namespace ezfuck {
enum class Status : int;
struct Instruction;
struct ExecutionState;
struct ProfileInfo;

/// @brief Only function you should use in your code: compiles and runs source against a state.
/// @param state Tape and cursors. The tape persists across calls, the instruction pointer is
/// reset to 0 and the stepper switched off before the run; the pointer is left at the program
/// length on success.
/// @param code Plain ezfuck source, unknown characters are ignored.
/// @param allowDebugging Compile `!` into breakpoints and pause on them. Check
/// EZFUCK_DEFAULT_DEBUGGING.
/// @param in Source for `,` and for debugger prompts.
/// @param out Sink for `.` and for the debugger display. Flushed after every print.
/// @param profile Filled with executed instruction count and elapsed time when not null.
/// @return Status::OK, a compile error (nothing ran) or the runtime fault that stopped the run.
Status execute(ExecutionState& state, std::string_view code,
               bool allowDebugging = EZFUCK_DEFAULT_DEBUGGING, std::istream& in = std::cin,
               std::ostream& out = std::cout, ProfileInfo* profile = nullptr);

// Runs an already compiled program from state.insPtr until it halts or faults.
Status interpret(const std::vector<Instruction>& program, ExecutionState& state,
                 bool allowDebugging, std::istream& in, std::ostream& out,
                 ProfileInfo* profile = nullptr);

// Executes one instruction without touching the instruction pointer increment.
Status step(const Instruction& ins, ExecutionState& state, bool allowDebugging,
            std::istream& in, std::ostream& out);

uint8_t applyArithmetic(InsType op, uint8_t cell, uint8_t value);

}  // namespace ezfuck
