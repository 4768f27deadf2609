/*
    Ezfuck - An extended brainfuck interpreter
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "debugger.hxx"

namespace ezfuck {

const char* statusMessage(Status status) {
    switch (status) {
        case Status::OK:
            return "OK";
        case Status::UNMATCHED_CLOSE:
            return "Unmatched close bracket";
        case Status::UNMATCHED_OPEN:
            return "Unmatched open bracket";
        case Status::UNKNOWN_LEXEME:
            return "Unknown lexeme";
        case Status::BAD_LITERAL:
            return "Integer literal is not a byte (0-255)";
        case Status::VALUELESS_OPERAND:
            return "Operand given to a command that takes none";
        case Status::DANGLING_OPERAND:
            return "Operand with no preceding command";
        case Status::POINTER_UNDERFLOW:
            return "Cell pointer moved before start";
        case Status::DIVISION_BY_ZERO:
            return "Division by zero";
        case Status::END_OF_INPUT:
            return "End of input while reading";
    }
    return "Unknown error";
}

uint8_t applyArithmetic(InsType op, uint8_t cell, uint8_t value) {
    switch (op) {
        case InsType::ADD:
            return static_cast<uint8_t>(cell + value);
        case InsType::SUB:
            return static_cast<uint8_t>(cell - value);
        case InsType::MUL:
            return static_cast<uint8_t>(cell * value);
        case InsType::DIV:
            return static_cast<uint8_t>(cell / value);
        default:
            return cell;
    }
}

Status step(const Instruction& ins, ExecutionState& state, bool allowDebugging, std::istream& in,
            std::ostream& out) {
    switch (ins.op) {
        case InsType::ADD:
        case InsType::SUB:
        case InsType::MUL:
        case InsType::DIV: {
            const uint8_t value = ins.operand.resolve(state.current());
            if (ins.op == InsType::DIV && value == 0) return Status::DIVISION_BY_ZERO;
            state.setCurrent(applyArithmetic(ins.op, state.current(), value));
            break;
        }
        case InsType::PTR_LFT:
        case InsType::PTR_RGT: {
            const ptrdiff_t delta = ins.operand.resolve(state.current());
            const ptrdiff_t newIndex = static_cast<ptrdiff_t>(state.cellPtr) +
                                       (ins.op == InsType::PTR_LFT ? -delta : delta);
            if (newIndex < 0) {
                std::cerr << "cannot move left by " << delta << " from cell " << state.cellPtr
                          << std::endl;
                return Status::POINTER_UNDERFLOW;
            }
            state.moveTo(static_cast<size_t>(newIndex));
            break;
        }
        case InsType::PTR_SET:
            state.moveTo(ins.operand.resolve(state.current()));
            break;
        case InsType::JMP_ZER:
            if (state.current() == 0) state.insPtr = ins.target;
            break;
        case InsType::JMP_NOT_ZER:
            if (state.current() != 0) state.insPtr = ins.target;
            break;
        case InsType::PUT_CHR:
            out.put(static_cast<char>(state.current()));
            out.flush();
            break;
        case InsType::RAD_CHR: {
            const int ch = in.get();
            if (ch == std::char_traits<char>::eof()) return Status::END_OF_INPUT;
            state.setCurrent(static_cast<uint8_t>(ch));
            break;
        }
        case InsType::SET:
            state.setCurrent(ins.operand.resolve(state.current()));
            break;
        case InsType::BREAK:
            if (allowDebugging) state.debugging = true;
            break;
    }
    return Status::OK;
}

Status interpret(const std::vector<Instruction>& program, ExecutionState& state,
                 bool allowDebugging, std::istream& in, std::ostream& out, ProfileInfo* profile) {
    while (state.insPtr < program.size()) {
        if (state.debugging) {
            DebugAction action = DebugAction::STEPPED;
            if (Status ret = debugBreak(program, state, in, out, action); ret != Status::OK)
                return ret;
            // The frozen instruction still has to run, now outside the stepper.
            if (action == DebugAction::QUIT) continue;
        } else {
            if (Status ret = step(program[state.insPtr], state, allowDebugging, in, out);
                ret != Status::OK)
                return ret;
        }
        if (profile) ++profile->instructions;
        ++state.insPtr;
    }
    return Status::OK;
}

Status execute(ExecutionState& state, std::string_view code, bool allowDebugging,
               std::istream& in, std::ostream& out, ProfileInfo* profile) {
    std::chrono::steady_clock::time_point start;
    if (profile) {
        profile->instructions = 0;
        start = std::chrono::steady_clock::now();
    }
    std::vector<Instruction> program;
    if (Status ret = compile(code, allowDebugging, program); ret != Status::OK) return ret;
    state.insPtr = 0;
    state.debugging = false;
    Status ret = interpret(program, state, allowDebugging, in, out, profile);
    if (profile)
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return ret;
}

}  // namespace ezfuck
