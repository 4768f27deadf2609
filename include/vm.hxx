/*
    Ezfuck - An extended brainfuck interpreter
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define EZFUCK_DEFAULT_OPERAND 1
#define EZFUCK_QUIT_SENTINEL '!'
#define EZFUCK_META_PREFIX ':'
#define EZFUCK_CURRENT_CELL_MARKER 'V'
#define EZFUCK_PROMPT "EZ> "
// Number of instructions shown on each side of the current one while paused.
#define EZFUCK_DEBUG_WINDOW 3
// File runs honour breakpoints unless -nodbg is given.
#define EZFUCK_DEFAULT_DEBUGGING 1

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ezfuck {

// Positive codes are compile-time errors, negative ones runtime faults.
enum class Status : int {
    OK = 0,
    UNMATCHED_CLOSE = 1,
    UNMATCHED_OPEN = 2,
    UNKNOWN_LEXEME = 3,
    BAD_LITERAL = 4,
    VALUELESS_OPERAND = 5,
    DANGLING_OPERAND = 6,
    POINTER_UNDERFLOW = -1,
    DIVISION_BY_ZERO = -2,
    END_OF_INPUT = -3,
};

const char* statusMessage(Status status);

inline bool isCompileError(Status status) { return static_cast<int>(status) > 0; }

// Either a literal byte or a reference to the cell under the pointer.
struct Operand {
    enum class Kind : uint8_t { Literal, CurrentCell };

    Kind kind = Kind::Literal;
    uint8_t value = EZFUCK_DEFAULT_OPERAND;

    static constexpr Operand literal(uint8_t v) { return Operand{Kind::Literal, v}; }
    static constexpr Operand currentCell() { return Operand{Kind::CurrentCell, 0}; }

    constexpr uint8_t resolve(uint8_t cell) const {
        return kind == Kind::CurrentCell ? cell : value;
    }

    bool operator==(const Operand&) const = default;
};

enum class InsType : uint8_t {
    ADD,
    SUB,
    MUL,
    DIV,
    PTR_LFT,
    PTR_RGT,
    PTR_SET,
    JMP_ZER,
    JMP_NOT_ZER,
    PUT_CHR,
    RAD_CHR,
    SET,
    BREAK,
};

struct Instruction {
    InsType op = InsType::ADD;
    Operand operand{};
    // Absolute index of the matching bracket, only meaningful for jumps.
    size_t target = 0;

    bool operator==(const Instruction&) const = default;
};

struct ExecutionState {
    std::vector<uint8_t> cells = std::vector<uint8_t>(1, 0);
    size_t cellPtr = 0;
    size_t insPtr = 0;
    bool debugging = false;

    uint8_t current() const { return cells[cellPtr]; }
    void setCurrent(uint8_t value) { cells[cellPtr] = value; }
    // Moves the cell pointer, growing the tape with zero cells when needed.
    void moveTo(size_t index) {
        if (index >= cells.size()) cells.resize(index + 1, 0);
        cellPtr = index;
    }
};

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
};

}  // namespace ezfuck

#include "vm/lexer.hxx"
#include "vm/parser.hxx"
#include "vm/compiler.hxx"
#include "vm/executor.hxx"
