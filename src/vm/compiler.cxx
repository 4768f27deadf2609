/*
    Ezfuck - An extended brainfuck interpreter
    Instruction compiler
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vm.hxx"

namespace ezfuck {

namespace {
constexpr std::array<std::pair<char, InsType>, 13> opcodes{{
    {'+', InsType::ADD},
    {'-', InsType::SUB},
    {'*', InsType::MUL},
    {'/', InsType::DIV},
    {'<', InsType::PTR_LFT},
    {'>', InsType::PTR_RGT},
    {'@', InsType::PTR_SET},
    {'[', InsType::JMP_ZER},
    {']', InsType::JMP_NOT_ZER},
    {'.', InsType::PUT_CHR},
    {',', InsType::RAD_CHR},
    {'^', InsType::SET},
    {'!', InsType::BREAK},
}};

constexpr bool hasOpcode(char symbol) {
    for (const auto& entry : opcodes)
        if (entry.first == symbol) return true;
    return false;
}

constexpr bool coversCommands() {
    for (char c : symbols::commands)
        if (!hasOpcode(c)) return false;
    return true;
}
static_assert(coversCommands(), "every command symbol needs an opcode");

// Entries without a symbol keep the UNMAPPED marker and are rejected by compileCommands.
constexpr uint8_t UNMAPPED = 0xFF;
constexpr std::array<uint8_t, 256> charToOpcode = [] {
    std::array<uint8_t, 256> table{};
    table.fill(UNMAPPED);
    for (const auto& entry : opcodes)
        table[static_cast<unsigned char>(entry.first)] = static_cast<uint8_t>(entry.second);
    return table;
}();

constexpr std::array<std::string_view, 13> opNames{
    "ADD",     "SUB",         "MUL",     "DIV",     "PTR_LFT", "PTR_RGT", "PTR_SET",
    "JMP_ZER", "JMP_NOT_ZER", "PUT_CHR", "RAD_CHR", "SET",     "BREAK"};
}  // namespace

Status compileCommands(const std::vector<Command>& commands, bool allowDebugging,
                       std::vector<Instruction>& program) {
    // Breakpoints go before loop resolution so bracket indices match the emitted list.
    std::vector<Command> kept;
    kept.reserve(commands.size());
    std::copy_if(commands.begin(), commands.end(), std::back_inserter(kept),
                 [allowDebugging](const Command& c) { return allowDebugging || c.symbol != '!'; });

    LoopMap loops;
    if (Status ret = resolveLoops(kept, loops); ret != Status::OK) return ret;

    program.clear();
    program.reserve(kept.size());
    for (size_t i = 0; i < kept.size(); ++i) {
        const Command& command = kept[i];
        const uint8_t opcode = charToOpcode[static_cast<unsigned char>(command.symbol)];
        if (opcode == UNMAPPED) {
            std::cerr << "no instruction for command " << command.symbol << std::endl;
            return Status::UNKNOWN_LEXEME;
        }
        Instruction ins;
        ins.op = static_cast<InsType>(opcode);
        if (!isValueless(command.symbol)) ins.operand = command.defaulted();
        if (ins.op == InsType::JMP_ZER) {
            ins.target = loops.openToClose.at(i);
        } else if (ins.op == InsType::JMP_NOT_ZER) {
            ins.target = loops.closeToOpen.at(i);
        }
        program.push_back(ins);
    }
    return Status::OK;
}

Status compile(std::string_view source, bool allowDebugging, std::vector<Instruction>& program) {
    std::vector<Token> tokens;
    if (Status ret = tokenize(source, tokens); ret != Status::OK) return ret;
    std::vector<Command> commands;
    if (Status ret = assembleCommands(tokens, commands); ret != Status::OK) return ret;
    return compileCommands(commands, allowDebugging, program);
}

std::string describe(const Instruction& ins) {
    std::string text{opNames[static_cast<size_t>(ins.op)]};
    switch (ins.op) {
        case InsType::JMP_ZER:
        case InsType::JMP_NOT_ZER:
            text += " -> " + std::to_string(ins.target);
            break;
        case InsType::PUT_CHR:
        case InsType::RAD_CHR:
        case InsType::BREAK:
            break;
        default:
            text += ' ';
            if (ins.operand.kind == Operand::Kind::CurrentCell)
                text += EZFUCK_CURRENT_CELL_MARKER;
            else
                text += std::to_string(ins.operand.value);
    }
    return text;
}

}  // namespace ezfuck
