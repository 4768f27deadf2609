/*
    Ezfuck - An extended brainfuck interpreter
    Command assembler and loop resolver
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <iostream>
#include <optional>
#include <vector>

#include "vm.hxx"

namespace ezfuck {

Operand Command::defaulted() const { return operand.value_or(Operand::literal(EZFUCK_DEFAULT_OPERAND)); }

static Status attach(std::optional<char>& pending, Operand operand, std::vector<Command>& commands) {
    if (!pending) {
        if (operand.kind == Operand::Kind::CurrentCell)
            std::cerr << "\"V\" must come after a command" << std::endl;
        else
            std::cerr << "integer literal " << +operand.value << " must come after a command"
                      << std::endl;
        return Status::DANGLING_OPERAND;
    }
    if (isValueless(*pending)) {
        std::cerr << "command " << *pending << " cannot be given a value" << std::endl;
        return Status::VALUELESS_OPERAND;
    }
    commands.push_back({*pending, operand});
    pending.reset();
    return Status::OK;
}

Status assembleCommands(const std::vector<Token>& tokens, std::vector<Command>& commands) {
    std::optional<char> pending;
    for (const auto& token : tokens) {
        Status ret = Status::OK;
        switch (token.kind) {
            case Token::Kind::Command:
                if (pending) commands.push_back({*pending, std::nullopt});
                pending = token.symbol;
                break;
            case Token::Kind::IntegerLiteral:
                ret = attach(pending, Operand::literal(token.value), commands);
                break;
            case Token::Kind::CurrentCellReference:
                ret = attach(pending, Operand::currentCell(), commands);
                break;
        }
        if (ret != Status::OK) return ret;
    }
    if (pending) commands.push_back({*pending, std::nullopt});
    return Status::OK;
}

Status resolveLoops(const std::vector<Command>& commands, LoopMap& loops) {
    std::vector<size_t> stack;
    for (size_t i = 0; i < commands.size(); ++i) {
        const char ch = commands[i].symbol;
        if (ch == '[') {
            stack.push_back(i);
        } else if (ch == ']') {
            if (stack.empty()) {
                std::cerr << "] at " << i << " has no matching [" << std::endl;
                return Status::UNMATCHED_CLOSE;
            }
            const size_t start = stack.back();
            stack.pop_back();
            loops.openToClose[start] = i;
            loops.closeToOpen[i] = start;
        }
    }
    if (!stack.empty()) {
        std::cerr << "[ at " << stack.back() << " has no matching ]" << std::endl;
        return Status::UNMATCHED_OPEN;
    }
    return Status::OK;
}

}  // namespace ezfuck
