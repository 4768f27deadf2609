#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

// Included from vm.hxx once Operand is complete.
namespace ezfuck {
enum class Status : int;
struct Token;

struct Command {
    char symbol = '\0';
    std::optional<Operand> operand{};

    Operand defaulted() const;
    bool operator==(const Command&) const = default;
};

struct LoopMap {
    std::unordered_map<size_t, size_t> openToClose;
    std::unordered_map<size_t, size_t> closeToOpen;
};

/// @brief Pairs every command symbol with the operand token that directly follows it.
/// @param tokens Output of tokenize().
/// @param commands Appended to; left partially filled on failure.
/// @return VALUELESS_OPERAND if a bracket, I/O or breakpoint symbol is given a value,
/// DANGLING_OPERAND if a value has no symbol in front of it.
Status assembleCommands(const std::vector<Token>& tokens, std::vector<Command>& commands);

Status resolveLoops(const std::vector<Command>& commands, LoopMap& loops);

}  // namespace ezfuck
