#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ezfuck {
enum class Status : int;
struct Command;
struct Instruction;

/// @brief Lowers commands into instructions with absolute jump targets.
/// @param allowDebugging When false, `!` commands are removed before the loops are resolved, so
/// targets always index the returned list.
Status compileCommands(const std::vector<Command>& commands, bool allowDebugging,
                       std::vector<Instruction>& program);

// Full front end: tokenize, assemble, resolve loops, lower.
Status compile(std::string_view source, bool allowDebugging, std::vector<Instruction>& program);

std::string describe(const Instruction& ins);

}  // namespace ezfuck
