#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ezfuck {
enum class Status : int;

namespace symbols {
inline constexpr std::string_view commands{"+-*/<>[]^.,!@"};
// Commands that never take an operand.
inline constexpr std::string_view valueless{"[],.!"};
inline constexpr std::string_view digits{"0123456789"};
}  // namespace symbols

enum class CharClass : uint8_t { IGNORED, COMMAND, DIGIT, CURRENT_CELL };

constexpr std::array<CharClass, 256> charClass = [] {
    std::array<CharClass, 256> table{};
    table.fill(CharClass::IGNORED);
    for (char c : symbols::commands) table[static_cast<unsigned char>(c)] = CharClass::COMMAND;
    for (char c : symbols::digits) table[static_cast<unsigned char>(c)] = CharClass::DIGIT;
    table[static_cast<unsigned char>(EZFUCK_CURRENT_CELL_MARKER)] = CharClass::CURRENT_CELL;
    return table;
}();

inline CharClass classify(char c) { return charClass[static_cast<unsigned char>(c)]; }

inline bool isValueless(char symbol) { return symbols::valueless.find(symbol) != std::string_view::npos; }

struct Token {
    enum class Kind : uint8_t { Command, IntegerLiteral, CurrentCellReference };

    Kind kind = Kind::Command;
    char symbol = '\0';
    uint8_t value = 0;

    static Token command(char c) { return Token{Kind::Command, c, 0}; }
    static Token integer(uint8_t v) { return Token{Kind::IntegerLiteral, '\0', v}; }
    static Token currentCell() { return Token{Kind::CurrentCellReference, '\0', 0}; }

    bool operator==(const Token&) const = default;
};

// Splits source into lexemes. Commands and `V` are always one character, digit runs merge,
// everything else is dropped but still ends a digit run.
std::vector<std::string> scanLexemes(std::string_view source);

Status evaluateLexemes(const std::vector<std::string>& lexemes, std::vector<Token>& tokens);

Status tokenize(std::string_view source, std::vector<Token>& tokens);

}  // namespace ezfuck
