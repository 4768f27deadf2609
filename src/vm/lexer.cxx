/*
    Ezfuck - An extended brainfuck interpreter
    Lexer
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vm.hxx"

namespace ezfuck {

std::vector<std::string> scanLexemes(std::string_view source) {
    std::vector<std::string> lexemes;
    lexemes.reserve(static_cast<size_t>(std::count_if(
        source.begin(), source.end(), [](char c) { return classify(c) != CharClass::IGNORED; })));
    std::string partial;
    auto flush = [&]() {
        if (!partial.empty()) {
            lexemes.push_back(std::move(partial));
            partial.clear();
        }
    };

    CharClass last = CharClass::IGNORED;
    for (char c : source) {
        const CharClass cls = classify(c);
        switch (cls) {
            case CharClass::COMMAND:
            case CharClass::CURRENT_CELL:
                flush();
                lexemes.emplace_back(1, c);
                break;
            case CharClass::DIGIT:
                if (last != CharClass::DIGIT) flush();
                partial.push_back(c);
                break;
            case CharClass::IGNORED:
                break;
        }
        last = cls;
    }
    flush();
    return lexemes;
}

static Status evaluateLexeme(const std::string& lexeme, Token& token) {
    if (lexeme.empty()) {
        std::cerr << "empty lexeme" << std::endl;
        return Status::UNKNOWN_LEXEME;
    }
    const CharClass cls = classify(lexeme[0]);
    if (cls == CharClass::COMMAND && lexeme.size() == 1) {
        token = Token::command(lexeme[0]);
        return Status::OK;
    }
    if (cls == CharClass::DIGIT) {
        unsigned value = 0;
        const char* first = lexeme.data();
        const char* last = first + lexeme.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last || value > 255) {
            std::cerr << "could not parse " << lexeme << " as a byte literal" << std::endl;
            return Status::BAD_LITERAL;
        }
        token = Token::integer(static_cast<uint8_t>(value));
        return Status::OK;
    }
    if (cls == CharClass::CURRENT_CELL && lexeme.size() == 1) {
        token = Token::currentCell();
        return Status::OK;
    }
    std::cerr << "unknown lexeme: " << lexeme << std::endl;
    return Status::UNKNOWN_LEXEME;
}

Status evaluateLexemes(const std::vector<std::string>& lexemes, std::vector<Token>& tokens) {
    tokens.reserve(tokens.size() + lexemes.size());
    for (const auto& lexeme : lexemes) {
        Token token;
        if (Status ret = evaluateLexeme(lexeme, token); ret != Status::OK) return ret;
        tokens.push_back(token);
    }
    return Status::OK;
}

Status tokenize(std::string_view source, std::vector<Token>& tokens) {
    return evaluateLexemes(scanLexemes(source), tokens);
}

}  // namespace ezfuck
