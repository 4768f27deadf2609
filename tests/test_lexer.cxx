#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "vm.hxx"

using ezfuck::Status;
using ezfuck::Token;

static Status evaluateQuiet(const std::vector<std::string>& lexemes, std::vector<Token>& tokens) {
    std::ostringstream err;
    auto* old = std::cerr.rdbuf(err.rdbuf());
    Status ret = ezfuck::evaluateLexemes(lexemes, tokens);
    std::cerr.rdbuf(old);
    return ret;
}

static void test_scan_lexemes() {
    auto lexemes = ezfuck::scanLexemes("+ V1+23+4 ");
    assert((lexemes == std::vector<std::string>{"+", "V", "1", "+", "23", "+", "4"}));
}

static void test_consecutive_commands_split() {
    auto lexemes = ezfuck::scanLexemes("++--");
    assert((lexemes == std::vector<std::string>{"+", "+", "-", "-"}));
}

static void test_ignored_characters_end_digit_runs() {
    assert((ezfuck::scanLexemes("+1 2") == std::vector<std::string>{"+", "1", "2"}));
    assert((ezfuck::scanLexemes("+1x2") == std::vector<std::string>{"+", "1", "2"}));
    assert((ezfuck::scanLexemes("+12") == std::vector<std::string>{"+", "12"}));
    assert((ezfuck::scanLexemes("hello") == std::vector<std::string>{}));
    assert(ezfuck::scanLexemes("").empty());
}

static void test_all_symbols_are_single_lexemes() {
    auto lexemes = ezfuck::scanLexemes("+-*/<>[]^.,!@V");
    assert(lexemes.size() == 14);
    for (const auto& lexeme : lexemes) assert(lexeme.size() == 1);
}

static void test_evaluate_lexemes() {
    std::vector<Token> tokens;
    Status ret = ezfuck::evaluateLexemes({"+", "123", "-", "V"}, tokens);
    assert(ret == Status::OK);
    assert((tokens == std::vector<Token>{Token::command('+'), Token::integer(123),
                                         Token::command('-'), Token::currentCell()}));
}

static void test_literal_bounds() {
    std::vector<Token> tokens;
    assert(ezfuck::evaluateLexemes({"0", "255", "007"}, tokens) == Status::OK);
    assert(tokens[0].value == 0);
    assert(tokens[1].value == 255);
    assert(tokens[2].value == 7);

    tokens.clear();
    assert(evaluateQuiet({"256"}, tokens) == Status::BAD_LITERAL);
    tokens.clear();
    assert(evaluateQuiet({"99999999999999999999"}, tokens) == Status::BAD_LITERAL);
    tokens.clear();
    assert(evaluateQuiet({"12a"}, tokens) == Status::BAD_LITERAL);
}

static void test_unknown_lexeme() {
    std::vector<Token> tokens;
    assert(evaluateQuiet({"|"}, tokens) == Status::UNKNOWN_LEXEME);
    tokens.clear();
    assert(evaluateQuiet({"++"}, tokens) == Status::UNKNOWN_LEXEME);
    tokens.clear();
    assert(evaluateQuiet({""}, tokens) == Status::UNKNOWN_LEXEME);
}

static void test_tokenize() {
    std::vector<Token> tokens;
    assert(ezfuck::tokenize("*V >2 comment", tokens) == Status::OK);
    assert((tokens == std::vector<Token>{Token::command('*'), Token::currentCell(),
                                         Token::command('>'), Token::integer(2)}));
}

static void test_comment_heavy_source_stays_small() {
    std::string source(100000, 'x');
    source[10] = '+';
    source[500] = '7';
    source[90000] = '.';
    auto lexemes = ezfuck::scanLexemes(source);
    assert((lexemes == std::vector<std::string>{"+", "7", "."}));
    assert(lexemes.capacity() < 16);
}

int main() {
    test_scan_lexemes();
    test_consecutive_commands_split();
    test_ignored_characters_end_digit_runs();
    test_all_symbols_are_single_lexemes();
    test_evaluate_lexemes();
    test_literal_bounds();
    test_unknown_lexeme();
    test_tokenize();
    test_comment_heavy_source_stays_small();
    return 0;
}
