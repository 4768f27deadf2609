#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "vm.hxx"

using ezfuck::InsType;
using ezfuck::Instruction;
using ezfuck::Operand;
using ezfuck::Status;

static std::vector<Instruction> compileOk(const std::string& code, bool allowDebugging = false) {
    std::vector<Instruction> program;
    Status ret = ezfuck::compile(code, allowDebugging, program);
    assert(ret == Status::OK);
    (void)ret;
    return program;
}

static Status compileQuiet(const std::string& code) {
    std::ostringstream err;
    auto* old = std::cerr.rdbuf(err.rdbuf());
    std::vector<Instruction> program;
    Status ret = ezfuck::compile(code, false, program);
    std::cerr.rdbuf(old);
    return ret;
}

static Instruction ins(InsType op, Operand operand = {}, size_t target = 0) {
    return Instruction{op, operand, target};
}

static void test_empty_loop_targets() {
    auto program = compileOk("[]");
    assert(program.size() == 2);
    assert(program[0] == ins(InsType::JMP_ZER, {}, 1));
    assert(program[1] == ins(InsType::JMP_NOT_ZER, {}, 0));
}

static void test_ignores_invalid_characters() {
    auto program = compileOk("+None of this should be considered*");
    assert(program.size() == 2);
    assert(program[0] == ins(InsType::ADD, Operand::literal(1)));
    assert(program[1] == ins(InsType::MUL, Operand::literal(1)));
}

static void test_instruction_for_each_symbol() {
    auto program = compileOk("[]+-*/<>@.,^");
    assert(program.size() == 12);
    assert(program[2] == ins(InsType::ADD, Operand::literal(1)));
    assert(program[3] == ins(InsType::SUB, Operand::literal(1)));
    assert(program[4] == ins(InsType::MUL, Operand::literal(1)));
    assert(program[5] == ins(InsType::DIV, Operand::literal(1)));
    assert(program[6] == ins(InsType::PTR_LFT, Operand::literal(1)));
    assert(program[7] == ins(InsType::PTR_RGT, Operand::literal(1)));
    assert(program[8] == ins(InsType::PTR_SET, Operand::literal(1)));
    assert(program[9].op == InsType::PUT_CHR);
    assert(program[10].op == InsType::RAD_CHR);
    assert(program[11] == ins(InsType::SET, Operand::literal(1)));
}

static void test_values_and_defaults() {
    auto program = compileOk("++1+2+3+40+200");
    assert(program.size() == 6);
    const uint8_t expected[] = {1, 1, 2, 3, 40, 200};
    for (size_t i = 0; i < program.size(); ++i) {
        assert(program[i] == ins(InsType::ADD, Operand::literal(expected[i])));
    }
}

static void test_current_cell_operand() {
    auto program = compileOk("+V");
    assert(program.size() == 1);
    assert(program[0] == ins(InsType::ADD, Operand::currentCell()));
}

static void test_consecutive_set_cells() {
    auto program = compileOk("^^65 .");
    assert(program.size() == 3);
    assert(program[0] == ins(InsType::SET, Operand::literal(1)));
    assert(program[1] == ins(InsType::SET, Operand::literal(65)));
    assert(program[2].op == InsType::PUT_CHR);
}

static void test_breakpoints_follow_debugging_flag() {
    auto withDebug = compileOk("+[!-]!", true);
    assert(withDebug.size() == 6);
    assert(withDebug[1] == ins(InsType::JMP_ZER, {}, 4));
    assert(withDebug[2].op == InsType::BREAK);
    assert(withDebug[4] == ins(InsType::JMP_NOT_ZER, {}, 1));
    assert(withDebug[5].op == InsType::BREAK);

    auto withoutDebug = compileOk("+[!-]!", false);
    assert(withoutDebug.size() == 4);
    assert(withoutDebug[1] == ins(InsType::JMP_ZER, {}, 3));
    assert(withoutDebug[2] == ins(InsType::SUB, Operand::literal(1)));
    assert(withoutDebug[3] == ins(InsType::JMP_NOT_ZER, {}, 1));
}

static void test_jump_targets_stay_in_range() {
    auto program = compileOk("+8[>+4[>+2>+3>+3>+<4-]>+>+>->2+[<]<-]>2.>-3.", false);
    for (const auto& i : program) {
        if (i.op == InsType::JMP_ZER || i.op == InsType::JMP_NOT_ZER) {
            assert(i.target < program.size());
            assert(program[i.target].op ==
                   (i.op == InsType::JMP_ZER ? InsType::JMP_NOT_ZER : InsType::JMP_ZER));
            assert(program[i.target].target < program.size());
        }
    }
}

static void test_compile_errors() {
    assert(compileQuiet("+[-") == Status::UNMATCHED_OPEN);
    assert(compileQuiet("+]-") == Status::UNMATCHED_CLOSE);
    assert(compileQuiet("+256") == Status::BAD_LITERAL);
    assert(compileQuiet("5+") == Status::DANGLING_OPERAND);
    assert(compileQuiet("V") == Status::DANGLING_OPERAND);
    assert(compileQuiet(".5") == Status::VALUELESS_OPERAND);
    assert(compileQuiet("[V]") == Status::VALUELESS_OPERAND);
    assert(compileQuiet("!3") == Status::VALUELESS_OPERAND);
    assert(ezfuck::isCompileError(Status::UNMATCHED_OPEN));
    assert(!ezfuck::isCompileError(Status::POINTER_UNDERFLOW));
}

static void test_describe() {
    auto program = compileOk("+5-V[>]@2,.^!", true);
    assert(ezfuck::describe(program[0]) == "ADD 5");
    assert(ezfuck::describe(program[1]) == "SUB V");
    assert(ezfuck::describe(program[2]) == "JMP_ZER -> 4");
    assert(ezfuck::describe(program[3]) == "PTR_RGT 1");
    assert(ezfuck::describe(program[4]) == "JMP_NOT_ZER -> 2");
    assert(ezfuck::describe(program[5]) == "PTR_SET 2");
    assert(ezfuck::describe(program[6]) == "RAD_CHR");
    assert(ezfuck::describe(program[7]) == "PUT_CHR");
    assert(ezfuck::describe(program[8]) == "SET 1");
    assert(ezfuck::describe(program[9]) == "BREAK");
}

static void test_command_without_opcode_is_rejected() {
    std::vector<Instruction> program;
    std::ostringstream err;
    auto* old = std::cerr.rdbuf(err.rdbuf());
    Status ret = ezfuck::compileCommands({{'+', std::nullopt}, {'x', std::nullopt}}, false, program);
    std::cerr.rdbuf(old);
    assert(ret == Status::UNKNOWN_LEXEME);
    assert(err.str().find("x") != std::string::npos);
}

int main() {
    test_empty_loop_targets();
    test_ignores_invalid_characters();
    test_instruction_for_each_symbol();
    test_values_and_defaults();
    test_current_cell_operand();
    test_consecutive_set_cells();
    test_breakpoints_follow_debugging_flag();
    test_jump_targets_stay_in_range();
    test_compile_errors();
    test_describe();
    test_command_without_opcode_is_rejected();
    return 0;
}
