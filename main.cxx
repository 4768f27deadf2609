/*
    Ezfuck - An extended brainfuck interpreter
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "display.hxx"
#include "vm.hxx"
#ifdef EZFUCK_ENABLE_REPL
#include "cpp-terminal/color.hpp"
#include "repl.hxx"
#endif

namespace {

void printFatal(const std::string& message) {
#ifdef EZFUCK_ENABLE_REPL
    std::cerr << Term::color_fg(Term::Color::Name::Red) << "ERROR:"
              << Term::color_fg(Term::Color::Name::Default) << ' ' << message << std::endl;
#else
    std::cerr << "ERROR: " << message << std::endl;
#endif
}

// Returns true on success; on error, 'err' is set and 'out' left unchanged.
bool readSourceFile(const std::string& filename, std::string& out, std::string& err) {
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened: " + filename;
        return false;
    }
    std::string source((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!in.eof() && in.fail()) {
        err = "Error while reading file: " + filename;
        return false;
    }
    out.swap(source);
    return true;
}

struct CmdArgs {
    std::string filename;
    std::string evalCode;
    bool dumpMemory = false;
    bool printProgram = false;
    bool help = false;
    bool debugging = EZFUCK_DEFAULT_DEBUGGING;
    bool profile = false;
    bool badArgs = false;
};

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-e" && i + 1 < argc) {
            args.evalCode = argv[++i];
            args.filename.clear();
        } else if (arg == "-i" && i + 1 < argc && args.evalCode.empty()) {
            args.filename = argv[++i];
        } else if (arg == "-dm") {
            args.dumpMemory = true;
        } else if (arg == "-p") {
            args.printProgram = true;
        } else if (arg == "-nodbg") {
            args.debugging = false;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "-h") {
            args.help = true;
        } else if (!arg.empty() && arg[0] != '-') {
            if (args.evalCode.empty()) args.filename = std::string(arg);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            args.badArgs = true;
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [file]\n"
              << "Options:\n"
              << "  <file>, -i <file> Execute code from file (breakpoints enabled)\n"
              << "  -e <code>         Execute ezfuck code directly\n"
              << "  -nodbg            Ignore ! breakpoints\n"
              << "  -dm               Dump memory after program\n"
              << "  -p                Print compiled instructions and exit\n"
              << "  --profile         Print execution profile\n"
              << "  -h                Show this help message\n"
              << "Without a program an interactive session is started." << std::endl;
}

int runProgram(const CmdArgs& opts, const std::string& code, bool allowDebugging) {
    if (opts.printProgram) {
        std::vector<ezfuck::Instruction> program;
        if (ezfuck::Status ret = ezfuck::compile(code, allowDebugging, program);
            ret != ezfuck::Status::OK) {
            ezfuck::reportError(ret, std::cerr);
            return 1;
        }
        for (size_t i = 0; i < program.size(); ++i)
            std::cout << i << ": " << ezfuck::describe(program[i]) << '\n';
        std::cout.flush();
        return 0;
    }

    ezfuck::ExecutionState state;
    ezfuck::ProfileInfo profileInfo;
    ezfuck::ProfileInfo* profPtr = opts.profile ? &profileInfo : nullptr;
    ezfuck::Status ret =
        ezfuck::execute(state, code, allowDebugging, std::cin, std::cout, profPtr);
    if (ret != ezfuck::Status::OK) {
        std::cout << std::endl;
        ezfuck::reportError(ret, std::cerr);
    }
    if (opts.dumpMemory) ezfuck::dumpTape(state.cells, state.cellPtr);
    if (opts.profile) {
        std::cout << "Instructions executed: " << profileInfo.instructions << std::endl;
        std::cout << "Elapsed time: " << profileInfo.seconds << "s" << std::endl;
    }
    return ret == ezfuck::Status::OK ? 0 : 1;
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    if (opts.help || opts.badArgs) {
        printHelp(argv[0]);
        return opts.badArgs ? 1 : 0;
    }
    if (!opts.evalCode.empty()) return runProgram(opts, opts.evalCode, false);
    if (!opts.filename.empty()) {
        std::string code;
        std::string err;
        if (!readSourceFile(opts.filename, code, err)) {
            printFatal(err);
            return 1;
        }
        return runProgram(opts, code, opts.debugging);
    }
#ifdef EZFUCK_ENABLE_REPL
    ezfuck::ExecutionState state;
    ezfuck::ReplConfig cfg{true};
    return ezfuck::runRepl(state, cfg);
#else
    std::cout << "REPL disabled; use -i <file> or -e <code> to run a program" << std::endl;
    return 0;
#endif
}
