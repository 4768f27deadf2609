/*
    Ezfuck - An extended brainfuck interpreter
    Tape and program rendering
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "display.hxx"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "ansi.hxx"

namespace ezfuck {

namespace {
std::string padded(size_t value, int width) {
    std::ostringstream ss;
    ss << std::setw(width) << std::setfill('0') << value;
    return ss.str();
}

size_t digits(size_t value) {
    size_t count = 1;
    while (value >= 10) {
        value /= 10;
        ++count;
    }
    return count;
}
}  // namespace

void dumpTape(const std::vector<uint8_t>& cells, size_t cellPtr, std::ostream& out,
              const std::vector<size_t>* changed, bool highlight) {
    if (cells.empty()) return;
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > 0 && !cells[lastNonEmpty]) --lastNonEmpty;
    const size_t end = std::min(std::max(lastNonEmpty, cellPtr), cells.size() - 1);

    std::string ptrRow{"  "}, indexRow{"i "}, rawRow{"d "}, asciiRow{"a "};
    for (size_t i = 0; i <= end; ++i) {
        const uint8_t value = cells[i];
        const char ascii = (value >= 32 && value < 127) ? static_cast<char>(value) : ' ';
        const bool changedCell = highlight && changed &&
                                 std::find(changed->begin(), changed->end(), i) != changed->end();
        ptrRow += i == cellPtr ? "   V  " : "      ";
        indexRow += "| " + padded(i, 3) + ' ';
        rawRow += "| ";
        if (changedCell) rawRow += ansi::yellow;
        rawRow += padded(value, 3);
        if (changedCell) rawRow += ansi::reset;
        rawRow += ' ';
        asciiRow += "|  ";
        asciiRow += ascii;
        asciiRow += "  ";
    }
    out << ptrRow << '\n' << indexRow << "|\n" << rawRow << "|\n" << asciiRow << "|\n";
    out.flush();
}

void dumpInstructions(const std::vector<Instruction>& program, size_t insPtr, size_t around,
                      std::ostream& out) {
    if (program.empty()) return;
    const size_t start = insPtr > around ? insPtr - around : 0;
    const size_t end = std::min(insPtr + around, program.size() - 1);
    const int places = static_cast<int>(digits(program.size()));
    for (size_t i = start; i <= end; ++i) {
        out << padded(i, places) << ' ' << (i == insPtr ? "> " : "  ") << describe(program[i])
            << '\n';
    }
}

void reportError(Status status, std::ostream& out) {
    out << ansi::red << "ERROR:" << ansi::reset << ' ' << statusMessage(status) << std::endl;
}

}  // namespace ezfuck
