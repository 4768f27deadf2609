/*
    Ezfuck - An extended brainfuck interpreter
    Tape and program rendering
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <vector>

#include "vm.hxx"

namespace ezfuck {

// Four rows: pointer marker, index, decimal value, printable ASCII. Spans cell 0 up to the last
// non-zero cell or the pointer, whichever is further right.
void dumpTape(const std::vector<uint8_t>& cells, size_t cellPtr, std::ostream& out = std::cout,
              const std::vector<size_t>* changed = nullptr, bool highlight = false);

void dumpInstructions(const std::vector<Instruction>& program, size_t insPtr, size_t around,
                      std::ostream& out = std::cout);

void reportError(Status status, std::ostream& out = std::cout);

}  // namespace ezfuck
