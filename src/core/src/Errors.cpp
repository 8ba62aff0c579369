// Copyright © 2026 The Tickwork Authors
//
// This file is part of Tickwork.
//
// Tickwork is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Tickwork is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Tickwork.
// If not, see <https://www.gnu.org/licenses/>.

#include "tickwork/Errors.hpp"

#include <iomanip>
#include <sstream>

namespace tickwork {

std::string FaultInfo::describe() const {
    std::ostringstream out;
    out << to_string(kind) << " at pc=0x" << std::hex << std::setw(4) << std::setfill('0') << pc;
    switch (kind) {
        case FaultKind::UnknownOpcode:
            out << " opcode=0x" << std::setw(4) << detail;
            break;
        case FaultKind::MemoryOutOfBounds:
        case FaultKind::BusViolation:
            out << " address=0x" << std::setw(4) << detail;
            break;
        default:
            break;
    }
    out << std::dec << " (cycle " << cycle << ")";
    if (!message.empty()) {
        out << ": " << message;
    }
    return out.str();
}

} // namespace tickwork
