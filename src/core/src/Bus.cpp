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

#include "tickwork/Bus.hpp"
#include "tickwork/Errors.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tickwork {

namespace {

std::string hex_address(uint32_t address) {
    std::ostringstream out;
    out << "0x" << std::hex << std::setw(4) << std::setfill('0') << address;
    return out.str();
}

} // anonymous namespace

void Bus::configure(size_t size) {
    memory_.assign(size, 0);
    regions_.clear();
    registers_.clear();
    keypad_.clear();
}

void Bus::add_region(BusRegion region) {
    if (!contains(region.base_address, region.size)) {
        throw BusError("Region '" + region.name + "' lies outside the bus", region.base_address);
    }
    regions_.push_back(std::move(region));
}

const BusRegion* Bus::region_at(uint32_t address) const {
    // Later regions take precedence, so a small register block can be
    // declared on top of a larger RAM region.
    for (auto it = regions_.rbegin(); it != regions_.rend(); ++it) {
        if (it->contains(address)) {
            return &*it;
        }
    }
    return nullptr;
}

void Bus::define_register(std::string name, uint32_t address) {
    check_range(address, 1);
    registers_[std::move(name)] = address;
}

uint32_t Bus::register_address(std::string_view name) const {
    auto it = registers_.find(name);
    if (it == registers_.end()) {
        throw BusError("Unknown register: " + std::string(name), 0);
    }
    return it->second;
}

void Bus::check_range(uint32_t address, size_t length) const {
    if (!contains(address, length)) {
        throw BusError("Bus access out of range at " + hex_address(address), address);
    }
}

void Bus::check_writable(uint32_t address, size_t length) const {
    check_range(address, length);
    for (size_t i = 0; i < length; ++i) {
        const auto addr = static_cast<uint32_t>(address + i);
        const auto* region = region_at(addr);
        if (region && !has_flag(region->flags, RegionFlags::Writable)) {
            throw BusError("Write to read-only region '" + region->name + "' at "
                           + hex_address(addr), addr);
        }
    }
}

uint8_t Bus::read8(uint32_t address) const {
    check_range(address, 1);
    return memory_[address];
}

uint16_t Bus::read16_be(uint32_t address) const {
    check_range(address, 2);
    return static_cast<uint16_t>((memory_[address] << 8) | memory_[address + 1]);
}

uint16_t Bus::read16_le(uint32_t address) const {
    check_range(address, 2);
    return static_cast<uint16_t>(memory_[address] | (memory_[address + 1] << 8));
}

void Bus::write8(uint32_t address, uint8_t value) {
    check_writable(address, 1);
    memory_[address] = value;
}

void Bus::write16_be(uint32_t address, uint16_t value) {
    check_writable(address, 2);
    memory_[address] = static_cast<uint8_t>(value >> 8);
    memory_[address + 1] = static_cast<uint8_t>(value & 0xFF);
}

void Bus::write16_le(uint32_t address, uint16_t value) {
    check_writable(address, 2);
    memory_[address] = static_cast<uint8_t>(value & 0xFF);
    memory_[address + 1] = static_cast<uint8_t>(value >> 8);
}

void Bus::write_block(uint32_t address, std::span<const uint8_t> data) {
    check_writable(address, data.size());
    std::copy(data.begin(), data.end(), memory_.begin() + address);
}

void Bus::poke(uint32_t address, uint8_t value) {
    check_range(address, 1);
    memory_[address] = value;
}

void Bus::load(uint32_t address, std::span<const uint8_t> data) {
    check_range(address, data.size());
    std::copy(data.begin(), data.end(), memory_.begin() + address);
}

std::vector<uint8_t> Bus::peek(uint32_t address, size_t length) const {
    check_range(address, length);
    return std::vector<uint8_t>(memory_.begin() + address,
                                memory_.begin() + address + static_cast<std::ptrdiff_t>(length));
}

void Bus::clear() {
    std::fill(memory_.begin(), memory_.end(), 0);
}

void Bus::restore(std::span<const uint8_t> bytes) {
    if (bytes.size() != memory_.size()) {
        throw IncompatibleState("Bus size mismatch: state has " + std::to_string(bytes.size())
                                + " bytes, bus has " + std::to_string(memory_.size()));
    }
    std::copy(bytes.begin(), bytes.end(), memory_.begin());
}

} // namespace tickwork
