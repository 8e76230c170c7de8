#pragma once

#include <bit>
#include <cstdint>
#include <vector>

// A set of sudoku digits 1..9 stored as a 9-bit mask (bit v-1 set means v is present).
class DigitSet {
public:
    static constexpr uint16_t ALL_MASK = 0x1FF;

    constexpr DigitSet() = default;
    constexpr explicit DigitSet(uint16_t mask) : bits(mask & ALL_MASK) {}

    static constexpr DigitSet all() { return DigitSet(ALL_MASK); }

    constexpr uint16_t mask() const { return bits; }
    constexpr bool empty() const { return bits == 0; }
    constexpr int size() const { return std::popcount(bits); }

    constexpr bool contains(int value) const {
        return value >= 1 && value <= 9 && (bits & bit_of(value)) != 0;
    }

    constexpr void insert(int value) { bits |= bit_of(value); }
    constexpr void erase(int value) { bits &= ~bit_of(value); }

    // Smallest member, or 0 for the empty set
    constexpr int smallest() const {
        return bits == 0 ? 0 : std::countr_zero(bits) + 1;
    }

    std::vector<int> values() const {
        std::vector<int> out;
        out.reserve(size());
        uint16_t m = bits;
        while (m) {
            out.push_back(std::countr_zero(m) + 1);
            m &= (m - 1);
        }
        return out;
    }

    constexpr DigitSet operator|(DigitSet other) const { return DigitSet(bits | other.bits); }
    constexpr DigitSet operator&(DigitSet other) const { return DigitSet(bits & other.bits); }
    constexpr DigitSet operator~() const { return DigitSet(~bits & ALL_MASK); }
    constexpr DigitSet& operator|=(DigitSet other) { bits |= other.bits; return *this; }
    constexpr bool operator==(const DigitSet&) const = default;

private:
    static constexpr uint16_t bit_of(int value) { return static_cast<uint16_t>(1u << (value - 1)); }

    uint16_t bits = 0;
};
