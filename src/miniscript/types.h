#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Miniscript type system.
//
// A Type is a set of properties, one bit each:
//
//   Base types (exactly one per valid expression)
//     B  pushes a nonzero on satisfaction, an exact 0 on dissatisfaction
//     V  cannot be dissatisfied; leaves nothing on the stack
//     K  pushes a public key for a following CHECKSIG
//     W  like B but operates one element below the top of the stack
//
//   Stack properties
//     z  consumes exactly 0 stack elements
//     o  consumes exactly 1 stack element
//     n  the top input element is never zero
//     d  has a dissatisfaction
//     u  on satisfaction leaves exactly 1 on the stack
//
//   Malleability properties
//     e  has a unique dissatisfaction, and it is non-malleable
//     f  every dissatisfaction requires a signature
//     s  every satisfaction requires a signature
//     m  has a non-malleable satisfaction
//
//   x  the last opcode has no VERIFY twin (expensive verify)
//
//   Timelocks
//     g  relative time   h  relative height
//     i  absolute time   j  absolute height
//     k  no branch mixes a time lock with a height lock
// ---------------------------------------------------------------------------

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace miniscript {

class Type {
public:
    constexpr Type() noexcept : flags_(0) {}

    static constexpr Type from_flags(uint32_t flags) noexcept {
        return Type(flags);
    }

    [[nodiscard]] constexpr uint32_t flags() const noexcept { return flags_; }

    /// Union of two property sets.
    constexpr Type operator|(Type other) const noexcept {
        return Type(flags_ | other.flags_);
    }

    /// Intersection of two property sets.
    constexpr Type operator&(Type other) const noexcept {
        return Type(flags_ & other.flags_);
    }

    /// True when every property of @p other is present in this type.
    constexpr bool operator<<(Type other) const noexcept {
        return (other.flags_ & ~flags_) == 0;
    }

    /// This type when @p cond holds, the empty type otherwise.
    constexpr Type only_if(bool cond) const noexcept {
        return cond ? *this : Type(0);
    }

    constexpr bool operator==(const Type&) const noexcept = default;

    /// One character per property, in declaration order.
    [[nodiscard]] std::string to_string() const;

private:
    constexpr explicit Type(uint32_t flags) noexcept : flags_(flags) {}

    uint32_t flags_;
};

/// Property letters accepted by the _mst literal, in bit order.
inline constexpr char TYPE_LETTERS[] = "BVKWzondufesmxghijk";

/// Literal for a type: "Bdu"_mst is the set {B, d, u}.
constexpr Type operator""_mst(const char* str, size_t len) {
    uint32_t flags = 0;
    for (size_t i = 0; i < len; ++i) {
        bool found = false;
        for (uint32_t bit = 0; TYPE_LETTERS[bit] != '\0'; ++bit) {
            if (TYPE_LETTERS[bit] == str[i]) {
                flags |= uint32_t{1} << bit;
                found = true;
                break;
            }
        }
        if (!found) throw std::logic_error("unknown miniscript type letter");
    }
    return Type::from_flags(flags);
}

inline std::string Type::to_string() const {
    std::string out;
    for (uint32_t bit = 0; TYPE_LETTERS[bit] != '\0'; ++bit) {
        if (flags_ & (uint32_t{1} << bit)) out.push_back(TYPE_LETTERS[bit]);
    }
    return out;
}

/// Keep @p t only if it names exactly one base type.
constexpr Type sanitize_type(Type t) noexcept {
    int bases = (t << "K"_mst) + (t << "V"_mst) + (t << "B"_mst) +
                (t << "W"_mst);
    return bases == 1 ? t : Type();
}

// ---------------------------------------------------------------------------
// MaxInt -- an integer that may be "impossible"
// ---------------------------------------------------------------------------
// Addition propagates impossibility; operator| takes the maximum of the
// possible operands.
template <typename I>
struct MaxInt {
    bool valid = false;
    I value = 0;

    constexpr MaxInt() noexcept = default;
    constexpr MaxInt(I v) noexcept : valid(true), value(v) {}  // NOLINT implicit

    friend constexpr MaxInt operator+(MaxInt a, MaxInt b) noexcept {
        if (!a.valid || !b.valid) return {};
        return MaxInt(a.value + b.value);
    }

    friend constexpr MaxInt operator|(MaxInt a, MaxInt b) noexcept {
        if (!a.valid) return b;
        if (!b.valid) return a;
        return MaxInt(std::max(a.value, b.value));
    }

    [[nodiscard]] std::optional<I> get() const {
        if (!valid) return std::nullopt;
        return value;
    }

    constexpr bool operator==(const MaxInt&) const noexcept = default;
};

/// Non-push opcode counts: the static count of the script plus the
/// worst case executed by a satisfaction (sat) or dissatisfaction (dsat),
/// which only CHECKMULTISIG key counts contribute to.
struct Ops {
    uint32_t count = 0;
    MaxInt<uint32_t> sat;
    MaxInt<uint32_t> dsat;
};

/// Worst-case figures for the satisfaction and the dissatisfaction.
struct SatInfo {
    MaxInt<uint32_t> sat;
    MaxInt<uint32_t> dsat;
};

} // namespace miniscript
