#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "primitives/script/script.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace interpreter {

// ---------------------------------------------------------------------------
// Element -- one item of a spend's scriptSig or witness
// ---------------------------------------------------------------------------
// The empty push and the single byte 0x01 are the canonical false and
// true values of Miniscript and are kept apart from other pushes.
// ---------------------------------------------------------------------------
struct Element {
    enum class Kind : uint8_t { PUSH, SATISFIED, DISSATISFIED };

    Kind kind = Kind::DISSATISFIED;
    std::vector<uint8_t> data;  // PUSH only

    static Element from_bytes(std::span<const uint8_t> bytes);
    static Element push(std::vector<uint8_t> bytes) {
        return {Kind::PUSH, std::move(bytes)};
    }
    static Element satisfied() { return {Kind::SATISFIED, {}}; }
    static Element dissatisfied() { return {Kind::DISSATISFIED, {}}; }

    [[nodiscard]] bool is_push() const noexcept { return kind == Kind::PUSH; }

    /// The pushed bytes.  Fails with EXPECTED_PUSH for the canonical
    /// true and false values.
    core::Result<std::span<const uint8_t>> as_push() const;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const Element&) const = default;
};

// ---------------------------------------------------------------------------
// Stack -- bottom element first, top element last
// ---------------------------------------------------------------------------
class Stack {
public:
    Stack() = default;
    explicit Stack(std::vector<Element> elems) : elems_(std::move(elems)) {}

    /// One element per witness item, witness[0] at the bottom.
    static Stack from_witness(const std::vector<std::vector<uint8_t>>& witness);

    /// One element per scriptSig push.  Pushes must be minimal; OP_0 and
    /// OP_1 are the canonical false and true.  Any other opcode fails with
    /// EXPECTED_PUSH.
    static core::Result<Stack> from_script_sig(
        const primitives::script::Script& script_sig);

    [[nodiscard]] bool empty() const noexcept { return elems_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return elems_.size(); }

    void push(Element e) { elems_.push_back(std::move(e)); }

    /// Remove and return the top element.
    std::optional<Element> pop();

    /// The top element, or nullptr on an empty stack.
    [[nodiscard]] const Element* top() const noexcept {
        return elems_.empty() ? nullptr : &elems_.back();
    }

    [[nodiscard]] const std::vector<Element>& elements() const noexcept {
        return elems_;
    }

    bool operator==(const Stack&) const = default;

private:
    std::vector<Element> elems_;
};

} // namespace interpreter
