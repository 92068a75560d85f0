// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "interpreter/stack.h"
#include "core/hex.h"
#include "primitives/script/opcodes.h"

namespace interpreter {

using core::ErrorCode;
using core::make_error;
using primitives::script::Opcode;

Element Element::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.empty()) return dissatisfied();
    if (bytes.size() == 1 && bytes[0] == 0x01) return satisfied();
    return push(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

core::Result<std::span<const uint8_t>> Element::as_push() const {
    if (kind != Kind::PUSH) {
        return make_error(ErrorCode::EXPECTED_PUSH, "expected push in script");
    }
    return std::span<const uint8_t>(data);
}

std::string Element::to_string() const {
    switch (kind) {
    case Kind::SATISFIED:    return "<satisfied>";
    case Kind::DISSATISFIED: return "<dissatisfied>";
    case Kind::PUSH:         break;
    }
    return core::to_hex(data);
}

Stack Stack::from_witness(const std::vector<std::vector<uint8_t>>& witness) {
    std::vector<Element> elems;
    elems.reserve(witness.size());
    for (const auto& item : witness) {
        elems.push_back(Element::from_bytes(item));
    }
    return Stack(std::move(elems));
}

core::Result<Stack> Stack::from_script_sig(
    const primitives::script::Script& script_sig) {
    std::vector<Element> elems;
    auto it = script_sig.begin_iter();
    while (auto elem = it.next()) {
        if (elem->opcode == Opcode::OP_1) {
            elems.push_back(Element::satisfied());
            continue;
        }
        if (static_cast<uint8_t>(elem->opcode) >
            static_cast<uint8_t>(Opcode::OP_PUSHDATA4)) {
            return make_error(ErrorCode::EXPECTED_PUSH,
                              "expected push in script");
        }
        if (!primitives::script::is_minimal_push(*elem)) {
            return make_error(ErrorCode::BAD_SCRIPT,
                              "non-minimal push in scriptSig");
        }
        elems.push_back(Element::from_bytes(elem->data));
    }
    if (it.failed()) {
        return make_error(ErrorCode::BAD_SCRIPT, "truncated push in scriptSig");
    }
    return Stack(std::move(elems));
}

std::optional<Element> Stack::pop() {
    if (elems_.empty()) return std::nullopt;
    Element top = std::move(elems_.back());
    elems_.pop_back();
    return top;
}

} // namespace interpreter
