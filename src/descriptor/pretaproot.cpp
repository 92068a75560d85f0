// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/pretaproot.h"
#include "core/logging.h"

namespace descriptor {

using core::ErrorCode;
using core::make_error;

namespace {

template <typename T>
core::Result<PreTaprootDescriptor> wrap(core::Result<T> r) {
    if (!r) return std::move(r).error();
    return PreTaprootDescriptor(PreTaprootDescriptor::Variant(
        std::move(r).value()));
}

} // anonymous namespace

core::Result<PreTaprootDescriptor> PreTaprootDescriptor::from_tree(
    const Tree& tree) {
    const std::string_view name = strip_elements_prefix(tree.name);
    const size_t arity = tree.args.size();
    if (name == "pkh" && arity == 1) return wrap(Pkh::from_tree(tree));
    if (name == "wpkh" && arity == 1) return wrap(Wpkh::from_tree(tree));
    if (name == "sh" && arity == 1) return wrap(Sh::from_tree(tree));
    if (name == "wsh" && arity == 1) return wrap(Wsh::from_tree(tree));
    return wrap(Bare::from_tree(tree));
}

core::Result<PreTaprootDescriptor> PreTaprootDescriptor::from_str(
    std::string_view s) {
    ELMS_TRY_ASSIGN(tree, parse_descriptor_tree(s));
    return from_tree(tree);
}

std::string PreTaprootDescriptor::to_string() const {
    return std::visit([](const auto& d) { return d.to_string(); }, desc_);
}

core::Result<void> PreTaprootDescriptor::sanity_check() const {
    return std::visit([](const auto& d) { return d.sanity_check(); }, desc_);
}

Script PreTaprootDescriptor::script_pubkey() const {
    return std::visit([](const auto& d) { return d.script_pubkey(); }, desc_);
}

Script PreTaprootDescriptor::unsigned_script_sig() const {
    return std::visit([](const auto& d) { return d.unsigned_script_sig(); },
                      desc_);
}

Script PreTaprootDescriptor::explicit_script() const {
    return std::visit([](const auto& d) { return d.explicit_script(); },
                      desc_);
}

Script PreTaprootDescriptor::script_code() const {
    return std::visit([](const auto& d) { return d.script_code(); }, desc_);
}

core::Result<Satisfaction> PreTaprootDescriptor::get_satisfaction(
    const Satisfier& sat) const {
    return std::visit(
        [&sat](const auto& d) { return d.get_satisfaction(sat); }, desc_);
}

core::Result<Satisfaction> PreTaprootDescriptor::get_satisfaction_mall(
    const Satisfier& sat) const {
    return std::visit(
        [&sat](const auto& d) { return d.get_satisfaction_mall(sat); }, desc_);
}

core::Result<size_t> PreTaprootDescriptor::max_satisfaction_weight() const {
    return std::visit(
        [](const auto& d) { return d.max_satisfaction_weight(); }, desc_);
}

core::Result<Address> PreTaprootDescriptor::address(
    const AddressParams& params) const {
    return std::visit([&params](const auto& d) { return d.address(params); },
                      desc_);
}

core::Result<Address> PreTaprootDescriptor::blind_addr(
    const std::optional<PublicKey>& blinder,
    const AddressParams& params) const {
    return std::visit(
        [&blinder, &params](const auto& d) {
            return d.blind_addr(blinder, params);
        },
        desc_);
}

bool PreTaprootDescriptor::for_each_key(const KeyPredicate& pred) const {
    return std::visit([&pred](const auto& d) { return d.for_each_key(pred); },
                      desc_);
}

core::Result<PreTaprootDescriptor> PreTaprootDescriptor::translate_keys(
    const KeyTranslator& t) const {
    return std::visit([&t](const auto& d) { return wrap(d.translate_keys(t)); },
                      desc_);
}

core::Result<bool> roundtrip_descriptor(std::string_view s) {
    auto first = PreTaprootDescriptor::from_str(s);
    if (!first) return false;

    const std::string printed = first.value().to_string();
    auto second = PreTaprootDescriptor::from_str(printed);
    if (!second) {
        return make_error(ErrorCode::INTERNAL_ERROR,
                          "printed descriptor does not parse: " + printed +
                              ": " + second.error().message());
    }
    if (!(second.value() == first.value()) ||
        second.value().to_string() != printed) {
        return make_error(ErrorCode::INTERNAL_ERROR,
                          "descriptor does not round-trip: " + printed);
    }
    LOG_TRACE(core::LogCategory::DESCRIPTOR, "round-tripped " + printed);
    return true;
}

} // namespace descriptor
