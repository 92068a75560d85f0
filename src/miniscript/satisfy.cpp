// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "miniscript/satisfy.h"
#include "core/logging.h"
#include "crypto/hash.h"
#include "crypto/secp256k1.h"
#include "miniscript/context.h"
#include "miniscript/node.h"

#include <limits>

namespace miniscript {

// ===================================================================
// EcdsaSig
// ===================================================================

std::vector<uint8_t> EcdsaSig::to_vec() const {
    std::vector<uint8_t> out(der);
    out.push_back(sighash_type);
    return out;
}

core::Result<EcdsaSig> EcdsaSig::from_slice(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return core::make_error(core::ErrorCode::BAD_SCRIPT,
                                "empty signature");
    }
    auto der = bytes.first(bytes.size() - 1);
    if (!crypto::is_valid_der_signature(der)) {
        return core::make_error(core::ErrorCode::BAD_SCRIPT,
                                "signature is not strict DER");
    }
    return EcdsaSig{std::vector<uint8_t>(der.begin(), der.end()),
                    bytes.back()};
}

// ===================================================================
// SimpleSatisfier
// ===================================================================

namespace {

/// BIP-68 fields.
constexpr uint32_t SEQUENCE_DISABLE_FLAG = 1u << 31;
constexpr uint32_t SEQUENCE_TYPE_FLAG = 1u << 22;
constexpr uint32_t SEQUENCE_MASK = 0x0000ffff;

constexpr uint32_t LOCKTIME_THRESHOLD = 500'000'000;

template <typename Map, typename Key>
std::optional<typename Map::mapped_type> find_in(const Map& m,
                                                 const Key& key) {
    auto it = m.find(key);
    if (it == m.end()) return std::nullopt;
    return it->second;
}

} // anonymous namespace

void SimpleSatisfier::add_preimage(const std::vector<uint8_t>& preimage) {
    sha256_preimages[crypto::sha256(preimage)] = preimage;
    hash256_preimages[crypto::sha256d(preimage)] = preimage;
    ripemd160_preimages[crypto::ripemd160(preimage)] = preimage;
    hash160_preimages[crypto::hash160(preimage)] = preimage;
}

std::optional<EcdsaSig> SimpleSatisfier::lookup_ecdsa_sig(
    const PublicKey& key) const {
    return find_in(ecdsa_sigs, key);
}

std::optional<std::vector<uint8_t>> SimpleSatisfier::lookup_schnorr_sig(
    const PublicKey& key) const {
    return find_in(schnorr_sigs, key);
}

std::optional<PublicKey> SimpleSatisfier::lookup_pkh_pk(
    const KeyHash& hash) const {
    for (const auto& [key, sig] : ecdsa_sigs) {
        if (key.hash160() == hash) return key;
    }
    for (const auto& [key, sig] : schnorr_sigs) {
        if (key.hash160() == hash) return key;
    }
    return std::nullopt;
}

std::optional<std::vector<uint8_t>> SimpleSatisfier::lookup_sha256(
    const core::uint256& hash) const {
    return find_in(sha256_preimages, hash);
}

std::optional<std::vector<uint8_t>> SimpleSatisfier::lookup_hash256(
    const core::uint256& hash) const {
    return find_in(hash256_preimages, hash);
}

std::optional<std::vector<uint8_t>> SimpleSatisfier::lookup_ripemd160(
    const core::uint160& hash) const {
    return find_in(ripemd160_preimages, hash);
}

std::optional<std::vector<uint8_t>> SimpleSatisfier::lookup_hash160(
    const core::uint160& hash) const {
    return find_in(hash160_preimages, hash);
}

bool SimpleSatisfier::check_older(uint32_t n) const {
    if (!sequence) return false;
    const uint32_t seq = *sequence;
    if (seq & SEQUENCE_DISABLE_FLAG) return false;
    if ((seq & SEQUENCE_TYPE_FLAG) != (n & SEQUENCE_TYPE_FLAG)) return false;
    return (seq & SEQUENCE_MASK) >= (n & SEQUENCE_MASK);
}

bool SimpleSatisfier::check_after(uint32_t n) const {
    if (!lock_time) return false;
    const bool have_time = *lock_time >= LOCKTIME_THRESHOLD;
    const bool want_time = n >= LOCKTIME_THRESHOLD;
    if (have_time != want_time) return false;
    return *lock_time >= n;
}

// ===================================================================
// Input stacks
// ===================================================================

namespace {

// One candidate (dis)satisfaction while walking the tree.
struct InputStack {
    bool available = true;
    /// Every way to produce this stack involves a signature.
    bool has_sig = false;
    /// A third party could turn this stack into another valid one.
    bool malleable = false;
    /// Not the canonical form; never chosen when a canonical one exists.
    bool non_canon = false;
    size_t size = 0;
    Witness stack;

    InputStack() = default;
    explicit InputStack(std::vector<uint8_t> elem)
        : size(elem.size() + 1), stack{std::move(elem)} {}

    InputStack& set_available(bool avail) {
        available = avail;
        if (!avail) {
            stack.clear();
            size = std::numeric_limits<size_t>::max();
            has_sig = false;
            malleable = false;
            non_canon = false;
        }
        return *this;
    }
    InputStack& set_with_sig() {
        has_sig = true;
        return *this;
    }
    InputStack& set_non_canon() {
        non_canon = true;
        return *this;
    }
    InputStack& set_malleable(bool x = true) {
        malleable = x;
        return *this;
    }
};

const InputStack& invalid_stack() {
    static const InputStack s = InputStack().set_available(false);
    return s;
}

/// Concatenate: @p a below @p b.
InputStack operator+(InputStack a, InputStack b) {
    if (!a.available || !b.available) return invalid_stack();
    a.stack.insert(a.stack.end(), std::make_move_iterator(b.stack.begin()),
                   std::make_move_iterator(b.stack.end()));
    a.size += b.size;
    a.has_sig |= b.has_sig;
    a.malleable |= b.malleable;
    a.non_canon |= b.non_canon;
    return a;
}

/// Pick between two alternatives while tracking malleability.
InputStack choose(InputStack a, InputStack b, bool non_malleable) {
    if (!a.available) return b;
    if (!b.available) return a;

    if (!non_malleable) {
        return a.size <= b.size ? std::move(a) : std::move(b);
    }

    // A signature-free alternative can always be substituted by a third
    // party, so it must be the one we pick.
    if (!a.has_sig && b.has_sig) return a;
    if (!b.has_sig && a.has_sig) return b;
    if (!a.has_sig && !b.has_sig) {
        a.malleable = true;
        b.malleable = true;
    } else {
        if (b.malleable && !a.malleable) return a;
        if (a.malleable && !b.malleable) return b;
    }
    // Prefer canonical, then smaller.
    if (a.non_canon != b.non_canon) return a.non_canon ? b : a;
    return a.size <= b.size ? std::move(a) : std::move(b);
}

struct InputResult {
    InputStack nsat;
    InputStack sat;
};

InputStack zero() { return InputStack(std::vector<uint8_t>()); }
InputStack one() { return InputStack(std::vector<uint8_t>{1}); }
InputStack zero32() {
    return InputStack(std::vector<uint8_t>(32, 0)).set_malleable();
}
InputStack empty() { return InputStack(); }

class Producer {
public:
    Producer(const Satisfier& sat, bool non_malleable)
        : sat_(sat), nonmal_(non_malleable) {}

    InputResult produce(const Node& node) const;

private:
    InputStack pick(InputStack a, InputStack b) const {
        return choose(std::move(a), std::move(b), nonmal_);
    }

    /// Signature stack element for @p key, INVALID when unavailable.
    InputStack sign(const Node& node, const PublicKey& key) const;

    InputStack preimage(const Node& node) const;

    const Satisfier& sat_;
    bool nonmal_;
};

InputStack Producer::sign(const Node& node, const PublicKey& key) const {
    if (is_tapscript(node.ctx)) {
        auto sig = sat_.lookup_schnorr_sig(key);
        if (!sig) return invalid_stack();
        return InputStack(std::move(*sig)).set_with_sig();
    }
    auto sig = sat_.lookup_ecdsa_sig(key);
    if (!sig) return invalid_stack();
    return InputStack(sig->to_vec()).set_with_sig();
}

InputStack Producer::preimage(const Node& node) const {
    std::optional<std::vector<uint8_t>> pre;
    switch (node.fragment) {
    case Fragment::SHA256:
        pre = sat_.lookup_sha256(core::uint256::from_bytes(
            std::span<const uint8_t, 32>(node.data.data(), 32)));
        break;
    case Fragment::HASH256:
        pre = sat_.lookup_hash256(core::uint256::from_bytes(
            std::span<const uint8_t, 32>(node.data.data(), 32)));
        break;
    case Fragment::RIPEMD160:
        pre = sat_.lookup_ripemd160(core::uint160::from_bytes(
            std::span<const uint8_t, 20>(node.data.data(), 20)));
        break;
    case Fragment::HASH160:
        pre = sat_.lookup_hash160(core::uint160::from_bytes(
            std::span<const uint8_t, 20>(node.data.data(), 20)));
        break;
    default:
        break;
    }
    if (!pre || pre->size() != 32) return invalid_stack();
    return InputStack(std::move(*pre));
}

InputResult Producer::produce(const Node& node) const {
    switch (node.fragment) {
    case Fragment::PK_K:
        return {zero(), sign(node, node.keys[0])};
    case Fragment::PK_H: {
        std::optional<PublicKey> key;
        if (node.is_raw_pkh()) {
            key = sat_.lookup_pkh_pk(*node.raw_pkh);
        } else {
            key = node.keys[0];
        }
        if (!key) return {invalid_stack(), invalid_stack()};
        InputStack key_push(key->bytes());
        return {zero() + key_push, sign(node, *key) + key_push};
    }
    case Fragment::MULTI_A: {
        // sats[j]: best stack with j signatures among the keys seen so far.
        // Keys are visited last first so the first key's signature ends
        // on top of the stack.
        std::vector<InputStack> sats{empty()};
        for (size_t i = 0; i < node.keys.size(); ++i) {
            InputStack sig = sign(node, node.keys[node.keys.size() - 1 - i]);
            std::vector<InputStack> next;
            next.push_back(sats[0] + zero());
            for (size_t j = 1; j < sats.size(); ++j) {
                next.push_back(pick(sats[j] + zero(), sats[j - 1] + sig));
            }
            next.push_back(sats.back() + sig);
            sats = std::move(next);
        }
        InputStack nsat = zero();
        for (size_t i = 1; i < node.keys.size(); ++i) nsat = nsat + zero();
        return {std::move(nsat), std::move(sats[node.k])};
    }
    case Fragment::MULTI: {
        std::vector<InputStack> sats{zero()};
        for (const auto& key : node.keys) {
            InputStack sig = sign(node, key);
            std::vector<InputStack> next;
            next.push_back(sats[0]);
            for (size_t j = 1; j < sats.size(); ++j) {
                next.push_back(pick(sats[j], sats[j - 1] + sig));
            }
            next.push_back(sats.back() + sig);
            sats = std::move(next);
        }
        InputStack nsat = zero();
        for (uint32_t i = 0; i < node.k; ++i) nsat = nsat + zero();
        return {std::move(nsat), std::move(sats[node.k])};
    }
    case Fragment::THRESH: {
        std::vector<InputResult> subres;
        subres.reserve(node.subs.size());
        for (const auto& s : node.subs) subres.push_back(produce(*s));

        std::vector<InputStack> sats{empty()};
        for (size_t i = 0; i < subres.size(); ++i) {
            const auto& res = subres[subres.size() - 1 - i];
            std::vector<InputStack> next;
            next.push_back(sats[0] + res.nsat);
            for (size_t j = 1; j < sats.size(); ++j) {
                next.push_back(pick(sats[j] + res.nsat, sats[j - 1] + res.sat));
            }
            next.push_back(sats.back() + res.sat);
            sats = std::move(next);
        }
        // Only i == 0 is the canonical dissatisfaction; every other i != k
        // is overcomplete.
        InputStack nsat = invalid_stack();
        for (size_t i = 0; i < sats.size(); ++i) {
            if (i != 0 && i != node.k) sats[i].set_malleable().set_non_canon();
            if (i != node.k) nsat = pick(std::move(nsat), sats[i]);
        }
        return {std::move(nsat), std::move(sats[node.k])};
    }
    case Fragment::OLDER:
        return {invalid_stack(),
                sat_.check_older(node.k) ? empty() : invalid_stack()};
    case Fragment::AFTER:
        return {invalid_stack(),
                sat_.check_after(node.k) ? empty() : invalid_stack()};
    case Fragment::SHA256:
    case Fragment::HASH256:
    case Fragment::RIPEMD160:
    case Fragment::HASH160:
        return {zero32(), preimage(node)};
    case Fragment::AND_V: {
        auto x = produce(*node.subs[0]);
        auto y = produce(*node.subs[1]);
        return {(y.nsat + x.sat).set_non_canon(), y.sat + x.sat};
    }
    case Fragment::AND_B: {
        auto x = produce(*node.subs[0]);
        auto y = produce(*node.subs[1]);
        return {pick(pick(y.nsat + x.nsat,
                          (y.sat + x.nsat).set_malleable().set_non_canon()),
                     (y.nsat + x.sat).set_malleable().set_non_canon()),
                y.sat + x.sat};
    }
    case Fragment::OR_B: {
        auto x = produce(*node.subs[0]);
        auto z = produce(*node.subs[1]);
        return {z.nsat + x.nsat,
                pick(pick(z.nsat + x.sat, z.sat + x.nsat),
                     (z.sat + x.sat).set_malleable().set_non_canon())};
    }
    case Fragment::OR_C: {
        auto x = produce(*node.subs[0]);
        auto z = produce(*node.subs[1]);
        return {invalid_stack(), pick(x.sat, z.sat + x.nsat)};
    }
    case Fragment::OR_D: {
        auto x = produce(*node.subs[0]);
        auto z = produce(*node.subs[1]);
        return {z.nsat + x.nsat, pick(x.sat, z.sat + x.nsat)};
    }
    case Fragment::ANDOR: {
        auto x = produce(*node.subs[0]);
        auto y = produce(*node.subs[1]);
        auto z = produce(*node.subs[2]);
        return {pick((y.nsat + x.sat).set_non_canon(), z.nsat + x.nsat),
                pick(y.sat + x.sat, z.sat + x.nsat)};
    }
    case Fragment::OR_I: {
        auto x = produce(*node.subs[0]);
        auto z = produce(*node.subs[1]);
        return {pick(x.nsat + one(), z.nsat + zero()),
                pick(x.sat + one(), z.sat + zero())};
    }
    case Fragment::WRAP_A:
    case Fragment::WRAP_S:
    case Fragment::WRAP_C:
    case Fragment::WRAP_N:
        return produce(*node.subs[0]);
    case Fragment::WRAP_D: {
        auto x = produce(*node.subs[0]);
        return {zero(), x.sat + one()};
    }
    case Fragment::WRAP_J: {
        auto x = produce(*node.subs[0]);
        // A dissatisfaction of X with a nonzero top element would be a
        // second way to dissatisfy j:X.
        return {zero().set_malleable(x.nsat.available && !x.nsat.has_sig),
                std::move(x.sat)};
    }
    case Fragment::WRAP_V: {
        auto x = produce(*node.subs[0]);
        return {invalid_stack(), std::move(x.sat)};
    }
    case Fragment::JUST_0:
        return {empty(), invalid_stack()};
    case Fragment::JUST_1:
        return {invalid_stack(), empty()};
    }
    return {invalid_stack(), invalid_stack()};
}

/// Minimal CScriptNum of at most 4 bytes.
std::optional<int64_t> read_script_num(const std::vector<uint8_t>& v) {
    if (v.size() > 4) return std::nullopt;
    if (v.empty()) return 0;
    if ((v.back() & 0x7f) == 0) {
        if (v.size() == 1 || (v[v.size() - 2] & 0x80) == 0) {
            return std::nullopt;
        }
    }
    int64_t result = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        result |= static_cast<int64_t>(v[i]) << (8 * i);
    }
    if (v.back() & 0x80) {
        return -(result & ~(int64_t{0x80} << (8 * (v.size() - 1))));
    }
    return result;
}

} // anonymous namespace

// ===================================================================
// Public entry points
// ===================================================================

core::Result<Witness> satisfy_node(const Node& node, const Satisfier& sat,
                                   bool non_malleable) {
    Producer producer(sat, non_malleable);
    InputResult res = producer.produce(node);

    if (!res.sat.available) {
        LOG_DEBUG(core::LogCategory::SATISFY,
                  "no satisfaction available for " + node_to_string(node));
        return core::make_error(core::ErrorCode::COULD_NOT_SATISFY,
                                "could not satisfy");
    }
    if (non_malleable && res.sat.malleable) {
        LOG_DEBUG(core::LogCategory::SATISFY,
                  "only malleable satisfactions for " + node_to_string(node));
        return core::make_error(core::ErrorCode::COULD_NOT_SATISFY,
                                "could not satisfy without malleability");
    }
    ELMS_TRY_VOID(check_witness(node.ctx, res.sat.stack));
    return std::move(res.sat.stack);
}

primitives::script::Script witness_to_script_sig(const Witness& witness) {
    primitives::script::Script out;
    for (const auto& elem : witness) {
        if (auto n = read_script_num(elem)) {
            out.push_int(*n);
        } else {
            out.push_data(elem);
        }
    }
    return out;
}

} // namespace miniscript
