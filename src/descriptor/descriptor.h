#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "miniscript/expression.h"
#include "miniscript/key.h"
#include "miniscript/miniscript.h"
#include "miniscript/satisfy.h"
#include "primitives/address.h"
#include "primitives/script/script.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace descriptor {

using Tree = miniscript::Tree;
using miniscript::Context;
using miniscript::KeyTranslator;
using miniscript::Miniscript;
using miniscript::PublicKey;
using miniscript::Satisfier;
using miniscript::Witness;
using primitives::Address;
using primitives::AddressParams;
using primitives::script::Script;

using KeyPredicate = std::function<bool(const PublicKey&)>;

/// Namespace marker of Elements descriptors.  Optional on input, always
/// written on output.
inline constexpr std::string_view ELEMENTS_PREFIX = "el";

/// Worst-case ECDSA signature push: 72 DER bytes, sighash byte, length.
inline constexpr size_t MAX_ECDSA_SIG_PUSH = 73;

/// The two halves of a spend.
struct Satisfaction {
    Witness witness;
    Script script_sig;
};

/// @p name without a leading "el", if it has one.
[[nodiscard]] std::string_view strip_elements_prefix(std::string_view name);

/// Check the checksum of @p s and parse what precedes it.
core::Result<Tree> parse_descriptor_tree(std::string_view s);

/// "<body>#<checksum>".  @p body is built from descriptor text, so it
/// always lies inside the checksum charset.
[[nodiscard]] std::string add_checksum(const std::string& body);

/// Bytes of a CompactSize length prefix for @p n.
[[nodiscard]] size_t varint_len(size_t n);

/// Bytes of the push opcode (with length field) for an @p n byte push.
[[nodiscard]] size_t push_opcode_size(size_t n);

/// Ensure @p key is a full-form key; @p compressed additionally rejects
/// 65-byte keys.
core::Result<void> check_full_key(const PublicKey& key, bool compressed,
                                  std::string_view what);

/// @p addr carrying @p blinder as its blinding key, or @p addr itself when
/// there is no blinder.  Blinding keys are always written compressed; an
/// x-only blinder fails with BAD_KEY.
core::Result<Address> blind_address(const Address& addr,
                                    const std::optional<PublicKey>& blinder);

} // namespace descriptor
