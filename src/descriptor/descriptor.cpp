// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/descriptor.h"
#include "core/serialize.h"
#include "descriptor/checksum.h"

#include <vector>

namespace descriptor {

std::string_view strip_elements_prefix(std::string_view name) {
    if (name.substr(0, ELEMENTS_PREFIX.size()) == ELEMENTS_PREFIX) {
        return name.substr(ELEMENTS_PREFIX.size());
    }
    return name;
}

core::Result<Tree> parse_descriptor_tree(std::string_view s) {
    ELMS_TRY_ASSIGN(body, verify_checksum(s));
    return Tree::from_str(body);
}

std::string add_checksum(const std::string& body) {
    return with_checksum(body).value();
}

size_t varint_len(size_t n) {
    return core::compact_size_len(n);
}

size_t push_opcode_size(size_t n) {
    if (n < 0x4c) return 1;
    if (n < 0x100) return 2;
    if (n < 0x10000) return 3;
    return 5;
}

core::Result<void> check_full_key(const PublicKey& key, bool compressed,
                                  std::string_view what) {
    if (key.is_xonly()) {
        return core::make_error(core::ErrorCode::BAD_KEY,
                                "x-only key in " + std::string(what) + ": " +
                                    key.to_string());
    }
    if (compressed && key.is_uncompressed()) {
        return core::make_error(core::ErrorCode::COMPRESSED_ONLY,
                                "uncompressed key in " + std::string(what) +
                                    ": " + key.to_string());
    }
    return core::make_ok();
}

core::Result<Address> blind_address(const Address& addr,
                                    const std::optional<PublicKey>& blinder) {
    if (!blinder) return addr;
    ELMS_TRY_VOID(check_full_key(*blinder, false, "blinding key"));
    const auto& bytes = blinder->bytes();
    if (!blinder->is_uncompressed()) return addr.blinded(bytes);

    // 04 || x || y  ->  (02 | parity(y)) || x
    std::vector<uint8_t> compressed(bytes.begin(), bytes.begin() + 33);
    compressed[0] = static_cast<uint8_t>(0x02 | (bytes[64] & 1));
    return addr.blinded(compressed);
}

} // namespace descriptor
