// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                        return "NONE";

        // Syntax
        case ErrorCode::PARSE_ERROR:                 return "PARSE_ERROR";
        case ErrorCode::UNEXPECTED:                  return "UNEXPECTED";
        case ErrorCode::BAD_CHECKSUM:                return "BAD_CHECKSUM";
        case ErrorCode::BAD_HEX:                     return "BAD_HEX";
        case ErrorCode::BAD_KEY:                     return "BAD_KEY";
        case ErrorCode::BAD_NUMBER:                  return "BAD_NUMBER";

        // Miniscript typing
        case ErrorCode::TYPE_CHECK:                  return "TYPE_CHECK";
        case ErrorCode::NON_TOP_LEVEL:               return "NON_TOP_LEVEL";
        case ErrorCode::TRAILING:                    return "TRAILING";
        case ErrorCode::MALLEABLE:                   return "MALLEABLE";
        case ErrorCode::NON_MINIMAL_VERIFY:          return "NON_MINIMAL_VERIFY";
        case ErrorCode::MIXED_TIMELOCKS:             return "MIXED_TIMELOCKS";
        case ErrorCode::REPEATED_KEYS:               return "REPEATED_KEYS";
        case ErrorCode::SIG_FREE_PATH:               return "SIG_FREE_PATH";
        case ErrorCode::BAD_COV_DESCRIPTOR:          return "BAD_COV_DESCRIPTOR";
        case ErrorCode::BAD_SCRIPT:                  return "BAD_SCRIPT";

        // Script context limits
        case ErrorCode::SCRIPT_SIZE_TOO_LARGE:       return "SCRIPT_SIZE_TOO_LARGE";
        case ErrorCode::MAX_REDEEM_SCRIPT_SIZE:      return "MAX_REDEEM_SCRIPT_SIZE";
        case ErrorCode::MAX_OPS_EXCEEDED:            return "MAX_OPS_EXCEEDED";
        case ErrorCode::MAX_WITNESS_ITEMS:           return "MAX_WITNESS_ITEMS";
        case ErrorCode::COMPRESSED_ONLY:             return "COMPRESSED_ONLY";
        case ErrorCode::XONLY_REQUIRED:              return "XONLY_REQUIRED";
        case ErrorCode::MULTI_A_NOT_ALLOWED:         return "MULTI_A_NOT_ALLOWED";
        case ErrorCode::MULTI_NOT_ALLOWED:           return "MULTI_NOT_ALLOWED";
        case ErrorCode::NON_STANDARD_BARE_SCRIPT:    return "NON_STANDARD_BARE_SCRIPT";
        case ErrorCode::MAX_SCRIPTSIG_SIZE:          return "MAX_SCRIPTSIG_SIZE";

        // Satisfaction
        case ErrorCode::MISSING_SIG:                 return "MISSING_SIG";
        case ErrorCode::MISSING_COV_SIGNATURE:       return "MISSING_COV_SIGNATURE";
        case ErrorCode::MISSING_SIGHASH_ITEM:        return "MISSING_SIGHASH_ITEM";
        case ErrorCode::COV_SIGHASH_TYPE_MISMATCH:   return "COV_SIGHASH_TYPE_MISMATCH";
        case ErrorCode::IMPOSSIBLE_SATISFACTION:     return "IMPOSSIBLE_SATISFACTION";
        case ErrorCode::COULD_NOT_SATISFY:           return "COULD_NOT_SATISFY";

        // Interpreter
        case ErrorCode::NON_EMPTY_WITNESS:           return "NON_EMPTY_WITNESS";
        case ErrorCode::NON_EMPTY_SCRIPT_SIG:        return "NON_EMPTY_SCRIPT_SIG";
        case ErrorCode::UNEXPECTED_STACK_END:        return "UNEXPECTED_STACK_END";
        case ErrorCode::EXPECTED_PUSH:               return "EXPECTED_PUSH";
        case ErrorCode::INCORRECT_PUBKEY_HASH:       return "INCORRECT_PUBKEY_HASH";
        case ErrorCode::INCORRECT_WPUBKEY_HASH:      return "INCORRECT_WPUBKEY_HASH";
        case ErrorCode::INCORRECT_SCRIPT_HASH:       return "INCORRECT_SCRIPT_HASH";
        case ErrorCode::INCORRECT_WSCRIPT_HASH:      return "INCORRECT_WSCRIPT_HASH";
        case ErrorCode::UNCOMPRESSED_PUBKEY:         return "UNCOMPRESSED_PUBKEY";
        case ErrorCode::PUBKEY_PARSE:                return "PUBKEY_PARSE";
        case ErrorCode::XONLY_PUBKEY_PARSE:          return "XONLY_PUBKEY_PARSE";
        case ErrorCode::TAP_ANNEX_UNSUPPORTED:       return "TAP_ANNEX_UNSUPPORTED";
        case ErrorCode::CONTROL_BLOCK_PARSE:         return "CONTROL_BLOCK_PARSE";
        case ErrorCode::CONTROL_BLOCK_VERIFICATION:  return "CONTROL_BLOCK_VERIFICATION";

        // Addresses
        case ErrorCode::BARE_DESCRIPTOR_ADDR:        return "BARE_DESCRIPTOR_ADDR";
        case ErrorCode::ADDRESS_ERROR:               return "ADDRESS_ERROR";

        // Cryptography
        case ErrorCode::CRYPTO_ERROR:                return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_HASH_FAIL:            return "CRYPTO_HASH_FAIL";
        case ErrorCode::CRYPTO_KEY_FAIL:             return "CRYPTO_KEY_FAIL";

        // Configuration
        case ErrorCode::CONFIG_ERROR:                return "CONFIG_ERROR";

        // Internal
        case ErrorCode::INTERNAL_ERROR:              return "INTERNAL_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:             return "NOT_IMPLEMENTED";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }
    if (index_) {
        oss << " #" << *index_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line() << ']';
    }

    return oss.str();
}

} // namespace core
