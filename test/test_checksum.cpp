// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "descriptor/checksum.h"

#include <string>

using descriptor::desc_checksum;
using descriptor::verify_checksum;
using descriptor::with_checksum;

namespace {

const std::string K1 =
    "025edd5cc23c51e87a497ca815d5dce0f8ab52554f849ed8995de64c5f34ce7143";

}  // namespace

// ===================================================================
// Checksum computation
// ===================================================================

TEST_CASE(Checksum, KnownAddrVector) {
    auto sum = desc_checksum("addr(mkmZxiEcEd8ZqjQWVZuC6so5dFMKEFpN2j)");
    CHECK_OK(sum);
    CHECK_EQ(sum.value(), "02wpgw69");
}

TEST_CASE(Checksum, ElementsDescriptors) {
    CHECK_EQ(desc_checksum("elpkh(" + K1 + ")").value(), "e0a9knv7");
    CHECK_EQ(desc_checksum("elwpkh(" + K1 + ")").value(), "c88czymq");
    CHECK_EQ(desc_checksum("elwsh(pk(" + K1 + "))").value(), "dpltk5ws");
    CHECK_EQ(desc_checksum("elsh(wpkh(" + K1 + "))").value(), "e2k6ns2m");
}

TEST_CASE(Checksum, PrefixChangesChecksum) {
    // The "el" prefix is part of the checksummed text.
    CHECK_EQ(desc_checksum("pkh(" + K1 + ")").value(), "0uwtly0v");
    CHECK_NE(desc_checksum("pkh(" + K1 + ")").value(),
             desc_checksum("elpkh(" + K1 + ")").value());
}

TEST_CASE(Checksum, InvalidCharacter) {
    CHECK_ERR_CODE(desc_checksum("elpk(\xc3\xa9)"),
                   core::ErrorCode::BAD_CHECKSUM);
}

TEST_CASE(Checksum, WithChecksumAppendsTag) {
    auto full = with_checksum("elpk(" + K1 + ")");
    CHECK_OK(full);
    CHECK_EQ(full.value(), "elpk(" + K1 + ")#mypm0233");
}

// ===================================================================
// Checksum verification
// ===================================================================

TEST_CASE(Checksum, VerifyAcceptsAndStrips) {
    std::string s = "elwsh(pk(" + K1 + "))#dpltk5ws";
    auto body = verify_checksum(s);
    CHECK_OK(body);
    CHECK_EQ(std::string(body.value()), "elwsh(pk(" + K1 + "))");
}

TEST_CASE(Checksum, VerifyRejectsMissing) {
    CHECK_ERR_CODE(verify_checksum("elwsh(pk(" + K1 + "))"),
                   core::ErrorCode::BAD_CHECKSUM);
}

TEST_CASE(Checksum, VerifyRejectsMultipleHashes) {
    CHECK_ERR_CODE(verify_checksum("elpk(" + K1 + ")#mypm0233#mypm0233"),
                   core::ErrorCode::BAD_CHECKSUM);
}

TEST_CASE(Checksum, VerifyRejectsWrongChecksum) {
    CHECK_ERR_CODE(verify_checksum("elpk(" + K1 + ")#mypm0234"),
                   core::ErrorCode::BAD_CHECKSUM);
    CHECK_ERR_CODE(verify_checksum("elpk(" + K1 + ")#"),
                   core::ErrorCode::BAD_CHECKSUM);
}

TEST_CASE(Checksum, VerifyRejectsEditedBody) {
    // Checksum of elpkh(K1) attached to elwpkh(K1).
    CHECK_ERR_CODE(verify_checksum("elwpkh(" + K1 + ")#e0a9knv7"),
                   core::ErrorCode::BAD_CHECKSUM);
}
