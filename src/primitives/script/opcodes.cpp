// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/opcodes.h"

#include <array>
#include <cstdio>
#include <string>

namespace primitives::script {

// ---------------------------------------------------------------------------
// Name table
// ---------------------------------------------------------------------------
// Built once on first use. Named opcodes come from NAMED below; the push
// range 0x01-0x4b and unassigned bytes get generated names.
// ---------------------------------------------------------------------------

namespace {

struct NamedOpcode {
    Opcode op;
    const char* name;
};

// Where two names share a byte (OP_NOP2 / OP_CHECKLOCKTIMEVERIFY) only the
// descriptive one is listed.
constexpr NamedOpcode NAMED[] = {
    {Opcode::OP_0, "OP_0"},
    {Opcode::OP_PUSHDATA1, "OP_PUSHDATA1"},
    {Opcode::OP_PUSHDATA2, "OP_PUSHDATA2"},
    {Opcode::OP_PUSHDATA4, "OP_PUSHDATA4"},
    {Opcode::OP_1NEGATE, "OP_1NEGATE"},
    {Opcode::OP_RESERVED, "OP_RESERVED"},
    {Opcode::OP_NOP, "OP_NOP"},
    {Opcode::OP_VER, "OP_VER"},
    {Opcode::OP_IF, "OP_IF"},
    {Opcode::OP_NOTIF, "OP_NOTIF"},
    {Opcode::OP_VERIF, "OP_VERIF"},
    {Opcode::OP_VERNOTIF, "OP_VERNOTIF"},
    {Opcode::OP_ELSE, "OP_ELSE"},
    {Opcode::OP_ENDIF, "OP_ENDIF"},
    {Opcode::OP_VERIFY, "OP_VERIFY"},
    {Opcode::OP_RETURN, "OP_RETURN"},
    {Opcode::OP_TOALTSTACK, "OP_TOALTSTACK"},
    {Opcode::OP_FROMALTSTACK, "OP_FROMALTSTACK"},
    {Opcode::OP_2DROP, "OP_2DROP"},
    {Opcode::OP_2DUP, "OP_2DUP"},
    {Opcode::OP_3DUP, "OP_3DUP"},
    {Opcode::OP_2OVER, "OP_2OVER"},
    {Opcode::OP_2ROT, "OP_2ROT"},
    {Opcode::OP_2SWAP, "OP_2SWAP"},
    {Opcode::OP_IFDUP, "OP_IFDUP"},
    {Opcode::OP_DEPTH, "OP_DEPTH"},
    {Opcode::OP_DROP, "OP_DROP"},
    {Opcode::OP_DUP, "OP_DUP"},
    {Opcode::OP_NIP, "OP_NIP"},
    {Opcode::OP_OVER, "OP_OVER"},
    {Opcode::OP_PICK, "OP_PICK"},
    {Opcode::OP_ROLL, "OP_ROLL"},
    {Opcode::OP_ROT, "OP_ROT"},
    {Opcode::OP_SWAP, "OP_SWAP"},
    {Opcode::OP_TUCK, "OP_TUCK"},
    {Opcode::OP_CAT, "OP_CAT"},
    {Opcode::OP_SUBSTR, "OP_SUBSTR"},
    {Opcode::OP_LEFT, "OP_LEFT"},
    {Opcode::OP_RIGHT, "OP_RIGHT"},
    {Opcode::OP_SIZE, "OP_SIZE"},
    {Opcode::OP_INVERT, "OP_INVERT"},
    {Opcode::OP_AND, "OP_AND"},
    {Opcode::OP_OR, "OP_OR"},
    {Opcode::OP_XOR, "OP_XOR"},
    {Opcode::OP_EQUAL, "OP_EQUAL"},
    {Opcode::OP_EQUALVERIFY, "OP_EQUALVERIFY"},
    {Opcode::OP_RESERVED1, "OP_RESERVED1"},
    {Opcode::OP_RESERVED2, "OP_RESERVED2"},
    {Opcode::OP_1ADD, "OP_1ADD"},
    {Opcode::OP_1SUB, "OP_1SUB"},
    {Opcode::OP_2MUL, "OP_2MUL"},
    {Opcode::OP_2DIV, "OP_2DIV"},
    {Opcode::OP_NEGATE, "OP_NEGATE"},
    {Opcode::OP_ABS, "OP_ABS"},
    {Opcode::OP_NOT, "OP_NOT"},
    {Opcode::OP_0NOTEQUAL, "OP_0NOTEQUAL"},
    {Opcode::OP_ADD, "OP_ADD"},
    {Opcode::OP_SUB, "OP_SUB"},
    {Opcode::OP_MUL, "OP_MUL"},
    {Opcode::OP_DIV, "OP_DIV"},
    {Opcode::OP_MOD, "OP_MOD"},
    {Opcode::OP_LSHIFT, "OP_LSHIFT"},
    {Opcode::OP_RSHIFT, "OP_RSHIFT"},
    {Opcode::OP_BOOLAND, "OP_BOOLAND"},
    {Opcode::OP_BOOLOR, "OP_BOOLOR"},
    {Opcode::OP_NUMEQUAL, "OP_NUMEQUAL"},
    {Opcode::OP_NUMEQUALVERIFY, "OP_NUMEQUALVERIFY"},
    {Opcode::OP_NUMNOTEQUAL, "OP_NUMNOTEQUAL"},
    {Opcode::OP_LESSTHAN, "OP_LESSTHAN"},
    {Opcode::OP_GREATERTHAN, "OP_GREATERTHAN"},
    {Opcode::OP_LESSTHANOREQUAL, "OP_LESSTHANOREQUAL"},
    {Opcode::OP_GREATERTHANOREQUAL, "OP_GREATERTHANOREQUAL"},
    {Opcode::OP_MIN, "OP_MIN"},
    {Opcode::OP_MAX, "OP_MAX"},
    {Opcode::OP_WITHIN, "OP_WITHIN"},
    {Opcode::OP_RIPEMD160, "OP_RIPEMD160"},
    {Opcode::OP_SHA1, "OP_SHA1"},
    {Opcode::OP_SHA256, "OP_SHA256"},
    {Opcode::OP_HASH160, "OP_HASH160"},
    {Opcode::OP_HASH256, "OP_HASH256"},
    {Opcode::OP_CODESEPARATOR, "OP_CODESEPARATOR"},
    {Opcode::OP_CHECKSIG, "OP_CHECKSIG"},
    {Opcode::OP_CHECKSIGVERIFY, "OP_CHECKSIGVERIFY"},
    {Opcode::OP_CHECKMULTISIG, "OP_CHECKMULTISIG"},
    {Opcode::OP_CHECKMULTISIGVERIFY, "OP_CHECKMULTISIGVERIFY"},
    {Opcode::OP_NOP1, "OP_NOP1"},
    {Opcode::OP_CHECKLOCKTIMEVERIFY, "OP_CHECKLOCKTIMEVERIFY"},
    {Opcode::OP_CHECKSEQUENCEVERIFY, "OP_CHECKSEQUENCEVERIFY"},
    {Opcode::OP_NOP4, "OP_NOP4"},
    {Opcode::OP_NOP5, "OP_NOP5"},
    {Opcode::OP_NOP6, "OP_NOP6"},
    {Opcode::OP_NOP7, "OP_NOP7"},
    {Opcode::OP_NOP8, "OP_NOP8"},
    {Opcode::OP_NOP9, "OP_NOP9"},
    {Opcode::OP_NOP10, "OP_NOP10"},
    {Opcode::OP_CHECKSIGADD, "OP_CHECKSIGADD"},
    {Opcode::OP_CHECKSIGFROMSTACK, "OP_CHECKSIGFROMSTACK"},
    {Opcode::OP_CHECKSIGFROMSTACKVERIFY, "OP_CHECKSIGFROMSTACKVERIFY"},
    {Opcode::OP_INVALIDOPCODE, "OP_INVALIDOPCODE"},
};

struct NameTable {
    std::array<std::string, 256> names;

    NameTable() {
        char buf[24];
        for (int i = 0; i < 256; ++i) {
            if (i >= 0x01 && i <= 0x4b) {
                std::snprintf(buf, sizeof(buf), "OP_PUSHBYTES_%d", i);
            } else {
                std::snprintf(buf, sizeof(buf), "OP_UNKNOWN_%02x", i);
            }
            names[static_cast<size_t>(i)] = buf;
        }
        for (int n = 1; n <= 16; ++n) {
            std::snprintf(buf, sizeof(buf), "OP_%d", n);
            names[0x50 + static_cast<size_t>(n)] = buf;
        }
        for (const auto& entry : NAMED) {
            names[static_cast<uint8_t>(entry.op)] = entry.name;
        }
    }
};

const NameTable& name_table() {
    static const NameTable instance;
    return instance;
}

} // namespace

std::string_view opcode_name(Opcode op) {
    return name_table().names[static_cast<uint8_t>(op)];
}

} // namespace primitives::script
