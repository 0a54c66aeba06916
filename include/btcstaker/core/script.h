// BTCSTAKER - Script Header
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Byte-level Bitcoin scripts and witness stacks. Scripts are carried as
// opaque data by the transaction model; only the standard output templates
// needed for address handling are built or recognized here.

#ifndef BTCSTAKER_CORE_SCRIPT_H
#define BTCSTAKER_CORE_SCRIPT_H

#include "btcstaker/core/types.h"
#include "btcstaker/core/serialize.h"
#include <cstdint>
#include <vector>
#include <string>

namespace btcstaker {

// ============================================================================
// Opcodes
// ============================================================================

enum Opcode : uint8_t {
    OP_0 = 0x00,
    OP_FALSE = OP_0,
    OP_PUSHDATA1 = 0x4c,
    OP_PUSHDATA2 = 0x4d,
    OP_PUSHDATA4 = 0x4e,
    OP_1NEGATE = 0x4f,
    OP_1 = 0x51,
    OP_TRUE = OP_1,
    OP_16 = 0x60,
    OP_RETURN = 0x6a,
    OP_DUP = 0x76,
    OP_EQUAL = 0x87,
    OP_EQUALVERIFY = 0x88,
    OP_HASH160 = 0xa9,
    OP_CHECKSIG = 0xac,
};

// ============================================================================
// Script Class
// ============================================================================

/// Serialized script, used inside transaction inputs and outputs
class Script : public std::vector<uint8_t> {
public:
    using base_type = std::vector<uint8_t>;
    using base_type::base_type;

    /// Push an opcode
    Script& operator<<(Opcode opcode);

    /// Push raw data with appropriate size prefix
    Script& operator<<(const std::vector<uint8_t>& data);

    /// Pattern: OP_DUP OP_HASH160 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG
    bool IsPayToPublicKeyHash() const;

    /// Pattern: OP_HASH160 <20 bytes> OP_EQUAL
    bool IsPayToScriptHash() const;

    /// Pattern: OP_n <2..40 bytes>. Fills version and program on success.
    bool IsWitnessProgram(int& version, std::vector<uint8_t>& program) const;

    /// Decode OP_N to integer (0-16)
    static int DecodeOP_N(Opcode opcode);

    /// Encode integer (0-16) to OP_N
    static Opcode EncodeOP_N(int n);

    static Script CreateP2PKH(const Hash160& pubKeyHash);
    static Script CreateP2SH(const Hash160& scriptHash);
    static Script CreateWitnessProgram(int version, const std::vector<uint8_t>& program);

private:
    void AppendDataSize(uint32_t size);
};

// ============================================================================
// ScriptWitness - Segregated witness stack of an input
// ============================================================================

struct ScriptWitness {
    std::vector<std::vector<uint8_t>> stack;

    bool IsNull() const { return stack.empty(); }
    void SetNull() { stack.clear(); }

    friend bool operator==(const ScriptWitness& a, const ScriptWitness& b) {
        return a.stack == b.stack;
    }

    friend bool operator!=(const ScriptWitness& a, const ScriptWitness& b) {
        return !(a == b);
    }
};

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Script& script) {
    WriteCompactSize(s, script.size());
    if (!script.empty()) {
        s.Write(script.data(), script.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, Script& script) {
    uint64_t size = ReadCompactSize(s);
    if (size > s.size()) {
        throw std::ios_base::failure("Unserialize(): script exceeds data");
    }
    script.resize(size);
    if (size > 0) {
        s.Read(script.data(), size);
    }
}

} // namespace btcstaker

#endif // BTCSTAKER_CORE_SCRIPT_H
