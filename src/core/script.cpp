// BTCSTAKER - Script Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/core/script.h"

namespace btcstaker {

// ============================================================================
// Script Building
// ============================================================================

void Script::AppendDataSize(uint32_t size) {
    if (size < OP_PUSHDATA1) {
        push_back(static_cast<uint8_t>(size));
    } else if (size <= 0xff) {
        push_back(OP_PUSHDATA1);
        push_back(static_cast<uint8_t>(size));
    } else if (size <= 0xffff) {
        push_back(OP_PUSHDATA2);
        push_back(size & 0xff);
        push_back((size >> 8) & 0xff);
    } else {
        push_back(OP_PUSHDATA4);
        push_back(size & 0xff);
        push_back((size >> 8) & 0xff);
        push_back((size >> 16) & 0xff);
        push_back((size >> 24) & 0xff);
    }
}

Script& Script::operator<<(Opcode opcode) {
    push_back(static_cast<uint8_t>(opcode));
    return *this;
}

Script& Script::operator<<(const std::vector<uint8_t>& data) {
    AppendDataSize(static_cast<uint32_t>(data.size()));
    insert(end(), data.begin(), data.end());
    return *this;
}

// ============================================================================
// Pattern Detection
// ============================================================================

bool Script::IsPayToPublicKeyHash() const {
    return size() == 25 &&
           (*this)[0] == OP_DUP &&
           (*this)[1] == OP_HASH160 &&
           (*this)[2] == 20 &&
           (*this)[23] == OP_EQUALVERIFY &&
           (*this)[24] == OP_CHECKSIG;
}

bool Script::IsPayToScriptHash() const {
    return size() == 23 &&
           (*this)[0] == OP_HASH160 &&
           (*this)[1] == 20 &&
           (*this)[22] == OP_EQUAL;
}

bool Script::IsWitnessProgram(int& version, std::vector<uint8_t>& program) const {
    if (size() < 4 || size() > 42) {
        return false;
    }
    uint8_t op = (*this)[0];
    if (op != OP_0 && (op < OP_1 || op > OP_16)) {
        return false;
    }
    if (static_cast<size_t>((*this)[1]) + 2 != size()) {
        return false;
    }
    version = DecodeOP_N(static_cast<Opcode>(op));
    program.assign(begin() + 2, end());
    return true;
}

int Script::DecodeOP_N(Opcode opcode) {
    if (opcode == OP_0) {
        return 0;
    }
    if (opcode < OP_1 || opcode > OP_16) {
        return -1;
    }
    return static_cast<int>(opcode) - static_cast<int>(OP_1) + 1;
}

Opcode Script::EncodeOP_N(int n) {
    if (n <= 0 || n > 16) {
        return OP_0;
    }
    return static_cast<Opcode>(OP_1 + n - 1);
}

// ============================================================================
// Standard Script Builders
// ============================================================================

Script Script::CreateP2PKH(const Hash160& pubKeyHash) {
    Script script;
    script << OP_DUP << OP_HASH160 << pubKeyHash.ToBytes() << OP_EQUALVERIFY << OP_CHECKSIG;
    return script;
}

Script Script::CreateP2SH(const Hash160& scriptHash) {
    Script script;
    script << OP_HASH160 << scriptHash.ToBytes() << OP_EQUAL;
    return script;
}

Script Script::CreateWitnessProgram(int version, const std::vector<uint8_t>& program) {
    Script script;
    script << EncodeOP_N(version) << program;
    return script;
}

} // namespace btcstaker
