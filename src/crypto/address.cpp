// BTCSTAKER - Bitcoin Address Validation Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/crypto/address.h"
#include "btcstaker/crypto/sha256.h"
#include <cctype>
#include <cstring>

namespace btcstaker {

// ============================================================================
// Networks
// ============================================================================

namespace {

const AddressParams MAINNET_PARAMS = {0x00, 0x05, "bc"};
const AddressParams TESTNET_PARAMS = {0x6F, 0xC4, "tb"};
const AddressParams REGTEST_PARAMS = {0x6F, 0xC4, "bcrt"};

} // namespace

const AddressParams& GetAddressParams(Network network) {
    switch (network) {
        case Network::MAINNET: return MAINNET_PARAMS;
        case Network::TESTNET: return TESTNET_PARAMS;
        case Network::SIGNET: return TESTNET_PARAMS;
        case Network::REGTEST: return REGTEST_PARAMS;
    }
    return MAINNET_PARAMS;
}

const char* NetworkName(Network network) {
    switch (network) {
        case Network::MAINNET: return "mainnet";
        case Network::TESTNET: return "testnet";
        case Network::SIGNET: return "signet";
        case Network::REGTEST: return "regtest";
    }
    return "unknown";
}

std::optional<Network> ParseNetwork(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "mainnet" || lower == "main") return Network::MAINNET;
    if (lower == "testnet" || lower == "test" || lower == "testnet3") return Network::TESTNET;
    if (lower == "signet") return Network::SIGNET;
    if (lower == "regtest") return Network::REGTEST;
    return std::nullopt;
}

// ============================================================================
// Base58 Implementation
// ============================================================================

namespace {

const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const int8_t BASE58_MAP[256] = {
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1, 0, 1, 2, 3, 4, 5, 6,  7, 8,-1,-1,-1,-1,-1,-1,
    -1, 9,10,11,12,13,14,15, 16,-1,17,18,19,20,21,-1,
    22,23,24,25,26,27,28,29, 30,31,32,-1,-1,-1,-1,-1,
    -1,33,34,35,36,37,38,39, 40,41,42,43,-1,44,45,46,
    47,48,49,50,51,52,53,54, 55,56,57,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
};

} // namespace

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    size_t zeroes = 0;
    while (zeroes < data.size() && data[zeroes] == 0) {
        ++zeroes;
    }

    // log(256) / log(58), rounded up
    size_t size = (data.size() - zeroes) * 138 / 100 + 1;
    std::vector<uint8_t> b58(size);
    size_t length = 0;

    for (size_t i = zeroes; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = carry % 58;
            carry /= 58;
        }
        length = j;
    }

    auto it = b58.begin() + (b58.size() - length);
    while (it != b58.end() && *it == 0) {
        ++it;
    }

    std::string str;
    str.reserve(zeroes + (b58.end() - it));
    str.assign(zeroes, '1');
    while (it != b58.end()) {
        str += BASE58_ALPHABET[*it++];
    }

    return str;
}

std::vector<uint8_t> DecodeBase58(const std::string& str) {
    if (str.empty()) {
        return {};
    }

    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == '1') {
        ++zeroes;
    }

    // log(58) / log(256), rounded up
    size_t size = (str.size() - zeroes) * 733 / 1000 + 1;
    std::vector<uint8_t> b256(size);
    size_t length = 0;

    for (size_t i = zeroes; i < str.size(); ++i) {
        int carry = BASE58_MAP[static_cast<uint8_t>(str[i])];
        if (carry < 0) {
            return {};
        }
        size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = carry % 256;
            carry /= 256;
        }
        length = j;
    }

    auto it = b256.begin() + (b256.size() - length);
    while (it != b256.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result;
    result.reserve(zeroes + (b256.end() - it));
    result.assign(zeroes, 0x00);
    while (it != b256.end()) {
        result.push_back(*it++);
    }

    return result;
}

std::string EncodeBase58Check(const std::vector<uint8_t>& data) {
    Hash256 hash = DoubleSHA256(data.data(), data.size());

    std::vector<uint8_t> dataWithChecksum = data;
    dataWithChecksum.insert(dataWithChecksum.end(), hash.begin(), hash.begin() + 4);

    return EncodeBase58(dataWithChecksum);
}

std::vector<uint8_t> DecodeBase58Check(const std::string& str) {
    auto data = DecodeBase58(str);
    if (data.size() < 4) {
        return {};
    }

    std::vector<uint8_t> payload(data.begin(), data.end() - 4);
    Hash256 hash = DoubleSHA256(payload.data(), payload.size());

    if (std::memcmp(hash.data(), data.data() + payload.size(), 4) != 0) {
        return {};
    }

    return payload;
}

// ============================================================================
// Bech32 Implementation
// ============================================================================

namespace {

const char* BECH32_ALPHABET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

const int8_t BECH32_MAP[128] = {
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    15,-1,10,17,21,20,26,30,  7, 5,-1,-1,-1,-1,-1,-1,
    -1,29,-1,24,13,25, 9, 8, 23,-1,18,22,31,27,19,-1,
     1, 0, 3,16,11,28,12,14,  6, 4, 2,-1,-1,-1,-1,-1,
    -1,29,-1,24,13,25, 9, 8, 23,-1,18,22,31,27,19,-1,
     1, 0, 3,16,11,28,12,14,  6, 4, 2,-1,-1,-1,-1,-1,
};

constexpr uint32_t BECH32_CONST = 1;
constexpr uint32_t BECH32M_CONST = 0x2bc830a3;

/// BIP173 maximum string length
constexpr size_t BECH32_MAX_LENGTH = 90;

uint32_t Bech32Polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        if (top & 1) chk ^= 0x3b6a57b2;
        if (top & 2) chk ^= 0x26508e6d;
        if (top & 4) chk ^= 0x1ea119fa;
        if (top & 8) chk ^= 0x3d4233dd;
        if (top & 16) chk ^= 0x2a1462b3;
    }
    return chk;
}

std::vector<uint8_t> Bech32HrpExpand(const std::string& hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) >> 5);
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) & 31);
    }
    return ret;
}

std::vector<uint8_t> Bech32CreateChecksum(const std::string& hrp,
                                          const std::vector<uint8_t>& values,
                                          Bech32Encoding encoding) {
    auto hrpExp = Bech32HrpExpand(hrp);
    hrpExp.insert(hrpExp.end(), values.begin(), values.end());
    hrpExp.resize(hrpExp.size() + 6);
    uint32_t target = encoding == Bech32Encoding::BECH32M ? BECH32M_CONST : BECH32_CONST;
    uint32_t mod = Bech32Polymod(hrpExp) ^ target;
    std::vector<uint8_t> ret(6);
    for (int i = 0; i < 6; ++i) {
        ret[i] = (mod >> (5 * (5 - i))) & 31;
    }
    return ret;
}

void ConvertBits8to5(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    int acc = 0;
    int bits = 0;
    for (uint8_t value : in) {
        acc = ((acc << 8) | value) & 0xfff;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back((acc >> bits) & 31);
        }
    }
    if (bits > 0) {
        out.push_back((acc << (5 - bits)) & 31);
    }
}

bool ConvertBits5to8(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    int acc = 0;
    int bits = 0;
    for (uint8_t value : in) {
        if (value >= 32) return false;
        acc = ((acc << 5) | value) & 0xfff;
        bits += 5;
        while (bits >= 8) {
            bits -= 8;
            out.push_back((acc >> bits) & 255);
        }
    }
    // At most four bits of zero padding
    if (bits >= 5 || ((acc << (8 - bits)) & 255)) {
        return false;
    }
    return true;
}

} // namespace

std::string EncodeSegwitAddress(const std::string& hrp, uint8_t version,
                                const std::vector<uint8_t>& program) {
    Bech32Encoding encoding = version == 0 ? Bech32Encoding::BECH32 : Bech32Encoding::BECH32M;

    std::vector<uint8_t> values;
    values.push_back(version);
    ConvertBits8to5(program, values);

    auto checksum = Bech32CreateChecksum(hrp, values, encoding);
    values.insert(values.end(), checksum.begin(), checksum.end());

    std::string result = hrp + "1";
    for (uint8_t v : values) {
        result += BECH32_ALPHABET[v];
    }
    return result;
}

std::optional<SegwitDecoded> DecodeSegwitAddress(const std::string& str) {
    if (str.size() > BECH32_MAX_LENGTH) {
        return std::nullopt;
    }

    bool hasLower = false;
    bool hasUpper = false;
    for (char c : str) {
        if (c < 33 || c > 126) return std::nullopt;
        if (c >= 'a' && c <= 'z') hasLower = true;
        if (c >= 'A' && c <= 'Z') hasUpper = true;
    }
    if (hasLower && hasUpper) {
        return std::nullopt;
    }

    size_t pos = str.rfind('1');
    if (pos == std::string::npos || pos < 1 || pos + 7 > str.size()) {
        return std::nullopt;
    }

    std::string hrp;
    for (size_t i = 0; i < pos; ++i) {
        hrp += static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
    }

    std::vector<uint8_t> values;
    for (size_t i = pos + 1; i < str.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (c >= sizeof(BECH32_MAP)) {
            return std::nullopt;
        }
        int8_t val = BECH32_MAP[c];
        if (val < 0) {
            return std::nullopt;
        }
        values.push_back(static_cast<uint8_t>(val));
    }

    auto hrpExp = Bech32HrpExpand(hrp);
    hrpExp.insert(hrpExp.end(), values.begin(), values.end());
    uint32_t check = Bech32Polymod(hrpExp);

    SegwitDecoded result;
    if (check == BECH32_CONST) {
        result.encoding = Bech32Encoding::BECH32;
    } else if (check == BECH32M_CONST) {
        result.encoding = Bech32Encoding::BECH32M;
    } else {
        return std::nullopt;
    }

    values.resize(values.size() - 6);
    if (values.empty()) {
        return std::nullopt;
    }

    result.hrp = std::move(hrp);
    result.version = values[0];
    values.erase(values.begin());

    if (!ConvertBits5to8(values, result.program)) {
        return std::nullopt;
    }

    return result;
}

// ============================================================================
// BitcoinAddress
// ============================================================================

std::optional<BitcoinAddress> BitcoinAddress::Parse(const std::string& str, Network network) {
    const AddressParams& params = GetAddressParams(network);

    // Segwit first: a valid bech32 string never passes the base58 checksum
    auto segwit = DecodeSegwitAddress(str);
    if (segwit) {
        if (segwit->hrp != params.bech32Hrp || segwit->version > 16) {
            return std::nullopt;
        }
        const auto& program = segwit->program;
        if (segwit->version == 0) {
            if (segwit->encoding != Bech32Encoding::BECH32) {
                return std::nullopt;
            }
            if (program.size() == 20) {
                return BitcoinAddress(AddressType::P2WPKH, network, 0, program);
            }
            if (program.size() == 32) {
                return BitcoinAddress(AddressType::P2WSH, network, 0, program);
            }
            return std::nullopt;
        }
        if (segwit->encoding != Bech32Encoding::BECH32M ||
            program.size() < 2 || program.size() > 40) {
            return std::nullopt;
        }
        AddressType type = (segwit->version == 1 && program.size() == 32)
            ? AddressType::P2TR : AddressType::WITNESS_UNKNOWN;
        return BitcoinAddress(type, network, segwit->version, program);
    }

    auto payload = DecodeBase58Check(str);
    if (payload.size() != 21) {
        return std::nullopt;
    }
    std::vector<uint8_t> hash(payload.begin() + 1, payload.end());
    if (payload[0] == params.pubkeyPrefix) {
        return BitcoinAddress(AddressType::P2PKH, network, -1, std::move(hash));
    }
    if (payload[0] == params.scriptPrefix) {
        return BitcoinAddress(AddressType::P2SH, network, -1, std::move(hash));
    }
    return std::nullopt;
}

std::string BitcoinAddress::Encode() const {
    const AddressParams& params = GetAddressParams(network_);
    switch (type_) {
        case AddressType::P2PKH:
        case AddressType::P2SH: {
            std::vector<uint8_t> data;
            data.reserve(21);
            data.push_back(type_ == AddressType::P2PKH ? params.pubkeyPrefix
                                                       : params.scriptPrefix);
            data.insert(data.end(), program_.begin(), program_.end());
            return EncodeBase58Check(data);
        }
        default:
            return EncodeSegwitAddress(params.bech32Hrp,
                                       static_cast<uint8_t>(witnessVersion_), program_);
    }
}

Script BitcoinAddress::GetScriptPubKey() const {
    switch (type_) {
        case AddressType::P2PKH:
            return Script::CreateP2PKH(Hash160(program_.data(), program_.size()));
        case AddressType::P2SH:
            return Script::CreateP2SH(Hash160(program_.data(), program_.size()));
        default:
            return Script::CreateWitnessProgram(witnessVersion_, program_);
    }
}

} // namespace btcstaker
