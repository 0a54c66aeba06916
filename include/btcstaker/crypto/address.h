// BTCSTAKER - Bitcoin Address Validation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Base58Check (P2PKH, P2SH) and Bech32/Bech32m (segwit) address handling
// for the Bitcoin networks a staker can be configured for.

#ifndef BTCSTAKER_CRYPTO_ADDRESS_H
#define BTCSTAKER_CRYPTO_ADDRESS_H

#include "btcstaker/core/script.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace btcstaker {

// ============================================================================
// Networks
// ============================================================================

enum class Network {
    MAINNET,
    TESTNET,
    SIGNET,
    REGTEST
};

/// Address prefixes of a network
struct AddressParams {
    uint8_t pubkeyPrefix;
    uint8_t scriptPrefix;
    const char* bech32Hrp;
};

const AddressParams& GetAddressParams(Network network);

/// "mainnet", "testnet", "signet", "regtest"
const char* NetworkName(Network network);

/// Parse a network name. Accepts "main" and "test" as aliases.
std::optional<Network> ParseNetwork(const std::string& name);

// ============================================================================
// Base58Check Encoding
// ============================================================================

std::string EncodeBase58(const std::vector<uint8_t>& data);

/// Returns empty vector on invalid characters
std::vector<uint8_t> DecodeBase58(const std::string& str);

/// Encode data with a 4-byte double SHA256 checksum appended
std::string EncodeBase58Check(const std::vector<uint8_t>& data);

/// Returns empty vector if the checksum fails
std::vector<uint8_t> DecodeBase58Check(const std::string& str);

// ============================================================================
// Bech32/Bech32m Encoding
// ============================================================================

enum class Bech32Encoding {
    BECH32,   ///< BIP173, witness version 0
    BECH32M   ///< BIP350, witness version 1 and above
};

/// Result of decoding a segwit address string
struct SegwitDecoded {
    Bech32Encoding encoding;
    std::string hrp;
    uint8_t version;
    std::vector<uint8_t> program;
};

std::string EncodeSegwitAddress(const std::string& hrp, uint8_t version,
                                const std::vector<uint8_t>& program);

/**
 * Decode a Bech32/Bech32m string into its witness version and program.
 * Rejects mixed case, bad checksums and invalid padding. Program length
 * and encoding rules are checked by BitcoinAddress::Parse.
 */
std::optional<SegwitDecoded> DecodeSegwitAddress(const std::string& str);

// ============================================================================
// BitcoinAddress
// ============================================================================

enum class AddressType {
    P2PKH,           ///< Pay to Public Key Hash (legacy)
    P2SH,            ///< Pay to Script Hash
    P2WPKH,          ///< Witness v0, 20 byte program
    P2WSH,           ///< Witness v0, 32 byte program
    P2TR,            ///< Witness v1, 32 byte program
    WITNESS_UNKNOWN  ///< Future witness versions
};

/**
 * A validated address for a specific network. Only obtainable through
 * Parse, so holding one means the string was well formed.
 */
class BitcoinAddress {
public:
    /// Parse and validate against the network's prefixes
    static std::optional<BitcoinAddress> Parse(const std::string& str, Network network);

    AddressType GetType() const { return type_; }
    Network GetNetwork() const { return network_; }

    /// Hash160 for base58 types, witness program for segwit types
    const std::vector<uint8_t>& GetProgram() const { return program_; }

    /// Witness version, or -1 for base58 types
    int GetWitnessVersion() const { return witnessVersion_; }

    /// Canonical string form (lowercase for segwit)
    std::string Encode() const;

    /// Output script paying to this address
    Script GetScriptPubKey() const;

    friend bool operator==(const BitcoinAddress& a, const BitcoinAddress& b) {
        return a.type_ == b.type_ && a.network_ == b.network_ &&
               a.witnessVersion_ == b.witnessVersion_ && a.program_ == b.program_;
    }

    friend bool operator!=(const BitcoinAddress& a, const BitcoinAddress& b) {
        return !(a == b);
    }

private:
    BitcoinAddress(AddressType type, Network network, int witnessVersion,
                   std::vector<uint8_t> program)
        : type_(type), network_(network), witnessVersion_(witnessVersion),
          program_(std::move(program)) {}

    AddressType type_;
    Network network_;
    int witnessVersion_;
    std::vector<uint8_t> program_;
};

} // namespace btcstaker

#endif // BTCSTAKER_CRYPTO_ADDRESS_H
