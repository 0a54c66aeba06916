// BTCSTAKER - Tracked Transaction Codec Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/stakerdb/codec.h"

namespace btcstaker {
namespace stakerdb {

std::string EncodeStoredTransaction(const StoredTransaction& tx) {
    DataStream ss;
    Serialize(ss, tx);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

bool DecodeStoredTransaction(const db::Slice& data, StoredTransaction& tx,
                             std::string* error) {
    StoredTransaction decoded;
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, decoded);
        if (!ss.empty()) {
            if (error) {
                *error = std::to_string(ss.size()) + " trailing bytes";
            }
            return false;
        }
    } catch (const std::ios_base::failure& e) {
        if (error) {
            *error = e.what();
        }
        return false;
    }
    tx = std::move(decoded);
    return true;
}

std::string EncodeIndexKey(uint64_t index) {
    return EncodeBE64Key(index);
}

bool DecodeIndexKey(const db::Slice& key, uint64_t& index) {
    return DecodeBE64Key(key.ToString(), index);
}

std::string EncodeOutpointKey(const OutPoint& outpoint) {
    std::string key(reinterpret_cast<const char*>(outpoint.hash.data()), TxHash::SIZE);
    uint8_t n[4];
    WriteBE32(n, outpoint.n);
    key.append(reinterpret_cast<const char*>(n), sizeof(n));
    return key;
}

} // namespace stakerdb
} // namespace btcstaker
