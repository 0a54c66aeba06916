// BTCSTAKER - Serialization Header
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Serialization primitives used by the transaction wire format and the
// tracked transaction record codec. Integers are little-endian, lengths are
// CompactSize prefixed. Database keys use the big-endian helpers at the end
// of this file so that lexicographic key order matches numeric order.

#ifndef BTCSTAKER_CORE_SERIALIZE_H
#define BTCSTAKER_CORE_SERIALIZE_H

#include "btcstaker/core/types.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace btcstaker {

/// Largest length prefix accepted when reading (32 MB)
static constexpr uint64_t MAX_SIZE = 0x02000000;

/// Cap on up-front vector reservation while reading
static constexpr unsigned int MAX_VECTOR_ALLOCATE = 5000000;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

/**
 * Append-only write buffer with a read cursor. Reads past the end throw
 * std::ios_base::failure.
 */
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(std::vector<uint8_t> data) : data_(std::move(data)) {}
    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - read_pos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Unread bytes as a vector
    std::vector<uint8_t> Bytes() const {
        return std::vector<uint8_t>(data(), data() + size());
    }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data(), len);
        }
        read_pos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

private:
    std::vector<uint8_t> data_;
    size_t read_pos_ = 0;
};

// ============================================================================
// Little-Endian Integers
// ============================================================================

template<typename Stream, typename T>
inline void WriteLE(Stream& s, T value) {
    static_assert(std::is_unsigned<T>::value, "WriteLE takes unsigned integers");
    uint8_t buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(buf, sizeof(T));
}

template<typename T, typename Stream>
inline T ReadLE(Stream& s) {
    static_assert(std::is_unsigned<T>::value, "ReadLE takes unsigned integers");
    uint8_t buf[sizeof(T)];
    s.Read(buf, sizeof(T));
    T value = 0;
    for (size_t i = sizeof(T); i-- > 0;) {
        value = static_cast<T>((value << 8) | buf[i]);
    }
    return value;
}

/// Integers other than bool; signed values are written as two's complement
template<typename T>
using EnableIfSerializableInt = typename std::enable_if<
    std::is_integral<T>::value && !std::is_same<T, bool>::value, int>::type;

template<typename Stream, typename T, EnableIfSerializableInt<T> = 0>
inline void Serialize(Stream& s, T a) {
    WriteLE(s, static_cast<typename std::make_unsigned<T>::type>(a));
}

template<typename Stream, typename T, EnableIfSerializableInt<T> = 0>
inline void Unserialize(Stream& s, T& a) {
    a = static_cast<T>(ReadLE<typename std::make_unsigned<T>::type>(s));
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 0xFD + 2 bytes
//   size <= 0xFFFFFFFF -- 0xFE + 4 bytes
//   otherwise          -- 0xFF + 8 bytes

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE(s, uint8_t{0xFD});
        WriteLE(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE(s, uint8_t{0xFE});
        WriteLE(s, static_cast<uint32_t>(size));
    } else {
        WriteLE(s, uint8_t{0xFF});
        WriteLE(s, size);
    }
}

/// Rejects non-canonical encodings and sizes above MAX_SIZE
template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ReadLE<uint16_t>(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 254) {
        size = ReadLE<uint32_t>(s);
        if (size < 0x10000) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        size = ReadLE<uint64_t>(s);
        if (size < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }

    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Byte Vectors and Strings
// ============================================================================
// Declared ahead of the generic vector template so nested byte vectors
// (witness stacks) resolve to the raw-bytes form.

template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompactSize(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    uint64_t size = ReadCompactSize(s);
    if (size > s.size()) {
        throw std::ios_base::failure("Unserialize(): byte vector exceeds data");
    }
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    if (size > s.size()) {
        throw std::ios_base::failure("Unserialize(): string exceeds data");
    }
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

// ============================================================================
// Vectors
// ============================================================================

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(std::min(size, static_cast<uint64_t>(MAX_VECTOR_ALLOCATE / sizeof(T))));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

// ============================================================================
// Hashes
// ============================================================================

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

// ============================================================================
// Optional Values
// ============================================================================
// A one byte presence flag (0 or 1) followed by the value when present.
// Any other flag value is rejected.

template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt) {
    WriteLE(s, static_cast<uint8_t>(opt.has_value() ? 1 : 0));
    if (opt) {
        Serialize(s, *opt);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt) {
    uint8_t flag = ReadLE<uint8_t>(s);
    if (flag == 0) {
        opt.reset();
        return;
    }
    if (flag != 1) {
        throw std::ios_base::failure("Unserialize(): invalid presence flag");
    }
    T value;
    Unserialize(s, value);
    opt = std::move(value);
}

// ============================================================================
// Big-Endian Key Encoding
// ============================================================================

inline void WriteBE32(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>(v >> 24);
    out[1] = static_cast<uint8_t>(v >> 16);
    out[2] = static_cast<uint8_t>(v >> 8);
    out[3] = static_cast<uint8_t>(v);
}

inline uint32_t ReadBE32(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

/// 8-byte big-endian encoding as a key string
inline std::string EncodeBE64Key(uint64_t v) {
    std::string key(8, '\0');
    for (int i = 7; i >= 0; --i) {
        key[i] = static_cast<char>(v & 0xFF);
        v >>= 8;
    }
    return key;
}

/// Parse an 8-byte big-endian key; false on wrong length
inline bool DecodeBE64Key(const std::string& key, uint64_t& out) {
    if (key.size() != 8) {
        return false;
    }
    out = 0;
    for (char c : key) {
        out = (out << 8) | static_cast<uint8_t>(c);
    }
    return true;
}

} // namespace btcstaker

#endif // BTCSTAKER_CORE_SERIALIZE_H
