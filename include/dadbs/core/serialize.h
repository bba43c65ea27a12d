// DADBS - Serialization Header
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Byte-level serialization primitives used by every wire and storage record
// (stake records, ledger instructions, transaction signing messages).
// All integers are little-endian; variable-length fields carry a
// CompactSize length prefix.

#ifndef DADBS_CORE_SERIALIZE_H
#define DADBS_CORE_SERIALIZE_H

#include <dadbs/core/types.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace dadbs {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for a length-prefixed field
static constexpr uint64_t MAX_SERIALIZED_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers
// ============================================================================

namespace detail {

inline uint16_t (htole16)(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t (htole32)(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t (htole64)(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint16_t (le16toh)(uint16_t little) { return (htole16)(little); }
inline uint32_t (le32toh)(uint32_t little) { return (htole32)(little); }
inline uint64_t (le64toh)(uint64_t little) { return (htole64)(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer with a read cursor
// ============================================================================

class DataStream {
public:
    DataStream() = default;

    explicit DataStream(const std::vector<Byte>& data) : data_(data) {}

    explicit DataStream(std::vector<Byte>&& data) : data_(std::move(data)) {}

    DataStream(const Byte* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }

    bool empty() const noexcept { return size() == 0; }

    void clear() {
        data_.clear();
        readPos_ = 0;
    }

    /// Whole buffer, including bytes already read
    const std::vector<Byte>& Data() const noexcept { return data_; }

    /// Move the buffer out (the stream is left empty)
    std::vector<Byte> Release() {
        std::vector<Byte> out = std::move(data_);
        clear();
        return out;
    }

    void Write(const Byte* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const Byte*>(src), len);
    }

    void Read(Byte* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + readPos_, len);
        }
        readPos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<Byte*>(dst), len);
    }

    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<Byte> data_;
    size_t readPos_ = 0;
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj) {
    obj = (detail::htole16)(obj);
    s.Write(reinterpret_cast<const Byte*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = (detail::htole32)(obj);
    s.Write(reinterpret_cast<const Byte*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = (detail::htole64)(obj);
    s.Write(reinterpret_cast<const Byte*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<Byte*>(&obj), 2);
    return (detail::le16toh)(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<Byte*>(&obj), 4);
    return (detail::le32toh)(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<Byte*>(&obj), 8);
    return (detail::le64toh)(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 3 bytes (0xFD + 2 bytes little-endian)
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   size >  0xFFFFFFFF -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        ser_writedata8(s, 0xFD);
        ser_writedata16(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ser_readdata16(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 254) {
        size = ser_readdata32(s);
        if (size < 0x10000) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        size = ser_readdata64(s);
        if (size < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }

    if (size > MAX_SERIALIZED_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }

    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

// ============================================================================
// Length-Prefixed Byte Strings
// ============================================================================

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
        throw std::ios_base::failure("Unserialize(): length exceeds data");
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
        throw std::ios_base::failure("Unserialize(): length exceeds data");
    }
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

// ============================================================================
// Fixed-Size Values (no length prefix)
// ============================================================================

template<typename Stream, size_t N>
void Serialize(Stream& s, const std::array<uint8_t, N>& arr) {
    s.Write(arr.data(), N);
}

template<typename Stream, size_t N>
void Unserialize(Stream& s, std::array<uint8_t, N>& arr) {
    s.Read(arr.data(), N);
}

template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

// ============================================================================
// DataStream Stream Operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace dadbs

#endif // DADBS_CORE_SERIALIZE_H
