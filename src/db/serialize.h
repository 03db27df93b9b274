// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_DB_SERIALIZE_H
#define PROXIGRAPH_DB_SERIALIZE_H

#include <primitives/identity.h>

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * CDataStream - Binary serialization buffer for stored records
 *
 * Little-endian fixed-width integers, CompactSize lengths. Reads past the
 * end throw std::runtime_error; decoders treat that as corruption.
 */
class CDataStream {
private:
    std::vector<uint8_t> data;
    size_t read_pos;

public:
    CDataStream() : read_pos(0) {}

    explicit CDataStream(const std::string& str)
        : data(str.begin(), str.end()), read_pos(0) {}

    size_t size() const { return data.size(); }

    bool eof() const { return read_pos >= data.size(); }

    size_t remaining() const {
        return read_pos < data.size() ? data.size() - read_pos : 0;
    }

    /** Buffer contents as a byte string (LevelDB value) */
    std::string str() const { return std::string(data.begin(), data.end()); }

    // --- Write Operations ---

    void write(const uint8_t* src, size_t len) {
        data.insert(data.end(), src, src + len);
    }

    void WriteUint8(uint8_t value) {
        data.push_back(value);
    }

    void WriteUint16(uint16_t value) {
        uint8_t buf[2];
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        write(buf, 2);
    }

    void WriteUint32(uint32_t value) {
        uint8_t buf[4];
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        buf[2] = (value >> 16) & 0xff;
        buf[3] = (value >> 24) & 0xff;
        write(buf, 4);
    }

    void WriteUint64(uint64_t value) {
        uint8_t buf[8];
        for (int i = 0; i < 8; i++) {
            buf[i] = (value >> (i * 8)) & 0xff;
        }
        write(buf, 8);
    }

    void WriteBool(bool value) {
        WriteUint8(value ? 1 : 0);
    }

    // Write variable-length integer (CompactSize)
    void WriteCompactSize(uint64_t value) {
        if (value < 253) {
            WriteUint8(static_cast<uint8_t>(value));
        } else if (value <= 0xFFFF) {
            WriteUint8(253);
            WriteUint16(static_cast<uint16_t>(value));
        } else if (value <= 0xFFFFFFFF) {
            WriteUint8(254);
            WriteUint32(static_cast<uint32_t>(value));
        } else {
            WriteUint8(255);
            WriteUint64(value);
        }
    }

    void WriteIdentity(const CIdentity& id) {
        write(id.data, CIdentity::SIZE);
    }

    void WriteIdentityList(const std::vector<CIdentity>& ids) {
        WriteCompactSize(ids.size());
        for (const CIdentity& id : ids) {
            WriteIdentity(id);
        }
    }

    // --- Read Operations ---

    void read(uint8_t* dst, size_t len) {
        if (read_pos + len > data.size()) {
            throw std::runtime_error("CDataStream: read past end");
        }
        memcpy(dst, &data[read_pos], len);
        read_pos += len;
    }

    uint8_t ReadUint8() {
        if (read_pos >= data.size()) {
            throw std::runtime_error("CDataStream: read past end");
        }
        return data[read_pos++];
    }

    uint16_t ReadUint16() {
        uint8_t buf[2];
        read(buf, 2);
        return static_cast<uint16_t>(buf[0]) |
               (static_cast<uint16_t>(buf[1]) << 8);
    }

    uint32_t ReadUint32() {
        uint8_t buf[4];
        read(buf, 4);
        return static_cast<uint32_t>(buf[0]) |
               (static_cast<uint32_t>(buf[1]) << 8) |
               (static_cast<uint32_t>(buf[2]) << 16) |
               (static_cast<uint32_t>(buf[3]) << 24);
    }

    uint64_t ReadUint64() {
        uint8_t buf[8];
        read(buf, 8);
        uint64_t result = 0;
        for (int i = 0; i < 8; i++) {
            result |= static_cast<uint64_t>(buf[i]) << (i * 8);
        }
        return result;
    }

    bool ReadBool() {
        uint8_t value = ReadUint8();
        if (value > 1) {
            throw std::runtime_error("CDataStream: invalid bool");
        }
        return value == 1;
    }

    uint64_t ReadCompactSize() {
        uint8_t first = ReadUint8();
        if (first < 253) {
            return first;
        } else if (first == 253) {
            return ReadUint16();
        } else if (first == 254) {
            return ReadUint32();
        } else {
            return ReadUint64();
        }
    }

    CIdentity ReadIdentity() {
        CIdentity result;
        read(result.data, CIdentity::SIZE);
        return result;
    }

    std::vector<CIdentity> ReadIdentityList() {
        uint64_t count = ReadCompactSize();
        // Bound by what the buffer can actually hold
        if (count > remaining() / CIdentity::SIZE) {
            throw std::runtime_error("CDataStream: identity list too large");
        }
        std::vector<CIdentity> result;
        result.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; i++) {
            result.push_back(ReadIdentity());
        }
        return result;
    }
};

/**
 * Big-endian encoding of an id for use inside database keys, so that
 * bytewise key order equals numeric order.
 */
inline std::string EncodeKeyUint64(uint64_t value) {
    std::string out(8, '\0');
    for (int i = 7; i >= 0; i--) {
        out[i] = static_cast<char>(value & 0xff);
        value >>= 8;
    }
    return out;
}

inline uint64_t DecodeKeyUint64(const std::string& bytes) {
    if (bytes.size() != 8) {
        throw std::runtime_error("DecodeKeyUint64: expected 8 bytes");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < 8; i++) {
        value = (value << 8) | static_cast<uint8_t>(bytes[i]);
    }
    return value;
}

#endif // PROXIGRAPH_DB_SERIALIZE_H
