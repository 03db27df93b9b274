// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <primitives/identity.h>
#include <util/strencodings.h>

#include <cstring>

CIdentity::CIdentity() {
    std::memset(data, 0, SIZE);
}

CIdentity::CIdentity(const uint8_t* bytes) {
    std::memcpy(data, bytes, SIZE);
}

bool CIdentity::IsNull() const {
    for (size_t i = 0; i < SIZE; i++) {
        if (data[i] != 0) return false;
    }
    return true;
}

bool CIdentity::operator==(const CIdentity& other) const {
    return std::memcmp(data, other.data, SIZE) == 0;
}

bool CIdentity::operator!=(const CIdentity& other) const {
    return !(*this == other);
}

bool CIdentity::operator<(const CIdentity& other) const {
    return std::memcmp(data, other.data, SIZE) < 0;
}

std::string CIdentity::GetHex() const {
    return HexStr(data, SIZE);
}

std::string CIdentity::ToShortString() const {
    return "0x" + GetHex().substr(0, 12);
}

bool CIdentity::SetHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > SIZE * 2) {
        return false;
    }
    // Left-pad to full width
    digits.insert(0, SIZE * 2 - digits.size(), '0');

    std::vector<uint8_t> bytes = ParseHex(digits);
    if (bytes.size() != SIZE) {
        return false;
    }
    std::memcpy(data, bytes.data(), SIZE);
    return true;
}

size_t CIdentityHasher::operator()(const CIdentity& id) const {
    // Identities are already uniformly distributed addresses; fold the tail.
    uint64_t h = 0;
    std::memcpy(&h, id.data + CIdentity::SIZE - sizeof(h), sizeof(h));
    return static_cast<size_t>(h ^ (h >> 29));
}

bool ParseIdentity(const std::string& str, CIdentity& identity) {
    CIdentity parsed;
    if (!parsed.SetHex(str) || parsed.IsNull()) {
        return false;
    }
    identity = parsed;
    return true;
}
