// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <util/strencodings.h>
#include <cstdarg>
#include <cstdio>
#include <limits>

std::string strprintf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    va_list copy;
    va_copy(copy, args);
    int len = vsnprintf(nullptr, 0, format, copy);
    va_end(copy);

    if (len < 0) {
        va_end(args);
        return std::string();
    }

    std::vector<char> buffer(static_cast<size_t>(len) + 1);
    vsnprintf(buffer.data(), buffer.size(), format, args);
    va_end(args);
    return std::string(buffer.data(), static_cast<size_t>(len));
}

std::string HexStr(const uint8_t* data, size_t len) {
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(hexmap[(data[i] >> 4) & 0x0F]);  // High nibble
        result.push_back(hexmap[data[i] & 0x0F]);         // Low nibble
    }

    return result;
}

std::string HexStr(const std::vector<uint8_t>& vch) {
    return HexStr(vch.data(), vch.size());
}

std::vector<uint8_t> ParseHex(const std::string& str) {
    if (!IsHex(str)) {
        return std::vector<uint8_t>();
    }

    std::vector<uint8_t> result;
    result.reserve(str.size() / 2);

    for (size_t i = 0; i < str.size(); i += 2) {
        int8_t high = HexDigit(str[i]);
        int8_t low = HexDigit(str[i + 1]);
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

bool IsHex(const std::string& str) {
    // Must have even number of characters
    if (str.size() % 2 != 0) {
        return false;
    }

    for (char c : str) {
        if (HexDigit(c) < 0) {
            return false;
        }
    }

    return true;
}

bool ParseUInt64(const std::string& str, uint64_t& out) {
    if (str.empty() || str.size() > 20) {
        return false;
    }

    uint64_t value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return false;  // Overflow
        }
        value = value * 10 + digit;
    }

    out = value;
    return true;
}

std::vector<std::string> SplitString(const std::string& str, char sep) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start <= str.size()) {
        size_t end = str.find(sep, start);
        if (end == std::string::npos) {
            end = str.size();
        }
        std::string item = str.substr(start, end - start);
        size_t first = item.find_first_not_of(" \t");
        if (first != std::string::npos) {
            size_t last = item.find_last_not_of(" \t");
            result.push_back(item.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return result;
}
