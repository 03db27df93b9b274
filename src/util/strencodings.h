// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_UTIL_STRENCODINGS_H
#define PROXIGRAPH_UTIL_STRENCODINGS_H

#include <string>
#include <vector>
#include <cstdint>

/**
 * printf-style formatting into a std::string (no length limit)
 */
std::string strprintf(const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

/**
 * Convert byte array to hexadecimal string
 */
std::string HexStr(const uint8_t* data, size_t len);

/**
 * Convert vector of bytes to hexadecimal string
 */
std::string HexStr(const std::vector<uint8_t>& vch);

/**
 * Parse hexadecimal string to byte array
 *
 * @return Empty vector if the input is not valid hex
 */
std::vector<uint8_t> ParseHex(const std::string& str);

/**
 * Check if string is valid hexadecimal (even length, hex digits only)
 */
bool IsHex(const std::string& str);

/**
 * Parse a decimal unsigned 64-bit integer
 *
 * Rejects signs, whitespace, trailing characters and overflow.
 */
bool ParseUInt64(const std::string& str, uint64_t& out);

/**
 * Split on a separator, trimming spaces and dropping empty items
 */
std::vector<std::string> SplitString(const std::string& str, char sep);

/**
 * Convert single hex character to its numeric value
 */
inline int8_t HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

#endif // PROXIGRAPH_UTIL_STRENCODINGS_H
