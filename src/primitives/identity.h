// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_PRIMITIVES_IDENTITY_H
#define PROXIGRAPH_PRIMITIVES_IDENTITY_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

/**
 * Account identity - 32-byte opaque address
 *
 * Identities are authenticated by the caller's environment before they
 * reach the graph. The graph only compares them. Neighbor lists reuse
 * this type for peer references.
 */
struct CIdentity {
    static constexpr size_t SIZE = 32;

    uint8_t data[SIZE];

    /** Construct null identity */
    CIdentity();

    /** Construct from raw bytes (SIZE bytes) */
    explicit CIdentity(const uint8_t* bytes);

    /** Check if identity is null (all zeros) */
    bool IsNull() const;

    bool operator==(const CIdentity& other) const;
    bool operator!=(const CIdentity& other) const;

    /** Less-than comparison (for std::map) */
    bool operator<(const CIdentity& other) const;

    /** Get hexadecimal string representation (64 chars) */
    std::string GetHex() const;

    /** Abbreviated hex for log lines */
    std::string ToShortString() const;

    /**
     * Set from hexadecimal string
     *
     * Accepts an optional "0x" prefix. Shorter inputs are left-padded
     * with zeros so "0xa" and "0x000...0a" name the same identity.
     *
     * @return false (identity unchanged) if the string is not valid hex
     *         or is longer than 64 digits
     */
    bool SetHex(const std::string& hex);
};

/** Hasher for unordered containers */
struct CIdentityHasher {
    size_t operator()(const CIdentity& id) const;
};

/**
 * Parse an identity from user input
 *
 * @param str Hex string, optionally 0x-prefixed
 * @param[out] identity Parsed identity
 * @return true if parsed and non-null
 */
bool ParseIdentity(const std::string& str, CIdentity& identity);

#endif // PROXIGRAPH_PRIMITIVES_IDENTITY_H
