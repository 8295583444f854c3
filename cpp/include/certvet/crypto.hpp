#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace certvet::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        /**
         * Compute SHA-256 hash of data
         */
        static SHA256Hash hash(std::span<const uint8_t> data);
    };

    /**
     * Hex helpers shared by fingerprint parsing and diagnostics
     */
    class Hex
    {
    public:
        /** True for [0-9A-Fa-f]. */
        static bool is_digit(char c);

        /**
         * Decode an even-length hex string (either case)
         */
        static Result<Bytes> decode(std::string_view hex);

        /** Encode as uppercase hex, no separators. */
        static std::string encode_upper(std::span<const uint8_t> data);
    };

} // namespace certvet::crypto
