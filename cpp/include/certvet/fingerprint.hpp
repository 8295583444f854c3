#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <array>
#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace certvet
{
    namespace x509
    {
        class Certificate;
    }

    /**
     * SHA-256 digest of a certificate's DER encoding.
     *
     * Canonical text form is 32 uppercase hex pairs joined by ':'.
     * Equality is byte-exact. Immutable once constructed.
     */
    class Fingerprint
    {
    public:
        static constexpr size_t kSize = 32;

        /** All-zero fingerprint. */
        Fingerprint() = default;

        /**
         * Parse user or upstream input. Surrounding whitespace is trimmed;
         * accepted forms are 64 contiguous hex digits, or 32 hex pairs
         * joined by one separator (':', '-' or ' ') used consistently.
         * Anything else, including doubled or dangling separators, fails.
         */
        static Result<Fingerprint> parse(std::string_view input);

        static Fingerprint from_certificate(const x509::Certificate &cert);

        /** Fails unless exactly 32 bytes are given. */
        static Result<Fingerprint> from_raw_bytes(std::span<const uint8_t> bytes);

        std::string to_string() const;

        /**
         * First `octets` pairs followed by "..." for compact display.
         * Empty for octets <= 0; the full form for octets >= 32.
         */
        std::string truncate(int octets) const;

        bool is_zero() const;

        const std::array<uint8_t, kSize> &bytes() const { return bytes_; }

        auto operator<=>(const Fingerprint &) const = default;

    private:
        explicit Fingerprint(const std::array<uint8_t, kSize> &bytes) : bytes_(bytes) {}

        std::array<uint8_t, kSize> bytes_{};
    };

} // namespace certvet

template <>
struct std::hash<certvet::Fingerprint>
{
    size_t operator()(const certvet::Fingerprint &fp) const noexcept
    {
        // Already a uniformly distributed digest
        size_t h = 0;
        for (size_t i = 0; i < sizeof(size_t); ++i)
            h = (h << 8) | fp.bytes()[i];
        return h;
    }
};
