#include "certvet/crypto.hpp"
#include <sodium.h>
#include <format>

namespace certvet::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(std::span<const uint8_t> data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    // ============================================================================
    // Hex Implementation
    // ============================================================================

    bool Hex::is_digit(char c)
    {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    Result<Bytes> Hex::decode(std::string_view hex)
    {
        if (hex.size() % 2 != 0)
        {
            return std::unexpected(CertvetError::parse("Invalid hex length"));
        }
        for (char c : hex)
        {
            if (!is_digit(c))
                return std::unexpected(CertvetError::parse(std::format("Invalid hex character '{}'", c)));
        }

        Bytes out(hex.size() / 2);
        size_t bin_len = 0;
        if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &bin_len, nullptr) != 0 ||
            bin_len != out.size())
        {
            return std::unexpected(CertvetError::parse("Invalid hex string"));
        }
        return out;
    }

    std::string Hex::encode_upper(std::span<const uint8_t> data)
    {
        std::string hex;
        hex.reserve(data.size() * 2);
        for (uint8_t byte : data)
        {
            hex += std::format("{:02X}", byte);
        }
        return hex;
    }

} // namespace certvet::crypto
