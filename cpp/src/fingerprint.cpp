#include "certvet/fingerprint.hpp"
#include "certvet/x509.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace certvet
{
    namespace
    {
        constexpr size_t kRawHexLength = Fingerprint::kSize * 2;
        // 32 pairs and 31 separators
        constexpr size_t kSeparatedLength = Fingerprint::kSize * 3 - 1;

        std::string_view trim(std::string_view s)
        {
            auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
            while (!s.empty() && is_space(s.front()))
                s.remove_prefix(1);
            while (!s.empty() && is_space(s.back()))
                s.remove_suffix(1);
            return s;
        }

        bool is_separator(char c)
        {
            return c == ':' || c == '-' || c == ' ';
        }

        // Collapse "AA:BB:..." into "AABB..." if every pair is hex and the
        // separator never changes.
        std::optional<std::string> join_separated(std::string_view input)
        {
            if (input.size() != kSeparatedLength)
                return std::nullopt;

            const char sep = input[2];
            if (!is_separator(sep))
                return std::nullopt;

            std::string hex;
            hex.reserve(kRawHexLength);
            for (size_t i = 0; i < Fingerprint::kSize; ++i)
            {
                size_t pos = i * 3;
                if (!crypto::Hex::is_digit(input[pos]) || !crypto::Hex::is_digit(input[pos + 1]))
                    return std::nullopt;
                if (i + 1 < Fingerprint::kSize && input[pos + 2] != sep)
                    return std::nullopt;
                hex.push_back(input[pos]);
                hex.push_back(input[pos + 1]);
            }
            return hex;
        }
    } // namespace

    Result<Fingerprint> Fingerprint::parse(std::string_view input)
    {
        input = trim(input);
        if (input.empty())
        {
            return std::unexpected(CertvetError::parse("empty fingerprint"));
        }

        std::string hex;
        if (input.size() == kRawHexLength && std::all_of(input.begin(), input.end(), crypto::Hex::is_digit))
        {
            hex = std::string(input);
        }
        else if (auto joined = join_separated(input))
        {
            hex = std::move(*joined);
        }
        else
        {
            return std::unexpected(CertvetError::parse(
                "invalid fingerprint format: must be 64 hex chars or 32 hex pairs with consistent separator"));
        }

        auto bytes = crypto::Hex::decode(hex);
        if (!bytes)
            return std::unexpected(bytes.error());
        return from_raw_bytes(*bytes);
    }

    Fingerprint Fingerprint::from_certificate(const x509::Certificate &cert)
    {
        return Fingerprint(crypto::SHA256::hash(cert.der()));
    }

    Result<Fingerprint> Fingerprint::from_raw_bytes(std::span<const uint8_t> bytes)
    {
        if (bytes.size() != kSize)
        {
            return std::unexpected(CertvetError::parse(
                std::format("fingerprint must be {} bytes, got {}", kSize, bytes.size())));
        }
        std::array<uint8_t, kSize> raw{};
        std::copy(bytes.begin(), bytes.end(), raw.begin());
        return Fingerprint(raw);
    }

    std::string Fingerprint::to_string() const
    {
        return truncate(static_cast<int>(kSize));
    }

    std::string Fingerprint::truncate(int octets) const
    {
        if (octets <= 0)
            return {};

        size_t count = std::min(static_cast<size_t>(octets), kSize);
        const auto hex = crypto::Hex::encode_upper(std::span<const uint8_t>(bytes_).first(count));
        std::string out;
        out.reserve(count * 3 + 3);
        for (size_t i = 0; i < hex.size(); i += 2)
        {
            if (i > 0)
                out.push_back(':');
            out.append(hex, i, 2);
        }
        if (count < kSize)
            out += "...";
        return out;
    }

    bool Fingerprint::is_zero() const
    {
        return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
    }

} // namespace certvet
