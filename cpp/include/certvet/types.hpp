#pragma once

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace certvet
{

    /**
     * Platforms with a tracked root store.
     * Closed set; stored and printed in lowercase.
     */
    enum class Platform
    {
        IOS,
        IPadOS,
        MacOS,
        TvOS,
        VisionOS,
        WatchOS,
        Android,
        Chrome,
        Windows
    };

    /**
     * Convert Platform to its canonical lowercase name
     */
    inline std::string platform_to_string(Platform platform)
    {
        switch (platform)
        {
        case Platform::IOS:
            return "ios";
        case Platform::IPadOS:
            return "ipados";
        case Platform::MacOS:
            return "macos";
        case Platform::TvOS:
            return "tvos";
        case Platform::VisionOS:
            return "visionos";
        case Platform::WatchOS:
            return "watchos";
        case Platform::Android:
            return "android";
        case Platform::Chrome:
            return "chrome";
        case Platform::Windows:
            return "windows";
        }
        return "unknown";
    }

    /** All platforms in declaration order. */
    const std::vector<Platform> &all_platforms();

    /**
     * Error types for certvet operations
     */
    enum class ErrorCode
    {
        ConfigError,
        ParseError,
        FilterError,
        CryptoError,
        CertificateError,
        DataError,
        IOError,
        NetworkError,
        NoStoresSelected
    };

    /**
     * certvet error with code and message
     */
    class CertvetError : public std::runtime_error
    {
    public:
        ErrorCode code;

        CertvetError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static CertvetError config(const std::string &msg)
        {
            return CertvetError(ErrorCode::ConfigError, msg);
        }

        static CertvetError parse(const std::string &msg)
        {
            return CertvetError(ErrorCode::ParseError, msg);
        }

        static CertvetError filter(const std::string &msg)
        {
            return CertvetError(ErrorCode::FilterError, msg);
        }

        static CertvetError crypto(const std::string &msg)
        {
            return CertvetError(ErrorCode::CryptoError, msg);
        }

        static CertvetError certificate(const std::string &msg)
        {
            return CertvetError(ErrorCode::CertificateError, msg);
        }

        static CertvetError data(const std::string &msg)
        {
            return CertvetError(ErrorCode::DataError, msg);
        }

        static CertvetError io(const std::string &msg)
        {
            return CertvetError(ErrorCode::IOError, msg);
        }

        static CertvetError network(const std::string &msg)
        {
            return CertvetError(ErrorCode::NetworkError, msg);
        }

        static CertvetError no_stores(const std::string &msg)
        {
            return CertvetError(ErrorCode::NoStoresSelected, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, CertvetError>;

    /**
     * Parse a platform name, case-insensitively.
     * Only whole names match: "iOS" is accepted, "ios17" is not.
     */
    Result<Platform> platform_from_string(std::string_view s);

    /**
     * One trust-store snapshot identity: platform plus version string
     * ("17", "17.4", "12.1.3" or "current").
     */
    struct PlatformVersion
    {
        Platform platform{Platform::IOS};
        std::string version;

        bool operator==(const PlatformVersion &) const = default;
    };

    inline std::string to_string(const PlatformVersion &pv)
    {
        return std::format("{}/{}", platform_to_string(pv.platform), pv.version);
    }

} // namespace certvet
