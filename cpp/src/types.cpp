#include "certvet/types.hpp"
#include <algorithm>
#include <cctype>

namespace certvet
{

    const std::vector<Platform> &all_platforms()
    {
        static const std::vector<Platform> platforms{
            Platform::IOS,
            Platform::IPadOS,
            Platform::MacOS,
            Platform::TvOS,
            Platform::VisionOS,
            Platform::WatchOS,
            Platform::Android,
            Platform::Chrome,
            Platform::Windows};
        return platforms;
    }

    Result<Platform> platform_from_string(std::string_view s)
    {
        std::string lower(s);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        for (Platform p : all_platforms())
        {
            if (platform_to_string(p) == lower)
                return p;
        }
        return std::unexpected(CertvetError::parse(std::format("Invalid platform: {}", s)));
    }

} // namespace certvet
