#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace certvet::version
{
    /** Rolling/latest release sentinel (Chrome, Windows). */
    inline constexpr std::string_view kCurrent = "current";

    /**
     * Numeric release version. Missing components are zero, so "15" and
     * "15.0.0" are the same version.
     */
    struct SemVer
    {
        uint64_t major{0};
        uint64_t minor{0};
        uint64_t patch{0};
        std::vector<std::string> prerelease;

        /** -1, 0 or 1, semver precedence (build metadata ignored). */
        int compare(const SemVer &other) const;
    };

    /**
     * Parse "17", "17.4", "12.1.3", optionally "v"-prefixed and with a
     * "-pre" or "+build" suffix. Returns nullopt for anything else.
     */
    std::optional<SemVer> parse(std::string_view text);

    /**
     * Total order over version strings: "current" sorts after every
     * numeric version; parseable versions sort before unparseable ones;
     * two unparseable strings compare lexicographically.
     */
    int compare(std::string_view a, std::string_view b);

    inline bool less_than(std::string_view a, std::string_view b)
    {
        return compare(a, b) < 0;
    }

    inline bool is_current(std::string_view v)
    {
        return v == kCurrent;
    }

} // namespace certvet::version
