#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace certvet
{
    /** Absolute UTC instant, millisecond resolution is sufficient for SCTs. */
    using Timestamp = std::chrono::system_clock::time_point;

    /** Source of "now"; injected into the validator so tests can pin time. */
    using Clock = std::function<Timestamp()>;

    inline Timestamp system_now()
    {
        return std::chrono::system_clock::now();
    }

    /**
     * Parse an RFC 3339 timestamp: "2024-01-31T12:00:00Z", with optional
     * fractional seconds and a "+hh:mm"/"-hh:mm" offset instead of "Z".
     */
    Result<Timestamp> parse_rfc3339(std::string_view text);

    /** "YYYY-MM-DD" in UTC, used in constraint messages and listings. */
    std::string format_date(Timestamp ts);

    /** "YYYY-MM-DDTHH:MM:SSZ" in UTC. */
    std::string format_rfc3339(Timestamp ts);

    /**
     * Milliseconds since the Unix epoch, as carried on the wire by SCTs.
     * Values past the clock's range saturate to Timestamp::max().
     */
    inline Timestamp from_unix_millis(uint64_t ms)
    {
        constexpr auto kMaxMillis =
            std::chrono::duration_cast<std::chrono::milliseconds>(Timestamp::duration::max()).count();
        if (ms > static_cast<uint64_t>(kMaxMillis))
            return Timestamp::max();
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
            std::chrono::milliseconds(static_cast<int64_t>(ms))));
    }

} // namespace certvet
