#include "certvet/timestamp.hpp"
#include <charconv>
#include <ctime>
#include <format>

namespace certvet
{
    namespace
    {
        bool read_int(std::string_view text, size_t pos, size_t width, int &out)
        {
            if (pos + width > text.size())
                return false;
            auto first = text.data() + pos;
            auto last = first + width;
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc() && ptr == last;
        }

        bool expect(std::string_view text, size_t pos, char c)
        {
            return pos < text.size() && text[pos] == c;
        }

        std::tm to_tm(Timestamp ts)
        {
            auto t = std::chrono::system_clock::to_time_t(ts);
            std::tm tm_buf{};
            gmtime_r(&t, &tm_buf);
            return tm_buf;
        }
    } // namespace

    Result<Timestamp> parse_rfc3339(std::string_view text)
    {
        auto fail = [&]() {
            return std::unexpected(CertvetError::parse(std::format("Invalid RFC 3339 timestamp: {}", text)));
        };

        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!read_int(text, 0, 4, year) || !expect(text, 4, '-') ||
            !read_int(text, 5, 2, month) || !expect(text, 7, '-') ||
            !read_int(text, 8, 2, day) ||
            !(expect(text, 10, 'T') || expect(text, 10, 't')) ||
            !read_int(text, 11, 2, hour) || !expect(text, 13, ':') ||
            !read_int(text, 14, 2, minute) || !expect(text, 16, ':') ||
            !read_int(text, 17, 2, second))
        {
            return fail();
        }

        std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok() || hour > 23 || minute > 59 || second > 60)
            return fail();

        size_t pos = 19;
        std::chrono::nanoseconds fraction{0};
        if (expect(text, pos, '.'))
        {
            ++pos;
            int64_t scale = 100000000;
            size_t digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                fraction += std::chrono::nanoseconds((text[pos] - '0') * scale);
                scale /= 10;
                ++pos;
                ++digits;
            }
            if (digits == 0)
                return fail();
        }

        std::chrono::minutes offset{0};
        if (expect(text, pos, 'Z') || expect(text, pos, 'z'))
        {
            ++pos;
        }
        else if (expect(text, pos, '+') || expect(text, pos, '-'))
        {
            int sign = text[pos] == '-' ? -1 : 1;
            int off_h = 0, off_m = 0;
            if (!read_int(text, pos + 1, 2, off_h) || !expect(text, pos + 3, ':') ||
                !read_int(text, pos + 4, 2, off_m))
                return fail();
            offset = std::chrono::minutes(sign * (off_h * 60 + off_m));
            pos += 6;
        }
        else
        {
            return fail();
        }

        if (pos != text.size())
            return fail();

        auto local = std::chrono::sys_days(ymd) + std::chrono::hours(hour) +
                     std::chrono::minutes(minute) + std::chrono::seconds(second) + fraction;
        return std::chrono::time_point_cast<Timestamp::duration>(local - offset);
    }

    std::string format_date(Timestamp ts)
    {
        auto tm_buf = to_tm(ts);
        return std::format("{:04d}-{:02d}-{:02d}",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday);
    }

    std::string format_rfc3339(Timestamp ts)
    {
        auto tm_buf = to_tm(ts);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec);
    }

} // namespace certvet
