#include "certvet/version.hpp"
#include <algorithm>
#include <charconv>

namespace certvet::version
{
    namespace
    {
        bool is_numeric(std::string_view s)
        {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
        }

        std::optional<uint64_t> parse_component(std::string_view s)
        {
            if (!is_numeric(s))
                return std::nullopt;
            uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
            if (ec != std::errc() || ptr != s.data() + s.size())
                return std::nullopt;
            return value;
        }

        std::vector<std::string_view> split(std::string_view s, char sep)
        {
            std::vector<std::string_view> parts;
            size_t start = 0;
            while (true)
            {
                size_t pos = s.find(sep, start);
                parts.push_back(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
                if (pos == std::string_view::npos)
                    break;
                start = pos + 1;
            }
            return parts;
        }

        int sign(uint64_t a, uint64_t b)
        {
            return a < b ? -1 : (a > b ? 1 : 0);
        }

        int compare_identifier(const std::string &a, const std::string &b)
        {
            bool a_num = is_numeric(a);
            bool b_num = is_numeric(b);
            if (a_num && b_num)
                return sign(*parse_component(a), *parse_component(b));
            // Numeric identifiers have lower precedence than alphanumeric ones
            if (a_num)
                return -1;
            if (b_num)
                return 1;
            return a < b ? -1 : (a > b ? 1 : 0);
        }
    } // namespace

    int SemVer::compare(const SemVer &other) const
    {
        if (int c = sign(major, other.major); c != 0)
            return c;
        if (int c = sign(minor, other.minor); c != 0)
            return c;
        if (int c = sign(patch, other.patch); c != 0)
            return c;

        // A release outranks any of its pre-releases
        if (prerelease.empty() || other.prerelease.empty())
        {
            if (prerelease.empty() && other.prerelease.empty())
                return 0;
            return prerelease.empty() ? 1 : -1;
        }

        size_t n = std::min(prerelease.size(), other.prerelease.size());
        for (size_t i = 0; i < n; ++i)
        {
            if (int c = compare_identifier(prerelease[i], other.prerelease[i]); c != 0)
                return c;
        }
        return sign(prerelease.size(), other.prerelease.size());
    }

    std::optional<SemVer> parse(std::string_view text)
    {
        if (!text.empty() && (text.front() == 'v' || text.front() == 'V'))
            text.remove_prefix(1);

        if (auto plus = text.find('+'); plus != std::string_view::npos)
        {
            if (plus + 1 == text.size())
                return std::nullopt;
            text = text.substr(0, plus);
        }

        std::string_view pre;
        if (auto dash = text.find('-'); dash != std::string_view::npos)
        {
            pre = text.substr(dash + 1);
            text = text.substr(0, dash);
            if (pre.empty())
                return std::nullopt;
        }

        auto parts = split(text, '.');
        if (parts.empty() || parts.size() > 3)
            return std::nullopt;

        SemVer v;
        uint64_t *fields[] = {&v.major, &v.minor, &v.patch};
        for (size_t i = 0; i < parts.size(); ++i)
        {
            auto value = parse_component(parts[i]);
            if (!value)
                return std::nullopt;
            *fields[i] = *value;
        }

        if (!pre.empty())
        {
            for (auto id : split(pre, '.'))
            {
                if (id.empty())
                    return std::nullopt;
                v.prerelease.emplace_back(id);
            }
        }
        return v;
    }

    int compare(std::string_view a, std::string_view b)
    {
        if (is_current(a) && is_current(b))
            return 0;
        if (is_current(a))
            return 1;
        if (is_current(b))
            return -1;

        auto va = parse(a);
        auto vb = parse(b);
        if (va && vb)
            return va->compare(*vb);

        // Parseable versions sort ahead of garbage
        if (va)
            return -1;
        if (vb)
            return 1;

        if (a < b)
            return -1;
        if (a > b)
            return 1;
        return 0;
    }

} // namespace certvet::version
