#pragma once

#include "trust_store.hpp"
#include "types.hpp"
#include "version.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace certvet::filter
{

    /** Version comparison operator. */
    enum class Operator
    {
        Equal,
        Greater,
        Less,
        GreaterEqual,
        LessEqual
    };

    std::string operator_to_string(Operator op);

    /**
     * Decide one comparison. `numeric_cmp` is the -1/0/1 result of comparing
     * the tested version with the constraint version and is only consulted
     * when neither side is "current".
     */
    bool evaluate(Operator op, bool test_is_current, bool constraint_is_current, int numeric_cmp);

    /**
     * A single `platform[op version]` term.
     */
    struct Constraint
    {
        Platform platform{Platform::IOS};
        Operator op{Operator::GreaterEqual};
        std::optional<version::SemVer> version; // nullopt with !is_current: any version
        bool is_current{false};

        bool matches_any() const { return !version && !is_current; }

        bool matches(std::string_view tested_version) const;
    };

    /**
     * Parsed filter expression such as "ios>=17.4,android>=10" or "chrome".
     *
     * Terms naming the same platform are AND-ed. A PlatformVersion matches
     * when its platform is named in the filter and every term for that
     * platform holds; platforms not named never match.
     */
    class Filter
    {
    public:
        /**
         * Grammar: constraint (',' constraint)*, constraint := platform (op version)?
         * Whitespace is insignificant, platform names are case-insensitive.
         */
        static Result<Filter> parse(std::string_view expr);

        bool match(const PlatformVersion &pv) const;

        const std::vector<Constraint> &constraints() const { return constraints_; }

    private:
        explicit Filter(std::vector<Constraint> constraints) : constraints_(std::move(constraints)) {}

        std::vector<Constraint> constraints_;
    };

    /**
     * Stores whose platform/version match. No filter means no restriction,
     * so the input is returned unchanged.
     */
    std::vector<Store> filter_stores(const std::vector<Store> &stores, const std::optional<Filter> &filter);

} // namespace certvet::filter
