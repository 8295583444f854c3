#include "certvet/filter.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>

namespace certvet::filter
{
    namespace
    {
        enum class TokenKind
        {
            Platform,
            Operator,
            Version,
            Comma
        };

        struct Token
        {
            TokenKind kind;
            std::string text;
            size_t pos;
        };

        bool is_word_char(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
        }

        bool is_digit(char c)
        {
            return c >= '0' && c <= '9';
        }

        std::string lower(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        CertvetError invalid(std::string_view expr, const std::string &detail)
        {
            return CertvetError::filter(std::format("invalid filter \"{}\": {}", expr, detail));
        }

        // Platform names are lexed as whole words, so "ios" never matches
        // inside "ipados" or "visionos".
        Result<std::vector<Token>> tokenize(std::string_view expr)
        {
            std::vector<Token> tokens;
            size_t i = 0;
            while (i < expr.size())
            {
                char c = expr[i];
                if (std::isspace(static_cast<unsigned char>(c)))
                {
                    ++i;
                }
                else if (c == ',')
                {
                    tokens.push_back({TokenKind::Comma, ",", i});
                    ++i;
                }
                else if (c == '>' || c == '<' || c == '=')
                {
                    size_t len = (c != '=' && i + 1 < expr.size() && expr[i + 1] == '=') ? 2 : 1;
                    tokens.push_back({TokenKind::Operator, std::string(expr.substr(i, len)), i});
                    i += len;
                }
                else if (is_digit(c))
                {
                    size_t start = i;
                    while (i < expr.size() && is_digit(expr[i]))
                        ++i;
                    while (i + 1 < expr.size() && expr[i] == '.' && is_digit(expr[i + 1]))
                    {
                        ++i;
                        while (i < expr.size() && is_digit(expr[i]))
                            ++i;
                    }
                    tokens.push_back({TokenKind::Version, std::string(expr.substr(start, i - start)), start});
                }
                else if (is_word_char(c))
                {
                    size_t start = i;
                    while (i < expr.size() && is_word_char(expr[i]))
                        ++i;
                    auto word = expr.substr(start, i - start);
                    auto word_lower = lower(word);
                    if (word_lower == version::kCurrent)
                    {
                        tokens.push_back({TokenKind::Version, word_lower, start});
                    }
                    else if (platform_from_string(word_lower))
                    {
                        tokens.push_back({TokenKind::Platform, word_lower, start});
                    }
                    else
                    {
                        return std::unexpected(invalid(expr, std::format("unknown platform \"{}\"", word)));
                    }
                }
                else
                {
                    return std::unexpected(invalid(expr, std::format("unexpected character '{}' at offset {}", c, i)));
                }
            }
            return tokens;
        }

        Result<Operator> operator_from_string(std::string_view expr, const std::string &op)
        {
            if (op == "=")
                return Operator::Equal;
            if (op == ">")
                return Operator::Greater;
            if (op == "<")
                return Operator::Less;
            if (op == ">=")
                return Operator::GreaterEqual;
            if (op == "<=")
                return Operator::LessEqual;
            return std::unexpected(invalid(expr, std::format("unknown operator \"{}\"", op)));
        }

        std::string trim(std::string_view s)
        {
            auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
            while (!s.empty() && is_space(s.front()))
                s.remove_prefix(1);
            while (!s.empty() && is_space(s.back()))
                s.remove_suffix(1);
            return std::string(s);
        }
    } // namespace

    std::string operator_to_string(Operator op)
    {
        switch (op)
        {
        case Operator::Equal:
            return "=";
        case Operator::Greater:
            return ">";
        case Operator::Less:
            return "<";
        case Operator::GreaterEqual:
            return ">=";
        case Operator::LessEqual:
            return "<=";
        }
        return "?";
    }

    bool evaluate(Operator op, bool test_is_current, bool constraint_is_current, int numeric_cmp)
    {
        if (constraint_is_current)
        {
            switch (op)
            {
            case Operator::Equal:
            case Operator::GreaterEqual:
                return test_is_current;
            case Operator::Greater:
                return false;
            case Operator::Less:
                return !test_is_current;
            case Operator::LessEqual:
                return true;
            }
            return false;
        }

        // "current" is above every numeric version
        if (test_is_current)
            return op == Operator::Greater || op == Operator::GreaterEqual;

        switch (op)
        {
        case Operator::Equal:
            return numeric_cmp == 0;
        case Operator::Greater:
            return numeric_cmp > 0;
        case Operator::Less:
            return numeric_cmp < 0;
        case Operator::GreaterEqual:
            return numeric_cmp >= 0;
        case Operator::LessEqual:
            return numeric_cmp <= 0;
        }
        return false;
    }

    bool Constraint::matches(std::string_view tested_version) const
    {
        if (matches_any())
            return true;

        bool test_is_current = version::is_current(tested_version);
        if (is_current || test_is_current)
            return evaluate(op, test_is_current, is_current, 0);

        auto tested = version::parse(tested_version);
        if (!tested)
            return false;
        return evaluate(op, false, false, tested->compare(*version));
    }

    Result<Filter> Filter::parse(std::string_view raw)
    {
        auto expr = trim(raw);
        if (expr.empty())
        {
            return std::unexpected(CertvetError::filter("empty filter expression"));
        }

        auto tokens = tokenize(expr);
        if (!tokens)
            return std::unexpected(tokens.error());

        std::vector<Constraint> constraints;
        size_t i = 0;
        const auto &toks = *tokens;
        while (true)
        {
            if (i >= toks.size() || toks[i].kind != TokenKind::Platform)
            {
                auto got = i < toks.size() ? std::format("\"{}\"", toks[i].text) : std::string("end of input");
                return std::unexpected(invalid(expr, std::format("expected platform, got {}", got)));
            }

            Constraint c;
            c.platform = *platform_from_string(toks[i].text);
            const std::string &platform_name = toks[i].text;
            ++i;

            std::optional<std::string> op;
            std::optional<std::string> ver;
            if (i < toks.size() && toks[i].kind == TokenKind::Operator)
                op = toks[i++].text;
            if (i < toks.size() && toks[i].kind == TokenKind::Version)
                ver = toks[i++].text;

            if (op && !ver)
                return std::unexpected(invalid(expr, std::format("missing version for {}{}", platform_name, *op)));
            if (!op && ver)
                return std::unexpected(invalid(expr, std::format("missing operator for {}", platform_name)));

            if (op && ver)
            {
                auto parsed_op = operator_from_string(expr, *op);
                if (!parsed_op)
                    return std::unexpected(parsed_op.error());
                c.op = *parsed_op;

                if (version::is_current(*ver))
                {
                    c.is_current = true;
                }
                else
                {
                    c.version = version::parse(*ver);
                    if (!c.version)
                        return std::unexpected(invalid(expr, std::format("invalid version \"{}\"", *ver)));
                }
            }
            constraints.push_back(std::move(c));

            if (i == toks.size())
                break;
            if (toks[i].kind != TokenKind::Comma)
            {
                return std::unexpected(invalid(expr, std::format("unexpected \"{}\" at offset {}", toks[i].text, toks[i].pos)));
            }
            ++i;
        }

        return Filter(std::move(constraints));
    }

    bool Filter::match(const PlatformVersion &pv) const
    {
        bool named = false;
        for (const auto &c : constraints_)
        {
            if (c.platform != pv.platform)
                continue;
            named = true;
            if (!c.matches(pv.version))
                return false;
        }
        return named;
    }

    std::vector<Store> filter_stores(const std::vector<Store> &stores, const std::optional<Filter> &filter)
    {
        if (!filter)
            return stores;

        std::vector<Store> out;
        std::copy_if(stores.begin(), stores.end(), std::back_inserter(out),
                     [&](const Store &s) { return filter->match(s.platform_version()); });
        return out;
    }

} // namespace certvet::filter
