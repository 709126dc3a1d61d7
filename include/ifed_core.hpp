// ifed_core.hpp - Interfaces Editor (ifed) - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef IFED_CORE_HPP
#define IFED_CORE_HPP

#include <compare>
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>

namespace ifed
{
//========================================================================
// Source locations
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    struct source_location
    {
        size_t line = 0;    // 1-based; 0 for generated content

        auto operator<=>(source_location const &) const = default;
    };

//========================================================================
// Errors and generation context
//========================================================================

    template <typename Kind>
    struct error
    {
        Kind            kind;
        source_location loc;
        std::string     message;
        std::vector<source_location> related;  // other occurrences, if any
    };

    template <typename Kind>
    std::string to_string(error<Kind> const & e)
    {
        if (e.loc.line == 0)
            return e.message;
        return "line " + std::to_string(e.loc.line) + ": " + e.message;
    }

    template <typename T, typename Error>
    struct context
    {
        std::optional<T>   result;
        std::vector<Error> errors;

        bool ok() const { return result.has_value(); }
        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// Interface identity
//========================================================================

    enum class address_family
    {
        inet,
        inet6,
        ipx,
        can,
        other
    };

    struct interface_key
    {
        std::string name;
        std::string family;

        auto operator<=>(interface_key const &) const = default;
    };

    // Names an iface block for mutation. Without a family the name alone
    // must identify exactly one block.
    struct interface_selector
    {
        std::string name;
        std::optional<std::string> family;

        interface_selector() = default;
        interface_selector(char const * n) : name(n) {}
        interface_selector(std::string n) : name(std::move(n)) {}
        interface_selector(std::string n, std::string f) : name(std::move(n)), family(std::move(f)) {}
        interface_selector(interface_key const & k) : name(k.name), family(k.family) {}

        bool matches(interface_key const & k) const
        {
            return k.name == name && (!family || *family == k.family);
        }
    };

    inline std::string to_string(interface_key const & k)
    {
        return k.name + "/" + k.family;
    }

    inline std::string to_string(interface_selector const & s)
    {
        return s.family ? s.name + "/" + *s.family : s.name;
    }

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr size_t MAX_LINES = 1'000'000;
        constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

        inline bool is_space(char c)
        {
            return c == ' ' || c == '\t' || c == '\f' || c == '\v';
        }

        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(WHITESPACE);
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(WHITESPACE);
            return s.substr(start, end - start + 1);
        }

        inline std::string_view rtrim_sv(std::string_view s)
        {
            size_t end = s.find_last_not_of(WHITESPACE);
            if (end == std::string_view::npos) return {};
            return s.substr(0, end + 1);
        }

        inline std::vector<std::string> split_words(std::string_view s)
        {
            std::vector<std::string> words;
            size_t i = 0;
            while (i < s.size())
            {
                while (i < s.size() && is_space(s[i])) ++i;
                size_t start = i;
                while (i < s.size() && !is_space(s[i])) ++i;
                if (i > start)
                    words.emplace_back(s.substr(start, i - start));
            }
            return words;
        }

        // First word of s, and the remainder with surrounding whitespace split off.
        struct word_split
        {
            std::string_view head;
            std::string_view gap;
            std::string_view rest;
        };

        inline word_split split_first_word(std::string_view s)
        {
            size_t i = 0;
            while (i < s.size() && !is_space(s[i])) ++i;
            size_t j = i;
            while (j < s.size() && is_space(s[j])) ++j;
            return { s.substr(0, i), s.substr(i, j - i), s.substr(j) };
        }

        // An odd run of trailing backslashes joins the next physical line.
        inline bool ends_with_continuation(std::string_view body)
        {
            size_t n = 0;
            for (auto it = body.rbegin(); it != body.rend() && *it == '\\'; ++it)
                ++n;
            return n % 2 == 1;
        }

        // Words that open a stanza wherever they start a line.
        inline bool is_stanza_keyword(std::string_view word)
        {
            return word == "iface"
                || word == "auto"
                || word.starts_with("allow-")
                || word == "mapping"
                || word == "source"
                || word == "source-directory"
                || word == "source-dir"
                || word == "no-auto-down"
                || word == "no-scripts";
        }

        inline bool has_space(std::string_view s)
        {
            return std::ranges::any_of(s, [](char c) { return is_space(c) || c == '\n' || c == '\r'; });
        }

        inline std::string join(std::vector<std::string> const & words, std::string_view sep = " ")
        {
            std::string out;
            for (size_t i = 0; i < words.size(); ++i)
            {
                if (i > 0) out += sep;
                out += words[i];
            }
            return out;
        }

        inline address_family classify_family(std::string_view token)
        {
            if (token == "inet")  return address_family::inet;
            if (token == "inet6") return address_family::inet6;
            if (token == "ipx")   return address_family::ipx;
            if (token == "can")   return address_family::can;
            return address_family::other;
        }
    }

} // namespace ifed

#endif // IFED_CORE_HPP
