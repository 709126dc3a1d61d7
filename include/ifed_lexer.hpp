// ifed_lexer.hpp - Interfaces Editor (ifed) - Lexer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef IFED_LEXER_HPP
#define IFED_LEXER_HPP

#include "ifed_core.hpp"

namespace ifed
{
//========================================================================
// Logical lines
//========================================================================

    enum class line_kind
    {
        blank,
        comment,
        content
    };

    // One logical line. A content line may span several physical lines
    // joined by backslash continuations; `raw` always holds the untouched
    // physical text so an unedited line is reproduced byte for byte.
    struct logical_line
    {
        size_t      line           = 0;   // first physical line, 1-based
        size_t      physical_count = 1;
        line_kind   kind           = line_kind::blank;

        std::string raw;       // verbatim, eols included
        std::string indent;    // leading whitespace
        std::string content;   // joined text without indent, trailing comment or trailing blanks
        std::string trailing;  // trailing whitespace and " # comment" tail
        std::string eol;       // "\n", "\r\n" or "" at end of input

        source_location loc() const { return { line }; }
    };

//========================================================================
// LEXER API
//========================================================================

    // Restartable cursor over the input. The lexer does not own the text;
    // the viewed buffer must outlive it.
    class lexer
    {
    public:
        explicit lexer(std::string_view text) noexcept
            : text_(text)
        {}

        std::optional<logical_line> next();

        void reset() noexcept
        {
            pos_  = 0;
            line_ = 0;
        }

        bool done() const noexcept { return pos_ >= text_.size(); }

    private:
        struct physical_line
        {
            std::string_view body;
            std::string_view eol;
        };

        physical_line read_physical();

        std::string_view text_;
        size_t           pos_  {0};
        size_t           line_ {0};
    };

    std::vector<logical_line> lex(std::string_view text);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline std::string_view leading_space(std::string_view s)
        {
            size_t i = 0;
            while (i < s.size() && is_space(s[i])) ++i;
            return s.substr(0, i);
        }

        // Splits "value   # note  " into "value" and "   # note  ".
        // A '#' only opens a trailing comment when whitespace precedes it.
        inline std::pair<std::string_view, std::string_view> split_trailing(std::string_view s)
        {
            size_t hash = std::string_view::npos;
            for (size_t i = 1; i < s.size(); ++i)
            {
                if (s[i] == '#' && is_space(s[i - 1]))
                {
                    hash = i;
                    break;
                }
            }

            std::string_view head = hash == std::string_view::npos ? s : s.substr(0, hash);
            head = rtrim_sv(head);
            return { head, s.substr(head.size()) };
        }
    }

    inline lexer::physical_line lexer::read_physical()
    {
        physical_line ph;
        ++line_;

        size_t nl = text_.find('\n', pos_);
        if (nl == std::string_view::npos)
        {
            ph.body = text_.substr(pos_);
            ph.eol  = {};
            pos_    = text_.size();
            return ph;
        }

        ph.body = text_.substr(pos_, nl - pos_);
        ph.eol  = text_.substr(nl, 1);
        if (!ph.body.empty() && ph.body.back() == '\r')
        {
            ph.body.remove_suffix(1);
            ph.eol = text_.substr(nl - 1, 2);
        }
        pos_ = nl + 1;
        return ph;
    }

    inline std::optional<logical_line> lexer::next()
    {
        if (done())
            return std::nullopt;

        logical_line out;
        physical_line ph = read_physical();

        out.line = line_;
        out.raw.assign(ph.body);
        out.raw.append(ph.eol);

        std::string_view trimmed = detail::trim_sv(ph.body);

        if (trimmed.empty())
        {
            out.kind   = line_kind::blank;
            out.indent = std::string(ph.body);
            out.eol    = std::string(ph.eol);
            return out;
        }

        if (trimmed.front() == '#' || trimmed.front() == '!')
        {
            auto lead = detail::leading_space(ph.body);
            auto body = ph.body.substr(lead.size());
            auto text = detail::rtrim_sv(body);

            out.kind     = line_kind::comment;
            out.indent   = std::string(lead);
            out.content  = std::string(text);
            out.trailing = std::string(body.substr(text.size()));
            out.eol      = std::string(ph.eol);
            return out;
        }

        // Content line, possibly continued.
        std::string joined;
        std::string_view piece = ph.body;
        std::string_view eol   = ph.eol;

        while (detail::ends_with_continuation(piece) && !done())
        {
            joined.append(piece.substr(0, piece.size() - 1));

            physical_line cont = read_physical();
            out.raw.append(cont.body);
            out.raw.append(cont.eol);
            ++out.physical_count;

            piece = cont.body;
            eol   = cont.eol;
        }

        // A continuation on the last physical line simply ends the line.
        if (detail::ends_with_continuation(piece))
            piece.remove_suffix(1);
        joined.append(piece);

        std::string_view j = joined;
        auto lead = detail::leading_space(j);
        auto [head, tail] = detail::split_trailing(j.substr(lead.size()));

        out.kind     = line_kind::content;
        out.indent   = std::string(lead);
        out.content  = std::string(head);
        out.trailing = std::string(tail);
        out.eol      = std::string(eol);
        return out;
    }

    inline std::vector<logical_line> lex(std::string_view text)
    {
        std::vector<logical_line> lines;
        lexer lx(text);
        while (auto ln = lx.next())
            lines.push_back(std::move(*ln));
        return lines;
    }

} // namespace ifed

#endif // IFED_LEXER_HPP
