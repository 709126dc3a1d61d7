// ifed_parser.hpp - Interfaces Editor (ifed) - Stanza Parser
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef IFED_PARSER_HPP
#define IFED_PARSER_HPP

#include "ifed_core.hpp"
#include "ifed_lexer.hpp"
#include "ifed_document.hpp"

namespace ifed
{
//========================================================================
// PARSER API
//========================================================================

    enum class parse_error_kind
    {
        unknown_keyword,
        missing_token,
        unexpected_token,
        misplaced_line,
        too_many_lines,
    // warnings
        ambiguous_interface,
    };

    using parse_error = error<parse_error_kind>;

    struct parser_options
    {
        size_t max_lines = detail::MAX_LINES;
    };

    // On success `result` holds the document and `errors` may carry
    // warnings. On failure `result` is empty and `errors` holds exactly
    // the one fatal error.
    using parse_context = context<document, parse_error>;

    parse_context parse(std::string_view input, parser_options opts = {});

    inline bool is_warning(parse_error const & e)
    {
        return e.kind == parse_error_kind::ambiguous_interface;
    }

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        enum class parse_state
        {
            top_level,
            in_iface_body,
            in_mapping_body
        };

        inline source_info authored(logical_line const & ln)
        {
            source_info src;
            src.source_literal   = ln.raw;
            src.layout.indent    = ln.indent;
            src.layout.trailing  = ln.trailing;
            src.layout.eol       = ln.eol;
            src.creation         = creation_state::authored;
            src.loc              = ln.loc();
            return src;
        }

        inline comment make_comment(logical_line const & ln)
        {
            comment c;
            c.marker = ln.content.front();
            c.text   = ln.content.substr(1);
            c.src    = authored(ln);
            return c;
        }

        struct parser_impl
        {
            parser_options opts;

            std::vector<entry>          entries;
            std::optional<parse_error>  failure;

            parse_state                   state {parse_state::top_level};
            std::optional<iface_stanza>   open_iface;
            std::optional<mapping_stanza> open_mapping;
            std::vector<logical_line>     pending_comments;

            void run(std::string_view input);

            bool fail(parse_error_kind kind, logical_line const & ln, std::string message);

            void parse_line(logical_line const & ln);
            void close_block();
            void flush_comments();

            bool is_keyword(std::string_view word) const;
            void keyword_line(std::string_view word, logical_line const & ln);

            void iface_header(logical_line const & ln);
            void auto_line(logical_line const & ln);
            void allow_line(std::string_view word, logical_line const & ln);
            void directive_line(directive_kind kind, logical_line const & ln);
            void source_line(logical_line const & ln);
            void source_directory_line(std::string_view word, logical_line const & ln);
            void mapping_header(logical_line const & ln);

            void option_line(logical_line const & ln);
            void mapping_body_line(logical_line const & ln);
        };

//---------------------------------------------------------------------------

        inline void parser_impl::run(std::string_view input)
        {
            lexer lx(input);

            while (auto ln = lx.next())
            {
                if (ln->line > opts.max_lines)
                {
                    fail(parse_error_kind::too_many_lines, *ln,
                         "input exceeds " + std::to_string(opts.max_lines) + " lines");
                    return;
                }

                parse_line(*ln);
                if (failure)
                    return;
            }

            // End of input terminates any open block.
            close_block();
            flush_comments();
        }

//---------------------------------------------------------------------------

        inline bool parser_impl::fail(parse_error_kind kind, logical_line const & ln, std::string message)
        {
            if (!failure)
                failure = parse_error{ kind, ln.loc(), std::move(message), {} };
            return false;
        }

//---------------------------------------------------------------------------

        inline void parser_impl::close_block()
        {
            if (open_iface)
            {
                entries.emplace_back(std::move(*open_iface));
                open_iface.reset();
            }

            if (open_mapping)
            {
                entries.emplace_back(std::move(*open_mapping));
                open_mapping.reset();
            }

            state = parse_state::top_level;
        }

//---------------------------------------------------------------------------

        inline void parser_impl::flush_comments()
        {
            for (auto const & ln : pending_comments)
                entries.emplace_back(make_comment(ln));
            pending_comments.clear();
        }

//---------------------------------------------------------------------------

        inline void parser_impl::parse_line(logical_line const & ln)
        {
            if (ln.kind == line_kind::comment)
            {
                pending_comments.push_back(ln);
                return;
            }

            if (ln.kind == line_kind::blank || ln.content.empty())
            {
                close_block();
                flush_comments();

                blank_line b;
                b.src = authored(ln);
                entries.emplace_back(std::move(b));
                return;
            }

            auto word = split_first_word(ln.content).head;

            if (is_keyword(word))
            {
                keyword_line(word, ln);
                return;
            }

            switch (state)
            {
                case parse_state::in_iface_body:
                    option_line(ln);
                    return;

                case parse_state::in_mapping_body:
                    mapping_body_line(ln);
                    return;

                case parse_state::top_level:
                    break;
            }

            if (!ln.indent.empty())
                fail(parse_error_kind::misplaced_line, ln,
                     "misplaced option '" + std::string(word) + "'; expected an iface or mapping block");
            else
                fail(parse_error_kind::unknown_keyword, ln,
                     "unknown keyword '" + std::string(word) +
                     "'; expected auto, allow-*, iface, mapping, source or source-directory");
        }

//---------------------------------------------------------------------------

        inline bool parser_impl::is_keyword(std::string_view word) const
        {
            return is_stanza_keyword(word);
        }

//---------------------------------------------------------------------------

        inline void parser_impl::keyword_line(std::string_view word, logical_line const & ln)
        {
            close_block();

            if (word == "iface")
            {
                iface_header(ln);
                return;
            }

            flush_comments();

            if (word == "auto")                   auto_line(ln);
            else if (word.starts_with("allow-"))  allow_line(word, ln);
            else if (word == "mapping")           mapping_header(ln);
            else if (word == "source")            source_line(ln);
            else if (word == "no-auto-down")      directive_line(directive_kind::no_auto_down, ln);
            else if (word == "no-scripts")        directive_line(directive_kind::no_scripts, ln);
            else                                  source_directory_line(word, ln);
        }

//---------------------------------------------------------------------------

        inline void parser_impl::iface_header(logical_line const & ln)
        {
            auto words = split_words(ln.content);

            if (words.size() < 2)
            {
                fail(parse_error_kind::missing_token, ln, "expected interface name");
                return;
            }
            if (words.size() < 3)
            {
                fail(parse_error_kind::missing_token, ln, "expected address family");
                return;
            }
            if (words.size() < 4)
            {
                fail(parse_error_kind::missing_token, ln, "expected method");
                return;
            }
            if (words.size() > 4)
            {
                fail(parse_error_kind::unexpected_token, ln,
                     "unexpected token '" + words[4] + "'; expected end of iface header");
                return;
            }

            iface_stanza ifc;
            ifc.name   = words[1];
            ifc.family = words[2];
            ifc.method = words[3];
            ifc.src    = authored(ln);

            for (auto const & c : pending_comments)
                ifc.leading_comments.push_back(make_comment(c));
            pending_comments.clear();

            open_iface = std::move(ifc);
            state = parse_state::in_iface_body;
        }

//---------------------------------------------------------------------------

        inline void parser_impl::auto_line(logical_line const & ln)
        {
            auto words = split_words(ln.content);
            if (words.size() < 2)
            {
                fail(parse_error_kind::missing_token, ln, "expected interface name");
                return;
            }

            auto_stanza st;
            st.interfaces.assign(words.begin() + 1, words.end());
            st.src = authored(ln);
            entries.emplace_back(std::move(st));
        }

//---------------------------------------------------------------------------

        inline void parser_impl::allow_line(std::string_view word, logical_line const & ln)
        {
            auto trigger = word.substr(std::string_view("allow-").size());
            if (trigger.empty())
            {
                fail(parse_error_kind::missing_token, ln, "expected allow trigger name");
                return;
            }

            auto words = split_words(ln.content);
            if (words.size() < 2)
            {
                fail(parse_error_kind::missing_token, ln, "expected interface name");
                return;
            }

            allow_stanza st;
            st.trigger = std::string(trigger);
            st.interfaces.assign(words.begin() + 1, words.end());
            st.src = authored(ln);
            entries.emplace_back(std::move(st));
        }

//---------------------------------------------------------------------------

        inline void parser_impl::directive_line(directive_kind kind, logical_line const & ln)
        {
            auto words = split_words(ln.content);
            if (words.size() < 2)
            {
                fail(parse_error_kind::missing_token, ln, "expected interface name");
                return;
            }

            directive_stanza st;
            st.kind = kind;
            st.interfaces.assign(words.begin() + 1, words.end());
            st.src = authored(ln);
            entries.emplace_back(std::move(st));
        }

//---------------------------------------------------------------------------

        inline void parser_impl::source_line(logical_line const & ln)
        {
            auto parts = split_first_word(ln.content);
            if (parts.rest.empty())
            {
                fail(parse_error_kind::missing_token, ln, "expected source path");
                return;
            }

            source_stanza st;
            st.pattern = std::string(parts.rest);
            st.src = authored(ln);
            st.src.layout.separator = std::string(parts.gap);
            entries.emplace_back(std::move(st));
        }

//---------------------------------------------------------------------------

        inline void parser_impl::source_directory_line(std::string_view word, logical_line const & ln)
        {
            auto parts = split_first_word(ln.content);
            if (parts.rest.empty())
            {
                fail(parse_error_kind::missing_token, ln, "expected source directory path");
                return;
            }

            source_directory_stanza st;
            st.keyword = std::string(word);
            st.pattern = std::string(parts.rest);
            st.src = authored(ln);
            st.src.layout.separator = std::string(parts.gap);
            entries.emplace_back(std::move(st));
        }

//---------------------------------------------------------------------------

        inline void parser_impl::mapping_header(logical_line const & ln)
        {
            auto parts = split_first_word(ln.content);
            if (parts.rest.empty())
            {
                fail(parse_error_kind::missing_token, ln, "expected mapping pattern");
                return;
            }

            mapping_stanza st;
            st.pattern = std::string(parts.rest);
            st.src = authored(ln);

            open_mapping = std::move(st);
            state = parse_state::in_mapping_body;
        }

//---------------------------------------------------------------------------

        inline void parser_impl::option_line(logical_line const & ln)
        {
            auto parts = split_first_word(ln.content);

            option opt;
            opt.key   = std::string(parts.head);
            opt.value = std::string(parts.rest);
            opt.src   = authored(ln);
            opt.src.layout.separator = std::string(parts.gap);

            for (auto const & c : pending_comments)
                opt.leading_comments.push_back(make_comment(c));
            pending_comments.clear();

            open_iface->options.push_back(std::move(opt));
        }

//---------------------------------------------------------------------------

        inline void parser_impl::mapping_body_line(logical_line const & ln)
        {
            auto parts = split_first_word(ln.content);
            auto & m   = *open_mapping;

            if (parts.head == "script")
            {
                if (parts.rest.empty())
                {
                    fail(parse_error_kind::missing_token, ln, "expected script path");
                    return;
                }
                m.script = std::string(parts.rest);
            }
            else if (parts.head == "map")
            {
                if (parts.rest.empty())
                {
                    fail(parse_error_kind::missing_token, ln, "expected mapping value");
                    return;
                }
                auto rule = split_first_word(parts.rest);
                m.mappings.push_back({ std::string(rule.head), std::string(rule.rest) });
            }
            else
            {
                fail(parse_error_kind::unexpected_token, ln,
                     "unexpected '" + std::string(parts.head) + "' in mapping block; expected script or map");
                return;
            }

            // Body comments and lines belong to the block literal.
            for (auto const & c : pending_comments)
                *m.src.source_literal += c.raw;
            pending_comments.clear();

            *m.src.source_literal += ln.raw;
            m.src.layout.eol = ln.eol;
        }

    } // namespace detail

//========================================================================
// Parser API implementation
//========================================================================

    inline parse_context parse(std::string_view input, parser_options opts)
    {
        detail::parser_impl p;
        p.opts = opts;
        p.run(input);

        parse_context ctx;

        if (p.failure)
        {
            ctx.errors.push_back(std::move(*p.failure));
            return ctx;
        }

        document doc(std::move(p.entries));

        for (auto const & key : doc.ambiguities())
        {
            parse_error warn;
            warn.kind = parse_error_kind::ambiguous_interface;

            std::string lines;
            for (size_t pos : doc.positions(key))
            {
                auto const & ifc = std::get<iface_stanza>(doc.entries()[pos]);
                warn.related.push_back(ifc.src.loc);
                if (!lines.empty()) lines += ", ";
                lines += std::to_string(ifc.src.loc.line);
            }

            warn.loc     = warn.related.front();
            warn.message = "interface " + to_string(key) + " is declared " +
                           std::to_string(warn.related.size()) + " times (lines " + lines +
                           "); resolve the duplicates before editing";
            ctx.errors.push_back(std::move(warn));
        }

        ctx.result = std::move(doc);
        return ctx;
    }

} // namespace ifed

#endif // IFED_PARSER_HPP
