// ifed_serializer.hpp - Interfaces Editor (ifed) - Renderer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef IFED_SERIALIZER_HPP
#define IFED_SERIALIZER_HPP

#include "ifed_document.hpp"

#include <ostream>
#include <sstream>

namespace ifed
{
//========================================================================
// SERIALIZER API
//========================================================================

    // Authored, unedited lines are written from their source literal.
    // Edited lines are rebuilt from their layout and generated lines use
    // canonical formatting.
    class serializer
    {
    public:
        explicit serializer(document const & doc) noexcept
            : doc_(doc)
        {}

        void write(std::ostream & out) const;

    private:
        document const & doc_;
    };

    std::string render(document const & doc);

//========================================================================
// SERIALIZER IMPLEMENTATION
//========================================================================

    namespace detail
    {
        class line_sink
        {
        public:
            explicit line_sink(std::ostream & out) : out_(out) {}

            // A line never continues output that lacks a final newline, and
            // an empty physical line closes a continuation left open by the
            // previous content line.
            void emit(std::string_view text, bool content = false)
            {
                if (text.empty())
                    return;
                if (!at_line_start_)
                    out_ << '\n';
                if (open_eol_)
                    out_ << *open_eol_;
                out_ << text;
                at_line_start_ = text.back() == '\n';
                open_eol_      = content ? continued_eol(text) : std::nullopt;
            }

            void emit(source_info const & src, std::string_view body, bool content = true)
            {
                if (src.verbatim())
                {
                    emit(*src.source_literal, content);
                    return;
                }

                std::string line = src.layout.indent;
                line += body;
                line += src.layout.trailing;
                line += src.layout.eol;
                emit(line, content);
            }

        private:
            std::ostream &             out_;
            bool                       at_line_start_ = true;
            std::optional<std::string> open_eol_;

            // The eol that ends a dangling continuation on the last physical
            // line of text, if there is one.
            static std::optional<std::string> continued_eol(std::string_view text)
            {
                std::string eol = text.ends_with("\r\n") ? "\r\n" : "\n";
                if (text.ends_with('\n'))
                    text.remove_suffix(eol.size());

                size_t nl = text.rfind('\n');
                if (nl != std::string_view::npos)
                    text.remove_prefix(nl + 1);

                if (!ends_with_continuation(text))
                    return std::nullopt;
                return eol;
            }
        };

        inline std::string keyword_line(std::string_view keyword, std::string_view separator, std::string_view rest)
        {
            std::string s(keyword);
            if (!rest.empty())
            {
                s += separator.empty() ? std::string_view(" ") : separator;
                s += rest;
            }
            return s;
        }

        class serializer_impl
        {
        public:
            explicit serializer_impl(std::ostream & out) : sink_(out) {}

            void write(document const & doc)
            {
                for (auto const & e : doc.entries())
                    write_entry(e);
            }

        private:
            line_sink sink_;

            void write_entry(entry const & e)
            {
                std::visit([this](auto const & v)
                {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, blank_line>)
                        sink_.emit(v.src, "", false);
                    else if constexpr (std::is_same_v<T, comment>)
                        write_comment(v);
                    else if constexpr (std::is_same_v<T, auto_stanza>)
                        sink_.emit(v.src, "auto " + join(v.interfaces));
                    else if constexpr (std::is_same_v<T, allow_stanza>)
                        sink_.emit(v.src, "allow-" + v.trigger + " " + join(v.interfaces));
                    else if constexpr (std::is_same_v<T, directive_stanza>)
                        sink_.emit(v.src, std::string(directive_keyword(v.kind)) + " " + join(v.interfaces));
                    else if constexpr (std::is_same_v<T, source_stanza>)
                        sink_.emit(v.src, keyword_line("source", v.src.layout.separator, v.pattern));
                    else if constexpr (std::is_same_v<T, source_directory_stanza>)
                        sink_.emit(v.src, keyword_line(v.keyword, v.src.layout.separator, v.pattern));
                    else if constexpr (std::is_same_v<T, mapping_stanza>)
                        write_mapping(v);
                    else if constexpr (std::is_same_v<T, iface_stanza>)
                        write_iface(v);
                }, e);
            }

            void write_comment(comment const & c)
            {
                std::string body(1, c.marker);
                body += c.text;
                sink_.emit(c.src, body, false);
            }

            void write_mapping(mapping_stanza const & m)
            {
                if (m.src.verbatim())
                {
                    sink_.emit(*m.src.source_literal, true);
                    return;
                }

                std::string const & indent = m.src.layout.indent;
                std::string const & eol    = m.src.layout.eol.empty() ? std::string("\n") : m.src.layout.eol;

                sink_.emit(indent + "mapping " + m.pattern + eol, true);
                if (!m.script.empty())
                    sink_.emit(indent + "    script " + m.script + eol, true);
                for (auto const & rule : m.mappings)
                    sink_.emit(indent + "    " + keyword_line("map", " ", rule.value + (rule.result.empty() ? "" : " " + rule.result)) + eol, true);
            }

            void write_iface(iface_stanza const & ifc)
            {
                for (auto const & c : ifc.leading_comments)
                    write_comment(c);

                sink_.emit(ifc.src, "iface " + ifc.name + " " + ifc.family + " " + ifc.method);

                for (auto const & opt : ifc.options)
                {
                    for (auto const & c : opt.leading_comments)
                        write_comment(c);
                    sink_.emit(opt.src, keyword_line(opt.key, opt.src.layout.separator, opt.value));
                }

                for (auto const & c : ifc.trailing_comments)
                    write_comment(c);
            }
        };

    } // namespace detail

//========================================================================
// PUBLIC SERIALIZER API IMPLEMENTATION
//========================================================================

    inline void serializer::write(std::ostream & out) const
    {
        detail::serializer_impl impl(out);
        impl.write(doc_);
    }

    inline std::string render(document const & doc)
    {
        std::ostringstream out;
        serializer s(doc);
        s.write(out);
        return out.str();
    }

} // namespace ifed

#endif // IFED_SERIALIZER_HPP
