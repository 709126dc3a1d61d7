// ifed_editor.hpp - Interfaces Editor (ifed) - Document Editor
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef IFED_EDITOR_HPP
#define IFED_EDITOR_HPP

#include "ifed_document.hpp"
#include "ifed_diff.hpp"

namespace ifed
{
//========================================================================
// Errors and options
//========================================================================

    enum class mutation_error_kind
    {
        target_not_found,
        ambiguous_interface,
        invalid_argument
    };

    using mutation_error = error<mutation_error_kind>;

    struct editor_options
    {
        std::string indent         = "    ";  // canonical option indentation
        bool        inherit_indent = true;    // new options copy the last option's indentation

        // Keys that may legitimately repeat within one iface block.
        std::vector<std::string> repeatable_options =
            { "pre-up", "up", "post-up", "pre-down", "down", "post-down" };

        bool is_repeatable(std::string_view key) const
        {
            return std::ranges::find(repeatable_options, key) != repeatable_options.end();
        }
    };

    struct mutation_result
    {
        bool changed = false;
        std::optional<mutation_error> error;

        bool ok() const { return !error.has_value(); }
    };

//========================================================================
// Editor
//========================================================================

    // Works on its own snapshot of a document. Every operation replaces the
    // snapshot with a freshly indexed successor; the source document is
    // never touched.
    class editor
    {
    public:
        explicit editor(document const & doc, editor_options opts = {})
            : current_(doc), opts_(std::move(opts))
        {}

    //============================================================
    // Iface blocks
    //============================================================

        mutation_result ensure_iface( std::string_view name, std::string_view family, std::string_view method );
        mutation_result set_method( interface_selector const & target, std::string_view method );
        mutation_result remove_iface( interface_selector const & target );

    //============================================================
    // Options
    //============================================================

        // With all_matches unset, repeatable directives append and all
        // other keys replace.
        mutation_result set_option( interface_selector const & target,
                                    std::string_view key,
                                    std::string_view value,
                                    std::optional<bool> all_matches = std::nullopt );

        // With a value, only options carrying that exact value are removed.
        mutation_result remove_option( interface_selector const & target,
                                       std::string_view key,
                                       std::optional<std::string_view> value = std::nullopt );

    //============================================================
    // Result
    //============================================================

        document const & result() const noexcept { return current_; }

        editor_options const & options() const noexcept { return opts_; }

    private:

        document       current_;
        editor_options opts_;

    //========================================================
    // Internal helpers; not exposed for clients
    //========================================================

        context<size_t, mutation_error> locate( interface_selector const & target ) const;

        std::string preferred_eol() const;

        static mutation_result fail( mutation_error_kind kind, std::string message )
        {
            return { false, mutation_error{ kind, {}, std::move(message), {} } };
        }

        static std::optional<mutation_result> check_token( std::string_view what, std::string_view token );
        static std::optional<mutation_result> check_key( std::string_view key );
        static std::optional<mutation_result> check_value( std::string_view key, std::string_view value );

        void commit( std::vector<entry> entries )
        {
            current_ = document(std::move(entries));
        }
    };

//========================================================================
// Operations
//========================================================================

    namespace op
    {
        struct ensure_iface
        {
            std::string name;
            std::string family;
            std::string method;
        };

        struct set_method
        {
            interface_selector target;
            std::string        method;
        };

        struct set_option
        {
            interface_selector  target;
            std::string         key;
            std::string         value;
            std::optional<bool> all_matches;
        };

        struct remove_option
        {
            interface_selector         target;
            std::string                key;
            std::optional<std::string> value;
        };

        struct remove_iface
        {
            interface_selector target;
        };
    }

    using operation = std::variant<
        op::ensure_iface,
        op::set_method,
        op::set_option,
        op::remove_option,
        op::remove_iface
    >;

    struct edit_result
    {
        document                      result;
        bool                          changed = false;
        std::optional<mutation_error> error;

        bool ok() const { return !error.has_value(); }
    };

    // On error the returned document is the input, unchanged.
    // `operation` is a std::variant, so argument-dependent lookup also finds
    // std::apply for an operation lvalue; call this one as ifed::apply.
    edit_result apply( document const & doc, operation const & o, editor_options opts = {} );

    enum class batch_policy
    {
        abort_on_error,     // any failure discards the whole batch
        continue_on_error   // failed operations are skipped
    };

    struct batch_result
    {
        document                    result;
        bool                        changed = false;
        size_t                      applied = 0;
        std::vector<mutation_error> errors;

        bool ok() const { return errors.empty(); }
    };

    batch_result apply_all( document const & doc,
                            std::span<const operation> ops,
                            batch_policy policy = batch_policy::abort_on_error,
                            editor_options opts = {} );

    std::string to_string( operation const & o );

//================================================================================================================
//
// Editor implementations
//
//================================================================================================================

//========================================================
// Internal helpers; not exposed for clients
//========================================================

    namespace detail
    {
        inline source_info generated(std::string indent, std::string eol)
        {
            source_info src;
            src.layout.indent = std::move(indent);
            src.layout.eol    = std::move(eol);
            src.creation      = creation_state::generated;
            return src;
        }

        // Comments of removed options move down to the next surviving
        // option, or to the end of the block.
        inline bool erase_options(iface_stanza & ifc, std::function<bool(option const &)> const & doomed)
        {
            std::vector<option>  kept;
            std::vector<comment> carry;
            bool removed = false;

            for (auto & o : ifc.options)
            {
                if (doomed(o))
                {
                    removed = true;
                    carry.insert(carry.end(), o.leading_comments.begin(), o.leading_comments.end());
                    continue;
                }

                if (!carry.empty())
                {
                    o.leading_comments.insert(o.leading_comments.begin(), carry.begin(), carry.end());
                    carry.clear();
                }
                kept.push_back(std::move(o));
            }

            ifc.trailing_comments.insert(ifc.trailing_comments.begin(), carry.begin(), carry.end());
            ifc.options = std::move(kept);
            return removed;
        }

        inline std::string_view last_eol(iface_stanza const & ifc)
        {
            return ifc.options.empty() ? ifc.src.layout.eol : ifc.options.back().src.layout.eol;
        }
    }

    inline context<size_t, mutation_error> editor::locate(interface_selector const & target) const
    {
        context<size_t, mutation_error> out;

        auto error_of = [&](mutation_error_kind kind, std::string message)
        {
            out.errors.push_back(mutation_error{ kind, {}, std::move(message), {} });
            return out;
        };

        std::optional<interface_key> key;

        if (target.family)
        {
            key = interface_key{ target.name, *target.family };
        }
        else
        {
            auto candidates = current_.find_ifaces(target.name);
            if (candidates.size() > 1)
            {
                std::vector<std::string> families;
                for (auto const & k : candidates)
                    families.push_back(k.family);
                return error_of(mutation_error_kind::ambiguous_interface,
                    "interface " + target.name + " is declared for several address families (" +
                    detail::join(families, ", ") + "); name one");
            }
            if (!candidates.empty())
                key = candidates.front();
        }

        auto where = key ? current_.positions(*key) : std::span<const size_t>{};

        if (where.empty())
            return error_of(mutation_error_kind::target_not_found,
                "interface " + to_string(target) + " not found");

        if (where.size() > 1)
        {
            auto err = mutation_error{ mutation_error_kind::ambiguous_interface, {},
                "interface " + to_string(*key) + " is declared " + std::to_string(where.size()) +
                " times; resolve the duplicates before editing", {} };
            for (size_t pos : where)
                err.related.push_back(std::get<iface_stanza>(current_.entries()[pos]).src.loc);
            err.loc = err.related.front();
            out.errors.push_back(std::move(err));
            return out;
        }

        out.result = where.front();
        return out;
    }

    inline std::string editor::preferred_eol() const
    {
        for (auto const & e : current_.entries())
        {
            auto const * b = std::get_if<blank_line>(&e);
            if (b && !b->src.layout.eol.empty())
                return b->src.layout.eol;
            if (auto const * ifc = std::get_if<iface_stanza>(&e); ifc && !ifc->src.layout.eol.empty())
                return ifc->src.layout.eol;
        }
        return "\n";
    }

    inline std::optional<mutation_result> editor::check_token(std::string_view what, std::string_view token)
    {
        if (token.empty())
            return fail(mutation_error_kind::invalid_argument, std::string(what) + " must not be empty");
        if (detail::has_space(token))
            return fail(mutation_error_kind::invalid_argument,
                std::string(what) + " '" + std::string(token) + "' must be a single word");

        // Tokens follow whitespace on their line, where '#' opens a comment.
        if (token.front() == '#')
            return fail(mutation_error_kind::invalid_argument,
                std::string(what) + " '" + std::string(token) + "' must not start with '#'");
        if (detail::ends_with_continuation(token))
            return fail(mutation_error_kind::invalid_argument,
                std::string(what) + " '" + std::string(token) + "' must not end with a line continuation");
        return std::nullopt;
    }

    // Keys start their line, so a comment marker or stanza keyword would
    // change what the line is.
    inline std::optional<mutation_result> editor::check_key(std::string_view key)
    {
        if (auto bad = check_token("option key", key))
            return bad;
        if (key.front() == '!')
            return fail(mutation_error_kind::invalid_argument,
                "option key '" + std::string(key) + "' must not start with '!'");
        if (detail::is_stanza_keyword(key))
            return fail(mutation_error_kind::invalid_argument,
                "option key '" + std::string(key) + "' is a stanza keyword");
        return std::nullopt;
    }

    // A value must read back unchanged from its rendered line.
    inline std::optional<mutation_result> editor::check_value(std::string_view key, std::string_view value)
    {
        auto bad = [&](std::string_view why)
        {
            return fail(mutation_error_kind::invalid_argument,
                "value of option '" + std::string(key) + "' " + std::string(why));
        };

        if (value.empty())
            return bad("must not be empty");
        if (value.find_first_of("\r\n") != std::string_view::npos)
            return bad("must be a single line");
        if (detail::is_space(value.front()) || detail::is_space(value.back()))
            return bad("must not start or end with whitespace");
        if (value.front() == '#')
            return bad("must not start with '#'");
        for (size_t i = 1; i < value.size(); ++i)
            if (value[i] == '#' && detail::is_space(value[i - 1]))
                return bad("must not contain '#' after whitespace");
        if (detail::ends_with_continuation(value))
            return bad("must not end with a line continuation");
        return std::nullopt;
    }

//============================================================
// Iface blocks
//============================================================

    inline mutation_result editor::ensure_iface(std::string_view name, std::string_view family, std::string_view method)
    {
        if (auto bad = check_token("interface name", name))   return *bad;
        if (auto bad = check_token("address family", family)) return *bad;
        if (auto bad = check_token("method", method))         return *bad;

        interface_key key{ std::string(name), std::string(family) };
        auto where = current_.positions(key);

        if (where.size() > 1)
            return fail(mutation_error_kind::ambiguous_interface,
                "interface " + to_string(key) + " is declared " + std::to_string(where.size()) +
                " times; resolve the duplicates before editing");

        if (where.size() == 1)
            return set_method(interface_selector{ key }, method);

        auto entries = current_.copy_entries();
        std::string eol = preferred_eol();

        if (!entries.empty() && !std::holds_alternative<blank_line>(entries.back()))
            entries.emplace_back(blank_line{ detail::generated("", eol) });

        iface_stanza ifc;
        ifc.name   = key.name;
        ifc.family = key.family;
        ifc.method = std::string(method);
        ifc.src    = detail::generated("", eol);
        entries.emplace_back(std::move(ifc));

        commit(std::move(entries));
        return { true, std::nullopt };
    }

    inline mutation_result editor::set_method(interface_selector const & target, std::string_view method)
    {
        if (auto bad = check_token("method", method)) return *bad;

        auto loc = locate(target);
        if (!loc.ok())
            return { false, loc.errors.front() };

        auto entries = current_.copy_entries();
        auto & ifc = std::get<iface_stanza>(entries[*loc.result]);

        if (ifc.method == method)
            return { false, std::nullopt };

        ifc.method        = std::string(method);
        ifc.src.is_edited = true;

        commit(std::move(entries));
        return { true, std::nullopt };
    }

    inline mutation_result editor::remove_iface(interface_selector const & target)
    {
        auto loc = locate(target);
        if (!loc.ok())
            return { false, loc.errors.front() };

        size_t pos   = *loc.result;
        auto entries = current_.copy_entries();
        entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(pos));

        // The blank line that separated the block goes with it when the
        // block was first in the file or already followed a blank line.
        bool follows_blank = pos < entries.size() && std::holds_alternative<blank_line>(entries[pos]);
        bool after_blank   = pos == 0 || std::holds_alternative<blank_line>(entries[pos - 1]);
        if (follows_blank && after_blank)
            entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(pos));

        commit(std::move(entries));
        return { true, std::nullopt };
    }

//============================================================
// Options
//============================================================

    inline mutation_result editor::set_option(
        interface_selector const & target,
        std::string_view key,
        std::string_view value,
        std::optional<bool> all_matches)
    {
        // Changing the method is not an option edit.
        if (key == "method" && !all_matches.value_or(false))
            return set_method(target, value);

        if (auto bad = check_key(key))          return *bad;
        if (auto bad = check_value(key, value)) return *bad;

        auto loc = locate(target);
        if (!loc.ok())
            return { false, loc.errors.front() };

        auto entries = current_.copy_entries();
        auto & ifc   = std::get<iface_stanza>(entries[*loc.result]);
        bool repeat  = all_matches.value_or(opts_.is_repeatable(key));

        auto first = std::ranges::find_if(ifc.options, [&](option const & o) { return o.key == key; });

        if (repeat)
        {
            bool present = std::ranges::any_of(ifc.options, [&](option const & o)
            {
                return o.key == key && o.value == value;
            });
            if (present)
                return { false, std::nullopt };
        }
        else if (first != ifc.options.end())
        {
            bool changed = false;

            if (first->value != value)
            {
                first->value         = std::string(value);
                first->src.is_edited = true;
                changed = true;
            }

            option const * keep = &*first;
            changed |= detail::erase_options(ifc, [&](option const & o)
            {
                return &o != keep && o.key == key;
            });

            if (!changed)
                return { false, std::nullopt };

            commit(std::move(entries));
            return { true, std::nullopt };
        }

        // Append at the end of the block.
        std::string indent = opts_.inherit_indent && !ifc.options.empty()
            ? ifc.options.back().src.layout.indent
            : ifc.src.layout.indent + opts_.indent;

        std::string eol(detail::last_eol(ifc));
        if (eol.empty())
            eol = preferred_eol();

        option opt;
        opt.key   = std::string(key);
        opt.value = std::string(value);
        opt.src   = detail::generated(std::move(indent), std::move(eol));
        ifc.options.push_back(std::move(opt));

        commit(std::move(entries));
        return { true, std::nullopt };
    }

    inline mutation_result editor::remove_option(
        interface_selector const & target,
        std::string_view key,
        std::optional<std::string_view> value)
    {
        auto loc = locate(target);
        if (!loc.ok())
            return { false, loc.errors.front() };

        auto entries = current_.copy_entries();
        auto & ifc   = std::get<iface_stanza>(entries[*loc.result]);

        bool removed = detail::erase_options(ifc, [&](option const & o)
        {
            return o.key == key && (!value || o.value == *value);
        });

        if (!removed)
            return { false, std::nullopt };

        commit(std::move(entries));
        return { true, std::nullopt };
    }

//============================================================
// Operations
//============================================================

    namespace detail
    {
        inline mutation_result dispatch(editor & ed, operation const & o)
        {
            return std::visit([&ed](auto const & v) -> mutation_result
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, op::ensure_iface>)
                    return ed.ensure_iface(v.name, v.family, v.method);
                else if constexpr (std::is_same_v<T, op::set_method>)
                    return ed.set_method(v.target, v.method);
                else if constexpr (std::is_same_v<T, op::set_option>)
                    return ed.set_option(v.target, v.key, v.value, v.all_matches);
                else if constexpr (std::is_same_v<T, op::remove_option>)
                {
                    if (v.value)
                        return ed.remove_option(v.target, v.key, std::string_view(*v.value));
                    return ed.remove_option(v.target, v.key);
                }
                else if constexpr (std::is_same_v<T, op::remove_iface>)
                    return ed.remove_iface(v.target);
            }, o);
        }
    }

    inline edit_result apply(document const & doc, operation const & o, editor_options opts)
    {
        editor ed(doc, std::move(opts));
        auto r = detail::dispatch(ed, o);

        if (!r.ok())
            return { doc, false, std::move(r.error) };

        return { ed.result(), !equivalent(doc, ed.result()), std::nullopt };
    }

    inline batch_result apply_all(
        document const & doc,
        std::span<const operation> ops,
        batch_policy policy,
        editor_options opts)
    {
        batch_result out;
        editor ed(doc, std::move(opts));

        for (auto const & o : ops)
        {
            auto r = detail::dispatch(ed, o);
            if (r.ok())
            {
                ++out.applied;
                continue;
            }

            out.errors.push_back(std::move(*r.error));
            if (policy == batch_policy::abort_on_error)
            {
                out.result  = doc;
                out.applied = 0;
                return out;
            }
        }

        out.result  = ed.result();
        out.changed = !equivalent(doc, out.result);
        return out;
    }

    inline std::string to_string(operation const & o)
    {
        return std::visit([](auto const & v) -> std::string
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, op::ensure_iface>)
                return "ensure iface " + v.name + " " + v.family + " " + v.method;
            else if constexpr (std::is_same_v<T, op::set_method>)
                return "set method of " + to_string(v.target) + " to " + v.method;
            else if constexpr (std::is_same_v<T, op::set_option>)
                return std::string(v.all_matches.value_or(false) ? "add" : "set") +
                       " option " + v.key + " " + v.value + " on " + to_string(v.target);
            else if constexpr (std::is_same_v<T, op::remove_option>)
                return "remove option " + v.key + (v.value ? " " + *v.value : std::string()) +
                       " from " + to_string(v.target);
            else if constexpr (std::is_same_v<T, op::remove_iface>)
                return "remove iface " + to_string(v.target);
        }, o);
    }

} // namespace ifed

#endif // IFED_EDITOR_HPP
