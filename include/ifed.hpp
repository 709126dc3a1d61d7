// ifed.hpp - Interfaces Editor (ifed)
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// ifed Core Principles:
//========================================================================
//
// The Authored-Form Principle
// ---------------------------
// An interfaces file is maintained by people. Order, spacing, comments
// and continuations are part of it and survive every edit that does not
// target them. Rendering an unedited document gives back its bytes.
//
//
// The Targeted-Edit Principle
// ---------------------------
// An edit names an interface and touches that interface only. Applying
// the same edit twice changes nothing the second time.
//
//
// The Snapshot Principle
// ----------------------
// A document never changes once built. Edits produce successors, so any
// number of readers may hold a snapshot while edits are prepared.
//
//
// The Explicit-Failure Principle
// ------------------------------
// Malformed input is rejected with a line and an expectation. Edits that
// cannot be resolved say so as values; nothing is silently skipped.
//
//========================================================================


#ifndef IFED_INTERFACES_EDITOR
#define IFED_INTERFACES_EDITOR

#include "ifed_core.hpp"
#include "ifed_lexer.hpp"
#include "ifed_document.hpp"
#include "ifed_parser.hpp"
#include "ifed_serializer.hpp"
#include "ifed_diff.hpp"
#include "ifed_editor.hpp"

namespace ifed
{
//========================================================================
// Document loading
//========================================================================

    inline parse_context load(std::string_view text, parser_options opt = {})
    {
        return parse(text, opt);
    }

//========================================================================
// Interface summary
//========================================================================

    struct interface_summary
    {
        std::string family;
        std::string method;
        std::map<std::string, std::string>              options;  // last value wins
        std::map<std::string, std::vector<std::string>> scripts;  // repeatable directives, in order
    };

    inline std::map<interface_key, interface_summary>
    summarise(document const & doc, editor_options const & opts = {})
    {
        std::map<interface_key, interface_summary> out;

        for (auto const & e : doc.entries())
        {
            auto const * ifc = std::get_if<iface_stanza>(&e);
            if (!ifc) continue;

            interface_summary & s = out[ifc->key()];
            s.family = ifc->family;
            s.method = ifc->method;

            for (auto const & key : opts.repeatable_options)
                s.scripts.try_emplace(key);

            for (auto const & o : ifc->options)
            {
                if (opts.is_repeatable(o.key))
                    s.scripts[o.key].push_back(o.value);
                else
                    s.options[o.key] = o.value;
            }
        }

        return out;
    }

//========================================================================
// Text to text
//========================================================================

    using any_error = std::variant<parse_error, mutation_error>;

    inline bool is_parse_error(any_error const & e) { return std::holds_alternative<parse_error>(e); }
    inline bool is_mutation_error(any_error const & e) { return std::holds_alternative<mutation_error>(e); }

    inline std::string to_string(any_error const & e)
    {
        return std::visit([](auto const & v) { return to_string(v); }, e);
    }

    struct edit_outcome
    {
        std::string              text;     // input text when nothing changed or on failure
        bool                     changed = false;
        std::vector<change>      changes;
        std::vector<parse_error> warnings;
        std::vector<any_error>   errors;

        bool ok() const { return errors.empty(); }
    };

    // Parse, apply, render. Unchanged documents give back the input as is.
    inline edit_outcome edit_text(
        std::string_view text,
        std::span<const operation> ops,
        batch_policy policy = batch_policy::abort_on_error,
        editor_options eopts = {},
        parser_options popts = {})
    {
        edit_outcome out;
        out.text = std::string(text);

        auto ctx = parse(text, popts);
        if (!ctx.ok())
        {
            for (auto & e : ctx.errors)
                out.errors.emplace_back(std::move(e));
            return out;
        }
        out.warnings = std::move(ctx.errors);

        auto batch = apply_all(*ctx.result, ops, policy, std::move(eopts));
        for (auto & e : batch.errors)
            out.errors.emplace_back(std::move(e));

        if (batch.changed)
        {
            out.changed = true;
            out.changes = diff(*ctx.result, batch.result);
            out.text    = render(batch.result);
        }

        return out;
    }

}

#endif
