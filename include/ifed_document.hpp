// ifed_document.hpp - Interfaces Editor (ifed) - Authoritative Document Model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef IFED_DOCUMENT_HPP
#define IFED_DOCUMENT_HPP

#include "ifed_core.hpp"

#include <map>
#include <span>

namespace ifed
{
//========================================================================
// Formatting metadata
//========================================================================

    enum class creation_state
    {
        authored,   // parsed from source
        generated   // created by the editor
    };

    struct line_layout
    {
        std::string indent;
        std::string separator = " ";  // between keyword/key and the rest
        std::string trailing;         // trailing blanks and comment
        std::string eol = "\n";
    };

    // Where a line came from and how to print it. None of this takes part
    // in structural equality.
    struct source_info
    {
        std::optional<std::string> source_literal;
        line_layout     layout;
        creation_state  creation  = creation_state::generated;
        bool            is_edited = false;
        source_location loc;

        bool verbatim() const noexcept
        {
            return source_literal.has_value() && !is_edited;
        }
    };

//========================================================================
// Entries
//========================================================================

    struct blank_line
    {
        source_info src;
    };

    struct comment
    {
        char        marker = '#';
        std::string text;   // everything after the marker
        source_info src;
    };

    struct auto_stanza
    {
        std::vector<std::string> interfaces;
        source_info src;
    };

    struct allow_stanza
    {
        std::string              trigger;   // "hotplug" for allow-hotplug
        std::vector<std::string> interfaces;
        source_info src;
    };

    enum class directive_kind
    {
        no_auto_down,
        no_scripts
    };

    struct directive_stanza
    {
        directive_kind           kind = directive_kind::no_auto_down;
        std::vector<std::string> interfaces;
        source_info src;
    };

    struct source_stanza
    {
        std::string pattern;
        source_info src;
    };

    struct source_directory_stanza
    {
        std::string pattern;
        std::string keyword = "source-directory";  // or the "source-dir" alias
        source_info src;
    };

    struct mapping_rule
    {
        std::string value;
        std::string result;
    };

    // The literal of a mapping spans the whole block, body comments included.
    struct mapping_stanza
    {
        std::string               pattern;
        std::string               script;
        std::vector<mapping_rule> mappings;
        source_info src;
    };

    struct option
    {
        std::string          key;
        std::string          value;
        std::vector<comment> leading_comments;
        source_info src;
    };

    struct iface_stanza
    {
        std::string          name;
        std::string          family;
        std::string          method;
        std::vector<option>  options;           // authored order, duplicates kept
        std::vector<comment> leading_comments;  // directly above the header
        std::vector<comment> trailing_comments; // left behind by option removal
        source_info src;                        // header line only

        interface_key key() const { return { name, family }; }
        address_family family_kind() const { return detail::classify_family(family); }
    };

    using entry = std::variant<
        blank_line,
        comment,
        auto_stanza,
        allow_stanza,
        directive_stanza,
        source_stanza,
        source_directory_stanza,
        mapping_stanza,
        iface_stanza
    >;

    inline std::string_view directive_keyword(directive_kind k)
    {
        switch (k)
        {
            case directive_kind::no_auto_down: return "no-auto-down";
            case directive_kind::no_scripts:   return "no-scripts";
        }
        return "no-auto-down";
    }

//========================================================================
// Document
//========================================================================

    class document
    {
    public:
        struct iface_view;

        //------------------------------------------------------------------------
        // Construction
        //------------------------------------------------------------------------

        document() = default;

        explicit document(std::vector<entry> entries)
            : entries_(std::move(entries))
        {
            build_index();
        }

        //------------------------------------------------------------------------
        // Entry access
        //------------------------------------------------------------------------

        std::span<const entry> entries() const noexcept
        {
            return entries_;
        }

        size_t entry_count() const noexcept
        {
            return entries_.size();
        }

        bool empty() const noexcept
        {
            return entries_.empty();
        }

        //------------------------------------------------------------------------
        // Interface access
        //------------------------------------------------------------------------

        // Every distinct key, in order of first declaration.
        std::vector<interface_key> interfaces() const;

        std::optional<iface_view> iface(interface_key const & key) const noexcept;

        std::vector<interface_key> find_ifaces(std::string_view name) const;

        std::span<const size_t> positions(interface_key const & key) const noexcept;

        // Keys declared more than once.
        std::vector<interface_key> ambiguities() const;

        bool is_ambiguous(interface_key const & key) const noexcept
        {
            return positions(key).size() > 1;
        }

        // Copy of the owned sequence, for building a successor document.
        std::vector<entry> copy_entries() const
        {
            return entries_;
        }

    private:
        void build_index();

        std::vector<entry>                           entries_;
        std::map<interface_key, std::vector<size_t>> index_;
    };

//========================================================================
// Views
//========================================================================

    struct document::iface_view
    {
        const iface_stanza* node;
        size_t              position;

        std::string_view name() const noexcept { return node->name; }
        std::string_view family() const noexcept { return node->family; }
        std::string_view method() const noexcept { return node->method; }
        interface_key key() const { return node->key(); }

        std::span<const option> options() const noexcept
        {
            return node->options;
        }

        std::vector<std::string> option_values(std::string_view key) const
        {
            std::vector<std::string> out;
            for (auto const & o : node->options)
                if (o.key == key)
                    out.push_back(o.value);
            return out;
        }

        source_location loc() const noexcept { return node->src.loc; }
    };

//========================================================================
// document member implementations
//========================================================================

    inline void document::build_index()
    {
        index_.clear();
        for (size_t i = 0; i < entries_.size(); ++i)
        {
            if (auto const * ifc = std::get_if<iface_stanza>(&entries_[i]))
                index_[ifc->key()].push_back(i);
        }
    }

    inline std::vector<interface_key> document::interfaces() const
    {
        std::vector<interface_key> out;
        for (auto const & e : entries_)
        {
            auto const * ifc = std::get_if<iface_stanza>(&e);
            if (!ifc) continue;

            auto k = ifc->key();
            if (std::ranges::find(out, k) == out.end())
                out.push_back(std::move(k));
        }
        return out;
    }

    inline std::optional<document::iface_view>
    document::iface(interface_key const & key) const noexcept
    {
        auto it = index_.find(key);
        if (it == index_.end() || it->second.empty())
            return std::nullopt;

        size_t pos = it->second.front();
        return iface_view{ &std::get<iface_stanza>(entries_[pos]), pos };
    }

    inline std::vector<interface_key> document::find_ifaces(std::string_view name) const
    {
        std::vector<interface_key> out;
        for (auto const & k : interfaces())
            if (k.name == name)
                out.push_back(k);
        return out;
    }

    inline std::span<const size_t> document::positions(interface_key const & key) const noexcept
    {
        auto it = index_.find(key);
        if (it == index_.end())
            return {};
        return it->second;
    }

    inline std::vector<interface_key> document::ambiguities() const
    {
        std::vector<interface_key> out;
        for (auto const & [key, where] : index_)
            if (where.size() > 1)
                out.push_back(key);
        return out;
    }

//========================================================================
// Read surface
//========================================================================

    inline std::vector<interface_key> list_interfaces(document const & doc)
    {
        return doc.interfaces();
    }

    // Options of an iface in authored order, optionally restricted to one key.
    inline std::vector<option> get_options(
        document const & doc,
        interface_key const & key,
        std::optional<std::string_view> filter = std::nullopt)
    {
        std::vector<option> out;
        auto view = doc.iface(key);
        if (!view)
            return out;

        for (auto const & o : view->options())
            if (!filter || o.key == *filter)
                out.push_back(o);
        return out;
    }

} // namespace ifed

#endif // IFED_DOCUMENT_HPP
