// ifed_diff.hpp - Interfaces Editor (ifed) - Structural comparison
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef IFED_DIFF_HPP
#define IFED_DIFF_HPP

#include "ifed_document.hpp"

#include <cstddef>
#include <functional>

namespace ifed
{
//========================================================================
// DIFF API
//========================================================================

    enum class change_kind
    {
        iface_added,
        iface_removed,
        iface_changed,
        option_added,
        option_removed,
        option_changed,
        entry_added,
        entry_removed
    };

    struct change
    {
        change_kind                  kind;
        std::optional<interface_key> key;     // set for iface and option changes
        std::string                  option;  // option key, for option changes
        std::string                  before;
        std::string                  after;
    };

    // Formatting metadata (layout, literals, edit flags) is ignored.
    bool same_entry(entry const & a, entry const & b);
    bool equivalent(document const & a, document const & b);

    std::vector<change> diff(document const & before, document const & after);

    std::string describe(change const & c);

    // Short, canonical one-line form of an entry.
    std::string summary(entry const & e);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline bool same_comments(std::vector<comment> const & a, std::vector<comment> const & b)
        {
            return std::ranges::equal(a, b, [](comment const & x, comment const & y)
            {
                return x.marker == y.marker && x.text == y.text;
            });
        }

        inline bool same_option(option const & a, option const & b)
        {
            return a.key == b.key
                && a.value == b.value
                && same_comments(a.leading_comments, b.leading_comments);
        }

        // Myers' O((n+m)D) alignment in linear space. Each box of the edit
        // graph is split at its middle snake until nothing is left, which
        // yields the corner points of one shortest edit path.
        class lcs_aligner
        {
        public:
            using index = std::ptrdiff_t;

            explicit lcs_aligner(std::function<bool(size_t, size_t)> const & eq)
                : eq_(eq)
            {}

            std::vector<std::pair<size_t, size_t>> run(size_t n, size_t m)
            {
                std::vector<point> path;
                find_path({ 0, 0, static_cast<index>(n), static_cast<index>(m) }, path);

                std::vector<std::pair<size_t, size_t>> out;
                for (size_t i = 1; i < path.size(); ++i)
                {
                    index x = path[i - 1].x, y = path[i - 1].y;
                    index u = path[i].x,     v = path[i].y;

                    walk_diagonal(x, y, u, v, out);
                    if (u - x < v - y)
                        ++y;
                    else if (u - x > v - y)
                        ++x;
                    walk_diagonal(x, y, u, v, out);
                }
                return out;
            }

        private:
            struct point
            {
                index x;
                index y;
            };

            struct box
            {
                index left, top, right, bottom;

                index width()  const { return right - left; }
                index height() const { return bottom - top; }
                index size()   const { return width() + height(); }
                index delta()  const { return width() - height(); }
            };

            std::function<bool(size_t, size_t)> const & eq_;

            bool same(index x, index y) const
            {
                return eq_(static_cast<size_t>(x), static_cast<size_t>(y));
            }

            void walk_diagonal(index & x, index & y, index u, index v, std::vector<std::pair<size_t, size_t>> & out) const
            {
                while (x < u && y < v && same(x, y))
                {
                    out.emplace_back(static_cast<size_t>(x), static_cast<size_t>(y));
                    ++x, ++y;
                }
            }

            bool find_path(box const & b, std::vector<point> & path) const
            {
                auto snake = middle_snake(b);
                if (!snake)
                    return false;

                auto [start, finish] = *snake;
                if (!find_path({ b.left, b.top, start.x, start.y }, path))
                    path.push_back(start);
                if (!find_path({ finish.x, finish.y, b.right, b.bottom }, path))
                    path.push_back(finish);
                return true;
            }

            std::optional<std::pair<point, point>> middle_snake(box const & b) const
            {
                if (b.size() == 0)
                    return std::nullopt;

                index const limit = (b.size() + 1) / 2;
                index const delta = b.delta();
                bool  const odd   = delta % 2 != 0;

                // Diagonals run from -limit-1 to limit+1.
                std::vector<index> forward(static_cast<size_t>(2 * limit + 3), 0);
                std::vector<index> backward(static_cast<size_t>(2 * limit + 3), 0);
                auto vf = [&](index k) -> index & { return forward[static_cast<size_t>(k + limit + 1)]; };
                auto vb = [&](index c) -> index & { return backward[static_cast<size_t>(c + limit + 1)]; };

                vf(1) = b.left;
                vb(1) = b.bottom;

                for (index d = 0; d <= limit; ++d)
                {
                    // Forward search, furthest reaching x per diagonal k = x - y.
                    for (index k = d; k >= -d; k -= 2)
                    {
                        index px, x;
                        if (k == -d || (k != d && vf(k - 1) < vf(k + 1)))
                            px = x = vf(k + 1);
                        else
                            px = vf(k - 1), x = px + 1;

                        index y  = b.top + (x - b.left) - k;
                        index py = (d == 0 || x != px) ? y : y - 1;

                        while (x < b.right && y < b.bottom && same(x, y))
                            ++x, ++y;

                        vf(k) = x;

                        index c = k - delta;
                        if (odd && c >= -(d - 1) && c <= d - 1 && y >= vb(c))
                            return std::pair{ point{ px, py }, point{ x, y } };
                    }

                    // Backward search, furthest reaching y per diagonal c = k - delta.
                    for (index c = d; c >= -d; c -= 2)
                    {
                        index py, y;
                        if (c == -d || (c != d && vb(c - 1) > vb(c + 1)))
                            py = y = vb(c + 1);
                        else
                            py = vb(c - 1), y = py - 1;

                        index k  = c + delta;
                        index x  = b.left + (y - b.top) + k;
                        index px = (d == 0 || y != py) ? x : x + 1;

                        while (x > b.left && y > b.top && same(x - 1, y - 1))
                            --x, --y;

                        vb(c) = y;

                        if (!odd && k >= -d && k <= d && x <= vf(k))
                            return std::pair{ point{ x, y }, point{ px, py } };
                    }
                }

                return std::nullopt;
            }
        };

        // Index pairs of a longest common subsequence of [0,n) and [0,m).
        inline std::vector<std::pair<size_t, size_t>> lcs_pairs(
            size_t n, size_t m, std::function<bool(size_t, size_t)> const & eq)
        {
            return lcs_aligner(eq).run(n, m);
        }

        inline void diff_options(
            interface_key const & key,
            iface_stanza const & before,
            iface_stanza const & after,
            std::vector<change> & out)
        {
            std::vector<std::string> keys;
            for (auto const * ifc : { &before, &after })
                for (auto const & o : ifc->options)
                    if (std::ranges::find(keys, o.key) == keys.end())
                        keys.push_back(o.key);

            for (auto const & k : keys)
            {
                std::vector<std::string> vb, va;
                for (auto const & o : before.options) if (o.key == k) vb.push_back(o.value);
                for (auto const & o : after.options)  if (o.key == k) va.push_back(o.value);

                auto pairs = lcs_pairs(vb.size(), va.size(),
                    [&](size_t i, size_t j) { return vb[i] == va[j]; });

                std::vector<bool> kept_b(vb.size(), false), kept_a(va.size(), false);
                for (auto [i, j] : pairs)
                    kept_b[i] = true, kept_a[j] = true;

                std::vector<std::string> removed, added;
                for (size_t i = 0; i < vb.size(); ++i) if (!kept_b[i]) removed.push_back(vb[i]);
                for (size_t j = 0; j < va.size(); ++j) if (!kept_a[j]) added.push_back(va[j]);

                // A removal and an addition of the same key read as a change.
                size_t paired = std::min(removed.size(), added.size());
                for (size_t p = 0; p < paired; ++p)
                    out.push_back({ change_kind::option_changed, key, k, removed[p], added[p] });
                for (size_t p = paired; p < removed.size(); ++p)
                    out.push_back({ change_kind::option_removed, key, k, removed[p], {} });
                for (size_t p = paired; p < added.size(); ++p)
                    out.push_back({ change_kind::option_added, key, k, {}, added[p] });
            }
        }

        inline std::string iface_header(iface_stanza const & ifc)
        {
            return "iface " + ifc.name + " " + ifc.family + " " + ifc.method;
        }

        inline std::string_view change_kind_name(change_kind k)
        {
            switch (k)
            {
                case change_kind::iface_added:    return "added iface";
                case change_kind::iface_removed:  return "removed iface";
                case change_kind::iface_changed:  return "changed iface";
                case change_kind::option_added:   return "added option";
                case change_kind::option_removed: return "removed option";
                case change_kind::option_changed: return "changed option";
                case change_kind::entry_added:    return "added";
                case change_kind::entry_removed:  return "removed";
            }
            return "changed";
        }
    }

    inline bool same_entry(entry const & a, entry const & b)
    {
        if (a.index() != b.index())
            return false;

        return std::visit([&b](auto const & x)
        {
            using T = std::decay_t<decltype(x)>;
            auto const & y = std::get<T>(b);

            if constexpr (std::is_same_v<T, blank_line>)
                return true;
            else if constexpr (std::is_same_v<T, comment>)
                return x.marker == y.marker && x.text == y.text;
            else if constexpr (std::is_same_v<T, auto_stanza>)
                return x.interfaces == y.interfaces;
            else if constexpr (std::is_same_v<T, allow_stanza>)
                return x.trigger == y.trigger && x.interfaces == y.interfaces;
            else if constexpr (std::is_same_v<T, directive_stanza>)
                return x.kind == y.kind && x.interfaces == y.interfaces;
            else if constexpr (std::is_same_v<T, source_stanza>)
                return x.pattern == y.pattern;
            else if constexpr (std::is_same_v<T, source_directory_stanza>)
                return x.pattern == y.pattern;
            else if constexpr (std::is_same_v<T, mapping_stanza>)
                return x.pattern == y.pattern
                    && x.script == y.script
                    && std::ranges::equal(x.mappings, y.mappings, [](auto const & p, auto const & q)
                       {
                           return p.value == q.value && p.result == q.result;
                       });
            else if constexpr (std::is_same_v<T, iface_stanza>)
                return x.name == y.name
                    && x.family == y.family
                    && x.method == y.method
                    && std::ranges::equal(x.options, y.options, detail::same_option)
                    && detail::same_comments(x.leading_comments, y.leading_comments)
                    && detail::same_comments(x.trailing_comments, y.trailing_comments);
        }, a);
    }

    inline bool equivalent(document const & a, document const & b)
    {
        return std::ranges::equal(a.entries(), b.entries(), same_entry);
    }

    inline std::string summary(entry const & e)
    {
        return std::visit([](auto const & v) -> std::string
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, blank_line>)
                return "blank line";
            else if constexpr (std::is_same_v<T, comment>)
                return std::string(1, v.marker) + v.text;
            else if constexpr (std::is_same_v<T, auto_stanza>)
                return "auto " + detail::join(v.interfaces);
            else if constexpr (std::is_same_v<T, allow_stanza>)
                return "allow-" + v.trigger + " " + detail::join(v.interfaces);
            else if constexpr (std::is_same_v<T, directive_stanza>)
                return std::string(directive_keyword(v.kind)) + " " + detail::join(v.interfaces);
            else if constexpr (std::is_same_v<T, source_stanza>)
                return "source " + v.pattern;
            else if constexpr (std::is_same_v<T, source_directory_stanza>)
                return v.keyword + " " + v.pattern;
            else if constexpr (std::is_same_v<T, mapping_stanza>)
                return "mapping " + v.pattern;
            else if constexpr (std::is_same_v<T, iface_stanza>)
                return detail::iface_header(v);
        }, e);
    }

    inline std::vector<change> diff(document const & before, document const & after)
    {
        std::vector<change> out;

        // Iface blocks, matched by key. First declarations only; duplicated
        // keys are reported by the parser.
        auto before_keys = before.interfaces();
        auto after_keys  = after.interfaces();

        for (auto const & k : before_keys)
        {
            auto const & b = *before.iface(k)->node;
            auto a_view = after.iface(k);

            if (!a_view)
            {
                out.push_back({ change_kind::iface_removed, k, {}, detail::iface_header(b), {} });
                continue;
            }

            auto const & a = *a_view->node;
            size_t mark = out.size();

            if (a.method != b.method)
                out.push_back({ change_kind::iface_changed, k, "method", b.method, a.method });

            detail::diff_options(k, b, a, out);

            if (out.size() == mark && !same_entry(entry{b}, entry{a}))
                out.push_back({ change_kind::iface_changed, k, "comments", {}, {} });
        }

        for (auto const & k : after_keys)
        {
            if (!before.iface(k))
                out.push_back({ change_kind::iface_added, k, {}, {}, detail::iface_header(*after.iface(k)->node) });
        }

        // Everything else, aligned by content.
        std::vector<entry const *> eb, ea;
        for (auto const & e : before.entries()) if (!std::holds_alternative<iface_stanza>(e)) eb.push_back(&e);
        for (auto const & e : after.entries())  if (!std::holds_alternative<iface_stanza>(e)) ea.push_back(&e);

        auto pairs = detail::lcs_pairs(eb.size(), ea.size(),
            [&](size_t i, size_t j) { return same_entry(*eb[i], *ea[j]); });

        std::vector<bool> kept_b(eb.size(), false), kept_a(ea.size(), false);
        for (auto [i, j] : pairs)
            kept_b[i] = true, kept_a[j] = true;

        for (size_t i = 0; i < eb.size(); ++i)
            if (!kept_b[i])
                out.push_back({ change_kind::entry_removed, std::nullopt, {}, summary(*eb[i]), {} });

        for (size_t j = 0; j < ea.size(); ++j)
            if (!kept_a[j])
                out.push_back({ change_kind::entry_added, std::nullopt, {}, {}, summary(*ea[j]) });

        return out;
    }

    inline std::string describe(change const & c)
    {
        std::string s(detail::change_kind_name(c.kind));

        switch (c.kind)
        {
            case change_kind::iface_added:
            case change_kind::entry_added:
                return s + ": " + c.after;

            case change_kind::iface_removed:
            case change_kind::entry_removed:
                return s + ": " + c.before;

            case change_kind::iface_changed:
                if (c.option == "method")
                    return s + " " + to_string(*c.key) + ": method " + c.before + " -> " + c.after;
                return s + " " + to_string(*c.key) + ": " + c.option;

            case change_kind::option_added:
                return s + " " + to_string(*c.key) + ": " + c.option + " " + c.after;

            case change_kind::option_removed:
                return s + " " + to_string(*c.key) + ": " + c.option + " " + c.before;

            case change_kind::option_changed:
                return s + " " + to_string(*c.key) + ": " + c.option + " " + c.before + " -> " + c.after;
        }
        return s;
    }

} // namespace ifed

#endif // IFED_DIFF_HPP
