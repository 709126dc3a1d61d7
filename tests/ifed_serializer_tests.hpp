#ifndef IFED_TESTS_SERIALIZER__
#define IFED_TESTS_SERIALIZER__

#include "ifed_test_harness.hpp"
#include "../include/ifed.hpp"

#include <sstream>

namespace ifed::tests
{
using namespace ifed;

    inline bool round_trips(std::string_view src)
    {
        auto ctx = parse(src);
        return ctx.ok() && render(*ctx.result) == src;
    }

//============================================================================
// Round trip
//============================================================================

static bool round_trip_debian_default()
{
    constexpr std::string_view src =
        "# This file describes the network interfaces available on your system\n"
        "# and how to activate them. For more information, see interfaces(5).\n"
        "\n"
        "source /etc/network/interfaces.d/*\n"
        "\n"
        "# The loopback network interface\n"
        "auto lo\n"
        "iface lo inet loopback\n"
        "\n"
        "# The primary network interface\n"
        "allow-hotplug eth0\n"
        "iface eth0 inet dhcp\n";

    EXPECT(round_trips(src), "default file does not round trip");
    return true;
}

static bool round_trip_irregular_whitespace()
{
    constexpr std::string_view src =
        "auto  lo   eth0\t\n"
        "iface lo inet loopback\n"
        "   \n"
        "iface eth0   inet\tstatic\n"
        "\taddress   192.0.2.10\n"
        "        netmask 255.255.255.0\n"
        "  \t gateway 192.0.2.1    \n"
        "dns-search example.org\n";

    EXPECT(round_trips(src), "irregular whitespace lost");
    return true;
}

static bool round_trip_comments_everywhere()
{
    constexpr std::string_view src =
        "#!header\n"
        "! bang comment\n"
        "iface eth0 inet static  # trailing on header\n"
        "    # before address\n"
        "    address 10.0.0.1 # trailing on option\n"
        "    # after the last option\n"
        "\n"
        "    # indented, at top level\n"
        "auto eth0\n"
        "# at the end";

    EXPECT(round_trips(src), "comments moved or lost");
    return true;
}

static bool round_trip_line_endings()
{
    EXPECT(round_trips("auto lo\r\niface lo inet loopback\r\n\r\niface eth0 inet dhcp\r\n"), "crlf lost");
    EXPECT(round_trips("auto lo\niface lo inet loopback\r\n  mtu 1500"), "mixed endings lost");
    EXPECT(round_trips("iface eth0 inet dhcp"), "missing final newline added");
    EXPECT(round_trips("\n\n\n"), "blank-only file altered");
    EXPECT(round_trips(""), "empty file altered");

    return true;
}

static bool round_trip_continuations()
{
    constexpr std::string_view src =
        "auto eth0 \\\n"
        "     eth1\n"
        "iface eth0 inet static\n"
        "    address 10.0.0.1\n"
        "    up ip route add 10.1.0.0/16 \\\n"
        "       via 10.0.0.254 \\\n"
        "       dev eth0\n"
        "    down echo done\\\\\n";

    EXPECT(round_trips(src), "continuations lost");

    auto ctx = parse(src);
    auto ups = ctx.result->iface({ "eth0", "inet" })->option_values("up");
    EXPECT(ups.size() == 1, "continued directive split");
    EXPECT(ups[0] == "ip route add 10.1.0.0/16        via 10.0.0.254        dev eth0", "continued value incorrect");

    return true;
}

static bool round_trip_other_stanzas()
{
    constexpr std::string_view src =
        "source-directory   /etc/network/interfaces.d\n"
        "source-dir extra.d\n"
        "source  /etc/network/*.cfg\n"
        "no-auto-down eth0\n"
        "no-scripts wlan0 wlan1\n"
        "allow-ovs br0\n"
        "\n"
        "mapping eth*\n"
        "  script /usr/local/sbin/map-scheme\n"
        "  # per site\n"
        "  map HOME eth0-home\n"
        "\tmap WORK   eth0-work\n"
        "\n"
        "iface eth0-home inet dhcp\n"
        "iface ipx0 ipx static\n"
        "iface can0 can static\n"
        "    bitrate 125000\n";

    EXPECT(round_trips(src), "non-iface stanzas lost");
    return true;
}

//============================================================================
// Rendering of edited and generated content
//============================================================================

static bool renders_generated_mapping()
{
    mapping_stanza m;
    m.pattern  = "eth*";
    m.script   = "/usr/local/sbin/map-scheme";
    m.mappings = { { "HOME", "eth0-home" }, { "WORK", "eth0-work" } };

    document doc(std::vector<entry>{ m });

    EXPECT(render(doc) ==
        "mapping eth*\n"
        "    script /usr/local/sbin/map-scheme\n"
        "    map HOME eth0-home\n"
        "    map WORK eth0-work\n",
        "generated mapping incorrect");

    return true;
}

static bool renders_generated_stanzas()
{
    source_stanza s;
    s.pattern = "/etc/network/interfaces.d/*";

    allow_stanza a;
    a.trigger    = "hotplug";
    a.interfaces = { "eth0", "eth1" };

    directive_stanza d;
    d.kind       = directive_kind::no_auto_down;
    d.interfaces = { "eth0" };

    comment c;
    c.marker = '#';
    c.text   = " managed";

    document doc({ c, s, blank_line{}, a, d });

    EXPECT(render(doc) ==
        "# managed\n"
        "source /etc/network/interfaces.d/*\n"
        "\n"
        "allow-hotplug eth0 eth1\n"
        "no-auto-down eth0\n",
        "generated stanzas incorrect");

    return true;
}

static bool breaks_unterminated_line_before_new_content()
{
    auto ctx = parse("auto lo");
    EXPECT(ctx.ok(), "parse failed");

    editor ed(*ctx.result);
    ed.ensure_iface("eth0", "inet", "dhcp");

    EXPECT(render(ed.result()) == "auto lo\n\niface eth0 inet dhcp\n", "new content joined to the last line");
    return true;
}

static bool closes_dangling_continuation()
{
    // The last line of each input ends in a continuation with nothing to join.
    std::string_view const inputs[] =
    {
        "iface eth0 inet static\n  up echo b \\\n",
        "iface eth0 inet static\n  up echo b \\"
    };

    for (auto src : inputs)
    {
        auto ctx = parse(src);
        EXPECT(ctx.ok(), "parse failed");
        EXPECT(render(*ctx.result) == src, "unedited input must render verbatim");

        editor ed(*ctx.result);
        ed.set_option("eth0", "mtu", "9000");

        std::string text = render(ed.result());
        EXPECT(text == "iface eth0 inet static\n  up echo b \\\n\n  mtu 9000\n", "new line joined to the continuation");

        auto back = parse(text);
        EXPECT(back.ok(), "rendered text does not parse");

        auto view = back.result->iface({ "eth0", "inet" });
        EXPECT(view && view->options().size() == 2, "options merged on re-parse");
        EXPECT(view->option_values("up") == std::vector<std::string>{ "echo b" }, "continued option altered");
        EXPECT(view->option_values("mtu") == std::vector<std::string>{ "9000" }, "new option lost");
    }

    return true;
}

static bool closes_dangling_continuation_with_crlf()
{
    auto ctx = parse("iface eth0 inet static\r\n  up echo b \\\r\n");
    EXPECT(ctx.ok(), "parse failed");

    editor ed(*ctx.result);
    ed.set_option("eth0", "mtu", "9000");

    EXPECT(render(ed.result()) == "iface eth0 inet static\r\n  up echo b \\\r\n\r\n  mtu 9000\r\n", "crlf continuation not closed");
    return true;
}

static bool comment_backslash_is_not_a_continuation()
{
    auto ctx = parse("iface eth0 inet dhcp\n\n# end \\\n");
    EXPECT(ctx.ok(), "parse failed");

    editor ed(*ctx.result);
    ed.ensure_iface("eth1", "inet", "dhcp");

    EXPECT(render(ed.result()) == "iface eth0 inet dhcp\n\n# end \\\n\niface eth1 inet dhcp\n", "comment line was treated as continued");
    return true;
}

static bool writes_to_stream()
{
    constexpr std::string_view src = "auto lo\niface lo inet loopback\n";
    auto ctx = parse(src);

    std::ostringstream out;
    serializer s(*ctx.result);
    s.write(out);
    s.write(out);

    EXPECT(out.str() == std::string(src) + std::string(src), "stream output incorrect");
    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_serializer_tests()
{
    SUBCAT("Round trip");
    RUN_TEST(round_trip_debian_default);
    RUN_TEST(round_trip_irregular_whitespace);
    RUN_TEST(round_trip_comments_everywhere);
    RUN_TEST(round_trip_line_endings);
    RUN_TEST(round_trip_continuations);
    RUN_TEST(round_trip_other_stanzas);

    SUBCAT("Generated content");
    RUN_TEST(renders_generated_mapping);
    RUN_TEST(renders_generated_stanzas);
    RUN_TEST(breaks_unterminated_line_before_new_content);
    RUN_TEST(closes_dangling_continuation);
    RUN_TEST(closes_dangling_continuation_with_crlf);
    RUN_TEST(comment_backslash_is_not_a_continuation);
    RUN_TEST(writes_to_stream);
}

}

#endif
