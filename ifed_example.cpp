#include "include/ifed.hpp"

#include <iomanip>
#include <iostream>

// Example interfaces file
const char* example_interfaces = R"(# This file describes the network interfaces available on your system
# and how to activate them. For more information, see interfaces(5).

source /etc/network/interfaces.d/*

# The loopback network interface
auto lo
iface lo inet loopback

# The primary network interface
auto eth0
iface eth0 inet static
	address 192.0.2.10/24
	gateway 192.0.2.1	# upstream router
	dns-nameservers 192.0.2.53 192.0.2.54
	up ip route add 198.51.100.0/24 via 192.0.2.254 \
	   dev eth0

iface eth0 inet6 static
	address 2001:db8::10/64

mapping eth1
    script /usr/local/sbin/map-scheme
    map HOME eth1-home
    map WORK eth1-work

iface eth1-home inet dhcp
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

bool show_parsing()
{
    print_separator("1: Parsing");

    auto ctx = ifed::load(example_interfaces);

    if (!ctx.ok())
    {
        std::cout << "✗ Parse failed with errors:\n";
        for (const auto& err : ctx.errors)
            std::cout << "  " << ifed::to_string(err) << "\n";
        return false;
    }

    const ifed::document& doc = *ctx.result;

    std::cout << "✓ Parsed " << doc.entry_count() << " entries, "
              << doc.interfaces().size() << " interfaces\n";

    for (const auto& key : ifed::list_interfaces(doc))
    {
        auto view = doc.iface(key);
        std::cout << "  • " << std::left << std::setw(16) << ifed::to_string(key)
                  << view->method() << ", " << view->options().size() << " options"
                  << " (line " << view->loc().line << ")\n";
    }

    return true;
}

bool show_summary()
{
    print_separator("2: Interface Summary");

    auto ctx = ifed::load(example_interfaces);
    if (!ctx.ok())
        return false;

    for (const auto& [key, s] : ifed::summarise(*ctx.result))
    {
        std::cout << ifed::to_string(key) << " (" << s.method << ")\n";
        for (const auto& [name, value] : s.options)
            std::cout << "    " << std::left << std::setw(18) << name << value << "\n";
        for (const auto& [name, scripts] : s.scripts)
            for (const auto& script : scripts)
                std::cout << "    " << std::left << std::setw(18) << name << script << "\n";
    }

    return true;
}

bool show_round_trip()
{
    print_separator("3: Round Trip");

    auto ctx = ifed::load(example_interfaces);
    if (!ctx.ok())
        return false;

    bool same = ifed::render(*ctx.result) == example_interfaces;
    std::cout << (same ? "✓ Rendering reproduces the input byte for byte\n"
                       : "✗ Rendering differs from the input\n");
    return same;
}

bool show_editing()
{
    print_separator("4: Editing");

    auto ctx = ifed::load(example_interfaces);
    if (!ctx.ok())
        return false;

    const ifed::document& before = *ctx.result;

    ifed::editor ed(before);
    ed.set_option({ "eth0", "inet" }, "address", "192.0.2.11/24");
    ed.set_option({ "eth0", "inet" }, "up", "ip route add 203.0.113.0/24 via 192.0.2.254");
    ed.remove_option({ "eth0", "inet" }, "dns-nameservers");
    ed.ensure_iface("wlan0", "inet", "dhcp");
    ed.set_option("wlan0", "wpa-conf", "/etc/wpa_supplicant/wpa_supplicant.conf");

    auto missing = ed.set_option({ "eth9", "inet" }, "mtu", "1500");
    if (!missing.ok())
        std::cout << "✓ Refused: " << ifed::to_string(*missing.error) << "\n\n";

    for (const auto& c : ifed::diff(before, ed.result()))
        std::cout << "  " << ifed::describe(c) << "\n";

    std::cout << "\n" << ifed::render(ed.result());

    ifed::editor again(ed.result());
    bool stable = !again.set_option({ "eth0", "inet" }, "address", "192.0.2.11/24").changed
               && !again.ensure_iface("wlan0", "inet", "dhcp").changed;

    std::cout << "\n" << (stable ? "✓ Re-applying the edits changes nothing\n"
                                 : "✗ Re-applying the edits changed the document\n");
    return stable;
}

bool show_error_handling()
{
    print_separator("5: Error Handling");

    const char* broken = "auto lo\niface lo inet\n";

    auto ctx = ifed::load(broken);
    if (ctx.ok())
    {
        std::cout << "✗ Malformed input was accepted\n";
        return false;
    }

    for (const auto& err : ctx.errors)
        std::cout << "✓ " << ifed::to_string(err) << "\n";

    return true;
}

int main()
{
    std::cout << R"(
  _  __        _
 (_)/ _| ___  __| |
 | | |_ / _ \/ _` |
 | |  _|  __/ (_| |
 |_|_|  \___|\__,_|

Interfaces Editor - Example
Version 0.1.0
)" << std::endl;

    bool ok = show_parsing();
    ok = show_summary() && ok;
    ok = show_round_trip() && ok;
    ok = show_editing() && ok;
    ok = show_error_handling() && ok;

    print_separator(ok ? "ALL EXAMPLES COMPLETED" : "EXAMPLES FAILED");
    return ok ? 0 : 1;
}
