#ifndef IFED_TESTS_INTEGRATION__
#define IFED_TESTS_INTEGRATION__

#include "ifed_test_harness.hpp"
#include "../include/ifed.hpp"

#include <atomic>
#include <thread>

namespace ifed::tests
{
using namespace ifed;

    constexpr std::string_view server_src =
        "# Managed by hand. Edits below keep this layout.\n"
        "source /etc/network/interfaces.d/*\n"
        "\n"
        "auto lo\n"
        "iface lo inet loopback\n"
        "\n"
        "auto eth0\n"
        "allow-hotplug eth1\n"
        "iface eth0 inet static\n"
        "\taddress 192.0.2.10/24\n"
        "\tgateway 192.0.2.1   # upstream\n"
        "\tdns-nameservers 192.0.2.53\n"
        "\tup ip route add 198.51.100.0/24 via 192.0.2.254 \\\n"
        "\t   dev eth0\n"
        "\n"
        "iface eth0 inet6 static\n"
        "\taddress 2001:db8::10/64\n"
        "\n"
        "# spare port\n"
        "iface eth1 inet manual\n";

    // Edits the text, then edits the written result again. The written text
    // must read back as the edited document and the second pass must find
    // nothing left to do.
    inline bool settles_in_one_pass(std::string_view text, std::vector<operation> const & ops)
    {
        auto first = edit_text(text, ops);
        if (!first.ok() || !first.changed)
            return false;

        auto source = parse(text);
        auto edited = apply_all(*source.result, ops);
        auto reread = parse(first.text);
        if (!reread.ok() || !equivalent(*reread.result, edited.result))
            return false;

        auto second = edit_text(first.text, ops);
        return second.ok() && !second.changed && second.text == first.text;
    }

static bool edit_text_applies_batch()
{
    std::vector<operation> ops
    {
        op::set_option{ { "eth0", "inet" }, "address", "192.0.2.11/24", std::nullopt },
        op::remove_option{ { "eth0", "inet" }, "dns-nameservers", std::nullopt },
        op::set_method{ "eth1", "dhcp" },
        op::ensure_iface{ "br0", "inet", "manual" },
        op::set_option{ { "br0", "inet" }, "bridge_ports", "eth1", std::nullopt }
    };

    auto out = edit_text(server_src, ops);
    EXPECT(out.ok(), "batch failed");
    EXPECT(out.changed, "batch should change the file");

    EXPECT(out.text ==
        "# Managed by hand. Edits below keep this layout.\n"
        "source /etc/network/interfaces.d/*\n"
        "\n"
        "auto lo\n"
        "iface lo inet loopback\n"
        "\n"
        "auto eth0\n"
        "allow-hotplug eth1\n"
        "iface eth0 inet static\n"
        "\taddress 192.0.2.11/24\n"
        "\tgateway 192.0.2.1   # upstream\n"
        "\tup ip route add 198.51.100.0/24 via 192.0.2.254 \\\n"
        "\t   dev eth0\n"
        "\n"
        "iface eth0 inet6 static\n"
        "\taddress 2001:db8::10/64\n"
        "\n"
        "# spare port\n"
        "iface eth1 inet dhcp\n"
        "\n"
        "iface br0 inet manual\n"
        "    bridge_ports eth1\n",
        "edited text incorrect");

    EXPECT(out.changes.size() == 5, "change list incorrect");

    auto again = edit_text(out.text, ops);
    EXPECT(again.ok() && !again.changed, "re-applying the batch should be a no-op");
    EXPECT(again.text == out.text, "no-op batch altered the text");
    EXPECT(again.changes.empty(), "no-op batch reported changes");

    return true;
}

static bool edit_text_unchanged_input()
{
    std::vector<operation> ops
    {
        op::set_option{ { "eth0", "inet" }, "gateway", "192.0.2.1", std::nullopt },
        op::remove_option{ "eth1", "mtu", std::nullopt }
    };

    auto out = edit_text(server_src, ops);
    EXPECT(out.ok(), "batch failed");
    EXPECT(!out.changed, "nothing should change");
    EXPECT(out.text == server_src, "text should be returned as is");

    return true;
}

static bool edit_text_reports_parse_error()
{
    std::vector<operation> ops { op::ensure_iface{ "eth0", "inet", "dhcp" } };

    auto out = edit_text("auto lo\niface lo\n", ops);
    EXPECT(!out.ok(), "malformed input should fail");
    EXPECT(out.errors.size() == 1 && is_parse_error(out.errors[0]), "parse error expected");
    EXPECT(to_string(out.errors[0]) == "line 2: expected address family", "error text incorrect");
    EXPECT(out.text == "auto lo\niface lo\n" && !out.changed, "failed input must be returned as is");

    return true;
}

static bool written_edits_settle_in_one_pass()
{
    std::vector<operation> server_ops
    {
        op::set_option{ { "eth0", "inet" }, "address", "192.0.2.11/24", std::nullopt },
        op::set_option{ { "eth0", "inet" }, "up", "ip link set eth0 mtu 9000", std::nullopt },
        op::remove_option{ { "eth0", "inet" }, "gateway", std::nullopt },
        op::set_method{ "eth1", "static" },
        op::set_option{ "eth1", "address", "198.51.100.2/24", std::nullopt },
        op::ensure_iface{ "br0", "inet", "manual" },
        op::set_option{ { "br0", "inet" }, "bridge_ports", "eth0 eth1", std::nullopt }
    };
    EXPECT(settles_in_one_pass(server_src, server_ops), "server batch did not settle");

    std::vector<operation> new_block
    {
        op::ensure_iface{ "eth0", "inet", "dhcp" },
        op::set_option{ "eth0", "hwaddress", "ether#1", std::nullopt }
    };
    EXPECT(settles_in_one_pass("auto eth0", new_block), "new block did not settle");

    return true;
}

static bool edits_after_dangling_continuation()
{
    std::vector<operation> add_mtu { op::set_option{ "eth0", "mtu", "9000", std::nullopt } };
    std::vector<operation> add_eth1 { op::ensure_iface{ "eth1", "inet", "dhcp" } };
    std::vector<operation> add_eth0 { op::ensure_iface{ "eth0", "inet", "dhcp" } };

    EXPECT(settles_in_one_pass("iface eth0 inet static\n  up echo b \\\n", add_mtu), "option after continuation");
    EXPECT(settles_in_one_pass("iface eth0 inet static\n  up echo b \\", add_mtu), "option after unterminated continuation");
    EXPECT(settles_in_one_pass("auto eth0\niface eth0 inet dhcp\n  up echo b \\\n", add_eth1), "block after continued option");
    EXPECT(settles_in_one_pass("mapping eth0\n    script /usr/local/sbin/map \\\n", add_eth0), "block after continued mapping");
    EXPECT(settles_in_one_pass("auto eth0 \\\n", add_eth0), "block after continued stanza");

    auto out = edit_text("auto eth0\niface eth0 inet dhcp\n  up echo b \\\n", add_eth1);
    EXPECT(out.text == "auto eth0\niface eth0 inet dhcp\n  up echo b \\\n\n\niface eth1 inet dhcp\n", "separator absorbed by continuation");

    return true;
}

static bool rejected_edits_leave_text_alone()
{
    constexpr std::string_view src = "iface eth0 inet static\n    address 10.0.0.1\n    netmask 255.0.0.0\n";

    std::vector<std::vector<operation>> batches
    {
        { op::set_option{ { "eth0", "inet" }, "address", "foo\\", std::nullopt } },
        { op::set_option{ { "eth0", "inet" }, "address", "a #b", std::nullopt } },
        { op::set_option{ { "eth0", "inet" }, "#x", "1", std::nullopt } },
        { op::set_option{ { "eth0", "inet" }, "auto", "eth1", std::nullopt } }
    };

    for (auto const & ops : batches)
    {
        auto out = edit_text(src, ops);
        EXPECT(!out.ok() && is_mutation_error(out.errors.front()), "edit that cannot be read back was accepted");
        EXPECT(!out.changed && out.text == src, "rejected edit altered the text");
    }

    return true;
}

static bool large_document_diff()
{
    constexpr size_t notes = 20000;

    std::string body;
    for (size_t i = 0; i < notes; ++i)
        body += "# note " + std::to_string(i) + "\n";

    std::string src = "iface eth0 inet dhcp\n\n" + body + "auto eth0\n";

    // Edits at both ends leave no common prefix or suffix to trim.
    std::vector<operation> ops
    {
        op::remove_iface{ { "eth0", "inet" } },
        op::ensure_iface{ "eth1", "inet", "dhcp" }
    };

    auto out = edit_text(src, ops);
    EXPECT(out.ok() && out.changed, "edit failed");
    EXPECT(out.text == body + "auto eth0\n\niface eth1 inet dhcp\n", "edited text incorrect");

    auto count = [&](change_kind k)
    {
        return std::ranges::count_if(out.changes, [k](change const & c) { return c.kind == k; });
    };

    EXPECT(out.changes.size() == 4, "change list incorrect");
    EXPECT(count(change_kind::iface_removed) == 1 && count(change_kind::iface_added) == 1, "iface changes incorrect");
    EXPECT(count(change_kind::entry_removed) == 1 && count(change_kind::entry_added) == 1, "separator changes incorrect");

    return true;
}

static bool batch_policies()
{
    std::vector<operation> ops
    {
        op::set_option{ { "eth0", "inet" }, "mtu", "1500", std::nullopt },
        op::set_option{ { "eth9", "inet" }, "mtu", "1500", std::nullopt },
        op::set_option{ { "eth1", "inet" }, "mtu", "1500", std::nullopt }
    };

    auto doc = parse(server_src).result.value();

    auto aborted = apply_all(doc, ops, batch_policy::abort_on_error);
    EXPECT(!aborted.ok() && aborted.errors.size() == 1, "abort should stop at the first error");
    EXPECT(!aborted.changed && aborted.applied == 0, "abort should discard the batch");
    EXPECT(render(aborted.result) == server_src, "aborted batch left traces");

    auto continued = apply_all(doc, ops, batch_policy::continue_on_error);
    EXPECT(continued.errors.size() == 1, "one failure expected");
    EXPECT(continued.errors[0].kind == mutation_error_kind::target_not_found, "wrong failure");
    EXPECT(continued.changed && continued.applied == 2, "the other edits should apply");
    EXPECT(summarise(continued.result).at({ "eth1", "inet" }).options.at("mtu") == "1500", "eth1 not edited");

    auto text = edit_text(server_src, ops, batch_policy::continue_on_error);
    EXPECT(text.changed && text.errors.size() == 1 && is_mutation_error(text.errors[0]), "text batch results incorrect");

    return true;
}

static bool duplicate_declarations_warn()
{
    constexpr std::string_view src =
        "iface eth0 inet dhcp\n"
        "\n"
        "iface eth0 inet static\n"
        "\n"
        "iface eth1 inet dhcp\n";

    std::vector<operation> edit_other { op::set_option{ "eth1", "mtu", "1500", std::nullopt } };

    auto out = edit_text(src, edit_other);
    EXPECT(out.ok() && out.changed, "unrelated interfaces stay editable");
    EXPECT(out.warnings.size() == 1, "duplicate should be reported");
    EXPECT(out.warnings[0].kind == parse_error_kind::ambiguous_interface, "wrong warning");

    std::vector<operation> edit_dup { op::set_option{ { "eth0", "inet" }, "mtu", "1500", std::nullopt } };

    auto refused = edit_text(src, edit_dup);
    EXPECT(!refused.ok() && !refused.changed, "duplicated interface must be refused");
    EXPECT(refused.text == src, "refused edit altered the text");

    return true;
}

static bool concurrent_readers()
{
    auto doc = parse(server_src).result.value();
    document const & shared = doc;

    std::atomic<int> failures { 0 };
    std::vector<std::thread> workers;

    for (int t = 0; t < 4; ++t)
    {
        workers.emplace_back([&shared, &failures, t]
        {
            for (int i = 0; i < 50; ++i)
            {
                if (render(shared) != server_src)
                    ++failures;

                auto r = apply(shared, op::set_option{ { "eth1", "inet" }, "mtu", std::to_string(1400 + t), std::nullopt });
                if (!r.changed || r.result.iface({ "eth1", "inet" })->option_values("mtu").size() != 1)
                    ++failures;

                if (!shared.iface({ "eth0", "inet6" }).has_value())
                    ++failures;
            }
        });
    }

    for (auto & w : workers)
        w.join();

    EXPECT(failures == 0, "concurrent readers saw inconsistent state");
    EXPECT(render(doc) == server_src, "shared document was modified");

    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_integration_tests()
{
    SUBCAT("Text workflow");
    RUN_TEST(edit_text_applies_batch);
    RUN_TEST(edit_text_unchanged_input);
    RUN_TEST(edit_text_reports_parse_error);
    RUN_TEST(written_edits_settle_in_one_pass);
    RUN_TEST(edits_after_dangling_continuation);
    RUN_TEST(rejected_edits_leave_text_alone);
    RUN_TEST(large_document_diff);

    SUBCAT("Batches");
    RUN_TEST(batch_policies);
    RUN_TEST(duplicate_declarations_warn);

    SUBCAT("Snapshots");
    RUN_TEST(concurrent_readers);
}

}

#endif
