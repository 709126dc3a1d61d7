// ifed_tool.cpp - Interfaces Editor (ifed) - Command line editor
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#include "../include/ifed.hpp"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace po = boost::program_options;

namespace
{
    struct file_error
    {
        std::string message;
    };

    std::string errno_text(std::string const & what, std::string const & path)
    {
        return what + " " + path + ": " + std::strerror(errno);
    }

    std::optional<file_error> read_file(std::string const & path, std::string & out)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            return file_error{ errno_text("cannot open", path) };

        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            return file_error{ errno_text("cannot read", path) };

        out = ss.str();
        return std::nullopt;
    }

    // Copies the file to <path>.<timestamp>~ and reports the backup name.
    std::optional<file_error> backup_file(std::string const & path, std::string const & text, std::string & backup)
    {
        std::time_t now = std::time(nullptr);
        std::tm local {};
        localtime_r(&now, &local);

        std::ostringstream name;
        name << path << '.' << ::getpid() << '.' << std::put_time(&local, "%Y-%m-%d@%H:%M:%S") << '~';
        backup = name.str();

        std::ofstream out(backup, std::ios::binary | std::ios::trunc);
        if (!out || !out.write(text.data(), static_cast<std::streamsize>(text.size())) || !out.flush())
            return file_error{ errno_text("cannot write backup", backup) };

        return std::nullopt;
    }

    // Writes next to the destination and renames over it, keeping the
    // destination's permission bits.
    std::optional<file_error> write_atomically(std::string const & path, std::string const & text)
    {
        std::string tmp = path + ".ifed-XXXXXX";
        int fd = ::mkstemp(tmp.data());
        if (fd < 0)
            return file_error{ errno_text("cannot create temporary file for", path) };

        auto fail = [&](std::string const & what)
        {
            file_error err{ errno_text(what, tmp) };
            ::close(fd);
            ::unlink(tmp.c_str());
            return err;
        };

        struct stat st {};
        if (::stat(path.c_str(), &st) == 0 && ::fchmod(fd, st.st_mode & 07777) != 0)
            return fail("cannot set permissions of");

        size_t done = 0;
        while (done < text.size())
        {
            ssize_t n = ::write(fd, text.data() + done, text.size() - done);
            if (n < 0)
            {
                if (errno == EINTR) continue;
                return fail("cannot write");
            }
            done += static_cast<size_t>(n);
        }

        if (::fsync(fd) != 0)
            return fail("cannot sync");

        if (::close(fd) != 0)
        {
            file_error err{ errno_text("cannot close", tmp) };
            ::unlink(tmp.c_str());
            return err;
        }

        if (std::rename(tmp.c_str(), path.c_str()) != 0)
        {
            file_error err{ errno_text("cannot replace", path) };
            ::unlink(tmp.c_str());
            return err;
        }

        return std::nullopt;
    }

    ifed::interface_selector make_target(std::string const & iface, po::variables_map const & config)
    {
        if (config.count("address-family"))
            return { iface, config["address-family"].as<std::string>() };
        return { iface };
    }

    void print_interfaces(ifed::document const & doc)
    {
        for (auto const & [key, s] : ifed::summarise(doc))
        {
            std::cout << ifed::to_string(key) << ' ' << s.method << '\n';
            for (auto const & [name, value] : s.options)
                std::cout << "    " << name << ' ' << value << '\n';
            for (auto const & [name, scripts] : s.scripts)
                for (auto const & script : scripts)
                    std::cout << "    " << name << ' ' << script << '\n';
        }
    }
}

int main(int argc, char* argv[])
{
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("dest", po::value<std::string>()->default_value("/etc/network/interfaces"), "the interfaces file to edit")
        ("iface", po::value<std::string>(), "name of the interface to edit")
        ("address-family", po::value<std::string>(), "address family of the interface (inet, inet6, ...)")
        ("method", po::value<std::string>(), "method for a new or existing iface block")
        ("option", po::value<std::string>(), "option to set or remove; 'method' changes the iface method")
        ("value", po::value<std::string>(), "value of the option")
        ("append", "add the option even when the key already exists")
        ("state", po::value<std::string>()->default_value("present"), "present or absent")
        ("backup", "keep a timestamped copy of the original file")
        ("check", "report what would change without writing")
        ("diff", "print the list of changes")
        ("list", "print the interfaces after editing")
    ;

    po::variables_map config;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), config);
        po::notify(config);
    }
    catch (po::error const & e)
    {
        std::cerr << "ifed-tool: " << e.what() << "\n" << desc << "\n";
        return 2;
    }

    if (config.count("help"))
    {
        std::cerr << desc << "\n";
        return 1;
    }

    std::string dest  = config["dest"].as<std::string>();
    std::string state = config["state"].as<std::string>();

    if (state != "present" && state != "absent")
    {
        std::cerr << "ifed-tool: unsupported state " << state << ", has to be either present or absent\n";
        return 2;
    }
    if (config.count("option") && !config.count("iface"))
    {
        std::cerr << "ifed-tool: --option requires --iface\n";
        return 2;
    }
    if (config.count("option") && state == "present" && !config.count("value"))
    {
        std::cerr << "ifed-tool: --value must be set if --option is given and state is present\n";
        return 2;
    }

    std::vector<ifed::operation> ops;

    if (config.count("iface"))
    {
        std::string iface = config["iface"].as<std::string>();
        auto target = make_target(iface, config);

        if (config.count("option"))
        {
            std::string option = config["option"].as<std::string>();

            if (state == "present")
            {
                std::optional<bool> all_matches;
                if (config.count("append"))
                    all_matches = true;
                ops.push_back(ifed::op::set_option{ target, option, config["value"].as<std::string>(), all_matches });
            }
            else
            {
                std::optional<std::string> value;
                if (config.count("value"))
                    value = config["value"].as<std::string>();
                ops.push_back(ifed::op::remove_option{ target, option, value });
            }
        }
        else if (state == "absent")
        {
            ops.push_back(ifed::op::remove_iface{ target });
        }
        else if (config.count("method"))
        {
            if (!target.family)
            {
                std::cerr << "ifed-tool: --method requires --address-family\n";
                return 2;
            }
            ops.push_back(ifed::op::ensure_iface{ iface, *target.family, config["method"].as<std::string>() });
        }
    }

    std::string text;
    if (auto err = read_file(dest, text))
    {
        std::cerr << "ifed-tool: " << err->message << "\n";
        return 1;
    }

    auto out = ifed::edit_text(text, ops);

    for (auto const & w : out.warnings)
        std::cerr << dest << ": warning: " << ifed::to_string(w) << "\n";

    if (!out.ok())
    {
        for (auto const & e : out.errors)
            std::cerr << dest << ": " << ifed::to_string(e) << "\n";
        return 1;
    }

    if (config.count("diff"))
        for (auto const & c : out.changes)
            std::cout << ifed::describe(c) << "\n";

    if (out.changed && !config.count("check"))
    {
        if (config.count("backup"))
        {
            std::string backup;
            if (auto err = backup_file(dest, text, backup))
            {
                std::cerr << "ifed-tool: " << err->message << "\n";
                return 1;
            }
            std::cout << "backup: " << backup << "\n";
        }

        if (auto err = write_atomically(dest, out.text))
        {
            std::cerr << "ifed-tool: " << err->message << "\n";
            return 1;
        }
    }

    if (config.count("list"))
    {
        auto ctx = ifed::load(out.text);
        if (ctx.ok())
            print_interfaces(*ctx.result);
    }

    std::cout << "changed: " << (out.changed ? "true" : "false") << "\n";
    return 0;
}
