/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#pragma once

#include <cctype>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <tessera/util/json.hpp>

namespace tessera
{
namespace app
{

using Args = std::vector<std::string>;

// Flag-based argument parser.  Each handler receives null for a bare flag,
// a string for a single value, or an array of strings for several values.
class ArgParser
{
public:
    using Handler = std::function<void(json)>;

    void setUsage(std::string usage) { m_usage = usage; }

    void add(std::string flag, std::string description, Handler handler)
    {
        add(flag, "", description, handler);
    }

    void add(
        std::string flag,
        std::string shortFlag,
        std::string description,
        Handler handler)
    {
        m_args.push_back(Arg { flag, shortFlag, description, handler });
    }

    // Returns false if help was requested, in which case usage is printed
    // and no handler runs.
    bool handle(const Args& args)
    {
        for (const std::string& a : args)
        {
            if (a == "-h" || a == "--help")
            {
                printUsage();
                return false;
            }
        }

        std::size_t i(0);
        while (i < args.size())
        {
            const Arg& arg(find(args[i]));
            ++i;

            json value;
            while (i < args.size() && !isFlag(args[i]))
            {
                if (value.is_null()) value = args[i];
                else if (value.is_string())
                {
                    value = json::array({ value, args[i] });
                }
                else value.push_back(args[i]);
                ++i;
            }

            arg.handler(value);
        }

        return true;
    }

    void printUsage() const
    {
        std::cout << m_usage << "\n\nOptions:\n";
        for (const Arg& a : m_args)
        {
            std::cout << "\t" << a.flag;
            if (!a.shortFlag.empty()) std::cout << ", " << a.shortFlag;
            std::cout << "\n\t\t" << a.description << "\n\n";
        }
        std::cout << std::flush;
    }

private:
    struct Arg
    {
        std::string flag;
        std::string shortFlag;
        std::string description;
        Handler handler;
    };

    // Negative numbers are values, not flags.
    static bool isFlag(const std::string& s)
    {
        if (s.size() < 2 || s[0] != '-') return false;
        return !(std::isdigit(static_cast<unsigned char>(s[1])) || s[1] == '.');
    }

    const Arg& find(const std::string& flag) const
    {
        for (const Arg& a : m_args)
        {
            if (a.flag == flag || (!a.shortFlag.empty() && a.shortFlag == flag))
            {
                return a;
            }
        }
        throw std::runtime_error("Invalid argument: " + flag);
    }

    std::string m_usage;
    std::vector<Arg> m_args;
};

} // namespace app
} // namespace tessera
