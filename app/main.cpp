/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <iostream>
#include <string>

#include "commands.hpp"

using namespace tessera;

namespace
{

std::string getUsageString()
{
    return
        "\nUsage: tessera <app> <options>\n"
        "\nApps:\n"
        "\tquery\n"
        "\t\tExtract the points of circular or rectangular regions of\n"
        "\t\tinterest from a catalog, with an optional buffer.\n"
        "\tretile\n"
        "\t\tRewrite a catalog as a regular grid of tiles, or one tile per\n"
        "\t\tinput file, with an optional buffer.\n"
        "\nUse 'tessera <app> --help' for app-specific options.";
}

} // unnamed namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cout << getUsageString() << std::endl;
        return 1;
    }

    const std::string appName(argv[1]);
    app::Args args;
    for (int i(2); i < argc; ++i) args.push_back(argv[i]);

    try
    {
        if (appName == "query") app::Query().go(args);
        else if (appName == "retile") app::Retile().go(args);
        else if (appName == "-h" || appName == "--help")
        {
            std::cout << getUsageString() << std::endl;
        }
        else
        {
            std::cout << "Invalid app name: " << appName << std::endl;
            std::cout << getUsageString() << std::endl;
            return 1;
        }
    }
    catch (const std::exception& e)
    {
        std::cout << "Encountered an error: " << e.what() << std::endl;
        std::cout << "Exiting." << std::endl;
        return 1;
    }

    return 0;
}
