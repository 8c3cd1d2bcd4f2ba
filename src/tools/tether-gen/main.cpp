//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point for tether-gen. Parsing and the pipeline live in cli.cpp so the
// driver tests can call them without spawning a process.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

int main(int argc, char **argv)
{
    using namespace tether::tools;

    CliOptions opts;
    if (parseCli(argc, argv, opts, std::cerr) != CliParseResult::Ok)
    {
        usage(std::cerr);
        return kExitDiagnostics;
    }
    if (opts.showHelp)
    {
        usage(std::cout);
        return kExitOk;
    }
    if (opts.showVersion)
    {
        printVersion(std::cout);
        return kExitOk;
    }
    if (const char *env = std::getenv("TETHER_GEN_TRACE"))
    {
        if (*env != '\0' && std::string_view(env) != "0")
            opts.trace = true;
    }
    return runGenerator(opts, std::cout, std::cerr);
}
