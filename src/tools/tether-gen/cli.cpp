//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements command-line parsing and the generation pipeline for tether-gen.
// The pipeline runs in stages: read the manifest, parse it, build and plan each
// function, then emit the header/source pair. Every stage reports into one
// DiagnosticEngine; files are written only when it holds no errors.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "bind/EmitCommon.hpp"
#include "bind/Emitter.hpp"
#include "bind/GenerationPlan.hpp"
#include "bind/Signature.hpp"
#include "frontend/ManifestParser.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "tether/version.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace tether::tools
{
namespace
{

constexpr std::string_view kManifestExtension = ".tether";

/// @brief Fetch the value of an option that takes an argument.
bool takeValue(int &index, int argc, char **argv, std::string &out, std::ostream &err)
{
    if (index + 1 >= argc)
    {
        err << "tether-gen: option '" << argv[index] << "' requires a value\n";
        return false;
    }
    out = argv[++index];
    return true;
}

bool readFile(const std::string &path, std::string &text)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    text = buffer.str();
    return !in.bad();
}

bool writeFile(const std::string &path, const std::string &text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return false;
    out << text;
    out.flush();
    return static_cast<bool>(out);
}

/// @brief Claim every C++ symbol emitted for @p name.
/// @return The owner of the first taken symbol, or nullopt when all were free.
///         An empty owner denotes the binding table.
std::optional<std::string> claimSymbols(const std::string &name,
                                        std::unordered_map<std::string, std::string> &owners,
                                        std::string &clash)
{
    const bind::BindingSymbols symbols = bind::symbolsFor(name);
    const std::string *all[] = {&symbols.native,
                                &symbols.callback,
                                &symbols.fast,
                                &symbols.fastArgs,
                                &symbols.fastInfo,
                                &symbols.fastCall,
                                &symbols.templ};
    for (const std::string *symbol : all)
    {
        auto it = owners.find(*symbol);
        if (it != owners.end())
        {
            clash = *symbol;
            return it->second;
        }
    }
    for (const std::string *symbol : all)
        owners.emplace(*symbol, name);
    return std::nullopt;
}

/// @brief Plan every declared function, skipping those with errors.
std::vector<bind::GenerationPlan> planManifest(const frontend::Manifest &manifest,
                                               const std::string &tableName,
                                               support::DiagnosticEngine &diags,
                                               std::ostream *trace)
{
    std::vector<bind::GenerationPlan> plans;
    std::unordered_set<std::string> nativeNames;
    std::unordered_set<std::string> scriptNames;
    std::unordered_map<std::string, std::string> symbolOwners{{tableName, std::string()}};
    bind::PlannerOptions plannerOptions;
    plannerOptions.trace = trace;

    for (const auto &decl : manifest.functions)
    {
        if (!nativeNames.insert(decl.name).second)
        {
            diags.report(support::makeConfigError(decl.loc,
                                                  "duplicate function '" + decl.name + "'"));
            continue;
        }

        std::string clash;
        const auto owner = claimSymbols(decl.name, symbolOwners, clash);
        if (owner)
        {
            const std::string what =
                owner->empty() ? "the binding table" : "function '" + *owner + "'";
            diags.report(support::makeConfigError(
                decl.loc,
                "function '" + decl.name + "' generates symbol '" + clash +
                    "', which is already used by " + what));
            continue;
        }

        auto sig = bind::buildSignature(decl, diags);
        if (!sig)
        {
            diags.report(sig.error());
            continue;
        }
        if (!scriptNames.insert(sig.value().scriptName).second)
        {
            diags.report(support::makeConfigError(
                decl.loc, "script name '" + sig.value().scriptName + "' is already bound"));
            continue;
        }

        auto plan = bind::planFunction(sig.value(), diags, plannerOptions);
        if (!plan)
        {
            diags.report(plan.error());
            continue;
        }
        plans.push_back(std::move(plan.value()));
    }
    return plans;
}

} // namespace

std::string defaultStem(const std::string &input)
{
    if (input.size() > kManifestExtension.size() &&
        std::string_view(input).substr(input.size() - kManifestExtension.size()) ==
            kManifestExtension)
    {
        return input.substr(0, input.size() - kManifestExtension.size());
    }
    return input;
}

std::string namespaceFromStem(const std::string &path)
{
    std::string stem = std::filesystem::path(path).stem().string();
    if (stem.empty())
        return "bindings";
    for (char &ch : stem)
    {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_')
            ch = '_';
    }
    if (std::isdigit(static_cast<unsigned char>(stem.front())))
        stem.insert(stem.begin(), '_');
    return stem;
}

CliParseResult parseCli(int argc, char **argv, CliOptions &opts, std::ostream &err)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "-o")
        {
            if (!takeValue(i, argc, argv, opts.outStem, err))
                return CliParseResult::Error;
        }
        else if (arg == "--namespace")
        {
            std::string ns;
            if (!takeValue(i, argc, argv, ns, err))
                return CliParseResult::Error;
            opts.cppNamespace = std::move(ns);
        }
        else if (arg == "--plan")
        {
            opts.printPlan = true;
        }
        else if (arg == "--trace")
        {
            opts.trace = true;
        }
        else if (arg == "--werror")
        {
            opts.werror = true;
        }
        else if (arg == "--version")
        {
            opts.showVersion = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            opts.showHelp = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            err << "tether-gen: unknown option '" << arg << "'\n";
            return CliParseResult::Error;
        }
        else if (opts.input.empty())
        {
            opts.input = arg;
        }
        else
        {
            err << "tether-gen: unexpected argument '" << arg << "'\n";
            return CliParseResult::Error;
        }
    }

    if (opts.showHelp || opts.showVersion)
        return CliParseResult::Ok;
    if (opts.input.empty())
    {
        err << "tether-gen: no input manifest\n";
        return CliParseResult::Error;
    }
    if (opts.outStem.empty())
        opts.outStem = defaultStem(opts.input);
    return CliParseResult::Ok;
}

int runGenerator(const CliOptions &opts, std::ostream &out, std::ostream &err)
{
    std::string text;
    if (!readFile(opts.input, text))
    {
        err << "tether-gen: cannot read '" << opts.input << "'\n";
        return kExitIo;
    }

    support::SourceManager sm;
    const uint32_t fileId = sm.addFile(opts.input);
    support::DiagnosticEngine diags;
    if (opts.werror)
        diags.promoteWarningsToErrors();

    const frontend::Manifest manifest = frontend::parseManifest(text, fileId, diags);
    if (opts.trace)
        err << "[gen] parsed " << manifest.functions.size() << " function(s) from "
            << opts.input << '\n';

    bind::BindingModule module;
    module.moduleName = namespaceFromStem(opts.input);
    module.sourceName = std::filesystem::path(opts.input).filename().string();
    module.cppNamespace =
        opts.cppNamespace.value_or(manifest.cppNamespace.value_or(module.moduleName));
    module.includes = manifest.includes;
    module.plans = planManifest(manifest,
                                bind::bindingTableName(module.moduleName),
                                diags,
                                opts.trace ? &err : nullptr);

    diags.printAll(err, &sm);
    if (diags.errorCount() > 0)
        return kExitDiagnostics;

    if (opts.printPlan)
    {
        for (const auto &plan : module.plans)
            bind::printPlan(plan, out);
        return kExitOk;
    }

    const std::string headerPath = opts.outStem + ".hpp";
    const std::string sourcePath = opts.outStem + ".cpp";
    const std::string headerName = std::filesystem::path(headerPath).filename().string();
    const bind::GeneratedFiles files = bind::emitModule(module, headerName);

    if (!writeFile(headerPath, files.header))
    {
        err << "tether-gen: cannot write '" << headerPath << "'\n";
        return kExitIo;
    }
    if (!writeFile(sourcePath, files.source))
    {
        err << "tether-gen: cannot write '" << sourcePath << "'\n";
        return kExitIo;
    }
    if (opts.trace)
        err << "[gen] wrote " << headerPath << " and " << sourcePath << " ("
            << module.plans.size() << " binding(s))\n";
    return kExitOk;
}

void usage(std::ostream &os)
{
    os << "tether-gen v" << TETHER_VERSION_STR << "\n"
       << "Usage: tether-gen <input.tether> [-o <out-stem>] [--namespace <ns>] [--plan]\n"
       << "                  [--trace] [--werror] [--version] [--help]\n"
       << "\n"
       << "  -o <out-stem>      write <out-stem>.hpp and <out-stem>.cpp\n"
       << "                     (default: input path without .tether)\n"
       << "  --namespace <ns>   override the manifest namespace\n"
       << "  --plan             print generation plans instead of writing files\n"
       << "  --trace            log planning decisions to stderr (also TETHER_GEN_TRACE)\n"
       << "  --werror           treat fast-path fallback warnings as errors\n";
}

void printVersion(std::ostream &os)
{
    os << "tether-gen v" << TETHER_VERSION_STR << "\n";
}

} // namespace tether::tools
