//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/Emitter.cpp
// Purpose: Assemble per-function artifacts into a compilable header/source
//          pair.
// Key invariants: The header declares every symbol the source defines, so
//                 embedders can register bindings from any translation unit.
// Links: bind/Emitter.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Module-level emission for tether-gen.

#include "bind/Emitter.hpp"

#include "bind/CodeWriter.hpp"
#include "bind/EmitCommon.hpp"
#include "bind/FastPathEmitter.hpp"
#include "bind/SlowPathEmitter.hpp"

namespace tether::bind
{
namespace
{

void emitBanner(const BindingModule &module, CodeWriter &out)
{
    out.line("// Generated by tether-gen from " + module.sourceName + ". Do not edit.");
    out.line();
}

std::string includeLine(const std::string &path)
{
    if (!path.empty() && path.front() == '<')
        return "#include " + path;
    return "#include " + cppStringLiteral(path);
}

void openNamespace(const BindingModule &module, CodeWriter &out)
{
    if (module.cppNamespace.empty())
        return;
    out.line("namespace " + module.cppNamespace);
    out.line("{");
    out.line();
}

void closeNamespace(const BindingModule &module, CodeWriter &out)
{
    if (module.cppNamespace.empty())
        return;
    out.line("} // namespace " + module.cppNamespace);
}

std::string tableType(const BindingModule &module)
{
    return "std::array<tether::runtime::BindingEntry, " + std::to_string(module.plans.size()) +
           ">";
}

void emitDeclarations(const GenerationPlan &plan, CodeWriter &out)
{
    const BindingSymbols symbols = symbolsFor(plan.signature.name);
    out.line("// " + plan.signature.scriptName + ": " + pathVerdictName(plan.verdict) +
             (plan.state ? std::string(", state ") + stateModeName(plan.state->mode) : ""));
    out.line(nativePrototype(plan) + ";");
    out.line(callbackPrototype(symbols) + ";");
    if (plan.hasFastPair())
    {
        out.line(fastPrototype(plan) + ";");
        out.line("extern const " + hostType("CFunctionInfo") + " " + symbols.fastInfo + ";");
        out.line("extern const " + hostType("CFunction") + " " + symbols.fastCall + ";");
    }
    if (plan.hasTemplateHelper())
        out.line(templatePrototype(plan, symbols) + ";");
}

void emitDefinitions(const GenerationPlan &plan, CodeWriter &out)
{
    if (plan.signature.fastRequested && !plan.hasFastPair())
        out.line("// Fast path not generated: " + plan.fallbackDetail + ".");
    emitSlowPath(plan, out);
    if (plan.hasFastPair())
    {
        out.line();
        emitFastPath(plan, out);
    }
    if (plan.hasTemplateHelper())
    {
        out.line();
        emitTemplateHelper(plan, out);
    }
}

} // namespace

FunctionArtifacts emitFunction(const GenerationPlan &plan)
{
    CodeWriter decls;
    emitDeclarations(plan, decls);
    CodeWriter defs;
    emitDefinitions(plan, defs);
    return {decls.str(), defs.str()};
}

std::string bindingTableName(const std::string &moduleName)
{
    return "k" + pascalCase(moduleName) + "Bindings";
}

GeneratedFiles emitModule(const BindingModule &module, const std::string &headerName)
{
    CodeWriter header;
    emitBanner(module, header);
    header.line("#pragma once");
    header.line();
    header.line("#include \"tether/Result.hpp\"");
    header.line("#include \"tether/host/FastApi.hpp\"");
    header.line("#include \"tether/host/Scope.hpp\"");
    header.line("#include \"tether/runtime/Binding.hpp\"");
    header.line();
    header.line("#include <array>");
    header.line("#include <cstdint>");
    header.line("#include <memory>");
    header.line("#include <optional>");
    header.line("#include <string>");
    header.line("#include <vector>");
    if (!module.includes.empty())
    {
        header.line();
        for (const auto &inc : module.includes)
            header.line(includeLine(inc));
    }
    header.line();
    openNamespace(module, header);
    for (const auto &plan : module.plans)
    {
        emitDeclarations(plan, header);
        header.line();
    }
    header.line("extern const " + tableType(module) + " " + bindingTableName(module.moduleName) +
                ";");
    header.line();
    closeNamespace(module, header);

    CodeWriter source;
    emitBanner(module, source);
    source.line(includeLine(headerName));
    source.line();
    source.line("#include \"tether/runtime/Borrow.hpp\"");
    source.line("#include \"tether/runtime/Convert.hpp\"");
    source.line();
    source.line("#include <utility>");
    source.line();
    openNamespace(module, source);
    for (const auto &plan : module.plans)
    {
        emitDefinitions(plan, source);
        source.line();
    }

    source.line("const " + tableType(module) + " " + bindingTableName(module.moduleName) + " = {{");
    for (const auto &plan : module.plans)
    {
        const BindingSymbols symbols = symbolsFor(plan.signature.name);
        source.line("    {" + cppStringLiteral(plan.signature.scriptName) + ", &" +
                    symbols.callback + ", " +
                    (plan.hasFastPair() ? "&" + symbols.fastCall : std::string("nullptr")) +
                    ", " + (plan.needsCapsule() ? "true" : "false") + "},");
    }
    source.line("}};");
    source.line();
    closeNamespace(module, source);

    return {header.str(), source.str()};
}

} // namespace tether::bind
