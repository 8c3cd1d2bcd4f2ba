//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/FastPathEmitter.cpp
// Purpose: Emit direct-call entry points, their descriptors, and the
//          registration helpers that pair them with the slow wrapper.
//
// Stateful direct calls:
//   The engine passes the callable's associated data through
//   FastCallOptions. The entry point rebuilds a borrowed handle from the
//   capsule it carries. If the capsule is missing the entry point cannot
//   throw, so it sets `fallback` and the engine re-runs the call through the
//   slow wrapper, which reports the internal error.
//
//===----------------------------------------------------------------------===//

#include "bind/FastPathEmitter.hpp"

#include "bind/EmitCommon.hpp"
#include "bind/TypeNames.hpp"

namespace tether::bind
{
namespace
{

bool returnsVoid(const GenerationPlan &plan)
{
    return fastReturnType(plan) == host::CType::Void;
}

} // namespace

std::vector<host::CType> fastArgumentTypes(const GenerationPlan &plan)
{
    std::vector<host::CType> types{host::CType::Receiver};
    for (const auto &pp : plan.params)
    {
        if (pp.param.role != ParamRole::Value)
            continue;
        if (auto ct = pp.cls.fastCType())
            types.push_back(*ct);
    }
    if (plan.needsCapsule())
        types.push_back(host::CType::CallbackOptions);
    return types;
}

host::CType fastReturnType(const GenerationPlan &plan)
{
    return plan.ret.declaredClass.fastCType().value_or(host::CType::Void);
}

std::string fastPrototype(const GenerationPlan &plan)
{
    const BindingSymbols symbols = symbolsFor(plan.signature.name);
    std::string out = std::string(names::primitiveCpp(plan.ret.declaredClass.primitiveKind())) +
                      " " + symbols.fast + "(" + hostType("Local") + "<" + hostType("Value") +
                      "> /*receiver*/";
    for (const auto &pp : plan.params)
    {
        if (pp.param.role != ParamRole::Value)
            continue;
        out += ", ";
        out += names::primitiveCpp(pp.cls.primitiveKind());
        out += " " + argLocal(pp.argIndex);
    }
    if (plan.needsCapsule())
        out += ", " + hostType("FastCallOptions") + " &options";
    out += ")";
    return out;
}

void emitFastPath(const GenerationPlan &plan, CodeWriter &out)
{
    const BindingSymbols symbols = symbolsFor(plan.signature.name);

    out.open(fastPrototype(plan));
    if (plan.needsCapsule())
    {
        out.line("void *capsule = tether::runtime::capsuleData(options.data);");
        out.open("if (!capsule)");
        out.line("options.fallback = true;");
        out.line(returnsVoid(plan) ? "return;" : "return {};");
        out.close();
        out.line("auto state = tether::runtime::borrowCapsule<" + plan.state->innerCpp() +
                 ">(capsule);");
    }
    std::string call = plan.signature.name + "(";
    bool first = true;
    for (const auto &pp : plan.params)
    {
        if (!first)
            call += ", ";
        first = false;
        call += pp.param.role == ParamRole::State ? plan.state->callArgument()
                                                   : argLocal(pp.argIndex);
    }
    call += ")";
    out.line(returnsVoid(plan) ? call + ";" : "return " + call + ";");
    out.close();
    out.line();

    out.line("constexpr " + hostType("CTypeInfo") + " " + symbols.fastArgs + "[] = {");
    for (host::CType type : fastArgumentTypes(plan))
        out.line("    {" + ctypeEnumerator(type) + "},");
    out.line("};");
    out.line();
    out.line("const " + hostType("CFunctionInfo") + " " + symbols.fastInfo + "(");
    out.line("    " + hostType("CTypeInfo") + "{" + ctypeEnumerator(fastReturnType(plan)) + "},");
    out.line("    " + symbols.fastArgs + ",");
    out.line("    " + hostType("Int64Representation") + "::BigInt);");
    out.line();
    out.line("const " + hostType("CFunction") + " " + symbols.fastCall +
             "(reinterpret_cast<const void *>(&" + symbols.fast + "), &" + symbols.fastInfo +
             ");");
}

void emitTemplateHelper(const GenerationPlan &plan, CodeWriter &out)
{
    const BindingSymbols symbols = symbolsFor(plan.signature.name);
    const std::string fastCall = plan.hasFastPair() ? "&" + symbols.fastCall : "nullptr";

    out.open(templatePrototype(plan, symbols));
    if (plan.needsCapsule())
    {
        out.line("const auto data = scope.newExternal(tether::runtime::capsulePointer(state));");
        out.line("return scope.newFunctionTemplate(&" + symbols.callback + ", data, " + fastCall +
                 ");");
    }
    else
    {
        out.line("return scope.newFunctionTemplate(&" + symbols.callback +
                 ", scope.undefined(), " + fastCall + ");");
    }
    out.close();
}

std::string ctypeEnumerator(host::CType type)
{
    const char *name = "Void";
    switch (type)
    {
        case host::CType::Void:
            name = "Void";
            break;
        case host::CType::Bool:
            name = "Bool";
            break;
        case host::CType::Int32:
            name = "Int32";
            break;
        case host::CType::Uint32:
            name = "Uint32";
            break;
        case host::CType::Int64:
            name = "Int64";
            break;
        case host::CType::Uint64:
            name = "Uint64";
            break;
        case host::CType::Float32:
            name = "Float32";
            break;
        case host::CType::Float64:
            name = "Float64";
            break;
        case host::CType::Receiver:
            name = "Receiver";
            break;
        case host::CType::CallbackOptions:
            name = "CallbackOptions";
            break;
    }
    return hostType("CType") + "::" + name;
}

} // namespace tether::bind
