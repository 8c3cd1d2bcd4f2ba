//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements symbol naming and prototype rendering for generated bindings.
//
//===----------------------------------------------------------------------===//

#include "bind/EmitCommon.hpp"

#include "bind/CodeWriter.hpp"

namespace tether::bind
{

BindingSymbols symbolsFor(const std::string &nativeName)
{
    const std::string pascal = pascalCase(nativeName);
    BindingSymbols s;
    s.native = nativeName;
    s.callback = nativeName + "_callback";
    s.fast = nativeName + "_fast";
    s.fastArgs = "k" + pascal + "FastCallArgs";
    s.fastInfo = "k" + pascal + "FastCallInfo";
    s.fastCall = "k" + pascal + "FastCall";
    s.templ = nativeName + "_template";
    return s;
}

std::string hostType(const char *name)
{
    return std::string("tether::host::") + name;
}

std::string nativePrototype(const GenerationPlan &plan)
{
    const auto &sig = plan.signature;
    std::string out = sig.returnType.cppSpelling() + " " + sig.name + "(";
    bool first = true;
    for (const auto &pp : plan.params)
    {
        if (!first)
            out += ", ";
        first = false;
        switch (pp.param.role)
        {
            case ParamRole::Scope:
                out += hostType("Scope") + " &" + pp.param.name;
                break;
            case ParamRole::State:
                out += plan.state->paramCppType() + pp.param.name;
                break;
            case ParamRole::Value:
                out += pp.param.type.cppSpelling() + " " + pp.param.name;
                break;
        }
    }
    out += ")";
    return out;
}

std::string callbackPrototype(const BindingSymbols &symbols)
{
    return "void " + symbols.callback + "(" + hostType("Scope") + " &scope, const " +
           hostType("CallbackArgs") + " &args, " + hostType("ReturnValue") + " &rv)";
}

std::string templatePrototype(const GenerationPlan &plan, const BindingSymbols &symbols)
{
    std::string out = hostType("Local") + "<" + hostType("FunctionTemplate") + "> " +
                      symbols.templ + "(" + hostType("Scope") + " &scope";
    if (plan.needsCapsule())
        out += ", const std::shared_ptr<" + plan.state->innerCpp() + "> &state";
    out += ")";
    return out;
}

std::string argLocal(int index)
{
    return "arg" + std::to_string(index);
}

} // namespace tether::bind
