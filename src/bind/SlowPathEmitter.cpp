//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/SlowPathEmitter.cpp
// Purpose: Emit `<name>_callback`, the wrapper every engine can call.
//
// Wrapper layout:
//   1. state extraction (context slot or capsule), if the function has state;
//   2. one extraction block per Value parameter, in argument order;
//   3. the native call with one of six return-handling shapes, selected by
//      {promise-wrapped, fallible, has-value} in that precedence.
//
// Error texts:
//   argument <i>: expected <T>: <conversion error>   primitives, opaque, optional
//   argument <i> must be a <Kind>                    engine handles
//   argument <i>: expected <declared type>           generic handle casts
//   internal error: state not found for <T>          empty context slot
//   internal error: state data not set for <T>       missing capsule
//
// Argument errors use the engine's type-error value; state and application
// errors use its generic error value.
//
//===----------------------------------------------------------------------===//

#include "bind/SlowPathEmitter.hpp"

#include "bind/EmitCommon.hpp"
#include "bind/TypeNames.hpp"

#include <string>
#include <vector>

namespace tether::bind
{
namespace
{

void emitThrow(CodeWriter &out, const char *factory, const std::string &messageExpr)
{
    out.line("scope.throwException(scope." + std::string(factory) + "(" + messageExpr + "));");
    out.line("return;");
}

void emitStateExtraction(const StateSpec &state, CodeWriter &out)
{
    const std::string declared = state.declared.display();
    if (state.mode == StateMode::SharedSlot)
    {
        out.line("auto state = scope.currentContext().slots().get<" + state.innerCpp() + ">();");
        out.open("if (!state)");
        emitThrow(out, "newError", cppStringLiteral("internal error: state not found for " + declared));
        out.close();
        return;
    }
    out.line("void *capsule = tether::runtime::capsuleData(args.data());");
    out.open("if (!capsule)");
    emitThrow(out, "newError", cppStringLiteral("internal error: state data not set for " + declared));
    out.close();
    out.line("auto state = tether::runtime::borrowCapsule<" + state.innerCpp() + ">(capsule);");
}

/// @brief Emit a runtime conversion and return the call-site expression.
std::string emitConverted(const PlannedParam &pp, const TypeRef &expected, CodeWriter &out)
{
    const std::string local = argLocal(pp.argIndex);
    const std::string index = std::to_string(pp.argIndex);
    out.line("auto " + local + " = tether::runtime::fromValue<" + pp.param.type.cppSpelling() +
             ">(scope, args.get(" + index + "));");
    out.open("if (!" + local + ".isOk())");
    emitThrow(out,
              "newTypeError",
              cppStringLiteral("argument " + index + ": expected " + expected.display() + ": ") +
                  " + " + local + ".error()");
    out.close();
    return "std::move(" + local + ").value()";
}

std::string emitHandle(const PlannedParam &pp, CodeWriter &out)
{
    const std::string local = argLocal(pp.argIndex);
    const std::string index = std::to_string(pp.argIndex);
    const HandleKind kind = pp.cls.handleKind();
    const std::string target = names::handleTargetCpp(pp.param.type.args.front());

    if (kind == HandleKind::AnyValue)
    {
        out.line("const " + hostType("Local") + "<" + hostType("Value") + "> " + local +
                 " = args.get(" + index + ");");
        return local;
    }
    if (kind == HandleKind::Generic)
    {
        out.line("const auto " + local + " = args.get(" + index + ").tryAs<" + target + ">();");
        out.open("if (!" + local + ")");
        emitThrow(out,
                  "newTypeError",
                  cppStringLiteral("argument " + index + ": expected " +
                                   pp.param.type.display()));
        out.close();
        return local;
    }
    out.line("const auto " + local + " = args.get(" + index + ");");
    out.open("if (!" + local + "->" + handlePredicate(kind) + "())");
    emitThrow(out,
              "newTypeError",
              cppStringLiteral("argument " + index + " must be a " + handleKindName(kind)));
    out.close();
    return local + ".as<" + target + ">()";
}

/// @brief Emit the extraction block for one Value parameter.
std::string emitArgument(const PlannedParam &pp, CodeWriter &out)
{
    switch (pp.cls.tag())
    {
        case TypeClass::Tag::Optional:
            // Errors name T, not Optional<T>.
            return emitConverted(pp, pp.param.type.args.front(), out);
        case TypeClass::Tag::EngineHandle:
            return emitHandle(pp, out);
        case TypeClass::Tag::Primitive:
        case TypeClass::Tag::Opaque:
            break;
    }
    return emitConverted(pp, pp.param.type, out);
}

void emitResolveWithValue(const std::string &valueExpr, CodeWriter &out)
{
    out.open("if (auto value = tether::runtime::toValue(scope, " + valueExpr + "))");
    out.line("deferred->resolve(scope, *value);");
    out.close();
}

void emitSetWithValue(const std::string &valueExpr, CodeWriter &out)
{
    out.open("if (auto value = tether::runtime::toValue(scope, " + valueExpr + "))");
    out.line("rv.set(*value);");
    out.close();
}

void emitCallAndReturn(const GenerationPlan &plan, const std::string &call, CodeWriter &out)
{
    const bool async = plan.signature.asyncWrapped;
    const bool fallible = plan.ret.fallible;
    const bool hasValue = plan.ret.hasValue;
    const std::string applicationError =
        "scope.newError(tether::runtime::describeError(result.error()))";

    if (async)
    {
        out.line("auto deferred = scope.newDeferred();");
        out.line("rv.set(deferred->promise());");
        if (fallible)
        {
            out.line("auto result = " + call + ";");
            out.open("if (result.isOk())");
            if (hasValue)
                emitResolveWithValue("result.value()", out);
            else
                out.line("deferred->resolve(scope, scope.undefined());");
            out.close();
            out.open("else");
            out.line("deferred->reject(scope, " + applicationError + ");");
            out.close();
        }
        else if (hasValue)
        {
            out.line("auto result = " + call + ";");
            emitResolveWithValue("result", out);
        }
        else
        {
            out.line(call + ";");
            out.line("deferred->resolve(scope, scope.undefined());");
        }
        return;
    }

    if (fallible)
    {
        out.line("auto result = " + call + ";");
        out.open("if (!result.isOk())");
        out.line("scope.throwException(" + applicationError + ");");
        out.line("return;");
        out.close();
        if (hasValue)
            emitSetWithValue("result.value()", out);
    }
    else if (hasValue)
    {
        out.line("auto result = " + call + ";");
        emitSetWithValue("result", out);
    }
    else
    {
        out.line(call + ";");
    }
}

} // namespace

void emitSlowPath(const GenerationPlan &plan, CodeWriter &out)
{
    const auto &sig = plan.signature;
    const BindingSymbols symbols = symbolsFor(sig.name);

    bool usesScope = sig.usesScope || plan.state.has_value() || sig.asyncWrapped ||
                     plan.ret.hasValue || plan.ret.fallible;
    for (const auto &pp : plan.params)
    {
        if (pp.param.role == ParamRole::Value &&
            !(pp.cls.tag() == TypeClass::Tag::EngineHandle &&
              pp.cls.handleKind() == HandleKind::AnyValue))
            usesScope = true;
    }
    const bool usesArgs = sig.valueParamCount() != 0 || plan.needsCapsule();
    const bool usesReturn = sig.asyncWrapped || plan.ret.hasValue;

    out.open(callbackPrototype(symbols));
    if (!usesScope)
        out.line("static_cast<void>(scope);");
    if (!usesArgs)
        out.line("static_cast<void>(args);");
    if (!usesReturn)
        out.line("static_cast<void>(rv);");

    if (plan.state)
        emitStateExtraction(*plan.state, out);

    std::vector<std::string> callArgs;
    for (const auto &pp : plan.params)
    {
        switch (pp.param.role)
        {
            case ParamRole::Scope:
                callArgs.push_back("scope");
                break;
            case ParamRole::State:
                callArgs.push_back(plan.state->callArgument());
                break;
            case ParamRole::Value:
                callArgs.push_back(emitArgument(pp, out));
                break;
        }
    }

    std::string call = sig.name + "(";
    for (size_t i = 0; i < callArgs.size(); ++i)
    {
        if (i != 0)
            call += ", ";
        call += callArgs[i];
    }
    call += ")";

    emitCallAndReturn(plan, call, out);
    out.close();
}

} // namespace tether::bind
