//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/Planner.cpp
// Purpose: Build GenerationPlans from FunctionSignatures.
// Key invariants: Gates run in the order (a) parameters, (b) return,
//                 (c) scope; the first failing gate is the recorded reason.
// Links: bind/GenerationPlan.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Classification, state resolution and fast-path eligibility.

#include "bind/GenerationPlan.hpp"

#include "bind/TypeNames.hpp"

namespace tether::bind
{
using support::makeConfigError;
using support::makeWarning;

namespace
{

struct GateResult
{
    FallbackReason reason = FallbackReason::None;
    std::string detail;
};

/// @brief Evaluate gates (a), (b) and (c) in order.
GateResult runGates(const GenerationPlan &plan)
{
    for (const auto &pp : plan.params)
    {
        if (pp.param.role != ParamRole::Value || pp.cls.isFastEligible())
            continue;
        return {FallbackReason::ParameterNotPrimitive,
                "parameter '" + pp.param.name + "' has type " + pp.param.type.display() +
                    " which is not a primitive"};
    }
    if (!plan.ret.declaredClass.isFastEligible())
        return {FallbackReason::ReturnNotPrimitive,
                "return type " + plan.ret.declared.display() + " is not a primitive"};
    if (plan.signature.usesScope)
        return {FallbackReason::UsesScope, "the function takes the execution scope"};
    if (plan.signature.asyncWrapped)
        return {FallbackReason::PromiseWrapped,
                "promise-wrapped results need the execution scope to settle"};
    return {};
}

void trace(const PlannerOptions &options, const std::string &line)
{
    if (options.trace)
        *options.trace << "[plan] " << line << '\n';
}

} // namespace

ReturnShape analyzeReturn(const TypeRef &declared)
{
    ReturnShape shape;
    shape.declared = declared;
    shape.declaredClass = classify(declared);
    if (names::isResult(declared))
    {
        shape.fallible = true;
        shape.valueType = declared.args.front();
    }
    else
    {
        shape.valueType = declared;
    }
    shape.valueClass = classify(shape.valueType);
    shape.hasValue = !(shape.valueClass.tag() == TypeClass::Tag::Primitive &&
                       shape.valueClass.primitiveKind() == PrimitiveKind::Void);
    return shape;
}

support::Expected<GenerationPlan> planFunction(const FunctionSignature &sig,
                                               support::DiagnosticEngine &diags,
                                               const PlannerOptions &options)
{
    GenerationPlan plan;
    plan.signature = sig;

    int argIndex = 0;
    for (const auto &param : sig.params)
    {
        PlannedParam pp;
        pp.param = param;
        if (param.role == ParamRole::Value)
        {
            pp.cls = classify(param.type);
            pp.argIndex = argIndex++;
            trace(options,
                  sig.name + ": argument " + std::to_string(pp.argIndex) + " '" + param.name +
                      "' " + param.type.display() + " -> " + pp.cls.describe());
        }
        plan.params.push_back(std::move(pp));
    }

    plan.ret = analyzeReturn(sig.returnType);
    trace(options,
          sig.name + ": return " + sig.returnType.display() + " -> " +
              plan.ret.valueClass.describe() + (plan.ret.fallible ? " (fallible)" : ""));

    if (sig.usesState)
    {
        if (!sig.stateType)
            return makeConfigError(sig.loc,
                                   "function '" + sig.name +
                                       "' has a 'state' parameter but no state type; add "
                                       "[state = Type]");
        auto spec = resolveStateSpec(*sig.stateType, sig.fastRequested, sig.loc);
        if (!spec)
            return spec.error();
        plan.state = spec.value();
        trace(options,
              sig.name + ": state " + plan.state->declared.display() + " as " +
                  stateModeName(plan.state->mode));
    }

    if (!sig.fastRequested)
    {
        plan.verdict = PathVerdict::SlowOnly;
        plan.reason = FallbackReason::NotRequested;
        trace(options, sig.name + ": slow path only (fast not requested)");
        return plan;
    }

    GateResult gates = runGates(plan);
    if (gates.reason != FallbackReason::None)
    {
        plan.verdict = PathVerdict::SlowOnly;
        plan.reason = gates.reason;
        plan.fallbackDetail = gates.detail;
        diags.report(makeWarning(sig.loc,
                                 "fast path not generated for '" + sig.name +
                                     "': " + gates.detail,
                                 support::DiagKind::FastPathFallback));
        trace(options,
              sig.name + ": slow path only (" + fallbackReasonName(gates.reason) + ")");
        return plan;
    }

    if (plan.state && plan.state->mode != StateMode::PinnedCapsule)
        return makeConfigError(sig.loc,
                               "function '" + sig.name +
                                   "' uses state on the fast path; state type " +
                                   plan.state->declared.display() +
                                   " must be a capsule, not a context slot");

    plan.verdict = PathVerdict::DualPath;
    plan.reason = FallbackReason::None;
    trace(options, sig.name + ": dual path");
    return plan;
}

void printPlan(const GenerationPlan &plan, std::ostream &os)
{
    const auto &sig = plan.signature;
    os << "fn " << sig.name << " (script name \"" << sig.scriptName << "\")\n";
    for (const auto &pp : plan.params)
    {
        os << "  param " << pp.param.name << ": ";
        switch (pp.param.role)
        {
            case ParamRole::Scope:
                os << "<scope>\n";
                break;
            case ParamRole::State:
                os << "<state>\n";
                break;
            case ParamRole::Value:
                os << pp.param.type.display() << " -> " << pp.cls.describe() << " [argument "
                   << pp.argIndex << "]\n";
                break;
        }
    }
    os << "  return: " << plan.ret.declared.display() << " -> " << plan.ret.valueClass.describe();
    if (plan.ret.fallible)
        os << " (fallible)";
    os << '\n';
    if (plan.state)
        os << "  state: " << plan.state->declared.display() << " ("
           << stateModeName(plan.state->mode) << ", key " << plan.state->inner.display() << ")\n";
    os << "  async: " << (sig.asyncWrapped ? "yes" : "no") << '\n';
    os << "  verdict: " << pathVerdictName(plan.verdict) << '\n';
    if (plan.verdict == PathVerdict::SlowOnly)
    {
        os << "  fallback: " << fallbackReasonName(plan.reason);
        if (!plan.fallbackDetail.empty())
            os << " (" << plan.fallbackDetail << ")";
        os << '\n';
    }
}

const char *pathVerdictName(PathVerdict verdict)
{
    return verdict == PathVerdict::DualPath ? "DualPath" : "SlowOnly";
}

const char *fallbackReasonName(FallbackReason reason)
{
    switch (reason)
    {
        case FallbackReason::None:
            return "None";
        case FallbackReason::NotRequested:
            return "NotRequested";
        case FallbackReason::ParameterNotPrimitive:
            return "ParameterNotPrimitive";
        case FallbackReason::ReturnNotPrimitive:
            return "ReturnNotPrimitive";
        case FallbackReason::UsesScope:
            return "UsesScope";
        case FallbackReason::PromiseWrapped:
            return "PromiseWrapped";
    }
    return "None";
}

} // namespace tether::bind
