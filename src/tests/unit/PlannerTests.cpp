//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/PlannerTests.cpp
// Purpose: Check the fast-path eligibility gates, their ordering, the state
//          mode strategy and the warnings raised on fallback.
// Key invariants: A fast pair exists only when every gate passes; a failed
//                 gate downgrades to SlowOnly with exactly one warning.
// Ownership/Lifetime: Each case owns its diagnostics and plan.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "bind/GenerationPlan.hpp"
#include "bind/Signature.hpp"
#include "frontend/ManifestParser.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <sstream>
#include <string>

using namespace tether::bind;
using tether::support::Diag;
using tether::support::DiagKind;
using tether::support::DiagnosticEngine;
using tether::support::Severity;

namespace
{

struct Planned
{
    DiagnosticEngine diags;
    std::optional<GenerationPlan> plan;
    std::optional<Diag> error;
};

void planInto(Planned &out, std::string_view source, const PlannerOptions &options = {})
{
    auto manifest = tether::frontend::parseManifest(source, 1, out.diags);
    ASSERT_EQ(out.diags.errorCount(), 0u) << source;
    ASSERT_EQ(manifest.functions.size(), 1u) << source;
    auto sig = buildSignature(manifest.functions.front(), out.diags);
    if (!sig)
    {
        out.error = sig.error();
        return;
    }
    auto plan = planFunction(sig.value(), out.diags, options);
    if (!plan)
    {
        out.error = plan.error();
        return;
    }
    out.plan = plan.value();
}

} // namespace

TEST(Planner, PrimitiveFunctionGetsDualPath)
{
    Planned p;
    planInto(p, "[fast] fn add(a: i32, b: i32) -> i32;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->verdict, PathVerdict::DualPath);
    EXPECT_EQ(p.plan->reason, FallbackReason::None);
    EXPECT_TRUE(p.plan->hasFastPair());
    EXPECT_TRUE(p.plan->hasTemplateHelper());
    EXPECT_FALSE(p.plan->needsCapsule());
    EXPECT_EQ(p.diags.warningCount(), 0u);
}

TEST(Planner, NoFastOptionMeansSlowOnlyWithoutWarning)
{
    Planned p;
    planInto(p, "fn add(a: i32, b: i32) -> i32;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->verdict, PathVerdict::SlowOnly);
    EXPECT_EQ(p.plan->reason, FallbackReason::NotRequested);
    EXPECT_FALSE(p.plan->hasTemplateHelper());
    EXPECT_EQ(p.diags.warningCount(), 0u);
}

TEST(Planner, NonPrimitiveParameterFailsFirstGate)
{
    Planned p;
    planInto(p, "[fast] fn shout(text: String) -> i32;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->verdict, PathVerdict::SlowOnly);
    EXPECT_EQ(p.plan->reason, FallbackReason::ParameterNotPrimitive);
    ASSERT_EQ(p.diags.warningCount(), 1u);
    const auto &warning = p.diags.diagnostics().front();
    EXPECT_EQ(warning.kind, DiagKind::FastPathFallback);
    EXPECT_EQ(warning.message,
              "fast path not generated for 'shout': parameter 'text' has type String which is "
              "not a primitive");
}

TEST(Planner, OptionalParameterIsNotPrimitive)
{
    Planned p;
    planInto(p, "[fast] fn f(a: Option<i32>) -> i32;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->reason, FallbackReason::ParameterNotPrimitive);
}

TEST(Planner, ParameterGateRunsBeforeReturnGate)
{
    Planned p;
    planInto(p, "[fast] fn f(s: String) -> String;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->reason, FallbackReason::ParameterNotPrimitive);
    EXPECT_EQ(p.diags.warningCount(), 1u);
}

TEST(Planner, FallibleReturnFailsSecondGate)
{
    Planned p;
    planInto(p, "[fast] fn f(a: i32) -> Result<i32, String>;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->reason, FallbackReason::ReturnNotPrimitive);
    EXPECT_EQ(p.plan->fallbackDetail, "return type Result<i32, String> is not a primitive");
}

TEST(Planner, ScopeParameterFailsThirdGate)
{
    Planned p;
    planInto(p, "[fast] fn f(scope, a: i32) -> i32;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->reason, FallbackReason::UsesScope);
}

TEST(Planner, PromiseWrappingFailsThirdGate)
{
    Planned p;
    planInto(p, "[fast, promise] fn f(a: i32) -> i32;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->reason, FallbackReason::PromiseWrapped);
}

TEST(Planner, WarningsBecomeErrorsUnderWerror)
{
    Planned p;
    p.diags.promoteWarningsToErrors();
    planInto(p, "[fast] fn f(s: String) -> i32;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.diags.errorCount(), 1u);
    EXPECT_EQ(p.diags.diagnostics().front().severity, Severity::Error);
}

TEST(Planner, ArgumentIndicesSkipScopeAndState)
{
    Planned p;
    planInto(p, "fn f(scope, a: i32, state, b: f64) [state = Counter];");
    ASSERT_TRUE(p.plan);
    ASSERT_EQ(p.plan->params.size(), 4u);
    EXPECT_EQ(p.plan->params[0].argIndex, -1);
    EXPECT_EQ(p.plan->params[1].argIndex, 0);
    EXPECT_EQ(p.plan->params[2].argIndex, -1);
    EXPECT_EQ(p.plan->params[3].argIndex, 1);
}

TEST(StateStrategy, SlowOnlyStateDefaultsToSlot)
{
    Planned p;
    planInto(p, "fn bump(state, n: i32) -> i32 [state = shared<Counter>];");
    ASSERT_TRUE(p.plan);
    ASSERT_TRUE(p.plan->state);
    EXPECT_EQ(p.plan->state->mode, StateMode::SharedSlot);
    EXPECT_TRUE(p.plan->state->sharedWrapper);
    EXPECT_EQ(p.plan->state->paramCppType(), "const std::shared_ptr<Counter> &");
    EXPECT_EQ(p.plan->state->callArgument(), "state");
}

TEST(StateStrategy, FastStateDefaultsToCapsule)
{
    Planned p;
    planInto(p, "[fast, state = Accumulator] fn acc(state, x: f64) -> f64;");
    ASSERT_TRUE(p.plan);
    ASSERT_TRUE(p.plan->state);
    EXPECT_EQ(p.plan->state->mode, StateMode::PinnedCapsule);
    EXPECT_EQ(p.plan->verdict, PathVerdict::DualPath);
    EXPECT_TRUE(p.plan->needsCapsule());
    EXPECT_EQ(p.plan->state->paramCppType(), "Accumulator &");
    EXPECT_EQ(p.plan->state->callArgument(), "*state");
}

TEST(StateStrategy, ExplicitSlotOnEligibleFastFunctionIsAnError)
{
    Planned p;
    planInto(p, "[fast, state = slot<Counter>] fn f(state, x: i32) -> i32;");
    EXPECT_FALSE(p.plan);
    ASSERT_TRUE(p.error);
    EXPECT_EQ(p.error->kind, DiagKind::Configuration);
    EXPECT_NE(p.error->message.find("must be a capsule"), std::string::npos);
}

TEST(StateStrategy, ExplicitSlotIsAllowedWhenFastIsIneligible)
{
    Planned p;
    planInto(p, "[fast, state = slot<Counter>] fn f(state, s: String) -> i32;");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->state->mode, StateMode::SharedSlot);
    EXPECT_EQ(p.plan->verdict, PathVerdict::SlowOnly);
    EXPECT_EQ(p.diags.warningCount(), 1u);
}

TEST(StateStrategy, CapsuleWithoutFastStillGetsTemplateHelper)
{
    Planned p;
    planInto(p, "fn f(state) -> i32 [state = capsule<Counter>];");
    ASSERT_TRUE(p.plan);
    EXPECT_EQ(p.plan->verdict, PathVerdict::SlowOnly);
    EXPECT_TRUE(p.plan->needsCapsule());
    EXPECT_TRUE(p.plan->hasTemplateHelper());
}

TEST(StateStrategy, StateParameterNeedsStateType)
{
    Planned p;
    planInto(p, "fn f(state, x: i32);");
    ASSERT_TRUE(p.error);
    EXPECT_EQ(p.error->message,
              "function 'f' has a 'state' parameter but no state type; add [state = Type]");
}

TEST(StateStrategy, PrimitiveStateTypeIsRejected)
{
    Planned p;
    planInto(p, "fn f(state) [state = i32];");
    ASSERT_TRUE(p.error);
    EXPECT_NE(p.error->message.find("must name a class type"), std::string::npos);
}

TEST(ReturnShape, ClassifiesFallibleAndVoidReturns)
{
    const ReturnShape unitResult = analyzeReturn(*parseTypeRef("Result<(), String>"));
    EXPECT_TRUE(unitResult.fallible);
    EXPECT_FALSE(unitResult.hasValue);

    const ReturnShape valueResult = analyzeReturn(*parseTypeRef("Result<f64, String>"));
    EXPECT_TRUE(valueResult.fallible);
    EXPECT_TRUE(valueResult.hasValue);
    EXPECT_EQ(valueResult.valueClass, TypeClass::primitive(PrimitiveKind::Float64));
    EXPECT_EQ(valueResult.declaredClass.tag(), TypeClass::Tag::Opaque);

    const ReturnShape none = analyzeReturn(TypeRef::unit());
    EXPECT_FALSE(none.fallible);
    EXPECT_FALSE(none.hasValue);
}

TEST(Planner, TraceAndPlanDump)
{
    std::ostringstream trace;
    PlannerOptions options;
    options.trace = &trace;
    Planned p;
    planInto(p, "[fast] fn add(a: i32, b: i32) -> i32;", options);
    ASSERT_TRUE(p.plan);
    EXPECT_NE(trace.str().find("[plan] add: argument 0 'a' i32 -> Primitive(int32)"),
              std::string::npos);
    EXPECT_NE(trace.str().find("[plan] add: dual path"), std::string::npos);

    std::ostringstream dump;
    printPlan(*p.plan, dump);
    EXPECT_NE(dump.str().find("fn add (script name \"add\")"), std::string::npos);
    EXPECT_NE(dump.str().find("verdict: DualPath"), std::string::npos);
    EXPECT_EQ(dump.str().find("fallback:"), std::string::npos);
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
