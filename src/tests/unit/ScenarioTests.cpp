//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/ScenarioTests.cpp
// Purpose: Drive the bindings tether-gen generates from
//          tests/bindings/scenarios.tether through the in-memory engine.
// Key invariants: Slow wrappers throw TypeError for bad arguments and Error for
//                 application failures; direct calls never touch the engine.
// Ownership/Lifetime: Each test owns a FakeEngine and any state it seeds.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "scenarios.hpp"
#include "tests/common/FakeEngine.hpp"
#include "tether/runtime/Borrow.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

using tether::host::Local;
using tether::host::Value;
using tether::testing::errorKind;
using tether::testing::errorMessage;
using tether::testing::FakeEngine;

namespace host = tether::host;

namespace
{

double numberOf(const Local<Value> &value)
{
    return value.as<host::Number>()->value();
}

std::string stringOf(const Local<Value> &value)
{
    return value.as<host::String>()->value();
}

Local<Value> pointValue(FakeEngine &engine, double x, double y)
{
    auto object = engine.newObject();
    object->set(engine, "x", engine.newNumber(x));
    object->set(engine, "y", engine.newNumber(y));
    return object;
}

} // namespace

TEST(ScenarioPrimitives, SlowPathAddsNumbers)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::add_callback, {engine.newNumber(2), engine.newNumber(3)});
    ASSERT_FALSE(out.threw());
    EXPECT_DOUBLE_EQ(numberOf(out.returned), 5.0);
}

TEST(ScenarioPrimitives, SlowAndFastPathsAgree)
{
    FakeEngine engine;
    const double pairs[][2] = {{2, 3}, {0.1, 0.2}, {-1e300, 1e-300}, {1.5, -7.25}};
    for (const auto &pair : pairs)
    {
        auto slow = engine.invoke(&scenarios::add_callback,
                                  {engine.newNumber(pair[0]), engine.newNumber(pair[1])});
        ASSERT_FALSE(slow.threw());
        const double fast =
            engine.invokeFast<double, double, double>(scenarios::kAddFastCall, pair[0], pair[1]);
        EXPECT_EQ(numberOf(slow.returned), fast);
    }
}

TEST(ScenarioPrimitives, SlowPathRejectsWrongType)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::add_callback, {engine.newString("2"), engine.newNumber(1)});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorKind(out.exception), "TypeError");
    EXPECT_EQ(errorMessage(out.exception),
              "argument 0: expected f64: invalid type; expected: number, got: string");
    EXPECT_TRUE(out.returned->isUndefined());
}

TEST(ScenarioPrimitives, SlowPathReportsRangeErrors)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::is_even_callback, {engine.newNumber(-1)});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorMessage(out.exception),
              "argument 0: expected u32: value out of range for uint32");
}

TEST(ScenarioPrimitives, BooleanReturn)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::is_even_callback, {engine.newNumber(8)});
    ASSERT_FALSE(out.threw());
    ASSERT_TRUE(out.returned->isBoolean());
    EXPECT_TRUE(out.returned.as<host::Boolean>()->value());
}

TEST(ScenarioPrimitives, MissingArgumentsReadAsUndefined)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::add_callback, {engine.newNumber(1)});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorMessage(out.exception),
              "argument 1: expected f64: invalid type; expected: number, got: undefined");
}

TEST(ScenarioPrimitives, FastPathsCallTheNativeFunction)
{
    FakeEngine engine;
    EXPECT_DOUBLE_EQ((engine.invokeFast<double, double, double>(scenarios::kAddFastCall, 7, 8)),
                     15.0);
    EXPECT_TRUE((engine.invokeFast<bool, uint32_t>(scenarios::kIsEvenFastCall, 4u)));
    EXPECT_FALSE((engine.invokeFast<bool, uint32_t>(scenarios::kIsEvenFastCall, 5u)));

    scenarios::gBumpedTotal = 0;
    engine.invokeFast<void, int64_t>(scenarios::kBumpTotalFastCall, int64_t{5});
    engine.invokeFast<void, int64_t>(scenarios::kBumpTotalFastCall, int64_t{6});
    EXPECT_EQ(scenarios::gBumpedTotal, 11);
}

TEST(ScenarioPrimitives, FastDescriptorsDescribeTheEntryPoints)
{
    const host::CFunctionInfo *info = scenarios::kBumpTotalFastCall.info();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->returnInfo().type, host::CType::Void);
    ASSERT_EQ(info->argumentCount(), 2u);
    EXPECT_EQ(info->argumentInfo(1).type, host::CType::Int64);
    EXPECT_EQ(info->int64Representation(), host::Int64Representation::BigInt);
    EXPECT_FALSE(info->hasOptions());
}

TEST(ScenarioPrimitives, VoidSlowPathLeavesUndefined)
{
    FakeEngine engine;
    scenarios::gBumpedTotal = 0;
    auto out = engine.invoke(&scenarios::bump_total_callback, {engine.newNumber(3)});
    ASSERT_FALSE(out.threw());
    EXPECT_TRUE(out.returned->isUndefined());
    EXPECT_EQ(scenarios::gBumpedTotal, 3);
}

TEST(ScenarioConversions, OptionalArgumentsMayBeOmitted)
{
    FakeEngine engine;
    auto bare = engine.invoke(&scenarios::greet_callback, {engine.newString("Alice")});
    ASSERT_FALSE(bare.threw());
    EXPECT_EQ(stringOf(bare.returned), "Alice");

    auto titled = engine.invoke(&scenarios::greet_callback,
                                {engine.newString("Alice"), engine.newString("Dr.")});
    EXPECT_EQ(stringOf(titled.returned), "Dr. Alice");

    auto nulled =
        engine.invoke(&scenarios::greet_callback, {engine.newString("Alice"), engine.null()});
    EXPECT_EQ(stringOf(nulled.returned), "Alice");

    auto undef = engine.invoke(&scenarios::greet_callback,
                               {engine.newString("Alice"), engine.undefined()});
    EXPECT_EQ(stringOf(undef.returned), "Alice");
}

TEST(ScenarioConversions, OptionalErrorsNameTheInnerType)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::greet_callback,
                             {engine.newString("Alice"), engine.newNumber(1)});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorMessage(out.exception),
              "argument 1: expected String: invalid type; expected: string, got: number");
}

TEST(ScenarioConversions, OptionalIntegerErrorsNameTheInnerType)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::clamp_optional_callback, {engine.newString("3")});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorMessage(out.exception),
              "argument 0: expected i32: invalid type; expected: int32, got: string");
}

TEST(ScenarioConversions, VectorsConvertElementwise)
{
    FakeEngine engine;
    const Local<Value> parts[] = {engine.newString("a"), engine.newString("b"),
                                  engine.newString("c")};
    auto out = engine.invoke(&scenarios::concat_callback,
                             {engine.newArray(parts), engine.newString("-")});
    ASSERT_FALSE(out.threw());
    EXPECT_EQ(stringOf(out.returned), "a-b-c");

    const Local<Value> mixed[] = {engine.newString("a"), engine.newBoolean(true)};
    auto bad = engine.invoke(&scenarios::concat_callback, {engine.newArray(mixed)});
    ASSERT_TRUE(bad.threw());
    EXPECT_EQ(errorMessage(bad.exception),
              "argument 0: expected Vec<String>: element 1: invalid type; expected: string, "
              "got: boolean");
}

TEST(ScenarioConversions, OptionalReturnBecomesNull)
{
    FakeEngine engine;
    auto none = engine.invoke(&scenarios::clamp_optional_callback, {engine.undefined()});
    ASSERT_FALSE(none.threw());
    EXPECT_TRUE(none.returned->isNull());

    auto clamped = engine.invoke(&scenarios::clamp_optional_callback,
                                 {engine.newNumber(12), engine.newNumber(10)});
    EXPECT_DOUBLE_EQ(numberOf(clamped.returned), 10.0);
}

TEST(ScenarioConversions, UnsafeIntegersAreDroppedSilently)
{
    FakeEngine engine;
    auto small = engine.invoke(&scenarios::big_number_callback, {engine.newNumber(10)});
    ASSERT_FALSE(small.threw());
    EXPECT_DOUBLE_EQ(numberOf(small.returned), 1024.0);

    auto huge = engine.invoke(&scenarios::big_number_callback, {engine.newNumber(60)});
    EXPECT_FALSE(huge.threw());
    EXPECT_TRUE(huge.returned->isUndefined());
}

TEST(ScenarioConversions, UserConvertersRoundTripThroughObjects)
{
    FakeEngine engine;
    auto described =
        engine.invoke(&scenarios::describe_point_callback, {pointValue(engine, 1.5, -2)});
    ASSERT_FALSE(described.threw());
    EXPECT_EQ(stringOf(described.returned), "(1.5, -2)");

    auto mid = engine.invoke(&scenarios::midpoint_callback,
                             {pointValue(engine, 0, 0), pointValue(engine, 4, 6)});
    ASSERT_FALSE(mid.threw());
    auto object = mid.returned.as<host::Object>();
    EXPECT_DOUBLE_EQ(numberOf(object->get(engine, "x")), 2.0);
    EXPECT_DOUBLE_EQ(numberOf(object->get(engine, "y")), 3.0);

    auto bad = engine.invoke(&scenarios::describe_point_callback, {engine.newObject()});
    ASSERT_TRUE(bad.threw());
    EXPECT_EQ(errorMessage(bad.exception),
              "argument 0: expected Point: field x: invalid type; expected: number, got: "
              "undefined");
}

TEST(ScenarioResults, FallibleSuccessReturnsValue)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::parse_number_callback, {engine.newString("42.5")});
    ASSERT_FALSE(out.threw());
    EXPECT_DOUBLE_EQ(numberOf(out.returned), 42.5);
}

TEST(ScenarioResults, FallibleFailureThrowsError)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::parse_number_callback, {engine.newString("abc")});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorKind(out.exception), "Error");
    EXPECT_EQ(errorMessage(out.exception), "not a number: 'abc'");
}

TEST(ScenarioResults, AsyncSuccessResolves)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::async_divide_callback,
                             {engine.newNumber(10), engine.newNumber(2)});
    ASSERT_FALSE(out.threw());
    ASSERT_TRUE(out.returned->isPromise());
    auto promise = out.returned.as<host::Promise>();
    EXPECT_EQ(promise->state(), host::Promise::State::Fulfilled);
    EXPECT_DOUBLE_EQ(numberOf(promise->result()), 5.0);
}

TEST(ScenarioResults, AsyncFailureRejects)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::async_divide_callback,
                             {engine.newNumber(10), engine.newNumber(0)});
    ASSERT_FALSE(out.threw());
    auto promise = out.returned.as<host::Promise>();
    EXPECT_EQ(promise->state(), host::Promise::State::Rejected);
    EXPECT_EQ(errorKind(promise->result()), "Error");
    EXPECT_EQ(errorMessage(promise->result()), "division by zero");
}

TEST(ScenarioResults, AsyncArgumentErrorsStillThrow)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::async_divide_callback, {engine.newString("x")});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorKind(out.exception), "TypeError");
}

TEST(ScenarioResults, InfallibleAsyncResolves)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::async_length_callback, {engine.newString("four")});
    ASSERT_FALSE(out.threw());
    auto promise = out.returned.as<host::Promise>();
    EXPECT_EQ(promise->state(), host::Promise::State::Fulfilled);
    EXPECT_DOUBLE_EQ(numberOf(promise->result()), 4.0);
}

TEST(ScenarioHandles, CallbacksReceiveTheScope)
{
    FakeEngine engine;
    auto doubler = engine.newNativeFunction(
        [](host::Scope &scope, std::span<const Local<Value>> args) -> Local<Value> {
            return scope.newNumber(args[0].as<host::Number>()->value() * 2);
        });
    auto out = engine.invoke(&scenarios::call_twice_callback, {doubler, engine.newNumber(5)});
    ASSERT_FALSE(out.threw());
    EXPECT_DOUBLE_EQ(numberOf(out.returned), 20.0);
}

TEST(ScenarioHandles, CallbackFailureBecomesError)
{
    FakeEngine engine;
    auto failing = engine.newNativeFunction(
        [](host::Scope &, std::span<const Local<Value>>) -> Local<Value> { return {}; });
    auto out = engine.invoke(&scenarios::call_twice_callback, {failing, engine.undefined()});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorMessage(out.exception), "callback failed on call 1");
}

TEST(ScenarioHandles, HandleKindIsChecked)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::call_twice_callback,
                             {engine.newNumber(1), engine.newNumber(5)});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorKind(out.exception), "TypeError");
    EXPECT_EQ(errorMessage(out.exception), "argument 0 must be a Function");

    auto bytes = engine.invoke(&scenarios::sum_bytes_callback, {engine.newObject()});
    ASSERT_TRUE(bytes.threw());
    EXPECT_EQ(errorMessage(bytes.exception), "argument 0 must be a Uint8Array");
}

TEST(ScenarioHandles, TypedArraysAreRead)
{
    FakeEngine engine;
    const uint8_t data[] = {1, 2, 3, 250};
    auto out = engine.invoke(&scenarios::sum_bytes_callback, {engine.newUint8Array(data)});
    ASSERT_FALSE(out.threw());
    EXPECT_DOUBLE_EQ(numberOf(out.returned), 256.0);
}

TEST(ScenarioHandles, AnyValuePassesThrough)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::describe_callback, {engine.newNumber(2)});
    ASSERT_FALSE(out.threw());
    EXPECT_EQ(stringOf(out.returned), "number:2");
}

TEST(ScenarioState, SharedSlotIsReadFromTheContext)
{
    FakeEngine engine;
    auto counter = std::make_shared<scenarios::Counter>();
    counter->value = 10;
    engine.currentContext().slots().set(counter);

    auto out = engine.invoke(&scenarios::increment_callback, {engine.newNumber(5)});
    ASSERT_FALSE(out.threw());
    EXPECT_DOUBLE_EQ(numberOf(out.returned), 15.0);

    auto again = engine.invoke(&scenarios::increment_callback, {engine.newNumber(7)});
    ASSERT_FALSE(again.threw());
    EXPECT_DOUBLE_EQ(numberOf(again.returned), 22.0);
    EXPECT_EQ(counter->value, 22);
}

TEST(ScenarioState, MissingSlotThrowsInternalError)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::increment_callback, {engine.newNumber(1)});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorKind(out.exception), "Error");
    EXPECT_EQ(errorMessage(out.exception), "internal error: state not found for shared<Counter>");
}

TEST(ScenarioState, FallibleUnitResultWithState)
{
    FakeEngine engine;
    auto counter = std::make_shared<scenarios::Counter>();
    counter->value = 3;
    engine.currentContext().slots().set(counter);

    auto ok = engine.invoke(&scenarios::checked_reset_callback, {engine.newNumber(0)});
    ASSERT_FALSE(ok.threw());
    EXPECT_TRUE(ok.returned->isUndefined());
    EXPECT_EQ(counter->value, 0);

    auto bad = engine.invoke(&scenarios::checked_reset_callback, {engine.newNumber(-4)});
    ASSERT_TRUE(bad.threw());
    EXPECT_EQ(errorMessage(bad.exception), "counter cannot be negative");
    EXPECT_EQ(counter->value, 0);
}

TEST(ScenarioState, CapsuleSlowPathReadsCallData)
{
    FakeEngine engine;
    auto acc = std::make_shared<scenarios::Accumulator>();
    auto data = engine.newExternal(tether::runtime::capsulePointer(acc));

    auto first = engine.invoke(&scenarios::accumulate_callback, {engine.newNumber(1.5)}, data);
    auto second = engine.invoke(&scenarios::accumulate_callback, {engine.newNumber(2)}, data);
    ASSERT_FALSE(second.threw());
    EXPECT_DOUBLE_EQ(numberOf(first.returned), 1.5);
    EXPECT_DOUBLE_EQ(numberOf(second.returned), 3.5);
    EXPECT_EQ(acc->calls, 2);
    EXPECT_EQ(acc.use_count(), 1);
}

TEST(ScenarioState, CapsuleSlowPathWithoutDataThrows)
{
    FakeEngine engine;
    auto out = engine.invoke(&scenarios::accumulate_callback, {engine.newNumber(1)});
    ASSERT_TRUE(out.threw());
    EXPECT_EQ(errorMessage(out.exception), "internal error: state data not set for Accumulator");
}

TEST(ScenarioState, CapsuleFastPathBorrowsState)
{
    FakeEngine engine;
    auto acc = std::make_shared<scenarios::Accumulator>();
    host::FastCallOptions options;
    options.data = engine.newExternal(tether::runtime::capsulePointer(acc));

    const double total = engine.invokeFast<double, double, host::FastCallOptions &>(
        scenarios::kAccumulateFastCall, 2.5, options);
    EXPECT_DOUBLE_EQ(total, 2.5);
    EXPECT_FALSE(options.fallback);
    EXPECT_EQ(acc->calls, 1);
    EXPECT_EQ(acc.use_count(), 1);
    EXPECT_TRUE(scenarios::kAccumulateFastCall.info()->hasOptions());
}

TEST(ScenarioState, CapsuleFastPathFallsBackWithoutData)
{
    FakeEngine engine;
    host::FastCallOptions options;
    options.data = engine.undefined();

    const double total = engine.invokeFast<double, double, host::FastCallOptions &>(
        scenarios::kAccumulateFastCall, 1.0, options);
    EXPECT_DOUBLE_EQ(total, 0.0);
    EXPECT_TRUE(options.fallback);
}

TEST(ScenarioState, TemplateHelperCarriesCapsuleAndFastCall)
{
    FakeEngine engine;
    auto acc = std::make_shared<scenarios::Accumulator>();
    auto templ = scenarios::accumulate_template(engine, acc);
    EXPECT_EQ(acc.use_count(), 1);
    EXPECT_EQ(templ->fastCall(), &scenarios::kAccumulateFastCall);
    EXPECT_TRUE(templ->callback() == &scenarios::accumulate_callback);
    EXPECT_EQ(tether::runtime::capsuleData(templ->data()), acc.get());

    auto fn = templ->getFunction(engine);
    auto out = engine.call(fn, {engine.newNumber(4)});
    ASSERT_FALSE(out.threw());
    EXPECT_DOUBLE_EQ(numberOf(out.returned), 4.0);
    EXPECT_DOUBLE_EQ(acc->total, 4.0);
}

TEST(ScenarioTable, ListsEveryBindingInOrder)
{
    const auto &table = scenarios::kScenariosBindings;
    ASSERT_EQ(table.size(), 18u);
    EXPECT_EQ(table[0].name, "add");
    EXPECT_EQ(table[0].fastCall, &scenarios::kAddFastCall);
    EXPECT_EQ(table[1].name, "isEven");
    EXPECT_EQ(table[14].name, "describe");
    EXPECT_EQ(table[14].fastCall, nullptr);
    EXPECT_EQ(table[13].name, "sumBytes");
    EXPECT_EQ(table[17].name, "accumulate");
    EXPECT_TRUE(table[17].needsCapsule);
    EXPECT_EQ(table[17].fastCall, &scenarios::kAccumulateFastCall);
    EXPECT_FALSE(table[15].needsCapsule);
}

TEST(ScenarioTable, InstallsOntoTheGlobalObject)
{
    FakeEngine engine;
    auto global = engine.currentContext().global();
    auto installed = tether::runtime::installBindings(engine, global, scenarios::kScenariosBindings);
    ASSERT_TRUE(installed.isOk());
    ASSERT_EQ(installed.value().size(), 1u);
    EXPECT_EQ(installed.value().front(), "accumulate");

    auto isEven = global->get(engine, "isEven").as<host::Function>();
    auto out = engine.call(isEven, {engine.newNumber(6)});
    ASSERT_FALSE(out.threw());
    EXPECT_TRUE(out.returned.as<host::Boolean>()->value());

    auto greet = global->get(engine, "greet").as<host::Function>();
    auto failed = engine.call(greet, {engine.newNumber(6)});
    ASSERT_TRUE(failed.threw());
    EXPECT_EQ(errorKind(failed.exception), "TypeError");
    EXPECT_TRUE(global->get(engine, "accumulate")->isUndefined());
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
