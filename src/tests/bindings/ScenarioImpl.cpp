//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Native definitions for the functions declared in scenarios.tether. The
// prototypes come from the generated header, so a signature drift between the
// manifest and this file fails to compile.
//
//===----------------------------------------------------------------------===//

#include "scenarios.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <system_error>

namespace scenarios
{

int64_t gBumpedTotal = 0;

double add(double a, double b)
{
    return a + b;
}

bool is_even(uint32_t n)
{
    return n % 2 == 0;
}

void bump_total(int64_t amount)
{
    gBumpedTotal += amount;
}

std::string greet(std::string name, std::optional<std::string> title)
{
    if (title)
        return *title + " " + name;
    return name;
}

std::string concat(std::vector<std::string> parts, std::optional<std::string> separator)
{
    const std::string sep = separator.value_or("");
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        if (i != 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

std::optional<int32_t> clamp_optional(std::optional<int32_t> value, std::optional<int32_t> limit)
{
    if (!value)
        return std::nullopt;
    if (limit)
        return std::min(*value, *limit);
    return value;
}

int64_t big_number(uint32_t shift)
{
    return int64_t{1} << std::min<uint32_t>(shift, 62);
}

std::string describe_point(Point p)
{
    std::ostringstream os;
    os << "(" << p.x << ", " << p.y << ")";
    return os.str();
}

Point midpoint(Point a, Point b)
{
    return Point{(a.x + b.x) / 2.0, (a.y + b.y) / 2.0};
}

tether::Result<double, std::string> parse_number(std::string text)
{
    double value = 0.0;
    const char *begin = text.data();
    const char *end = begin + text.size();
    const auto parsed = std::from_chars(begin, end, value);
    if (text.empty() || parsed.ec != std::errc() || parsed.ptr != end)
        return tether::Result<double, std::string>::failure("not a number: '" + text + "'");
    return value;
}

tether::Result<double, std::string> async_divide(double a, double b)
{
    if (b == 0.0)
        return tether::Result<double, std::string>::failure(std::string("division by zero"));
    return a / b;
}

uint32_t async_length(std::string text)
{
    return static_cast<uint32_t>(text.size());
}

tether::Result<tether::host::Local<tether::host::Value>, std::string> call_twice(
    tether::host::Scope &scope,
    tether::host::Local<tether::host::Function> callback,
    tether::host::Local<tether::host::Value> value)
{
    using CallResult = tether::Result<tether::host::Local<tether::host::Value>, std::string>;
    tether::host::Local<tether::host::Value> current = value;
    for (int i = 0; i < 2; ++i)
    {
        const tether::host::Local<tether::host::Value> argv[] = {current};
        current = callback->call(scope, scope.undefined(), argv);
        if (current.isEmpty())
            return CallResult::failure(std::string("callback failed on call ") +
                                       std::to_string(i + 1));
    }
    return current;
}

uint32_t sum_bytes(tether::host::Local<tether::host::Uint8Array> data)
{
    std::vector<uint8_t> bytes(data->byteLength());
    data->copyContents(bytes);
    uint32_t sum = 0;
    for (uint8_t b : bytes)
        sum += b;
    return sum;
}

std::string describe(tether::host::Local<tether::host::Value> value)
{
    return value->typeName() + ":" + value->toDisplayString();
}

int32_t increment(const std::shared_ptr<Counter> &state, int32_t amount)
{
    state->value += amount;
    return state->value;
}

tether::Result<void, std::string> checked_reset(const std::shared_ptr<Counter> &state, int32_t to)
{
    if (to < 0)
        return tether::Result<void, std::string>::failure("counter cannot be negative");
    state->value = to;
    return {};
}

double accumulate(Accumulator &state, double amount)
{
    state.total += amount;
    ++state.calls;
    return state.total;
}

} // namespace scenarios
