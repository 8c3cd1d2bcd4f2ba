//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/TypeRef.hpp
// Purpose: Structured type description produced by the manifest front end and
//          consumed by the classifier and the emitters.
// Key invariants: A unit type has an empty path and no arguments. Every other
//                 TypeRef has at least one path segment.
// Ownership/Lifetime: Value type; owns its segments and arguments.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::bind
{

/// @brief A possibly qualified, possibly generic type name such as
///        `std::optional<String>` or `Result<f64, String>`.
struct TypeRef
{
    /// Qualified name split on `::`; empty for the unit type `()`.
    std::vector<std::string> path;

    /// Generic arguments in declaration order.
    std::vector<TypeRef> args;

    /// @brief Build a named type; @p qualified may contain `::` separators.
    static TypeRef named(std::string_view qualified, std::vector<TypeRef> args = {});

    /// @brief The unit type `()`.
    static TypeRef unit();

    [[nodiscard]] bool isUnit() const
    {
        return path.empty();
    }

    /// @brief Last path segment, or an empty view for the unit type.
    [[nodiscard]] std::string_view lastSegment() const;

    /// @brief Path joined with `::`.
    [[nodiscard]] std::string qualifiedName() const;

    /// @brief Spelling as written in the manifest, e.g. `Result<f64, String>`.
    [[nodiscard]] std::string display() const;

    /// @brief Canonical C++ spelling used in generated code, e.g.
    ///        `tether::Result<double, std::string>`.
    [[nodiscard]] std::string cppSpelling() const;

    bool operator==(const TypeRef &other) const = default;
};

/// @brief Parse a standalone type spelling such as `shared<Counter>`.
/// @return The parsed type, or std::nullopt when @p text is malformed.
std::optional<TypeRef> parseTypeRef(std::string_view text);

} // namespace tether::bind
