//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the lightweight source location used by manifest
//          diagnostics.
// Key invariants: file_id == 0 denotes an invalid location; line/column are
//                 1-based when valid.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace tether::support
{

/// @brief Represents an absolute position within a manifest file.
/// @invariant file_id == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a registered file.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace tether::support
