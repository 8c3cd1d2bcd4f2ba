//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping manifest file ids to paths.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tether::support
{

/// Maintains the mapping between numeric file identifiers and the manifest
/// paths they stand for. Diagnostics carry only the identifier; printing
/// resolves it back through this table.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @return File path view, empty for unknown identifiers.
    std::string_view getPath(uint32_t file_id) const;

  private:
    /// Stored paths; std::deque keeps references stable as files are added.
    std::deque<std::string> files_;

    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace tether::support
