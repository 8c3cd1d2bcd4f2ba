//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager used by the manifest front end. The manager
// assigns stable numeric identifiers to manifest paths and resolves them back
// to normalized strings when diagnostics are printed.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace tether::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a manifest path and assign it a stable identifier.
///
/// @details Paths are normalized so the same manifest reached through two
///          spellings ("./a.tether" and "a.tether") shares one identifier.
///          Identifiers start at one; zero stays reserved for "unknown".
///
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0), or 0 when the identifier space is exhausted.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        printDiag(makeError({}, "source manager exhausted file identifier space"), std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Retrieve the canonical path associated with a file identifier.
/// @param file_id 1-based identifier previously returned by addFile().
/// @return Stored path, or an empty view if @p file_id is unknown.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}
} // namespace tether::support
