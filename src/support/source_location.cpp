//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc. A location is valid when it refers
// to a file registered with the SourceManager; line and column are optional.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace tether::support
{
/// @brief Determine whether the location carries a real manifest attachment.
/// @return True when the location originated from a tracked manifest file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace tether::support
