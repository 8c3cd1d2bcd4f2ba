//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/CodeWriter.hpp
// Purpose: Indentation-aware line writer used by the emitters.
// Key invariants: Generated code uses Allman braces and four-space indents;
//                 every open() is matched by a close().
// Ownership/Lifetime: Owns its buffer; str() copies it out.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace tether::bind
{

class CodeWriter
{
  public:
    /// @brief Write one indented line. An empty @p text writes a blank line.
    void line(std::string_view text = {});

    /// @brief Write @p header, then `{` on its own line, and indent.
    void open(std::string_view header);

    /// @brief Dedent and write `}` followed by @p suffix.
    void close(std::string_view suffix = {});

    /// @brief Write text verbatim without indentation or newline.
    void raw(std::string_view text);

    [[nodiscard]] std::string str() const
    {
        return out_.str();
    }

  private:
    std::ostringstream out_;
    int depth_ = 0;
};

/// @brief Quote @p text as a C++ string literal.
std::string cppStringLiteral(std::string_view text);

/// @brief `async_divide` -> `AsyncDivide`.
std::string pascalCase(std::string_view name);

} // namespace tether::bind
