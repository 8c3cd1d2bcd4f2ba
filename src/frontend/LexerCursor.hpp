//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/LexerCursor.hpp
// Purpose: Character cursor with line/column tracking for the manifest lexer.
//
// Key Invariants:
//   - Position tracking maintains 1-based line and column numbers
//   - EOF is indicated by returning '\0' from peek operations
//   - Newlines increment line and reset column to 1
//
//===----------------------------------------------------------------------===//
#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tether::frontend
{

/// @brief CRTP base class for lexer cursor management.
/// @details Derived class must provide source() returning std::string_view.
template <typename Derived> class LexerCursor
{
  public:
    explicit LexerCursor(uint32_t fileId) : fileId_(fileId) {}

    /// @return The current character, or '\0' at end of source.
    [[nodiscard]] char peek() const
    {
        auto src = static_cast<const Derived *>(this)->source();
        return pos_ < src.size() ? src[pos_] : '\0';
    }

    /// @return The character @p offset ahead, or '\0' beyond the end.
    [[nodiscard]] char peek(std::size_t offset) const
    {
        auto src = static_cast<const Derived *>(this)->source();
        std::size_t idx = pos_ + offset;
        return idx < src.size() ? src[idx] : '\0';
    }

    /// @brief Consume and return the current character.
    char get()
    {
        auto src = static_cast<const Derived *>(this)->source();
        if (pos_ >= src.size())
            return '\0';
        char c = src[pos_++];
        if (c == '\n')
        {
            line_++;
            column_ = 1;
        }
        else
        {
            column_++;
        }
        return c;
    }

    [[nodiscard]] bool eof() const
    {
        return pos_ >= static_cast<const Derived *>(this)->source().size();
    }

    /// @brief Location of the next unread character.
    [[nodiscard]] support::SourceLoc here() const noexcept
    {
        return support::SourceLoc{fileId_, line_, column_};
    }

  protected:
    std::size_t pos_{0};
    uint32_t line_{1};
    uint32_t column_{1};
    uint32_t fileId_;
};

} // namespace tether::frontend
