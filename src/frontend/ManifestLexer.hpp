//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/ManifestLexer.hpp
// Purpose: Tokenizer for `.tether` manifests.
// Key invariants: next() never throws; malformed input yields an Error token
//                 and lexing resumes after the offending character.
// Ownership/Lifetime: Borrows the source text, which must outlive the lexer.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/LexerCursor.hpp"
#include "frontend/Token.hpp"

#include <cstdint>
#include <string_view>

namespace tether::frontend
{

class ManifestLexer : public LexerCursor<ManifestLexer>
{
  public:
    ManifestLexer(std::string_view source, uint32_t fileId);

    /// @brief Produce the next token; Eof once the input is exhausted.
    Token next();

    [[nodiscard]] std::string_view source() const
    {
        return source_;
    }

  private:
    /// @brief Skip whitespace, `//` line comments and `/* */` block comments.
    /// @return False when a block comment is unterminated.
    bool skipTrivia();

    Token lexIdentifier(support::SourceLoc loc);
    Token lexString(support::SourceLoc loc);

    std::string_view source_;
};

} // namespace tether::frontend
