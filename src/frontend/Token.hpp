//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the manifest lexer.
///
/// `fn`, `include`, `namespace`, `true` and `false` are reserved. Every other
/// word, including the option keys, lexes as an Identifier. `<` and `>` are
/// always single tokens so nested generics such as `Result<Vec<u8>>` need no
/// special splitting in the parser.
///
/// @invariant Each token has a valid TokenKind and SourceLoc.
/// @invariant String tokens carry their unescaped contents in text; Error
///            tokens carry the diagnostic message in text.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <string>

namespace tether::frontend
{

enum class TokenKind
{
    Eof,
    Error,
    Identifier,
    String,

    KwFn,
    KwInclude,
    KwNamespace,
    KwTrue,
    KwFalse,

    LParen,
    RParen,
    LBracket,
    RBracket,
    Less,
    Greater,
    Comma,
    Colon,
    ColonColon,
    Semicolon,
    Arrow,
    Equals,
};

struct Token
{
    TokenKind kind = TokenKind::Eof;
    std::string text;
    support::SourceLoc loc;
};

/// @brief Human-readable token description used in "expected X, got Y".
const char *tokenKindToString(TokenKind kind);

} // namespace tether::frontend
