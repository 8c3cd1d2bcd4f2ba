//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/ManifestParser.hpp
// Purpose: Recursive-descent parser turning a `.tether` manifest into
//          function declarations with raw binding options.
//
// Grammar:
//   manifest := item*
//   item     := 'include' STRING ';'
//             | 'namespace' qualified ';'
//             | attrs? 'fn' IDENT '(' params? ')' ('->' type)? attrs? ';'
//   attrs    := '[' option (',' option)* ']'
//   option   := IDENT ('=' (type | STRING | 'true' | 'false'))? | STRING
//   params   := param (',' param)*
//   param    := IDENT (':' type)?
//   type     := qualified ('<' type (',' type)* '>')? | '(' ')'
//
// Key invariants:
//   - Parameters named `scope` or `_scope` take the Scope role and `state`
//     takes the State role; any type written on them is ignored. Every other
//     parameter must be typed.
//   - After an error the parser skips to the next ';' so one run reports
//     every malformed item.
// Ownership/Lifetime: The parser borrows the source text and the
//                     diagnostic engine for the duration of parse().
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/Signature.hpp"
#include "bind/TypeRef.hpp"
#include "frontend/ManifestLexer.hpp"
#include "frontend/Token.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::frontend
{

/// @brief Parsed contents of one manifest file.
struct Manifest
{
    std::vector<std::string> includes;
    std::optional<std::string> cppNamespace;
    std::vector<bind::FunctionDecl> functions;
};

class ManifestParser
{
  public:
    ManifestParser(std::string_view source, uint32_t fileId, support::DiagnosticEngine &diags);

    /// @brief Parse the whole input.
    /// @details Syntax errors are reported to the diagnostic engine; the
    ///          returned manifest holds every item that parsed cleanly.
    Manifest parse();

  private:
    const Token &peek();
    Token advance();
    bool check(TokenKind kind);
    bool match(TokenKind kind, Token *out = nullptr);
    bool expect(TokenKind kind, const char *what, Token *out = nullptr);
    void error(support::SourceLoc loc, std::string message);
    void resyncAfterError();

    bool parseInclude(Manifest &manifest);
    bool parseNamespace(Manifest &manifest);
    bool parseFunction(Manifest &manifest);
    bool parseAttributes(std::vector<bind::RawOption> &options);
    std::optional<bind::RawOption> parseOption();
    std::optional<bind::Param> parseParam();
    std::optional<bind::TypeRef> parseType();
    std::optional<std::string> parseQualified(support::SourceLoc *loc = nullptr);

    ManifestLexer lexer_;
    support::DiagnosticEngine &diags_;
    std::optional<Token> lookahead_;
};

/// @brief Convenience wrapper around ManifestParser.
Manifest parseManifest(std::string_view source,
                       uint32_t fileId,
                       support::DiagnosticEngine &diags);

} // namespace tether::frontend
