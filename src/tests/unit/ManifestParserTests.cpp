//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/ManifestParserTests.cpp
// Purpose: Validate the manifest lexer and parser: items, attribute forms,
//          parameter roles, types and error recovery.
// Key invariants: Syntax errors carry a location and parsing resumes at the
//                 next ';'.
// Ownership/Lifetime: Test-local source strings and diagnostic engines.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/ManifestLexer.hpp"
#include "frontend/ManifestParser.hpp"
#include "support/diagnostics.hpp"

#include <string>
#include <vector>

using namespace tether::frontend;
using tether::bind::ParamRole;
using tether::bind::RawOption;
using tether::support::DiagKind;
using tether::support::DiagnosticEngine;

namespace
{

std::vector<TokenKind> lexAll(std::string_view source)
{
    ManifestLexer lexer(source, 1);
    std::vector<TokenKind> kinds;
    for (Token tok = lexer.next(); tok.kind != TokenKind::Eof; tok = lexer.next())
        kinds.push_back(tok.kind);
    return kinds;
}

} // namespace

TEST(ManifestLexer, PunctuationAndKeywords)
{
    const std::vector<TokenKind> expected{TokenKind::LBracket,
                                          TokenKind::Identifier,
                                          TokenKind::RBracket,
                                          TokenKind::KwFn,
                                          TokenKind::Identifier,
                                          TokenKind::LParen,
                                          TokenKind::Identifier,
                                          TokenKind::Colon,
                                          TokenKind::Identifier,
                                          TokenKind::ColonColon,
                                          TokenKind::Identifier,
                                          TokenKind::Less,
                                          TokenKind::Identifier,
                                          TokenKind::Greater,
                                          TokenKind::RParen,
                                          TokenKind::Arrow,
                                          TokenKind::LParen,
                                          TokenKind::RParen,
                                          TokenKind::Semicolon};
    EXPECT_EQ(lexAll("[fast] fn f(x: a::Vec<u8>) -> ();"), expected);
}

TEST(ManifestLexer, CommentsAreSkipped)
{
    const std::vector<TokenKind> expected{TokenKind::KwInclude, TokenKind::String,
                                          TokenKind::Semicolon};
    EXPECT_EQ(lexAll("// line\ninclude /* block\n comment */ \"x.hpp\";"), expected);
}

TEST(ManifestLexer, StringEscapesAndLocations)
{
    ManifestLexer lexer("\n  \"a\\\"b\\n\"", 7);
    const Token tok = lexer.next();
    ASSERT_EQ(tok.kind, TokenKind::String);
    EXPECT_EQ(tok.text, "a\"b\n");
    EXPECT_EQ(tok.loc.file_id, 7u);
    EXPECT_EQ(tok.loc.line, 2u);
    EXPECT_EQ(tok.loc.column, 3u);
}

TEST(ManifestLexer, ErrorTokens)
{
    EXPECT_EQ(ManifestLexer("\"open", 1).next().text, "unterminated string literal");
    EXPECT_EQ(ManifestLexer("\"\\q\"", 1).next().text, "unknown escape sequence '\\q'");
    EXPECT_EQ(ManifestLexer("/* never closed", 1).next().text, "unterminated block comment");
    const Token bad = ManifestLexer("@", 1).next();
    EXPECT_EQ(bad.kind, TokenKind::Error);
    EXPECT_EQ(bad.text, "unexpected character '@'");
}

TEST(ManifestParser, IncludesAndNamespace)
{
    DiagnosticEngine diags;
    const Manifest m = parseManifest(
        "namespace app::bindings;\ninclude \"app/Types.hpp\";\ninclude \"<map>\";\n", 1, diags);
    EXPECT_EQ(diags.errorCount(), 0u);
    ASSERT_TRUE(m.cppNamespace.has_value());
    EXPECT_EQ(*m.cppNamespace, "app::bindings");
    ASSERT_EQ(m.includes.size(), 2u);
    EXPECT_EQ(m.includes[0], "app/Types.hpp");
    EXPECT_EQ(m.includes[1], "<map>");
}

TEST(ManifestParser, FunctionWithEveryPart)
{
    DiagnosticEngine diags;
    const Manifest m = parseManifest(
        "[fast] fn step(scope, state, n: Option<i32>, cb: Local<Function>) -> Result<f64, String> "
        "[state = shared<Counter>];",
        1,
        diags);
    EXPECT_EQ(diags.errorCount(), 0u);
    ASSERT_EQ(m.functions.size(), 1u);
    const auto &fn = m.functions.front();
    EXPECT_EQ(fn.name, "step");
    EXPECT_EQ(fn.loc.line, 1u);
    ASSERT_EQ(fn.params.size(), 4u);
    EXPECT_EQ(fn.params[0].role, ParamRole::Scope);
    EXPECT_EQ(fn.params[1].role, ParamRole::State);
    EXPECT_EQ(fn.params[2].role, ParamRole::Value);
    EXPECT_EQ(fn.params[2].type.display(), "Option<i32>");
    EXPECT_EQ(fn.params[3].type.display(), "Local<Function>");
    EXPECT_EQ(fn.returnType.display(), "Result<f64, String>");
    ASSERT_EQ(fn.options.size(), 2u);
    EXPECT_EQ(fn.options[0].key, "fast");
    EXPECT_EQ(fn.options[0].shape, RawOption::Shape::Flag);
    EXPECT_EQ(fn.options[1].key, "state");
    EXPECT_EQ(fn.options[1].shape, RawOption::Shape::Type);
    EXPECT_EQ(fn.options[1].typeValue.display(), "shared<Counter>");
}

TEST(ManifestParser, OptionValueForms)
{
    DiagnosticEngine diags;
    const Manifest m = parseManifest(
        "[\"jsName\", promise = false, fast = true, name = \"other\"] fn f();", 1, diags);
    EXPECT_EQ(diags.errorCount(), 0u);
    ASSERT_EQ(m.functions.size(), 1u);
    const auto &opts = m.functions.front().options;
    ASSERT_EQ(opts.size(), 4u);
    EXPECT_EQ(opts[0].key, "name");
    EXPECT_EQ(opts[0].shape, RawOption::Shape::String);
    EXPECT_EQ(opts[0].stringValue, "jsName");
    EXPECT_EQ(opts[1].shape, RawOption::Shape::Bool);
    EXPECT_FALSE(opts[1].boolValue);
    EXPECT_EQ(opts[2].shape, RawOption::Shape::Bool);
    EXPECT_TRUE(opts[2].boolValue);
    EXPECT_EQ(opts[3].stringValue, "other");
}

TEST(ManifestParser, MissingArrowMeansUnit)
{
    DiagnosticEngine diags;
    const Manifest m = parseManifest("fn ping();", 1, diags);
    ASSERT_EQ(m.functions.size(), 1u);
    EXPECT_TRUE(m.functions.front().returnType.isUnit());
    EXPECT_TRUE(m.functions.front().params.empty());
}

TEST(ManifestParser, TypedScopeParameterKeepsRole)
{
    DiagnosticEngine diags;
    const Manifest m = parseManifest("fn f(_scope: Scope, x: i32);", 1, diags);
    EXPECT_EQ(diags.errorCount(), 0u);
    ASSERT_EQ(m.functions.size(), 1u);
    EXPECT_EQ(m.functions.front().params[0].role, ParamRole::Scope);
}

TEST(ManifestParser, UntypedValueParameterIsAnError)
{
    DiagnosticEngine diags;
    const Manifest m = parseManifest("fn f(x);", 1, diags);
    EXPECT_TRUE(m.functions.empty());
    ASSERT_EQ(diags.errorCount(), 1u);
    EXPECT_EQ(diags.diagnostics().front().message, "parameter 'x' needs a type");
    EXPECT_EQ(diags.diagnostics().front().kind, DiagKind::Syntax);
}

TEST(ManifestParser, RecoversAtNextSemicolon)
{
    DiagnosticEngine diags;
    const Manifest m = parseManifest("fn a(x: i32;\n"
                                     "fn b() -> ;\n"
                                     "fn c(y: f64) -> f64;\n",
                                     1,
                                     diags);
    EXPECT_EQ(diags.errorCount(), 2u);
    ASSERT_EQ(m.functions.size(), 1u);
    EXPECT_EQ(m.functions.front().name, "c");
    EXPECT_EQ(diags.diagnostics()[0].message, "expected ')', got ';'");
    EXPECT_EQ(diags.diagnostics()[1].loc.line, 2u);
}

TEST(ManifestParser, MissingSemicolonResyncsAtNextFunction)
{
    DiagnosticEngine diags;
    const Manifest m = parseManifest("fn a()\nfn b();", 1, diags);
    EXPECT_EQ(diags.errorCount(), 1u);
    ASSERT_EQ(m.functions.size(), 1u);
    EXPECT_EQ(m.functions.front().name, "b");
}

TEST(ManifestParser, DuplicateNamespaceIsAnError)
{
    DiagnosticEngine diags;
    const Manifest m = parseManifest("namespace a;\nnamespace b;\n", 1, diags);
    EXPECT_EQ(diags.errorCount(), 1u);
    EXPECT_EQ(m.cppNamespace.value_or(""), "a");
    EXPECT_EQ(diags.diagnostics().front().message, "namespace already declared as 'a'");
}

TEST(ManifestParser, StrayTokenIsReported)
{
    DiagnosticEngine diags;
    parseManifest("42", 1, diags);
    ASSERT_EQ(diags.errorCount(), 1u);
    EXPECT_EQ(diags.diagnostics().front().message, "unexpected character '4'");
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
