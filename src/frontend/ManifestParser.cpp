//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ManifestParser.cpp
/// @brief Recursive-descent parser for `.tether` manifests.
///
//===----------------------------------------------------------------------===//

#include "frontend/ManifestParser.hpp"

#include "support/diag_expected.hpp"

namespace tether::frontend
{
using bind::FunctionDecl;
using bind::Param;
using bind::ParamRole;
using bind::RawOption;
using bind::TypeRef;

ManifestParser::ManifestParser(std::string_view source,
                               uint32_t fileId,
                               support::DiagnosticEngine &diags)
    : lexer_(source, fileId), diags_(diags)
{
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &ManifestParser::peek()
{
    if (!lookahead_)
        lookahead_ = lexer_.next();
    return *lookahead_;
}

Token ManifestParser::advance()
{
    Token cur = peek();
    lookahead_.reset();
    return cur;
}

bool ManifestParser::check(TokenKind kind)
{
    return peek().kind == kind;
}

bool ManifestParser::match(TokenKind kind, Token *out)
{
    if (!check(kind))
        return false;
    Token tok = advance();
    if (out)
        *out = std::move(tok);
    return true;
}

bool ManifestParser::expect(TokenKind kind, const char *what, Token *out)
{
    if (match(kind, out))
        return true;
    const Token &tok = peek();
    if (tok.kind == TokenKind::Error)
        error(tok.loc, tok.text);
    else
        error(tok.loc, std::string("expected ") + what + ", got " + tokenKindToString(tok.kind));
    return false;
}

void ManifestParser::error(support::SourceLoc loc, std::string message)
{
    diags_.report(support::makeError(loc, std::move(message), support::DiagKind::Syntax));
}

void ManifestParser::resyncAfterError()
{
    while (!check(TokenKind::Eof))
    {
        if (check(TokenKind::Semicolon))
        {
            advance();
            return;
        }
        if (check(TokenKind::KwFn) || check(TokenKind::KwInclude) ||
            check(TokenKind::KwNamespace))
        {
            return;
        }
        advance();
    }
}

//===----------------------------------------------------------------------===//
// Items
//===----------------------------------------------------------------------===//

Manifest ManifestParser::parse()
{
    Manifest manifest;
    while (!check(TokenKind::Eof))
    {
        bool ok = false;
        if (check(TokenKind::KwInclude))
        {
            ok = parseInclude(manifest);
        }
        else if (check(TokenKind::KwNamespace))
        {
            ok = parseNamespace(manifest);
        }
        else if (check(TokenKind::KwFn) || check(TokenKind::LBracket))
        {
            ok = parseFunction(manifest);
        }
        else
        {
            const Token tok = advance();
            if (tok.kind == TokenKind::Error)
                error(tok.loc, tok.text);
            else
                error(tok.loc,
                      std::string("expected 'fn', 'include' or 'namespace', got ") +
                          tokenKindToString(tok.kind));
        }
        if (!ok)
            resyncAfterError();
    }
    return manifest;
}

bool ManifestParser::parseInclude(Manifest &manifest)
{
    advance(); // include
    Token path;
    if (!expect(TokenKind::String, "include path", &path))
        return false;
    if (path.text.empty())
    {
        error(path.loc, "include path must not be empty");
        return false;
    }
    if (!expect(TokenKind::Semicolon, "';'"))
        return false;
    manifest.includes.push_back(std::move(path.text));
    return true;
}

bool ManifestParser::parseNamespace(Manifest &manifest)
{
    const Token kw = advance();
    auto name = parseQualified();
    if (!name)
        return false;
    if (!expect(TokenKind::Semicolon, "';'"))
        return false;
    if (manifest.cppNamespace)
    {
        error(kw.loc, "namespace already declared as '" + *manifest.cppNamespace + "'");
        return false;
    }
    manifest.cppNamespace = std::move(*name);
    return true;
}

bool ManifestParser::parseFunction(Manifest &manifest)
{
    FunctionDecl decl;
    if (check(TokenKind::LBracket) && !parseAttributes(decl.options))
        return false;
    if (!expect(TokenKind::KwFn, "'fn'"))
        return false;

    Token name;
    if (!expect(TokenKind::Identifier, "function name", &name))
        return false;
    decl.name = name.text;
    decl.loc = name.loc;

    if (!expect(TokenKind::LParen, "'('"))
        return false;
    if (!check(TokenKind::RParen))
    {
        do
        {
            auto param = parseParam();
            if (!param)
                return false;
            decl.params.push_back(std::move(*param));
        } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RParen, "')'"))
        return false;

    if (match(TokenKind::Arrow))
    {
        auto ret = parseType();
        if (!ret)
            return false;
        decl.returnType = std::move(*ret);
    }

    if (check(TokenKind::LBracket) && !parseAttributes(decl.options))
        return false;
    if (!expect(TokenKind::Semicolon, "';'"))
        return false;

    manifest.functions.push_back(std::move(decl));
    return true;
}

//===----------------------------------------------------------------------===//
// Attributes
//===----------------------------------------------------------------------===//

bool ManifestParser::parseAttributes(std::vector<RawOption> &options)
{
    advance(); // [
    do
    {
        auto option = parseOption();
        if (!option)
            return false;
        options.push_back(std::move(*option));
    } while (match(TokenKind::Comma));
    return expect(TokenKind::RBracket, "']'");
}

std::optional<RawOption> ManifestParser::parseOption()
{
    RawOption option;
    Token tok;
    if (match(TokenKind::String, &tok))
    {
        option.key = "name";
        option.shape = RawOption::Shape::String;
        option.stringValue = std::move(tok.text);
        option.loc = tok.loc;
        return option;
    }
    if (!expect(TokenKind::Identifier, "option name", &tok))
        return std::nullopt;
    option.key = tok.text;
    option.loc = tok.loc;

    if (!match(TokenKind::Equals))
    {
        option.shape = RawOption::Shape::Flag;
        option.boolValue = true;
        return option;
    }

    Token value;
    if (match(TokenKind::KwTrue) || match(TokenKind::KwFalse, &value))
    {
        option.shape = RawOption::Shape::Bool;
        option.boolValue = value.kind != TokenKind::KwFalse;
        return option;
    }
    if (match(TokenKind::String, &value))
    {
        option.shape = RawOption::Shape::String;
        option.stringValue = std::move(value.text);
        return option;
    }
    auto type = parseType();
    if (!type)
        return std::nullopt;
    option.shape = RawOption::Shape::Type;
    option.typeValue = std::move(*type);
    return option;
}

//===----------------------------------------------------------------------===//
// Parameters and Types
//===----------------------------------------------------------------------===//

std::optional<Param> ManifestParser::parseParam()
{
    Token name;
    if (!expect(TokenKind::Identifier, "parameter name", &name))
        return std::nullopt;

    Param param;
    param.name = name.text;
    param.loc = name.loc;
    if (name.text == "scope" || name.text == "_scope")
        param.role = ParamRole::Scope;
    else if (name.text == "state")
        param.role = ParamRole::State;

    if (match(TokenKind::Colon))
    {
        auto type = parseType();
        if (!type)
            return std::nullopt;
        param.type = std::move(*type);
    }
    else if (param.role == ParamRole::Value)
    {
        error(name.loc, "parameter '" + name.text + "' needs a type");
        return std::nullopt;
    }
    return param;
}

std::optional<TypeRef> ManifestParser::parseType()
{
    if (match(TokenKind::LParen))
    {
        if (!expect(TokenKind::RParen, "')' of unit type"))
            return std::nullopt;
        return TypeRef::unit();
    }

    auto name = parseQualified();
    if (!name)
        return std::nullopt;
    TypeRef type = TypeRef::named(*name);
    if (match(TokenKind::Less))
    {
        do
        {
            auto arg = parseType();
            if (!arg)
                return std::nullopt;
            type.args.push_back(std::move(*arg));
        } while (match(TokenKind::Comma));
        if (!expect(TokenKind::Greater, "'>'"))
            return std::nullopt;
    }
    return type;
}

std::optional<std::string> ManifestParser::parseQualified(support::SourceLoc *loc)
{
    Token first;
    if (!expect(TokenKind::Identifier, "type name", &first))
        return std::nullopt;
    if (loc)
        *loc = first.loc;
    std::string name = first.text;
    while (match(TokenKind::ColonColon))
    {
        Token seg;
        if (!expect(TokenKind::Identifier, "name after '::'", &seg))
            return std::nullopt;
        name += "::" + seg.text;
    }
    return name;
}

Manifest parseManifest(std::string_view source, uint32_t fileId, support::DiagnosticEngine &diags)
{
    ManifestParser parser(source, fileId, diags);
    return parser.parse();
}

} // namespace tether::frontend
