//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the manifest tokenizer. The grammar is small enough that a single
// switch on the first character decides every token; identifiers and keywords
// share one path and are told apart by a table lookup afterwards.
//
//===----------------------------------------------------------------------===//

#include "frontend/ManifestLexer.hpp"

#include <string>

namespace tether::frontend
{
namespace
{

bool isIdentStart(char ch)
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

bool isIdentChar(char ch)
{
    return isIdentStart(ch) || (ch >= '0' && ch <= '9');
}

TokenKind keywordKind(std::string_view word)
{
    if (word == "fn")
        return TokenKind::KwFn;
    if (word == "include")
        return TokenKind::KwInclude;
    if (word == "namespace")
        return TokenKind::KwNamespace;
    if (word == "true")
        return TokenKind::KwTrue;
    if (word == "false")
        return TokenKind::KwFalse;
    return TokenKind::Identifier;
}

Token makeToken(TokenKind kind, std::string text, support::SourceLoc loc)
{
    return Token{kind, std::move(text), loc};
}

} // namespace

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of file";
        case TokenKind::Error:
            return "invalid token";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::String:
            return "string literal";
        case TokenKind::KwFn:
            return "'fn'";
        case TokenKind::KwInclude:
            return "'include'";
        case TokenKind::KwNamespace:
            return "'namespace'";
        case TokenKind::KwTrue:
            return "'true'";
        case TokenKind::KwFalse:
            return "'false'";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::LBracket:
            return "'['";
        case TokenKind::RBracket:
            return "']'";
        case TokenKind::Less:
            return "'<'";
        case TokenKind::Greater:
            return "'>'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::Colon:
            return "':'";
        case TokenKind::ColonColon:
            return "'::'";
        case TokenKind::Semicolon:
            return "';'";
        case TokenKind::Arrow:
            return "'->'";
        case TokenKind::Equals:
            return "'='";
    }
    return "token";
}

ManifestLexer::ManifestLexer(std::string_view source, uint32_t fileId)
    : LexerCursor(fileId), source_(source)
{
}

bool ManifestLexer::skipTrivia()
{
    while (!eof())
    {
        const char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
        {
            get();
        }
        else if (c == '/' && peek(1) == '/')
        {
            while (!eof() && peek() != '\n')
                get();
        }
        else if (c == '/' && peek(1) == '*')
        {
            get();
            get();
            while (!(peek() == '*' && peek(1) == '/'))
            {
                if (eof())
                    return false;
                get();
            }
            get();
            get();
        }
        else
        {
            break;
        }
    }
    return true;
}

Token ManifestLexer::lexIdentifier(support::SourceLoc loc)
{
    std::string word;
    while (isIdentChar(peek()))
        word += get();
    const TokenKind kind = keywordKind(word);
    return makeToken(kind, std::move(word), loc);
}

Token ManifestLexer::lexString(support::SourceLoc loc)
{
    get(); // opening quote
    std::string text;
    while (true)
    {
        if (eof() || peek() == '\n')
            return makeToken(TokenKind::Error, "unterminated string literal", loc);
        char c = get();
        if (c == '"')
            break;
        if (c == '\\')
        {
            const char esc = get();
            switch (esc)
            {
                case 'n':
                    text += '\n';
                    break;
                case 't':
                    text += '\t';
                    break;
                case '"':
                case '\\':
                    text += esc;
                    break;
                default:
                    return makeToken(TokenKind::Error,
                                     std::string("unknown escape sequence '\\") + esc + "'",
                                     loc);
            }
            continue;
        }
        text += c;
    }
    return makeToken(TokenKind::String, std::move(text), loc);
}

Token ManifestLexer::next()
{
    const support::SourceLoc commentLoc = here();
    if (!skipTrivia())
        return makeToken(TokenKind::Error, "unterminated block comment", commentLoc);

    const support::SourceLoc loc = here();
    if (eof())
        return makeToken(TokenKind::Eof, "", loc);

    const char c = peek();
    if (isIdentStart(c))
        return lexIdentifier(loc);
    if (c == '"')
        return lexString(loc);

    get();
    switch (c)
    {
        case '(':
            return makeToken(TokenKind::LParen, "(", loc);
        case ')':
            return makeToken(TokenKind::RParen, ")", loc);
        case '[':
            return makeToken(TokenKind::LBracket, "[", loc);
        case ']':
            return makeToken(TokenKind::RBracket, "]", loc);
        case '<':
            return makeToken(TokenKind::Less, "<", loc);
        case '>':
            return makeToken(TokenKind::Greater, ">", loc);
        case ',':
            return makeToken(TokenKind::Comma, ",", loc);
        case ';':
            return makeToken(TokenKind::Semicolon, ";", loc);
        case '=':
            return makeToken(TokenKind::Equals, "=", loc);
        case ':':
            if (peek() == ':')
            {
                get();
                return makeToken(TokenKind::ColonColon, "::", loc);
            }
            return makeToken(TokenKind::Colon, ":", loc);
        case '-':
            if (peek() == '>')
            {
                get();
                return makeToken(TokenKind::Arrow, "->", loc);
            }
            break;
        default:
            break;
    }
    return makeToken(TokenKind::Error, std::string("unexpected character '") + c + "'", loc);
}

} // namespace tether::frontend
