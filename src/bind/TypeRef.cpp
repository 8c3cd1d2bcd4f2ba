//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements rendering and standalone parsing of TypeRef trees. Display
// rendering reproduces the manifest spelling; C++ rendering maps the
// recognized wrapper families onto the standard library and the Tether host
// contract so generated prototypes compile without user type aliases.
//
//===----------------------------------------------------------------------===//

#include "bind/TypeRef.hpp"

#include "bind/TypeNames.hpp"

#include <cctype>

namespace tether::bind
{
namespace
{

constexpr bool isIdentStart(char ch)
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

constexpr bool isIdentChar(char ch)
{
    return isIdentStart(ch) || (ch >= '0' && ch <= '9');
}

std::string joinArgs(const std::vector<TypeRef> &args, bool cpp)
{
    std::string out;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += cpp ? args[i].cppSpelling() : args[i].display();
    }
    return out;
}

/// @brief Recursive-descent reader for parseTypeRef().
class TypeReader
{
  public:
    explicit TypeReader(std::string_view text) : text_(text) {}

    std::optional<TypeRef> readAll()
    {
        auto type = readType();
        skipSpace();
        if (!type || pos_ != text_.size())
            return std::nullopt;
        return type;
    }

  private:
    void skipSpace()
    {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])))
            ++pos_;
    }

    bool consume(std::string_view token)
    {
        skipSpace();
        if (text_.substr(pos_, token.size()) != token)
            return false;
        pos_ += token.size();
        return true;
    }

    std::optional<std::string> readIdent()
    {
        skipSpace();
        if (pos_ >= text_.size() || !isIdentStart(text_[pos_]))
            return std::nullopt;
        size_t start = pos_;
        while (pos_ < text_.size() && isIdentChar(text_[pos_]))
            ++pos_;
        return std::string(text_.substr(start, pos_ - start));
    }

    std::optional<TypeRef> readType()
    {
        if (consume("("))
        {
            if (!consume(")"))
                return std::nullopt;
            return TypeRef::unit();
        }
        TypeRef type;
        auto first = readIdent();
        if (!first)
            return std::nullopt;
        type.path.push_back(std::move(*first));
        while (consume("::"))
        {
            auto seg = readIdent();
            if (!seg)
                return std::nullopt;
            type.path.push_back(std::move(*seg));
        }
        if (consume("<"))
        {
            do
            {
                auto arg = readType();
                if (!arg)
                    return std::nullopt;
                type.args.push_back(std::move(*arg));
            } while (consume(","));
            if (!consume(">"))
                return std::nullopt;
        }
        return type;
    }

    std::string_view text_;
    size_t pos_ = 0;
};

} // namespace

TypeRef TypeRef::named(std::string_view qualified, std::vector<TypeRef> args)
{
    TypeRef type;
    size_t start = 0;
    while (true)
    {
        size_t sep = qualified.find("::", start);
        type.path.emplace_back(qualified.substr(start, sep - start));
        if (sep == std::string_view::npos)
            break;
        start = sep + 2;
    }
    type.args = std::move(args);
    return type;
}

TypeRef TypeRef::unit()
{
    return TypeRef{};
}

std::string_view TypeRef::lastSegment() const
{
    if (path.empty())
        return {};
    return path.back();
}

std::string TypeRef::qualifiedName() const
{
    std::string out;
    for (size_t i = 0; i < path.size(); ++i)
    {
        if (i != 0)
            out += "::";
        out += path[i];
    }
    return out;
}

std::string TypeRef::display() const
{
    if (isUnit())
        return "()";
    std::string out = qualifiedName();
    if (!args.empty())
        out += "<" + joinArgs(args, false) + ">";
    return out;
}

std::string TypeRef::cppSpelling() const
{
    if (isUnit())
        return "void";
    if (args.empty())
    {
        if (auto prim = names::primitiveFromName(lastSegment()))
            return names::primitiveCpp(*prim);
        if (names::isString(*this))
            return "std::string";
        return qualifiedName();
    }
    if (names::isOptional(*this))
        return "std::optional<" + args.front().cppSpelling() + ">";
    if (names::isVector(*this))
        return "std::vector<" + args.front().cppSpelling() + ">";
    if (names::isShared(*this))
        return "std::shared_ptr<" + args.front().cppSpelling() + ">";
    if (names::isResult(*this))
        return "tether::Result<" + joinArgs(args, true) + ">";
    if (names::isHandle(*this))
        return "tether::host::Local<" + names::handleTargetCpp(args.front()) + ">";
    return qualifiedName() + "<" + joinArgs(args, true) + ">";
}

/// @brief Host-contract spelling of the K in `Local<K>`.
std::string names::handleTargetCpp(const TypeRef &inner)
{
    if (inner.isUnit() || !inner.args.empty())
        return inner.cppSpelling();
    const bool known = names::handleKindFromName(inner.lastSegment()) != HandleKind::Generic;
    const auto &head = inner.path.front();
    if (inner.path.size() == 1 || known || head == "tether" || head == "host" || head == "v8")
        return "tether::host::" + std::string(inner.lastSegment());
    return inner.qualifiedName();
}

std::optional<TypeRef> parseTypeRef(std::string_view text)
{
    return TypeReader(text).readAll();
}

} // namespace tether::bind
