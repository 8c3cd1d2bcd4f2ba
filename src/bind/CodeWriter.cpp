//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the line writer and the small text helpers shared by the slow
// and fast path emitters.
//
//===----------------------------------------------------------------------===//

#include "bind/CodeWriter.hpp"

#include <cctype>
#include <cstdio>

namespace tether::bind
{

void CodeWriter::line(std::string_view text)
{
    if (!text.empty())
    {
        for (int i = 0; i < depth_; ++i)
            out_ << "    ";
        out_ << text;
    }
    out_ << '\n';
}

void CodeWriter::open(std::string_view header)
{
    if (!header.empty())
        line(header);
    line("{");
    ++depth_;
}

void CodeWriter::close(std::string_view suffix)
{
    if (depth_ > 0)
        --depth_;
    std::string text = "}";
    text.append(suffix);
    line(text);
}

void CodeWriter::raw(std::string_view text)
{
    out_ << text;
}

std::string cppStringLiteral(std::string_view text)
{
    std::string out = "\"";
    for (char ch : text)
    {
        switch (ch)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\%03o", static_cast<unsigned char>(ch));
                    out += buf;
                }
                else
                {
                    out += ch;
                }
        }
    }
    out += '"';
    return out;
}

std::string pascalCase(std::string_view name)
{
    std::string out;
    bool upper = true;
    for (char ch : name)
    {
        if (ch == '_')
        {
            upper = true;
            continue;
        }
        out += upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(ch))) : ch;
        upper = false;
    }
    return out;
}

} // namespace tether::bind
