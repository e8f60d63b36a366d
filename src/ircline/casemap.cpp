/**
 * \file
 * \author Mattia Basaglia
 * \copyright Copyright 2016 Mattia Basaglia
 * \section License
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "casemap.hpp"

#include <algorithm>
#include <functional>

namespace ircline {

/**
 * \brief Lower case form of a single character
 */
static char fold_char(char c, CaseMapping mapping)
{
    if ( c >= 'A' && c <= 'Z' )
        return c - 'A' + 'a';

    if ( mapping == CaseMapping::Ascii )
        return c;

    switch ( c )
    {
        case '[':  return '{';
        case ']':  return '}';
        case '\\': return '|';
        case '~':  return mapping == CaseMapping::Rfc1459 ? '^' : c;
        default:   return c;
    }
}

/**
 * \brief Upper case form of a single character
 */
static char upper_char(char c, CaseMapping mapping)
{
    if ( c >= 'a' && c <= 'z' )
        return c - 'a' + 'A';

    if ( mapping == CaseMapping::Ascii )
        return c;

    switch ( c )
    {
        case '{': return '[';
        case '}': return ']';
        case '|': return '\\';
        case '^': return mapping == CaseMapping::Rfc1459 ? '~' : c;
        default:  return c;
    }
}

std::string fold(std::string text, CaseMapping mapping)
{
    std::transform(text.begin(), text.end(), text.begin(),
        [mapping](char c) { return fold_char(c, mapping); });
    return text;
}

std::string upper(std::string text, CaseMapping mapping)
{
    std::transform(text.begin(), text.end(), text.begin(),
        [mapping](char c) { return upper_char(c, mapping); });
    return text;
}

bool fold_equal(const std::string& a, const std::string& b, CaseMapping mapping)
{
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [mapping](char l, char r) {
            return fold_char(l, mapping) == fold_char(r, mapping);
        });
}

Optional<CaseMapping> casemapping_from_name(const std::string& name)
{
    if ( name == "ascii" )
        return CaseMapping::Ascii;
    if ( name == "rfc1459" )
        return CaseMapping::Rfc1459;
    if ( name == "strict-rfc1459" || name == "rfc1459-strict" )
        return CaseMapping::Rfc1459Strict;
    return none;
}

std::string casemapping_name(CaseMapping mapping)
{
    switch ( mapping )
    {
        case CaseMapping::Ascii:         return "ascii";
        case CaseMapping::Rfc1459:       return "rfc1459";
        case CaseMapping::Rfc1459Strict: return "strict-rfc1459";
    }
    return "rfc1459";
}

std::size_t FoldedHash::operator()(const std::string& text) const
{
    return std::hash<std::string>()(fold(text, mapping));
}

} // namespace ircline
