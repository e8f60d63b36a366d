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
#include "tags.hpp"

#include <cctype>

namespace ircline {

std::string encode_tag_value(const std::string& raw)
{
    std::string out;
    out.reserve(raw.size());
    for ( char c : raw )
    {
        switch ( c )
        {
            case ';':  out += "\\:";  break;
            case ' ':  out += "\\s";  break;
            case '\\': out += "\\\\"; break;
            case '\r': out += "\\r";  break;
            case '\n': out += "\\n";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

std::string decode_tag_value(const std::string& escaped, bool& recovered)
{
    recovered = false;
    std::string out;
    out.reserve(escaped.size());

    for ( std::string::size_type i = 0; i < escaped.size(); i++ )
    {
        if ( escaped[i] != '\\' )
        {
            out += escaped[i];
            continue;
        }

        if ( ++i == escaped.size() )
        {
            recovered = true;
            break;
        }

        switch ( escaped[i] )
        {
            case ':':  out += ';';  break;
            case 's':  out += ' ';  break;
            case '\\': out += '\\'; break;
            case 'r':  out += '\r'; break;
            case 'n':  out += '\n'; break;
            default:
                recovered = true;
                out += escaped[i];
                break;
        }
    }

    return out;
}

std::string decode_tag_value(const std::string& escaped)
{
    bool recovered;
    return decode_tag_value(escaped, recovered);
}

/**
 * \brief Characters allowed in the name part of a tag key
 */
static bool is_key_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
}

bool is_valid_tag_key(const std::string& key)
{
    std::string::size_type start = 0;
    if ( !key.empty() && key[0] == '+' )
        start = 1;

    auto slash = key.rfind('/');
    if ( slash != std::string::npos )
    {
        if ( slash <= start )
            return false;
        for ( auto i = start; i < slash; i++ )
        {
            if ( !is_key_char(key[i]) && key[i] != '.' )
                return false;
        }
        start = slash + 1;
    }

    if ( start >= key.size() )
        return false;

    for ( auto i = start; i < key.size(); i++ )
    {
        if ( !is_key_char(key[i]) )
            return false;
    }

    return true;
}

} // namespace ircline
