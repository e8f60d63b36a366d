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
#ifndef IRCLINE_STRING_UTILS_HPP
#define IRCLINE_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace ircline {
namespace string {

/**
 * \brief Turn a container into a string
 * \pre Container::const_iterator is a ForwardIterator
 *      Container::value_type has the stream operator
 */
template<class Container>
    std::string implode(const std::string& glue, const Container& elements)
    {
        auto iter = std::begin(elements);
        auto end = std::end(elements);
        if ( iter == end )
            return "";

        std::ostringstream ss;
        while ( true )
        {
            ss << *iter;
            ++iter;
            if ( iter != end )
                ss << glue;
            else
                break;
        }

        return ss.str();
    }

/**
 * \brief Whether a string starts with the given prefix
 */
inline bool starts_with(const std::string& haystack, const std::string& prefix)
{
    auto it1 = haystack.begin();
    auto it2 = prefix.begin();
    while ( it1 != haystack.end() && it2 != prefix.end() && *it1 == *it2 )
    {
        ++it1;
        ++it2;
    }
    return it2 == prefix.end();
}

/**
 * \brief Separate the string into components separated by \c separator
 */
std::vector<std::string> char_split(const std::string& input,
                                    char separator,
                                    bool skip_empty = true);

/**
 * \brief Removes leading and trailing characters found in \c characters
 */
std::string trim(const std::string& input, const std::string& characters = " \t\r\n");

/**
 * \brief Case-insensitive string comparison (ASCII only)
 */
inline bool icase_equal(const std::string& a, const std::string& b) noexcept
{
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(),
            [](char l, char r) {
                return std::tolower(static_cast<unsigned char>(l)) ==
                       std::tolower(static_cast<unsigned char>(r));
            });
}

/**
 * \brief Converts a number to string padding with zeros to have at least
 *      \c digits digits
 */
template<class T>
    std::string to_string(T number,int digits=-1)
    {
        auto s = std::to_string(number);
        if ( int(s.size()) < digits )
            s = std::string(digits-s.size(),'0')+s;
        return s;
    }

} // namespace string
} // namespace ircline
#endif // IRCLINE_STRING_UTILS_HPP
