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
#include "stringutils.hpp"

namespace ircline {
namespace string {

std::vector<std::string> char_split(const std::string& input,
                                    char separator,
                                    bool skip_empty)
{
    std::vector<std::string> out;

    auto begin = input.begin();
    while (true)
    {
        auto next = std::find(begin, input.end(),separator);
        if ( !skip_empty || next != begin )
            out.emplace_back(begin,next);
        if ( next == input.end() )
            break;
        begin = next+1;
    }
    return out;
}

std::string trim(const std::string& input, const std::string& characters)
{
    auto first = input.find_first_not_of(characters);
    if ( first == std::string::npos )
        return {};
    auto last = input.find_last_not_of(characters);
    return input.substr(first, last - first + 1);
}

} // namespace string
} // namespace ircline
