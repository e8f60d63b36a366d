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
#include "mask.hpp"

namespace ircline {

bool matches(const std::string& candidate, const std::string& pattern,
             CaseMapping mapping)
{
    std::string text = fold(candidate, mapping);
    std::string mask = fold(pattern, mapping);

    using size_type = std::string::size_type;
    size_type t = 0;
    size_type m = 0;
    // Position of the last * seen and of the text when it was seen
    size_type star = std::string::npos;
    size_type star_text = 0;

    while ( t < text.size() )
    {
        if ( m < mask.size() && (mask[m] == '?' || mask[m] == text[t]) && mask[m] != '*' )
        {
            t++;
            m++;
        }
        else if ( m < mask.size() && mask[m] == '*' )
        {
            star = m++;
            star_text = t;
        }
        else if ( star != std::string::npos )
        {
            m = star + 1;
            t = ++star_text;
        }
        else
        {
            return false;
        }
    }

    while ( m < mask.size() && mask[m] == '*' )
        m++;

    return m == mask.size();
}

} // namespace ircline
