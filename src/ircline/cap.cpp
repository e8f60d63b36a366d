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
#include "cap.hpp"

#include <algorithm>
#include <ostream>

#include "ircline/string/stringutils.hpp"

namespace ircline {

Cap Cap::parse(const std::string& text)
{
    auto equals = text.find('=');
    if ( equals == std::string::npos || equals + 1 == text.size() )
        return Cap(text.substr(0, equals));
    return Cap(text.substr(0, equals), text.substr(equals + 1));
}

std::string Cap::str() const
{
    if ( value && !value->empty() )
        return name + '=' + *value;
    return name;
}

std::ostream& operator<<(std::ostream& stream, const Cap& cap)
{
    return stream << cap.str();
}

CapList CapList::parse(const std::string& text)
{
    std::string list = text;
    if ( !list.empty() && list[0] == ':' )
        list.erase(0, 1);

    CapList result;
    for ( const auto& item : string::char_split(string::trim(list), ' ') )
        result.caps.push_back(Cap::parse(item));
    return result;
}

Optional<Cap> CapList::find(const std::string& name) const
{
    auto it = std::find_if(caps.begin(), caps.end(),
        [&name](const Cap& cap) { return cap.name == name; });
    if ( it == caps.end() )
        return none;
    return *it;
}

std::string CapList::str() const
{
    return string::implode(" ", caps);
}

} // namespace ircline
