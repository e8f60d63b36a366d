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
#ifndef IRCLINE_NUMERICS_HPP
#define IRCLINE_NUMERICS_HPP

#include <string>
#include <vector>

#include "ircline/c++-compat.hpp"

namespace ircline {

/**
 * \brief Numeric reply
 * \see http://tools.ietf.org/html/rfc2812#section-5
 */
struct Numeric
{
    std::string name;
    int code;

    /**
     * \brief Command token for this reply (zero-padded to three digits)
     */
    std::string command() const;

    bool operator==(const Numeric& other) const
    {
        return code == other.code && name == other.name;
    }
};

/**
 * \brief All the known numeric replies, sorted by code
 */
const std::vector<Numeric>& numerics();

/**
 * \brief Finds the reply with the given code
 */
Optional<Numeric> numeric_from_code(int code);

/**
 * \brief Finds the reply with the given name (case-insensitive)
 */
Optional<Numeric> numeric_from_name(const std::string& name);

/**
 * \brief Finds the reply for a three-digit command token
 */
Optional<Numeric> numeric_from_command(const std::string& command);

} // namespace ircline
#endif // IRCLINE_NUMERICS_HPP
