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
#ifndef IRCLINE_MASK_HPP
#define IRCLINE_MASK_HPP

#include <string>

#include "ircline/casemap.hpp"
#include "ircline/message.hpp"

namespace ircline {

/**
 * \brief Checks if \p candidate matches the hostmask \p pattern
 *
 * \c * matches any sequence of characters (including none), \c ? matches
 * exactly one character, everything else matches itself after folding
 * both sides with \p mapping. The match is anchored at both ends.
 */
bool matches(const std::string& candidate, const std::string& pattern,
             CaseMapping mapping = CaseMapping::Rfc1459);

/**
 * \brief Checks if the mask of \p prefix matches \p pattern
 */
inline bool matches(const Prefix& prefix, const std::string& pattern,
                    CaseMapping mapping = CaseMapping::Rfc1459)
{
    return matches(prefix.mask(), pattern, mapping);
}

} // namespace ircline
#endif // IRCLINE_MASK_HPP
