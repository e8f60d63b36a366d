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
#ifndef IRCLINE_TAGS_HPP
#define IRCLINE_TAGS_HPP

#include <string>

namespace ircline {

/**
 * \brief Escapes a raw tag value so it can be written on the wire
 * \see http://ircv3.net/specs/core/message-tags-3.2.html#escaping-values
 *
 * <tt>;</tt>, space, <tt>\\</tt>, CR and LF are replaced by
 * <tt>\\:</tt>, <tt>\\s</tt>, <tt>\\\\</tt>, <tt>\\r</tt> and <tt>\\n</tt>
 */
std::string encode_tag_value(const std::string& raw);

/**
 * \brief Reverses encode_tag_value()
 *
 * Unknown escape sequences lose the backslash and keep the escaped character,
 * a lone trailing backslash is dropped.
 */
std::string decode_tag_value(const std::string& escaped);

/**
 * \brief Same as decode_tag_value(const std::string&)
 * \param[out] recovered Set to \b true if the value contained an unknown
 *                       escape or a lone trailing backslash
 */
std::string decode_tag_value(const std::string& escaped, bool& recovered);

/**
 * \brief Whether \p key follows the tag key grammar
 *
 * <tt>['+'] [ vendor '/' ] name</tt>, where \c vendor is made of letters,
 * digits, \c - and \c . and \c name is a non-empty run of letters, digits
 * and \c -
 */
bool is_valid_tag_key(const std::string& key);

} // namespace ircline
#endif // IRCLINE_TAGS_HPP
