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
#ifndef IRCLINE_SERIALIZER_HPP
#define IRCLINE_SERIALIZER_HPP

#include <string>

#include "ircline/message.hpp"

namespace ircline {

/**
 * \brief Renders a message as a protocol line (without CR LF)
 *
 * The result is not truncated to the line length limit.
 * \throws SerializeError if \p message can't be written in a way that
 *         parses back to the same message
 */
std::string serialize(const Message& message);

/**
 * \brief Renders the tag segment (without the leading \c @)
 * \throws SerializeError on invalid keys
 */
std::string serialize_tags(const TagMap& tags);

/**
 * \brief Renders the prefix segment (without the leading \c :)
 * \throws SerializeError if a component would be split differently
 */
std::string serialize_prefix(const Prefix& prefix);

} // namespace ircline
#endif // IRCLINE_SERIALIZER_HPP
