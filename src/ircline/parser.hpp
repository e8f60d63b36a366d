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
#ifndef IRCLINE_PARSER_HPP
#define IRCLINE_PARSER_HPP

#include <string>

#include "ircline/message.hpp"

namespace ircline {

/**
 * \brief Lenient recoveries performed while parsing a line
 *
 * None of these make the line invalid, they are reported so that callers
 * checking conformance can tell them apart from strict parses.
 */
struct ParseDiagnostics
{
    /**
     * \brief Text after the last parameter slot was folded into it
     */
    bool folded_parameters = false;
    /**
     * \brief A tag value had an unknown escape or a lone trailing backslash
     */
    bool dropped_escapes = false;
    /**
     * \brief A tag key appeared more than once (the last one was kept)
     */
    bool duplicate_tags = false;

    /**
     * \brief Whether any recovery happened
     */
    bool lenient() const
    {
        return folded_parameters || dropped_escapes || duplicate_tags;
    }
};

/**
 * \brief Parses a single line (without CR LF)
 * \see http://tools.ietf.org/html/rfc2812#section-2.3.1
 * \see http://ircv3.net/specs/core/message-tags-3.2.html
 * \throws ParseError
 */
Message parse(const std::string& line);

/**
 * \brief Parses a single line (without CR LF)
 * \param[out] diagnostics Receives the recoveries performed on \p line
 * \throws ParseError
 */
Message parse(const std::string& line, ParseDiagnostics& diagnostics);

/**
 * \brief Parses the tag segment of a line (without the leading \c @)
 * \throws ParseError on invalid keys
 */
TagMap parse_tags(const std::string& text, ParseDiagnostics& diagnostics);

} // namespace ircline
#endif // IRCLINE_PARSER_HPP
