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
#include "serializer.hpp"

#include "ircline/error.hpp"
#include "ircline/tags.hpp"

namespace ircline {

std::string serialize_tags(const TagMap& tags)
{
    std::string out;
    for ( const auto& tag : tags )
    {
        if ( !is_valid_tag_key(tag.first) )
            throw SerializeError(SerializeError::InvalidTag,
                "Invalid tag key: \"" + tag.first + '"');

        if ( !out.empty() )
            out += ';';
        out += tag.first;
        if ( tag.second )
            out += '=' + encode_tag_value(*tag.second);
    }
    return out;
}

/**
 * \brief Characters which would end the line early
 */
static const std::string line_terminators("\r\n\0", 3);

std::string serialize_prefix(const Prefix& prefix)
{
    if ( prefix.nick.find_first_of(line_terminators) != std::string::npos ||
         (prefix.user && prefix.user->find_first_of(line_terminators) != std::string::npos) ||
         (prefix.host && prefix.host->find_first_of(line_terminators) != std::string::npos) )
        throw SerializeError(SerializeError::InvalidPrefix,
            "Prefix contains a line terminator");

    if ( prefix.nick.find_first_of(" !@") != std::string::npos )
        throw SerializeError(SerializeError::InvalidPrefix,
            "Invalid nick in prefix: \"" + prefix.nick + '"');
    if ( prefix.user && prefix.user->find_first_of(" @") != std::string::npos )
        throw SerializeError(SerializeError::InvalidPrefix,
            "Invalid user in prefix: \"" + *prefix.user + '"');
    // Without a user the first ! in the host would be read as the user separator
    if ( prefix.host && prefix.host->find_first_of(prefix.user ? " " : " !") != std::string::npos )
        throw SerializeError(SerializeError::InvalidPrefix,
            "Invalid host in prefix: \"" + *prefix.host + '"');

    return prefix.mask();
}

/**
 * \brief Whether the last parameter has to be written as trailing
 */
static bool needs_trailing(const std::string& param)
{
    return param.empty() || param[0] == ':' || param.find(' ') != std::string::npos;
}

std::string serialize(const Message& message)
{
    if ( !is_valid_command(message.command()) )
        throw SerializeError(SerializeError::InvalidCommand,
            "Invalid command: \"" + message.command() + '"');

    const auto& params = message.params();
    if ( params.size() > max_params )
        throw SerializeError(SerializeError::TooManyParameters,
            "Too many parameters: " + std::to_string(params.size()));

    std::string line;

    if ( !message.tags().empty() )
    {
        line += '@';
        line += serialize_tags(message.tags());
        line += ' ';
    }

    if ( message.source() )
    {
        line += ':';
        line += serialize_prefix(*message.source());
        line += ' ';
    }

    line += message.command();

    for ( auto it = params.begin(); it != params.end(); ++it )
    {
        if ( it->find_first_of(line_terminators) != std::string::npos )
            throw SerializeError(SerializeError::InvalidParameter,
                "Parameter contains a line terminator");

        line += ' ';
        if ( it == params.end() - 1 )
        {
            if ( needs_trailing(*it) )
                line += ':';
        }
        else if ( needs_trailing(*it) )
        {
            throw SerializeError(SerializeError::InvalidParameter,
                "Invalid middle parameter: \"" + *it + '"');
        }
        line += *it;
    }

    return line;
}

} // namespace ircline
