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
#include "parser.hpp"

#include "ircline/error.hpp"
#include "ircline/tags.hpp"
#include "ircline/string/stringutils.hpp"

namespace ircline {

/**
 * \brief Reads the token starting at \p pos up to the next space
 *
 * \p pos is moved past the token and the run of spaces after it
 */
static std::string read_token(const std::string& line, std::string::size_type& pos)
{
    auto end = line.find(' ', pos);
    if ( end == std::string::npos )
        end = line.size();

    std::string token = line.substr(pos, end - pos);

    pos = line.find_first_not_of(' ', end);
    if ( pos == std::string::npos )
        pos = line.size();

    return token;
}

TagMap parse_tags(const std::string& text, ParseDiagnostics& diagnostics)
{
    TagMap tags;

    for ( const auto& item : string::char_split(text, ';') )
    {
        auto equals = item.find('=');
        std::string key = item.substr(0, equals);

        if ( !is_valid_tag_key(key) )
            throw ParseError(ParseError::MalformedTags, "Invalid tag key: \"" + key + '"');

        Optional<std::string> value;
        if ( equals != std::string::npos )
        {
            bool recovered = false;
            value = decode_tag_value(item.substr(equals + 1), recovered);
            if ( recovered )
                diagnostics.dropped_escapes = true;
        }

        if ( tags.contains(key) )
            diagnostics.duplicate_tags = true;
        tags.set(key, std::move(value));
    }

    return tags;
}

Message parse(const std::string& line, ParseDiagnostics& diagnostics)
{
    diagnostics = ParseDiagnostics();

    if ( line.empty() )
        throw ParseError(ParseError::EmptyLine, "Empty line");

    std::string::size_type pos = 0;

    TagMap tags;
    if ( line[pos] == '@' )
    {
        pos++;
        tags = parse_tags(read_token(line, pos), diagnostics);
    }

    Optional<Prefix> source;
    if ( pos < line.size() && line[pos] == ':' )
    {
        pos++;
        source = Prefix::parse(read_token(line, pos));
    }

    std::string command = read_token(line, pos);
    if ( !is_valid_command(command) )
        throw ParseError(ParseError::MissingCommand,
            command.empty() ? "Missing command" : "Invalid command: \"" + command + '"');

    std::vector<std::string> params;
    while ( pos < line.size() )
    {
        if ( line[pos] == ':' )
        {
            params.push_back(line.substr(pos + 1));
            break;
        }

        if ( params.size() == max_params - 1 )
        {
            // Excess tokens are kept verbatim, trailing spaces are still separators
            std::string last = string::trim(line.substr(pos), " ");
            if ( last.find(' ') != std::string::npos )
                diagnostics.folded_parameters = true;
            params.push_back(std::move(last));
            break;
        }

        params.push_back(read_token(line, pos));
    }

    return Message(std::move(command), std::move(params), std::move(source), std::move(tags));
}

Message parse(const std::string& line)
{
    ParseDiagnostics diagnostics;
    return parse(line, diagnostics);
}

} // namespace ircline
