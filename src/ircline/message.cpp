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
#include "message.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>

#include "ircline/serializer.hpp"

namespace ircline {

bool is_valid_command(const std::string& command)
{
    if ( command.empty() )
        return false;

    if ( std::isdigit(static_cast<unsigned char>(command[0])) )
        return command.size() == 3 &&
            std::all_of(command.begin(), command.end(),
                [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });

    return std::all_of(command.begin(), command.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    });
}

Prefix Prefix::parse(const std::string& text)
{
    Prefix prefix;

    auto bang = text.find('!');
    auto at = text.find('@', bang == std::string::npos ? 0 : bang);
    prefix.nick = text.substr(0, std::min(bang, at));

    if ( bang != std::string::npos )
        prefix.user = text.substr(bang + 1, at == std::string::npos ? at : at - bang - 1);

    if ( at != std::string::npos )
        prefix.host = text.substr(at + 1);

    return prefix;
}

std::string Prefix::mask() const
{
    std::string mask = nick;
    if ( user )
        mask += '!' + *user;
    if ( host )
        mask += '@' + *host;
    return mask;
}

std::ostream& operator<<(std::ostream& stream, const Prefix& prefix)
{
    return stream << prefix.mask();
}

TagMap::TagMap(std::initializer_list<value_type> tags)
{
    for ( const auto& tag : tags )
        set(tag.first, tag.second);
}

TagMap::const_iterator TagMap::find(const std::string& key) const
{
    return std::find_if(tags.begin(), tags.end(),
        [&key](const value_type& tag) { return tag.first == key; });
}

void TagMap::set(const std::string& key, Optional<std::string> value)
{
    auto it = std::find_if(tags.begin(), tags.end(),
        [&key](const value_type& tag) { return tag.first == key; });
    if ( it != tags.end() )
        it->second = std::move(value);
    else
        tags.emplace_back(key, std::move(value));
}

bool TagMap::erase(const std::string& key)
{
    auto it = std::remove_if(tags.begin(), tags.end(),
        [&key](const value_type& tag) { return tag.first == key; });
    if ( it == tags.end() )
        return false;
    tags.erase(it, tags.end());
    return true;
}

Optional<std::string> TagMap::get(const std::string& key) const
{
    auto it = find(key);
    if ( it == end() )
        return none;
    return it->second;
}

bool TagMap::operator==(const TagMap& other) const
{
    if ( size() != other.size() )
        return false;

    // Keys are unique so checking one direction is enough
    for ( const auto& tag : tags )
    {
        auto it = other.find(tag.first);
        if ( it == other.end() || it->second != tag.second )
            return false;
    }
    return true;
}

Message Message::with_tag(const std::string& key, Optional<std::string> value) const
{
    Message copy = *this;
    copy.tags_.set(key, std::move(value));
    return copy;
}

Message Message::without_tag(const std::string& key) const
{
    Message copy = *this;
    copy.tags_.erase(key);
    return copy;
}

Message Message::with_source(Optional<Prefix> source) const
{
    Message copy = *this;
    copy.source_ = std::move(source);
    return copy;
}

Message Message::with_params(std::vector<std::string> params) const
{
    Message copy = *this;
    copy.params_ = std::move(params);
    return copy;
}

bool Message::operator==(const Message& other) const
{
    return command_ == other.command_ && params_ == other.params_ &&
        source_ == other.source_ && tags_ == other.tags_;
}

std::ostream& operator<<(std::ostream& stream, const Message& message)
{
    return stream << serialize(message);
}

} // namespace ircline
