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
#ifndef IRCLINE_MESSAGE_HPP
#define IRCLINE_MESSAGE_HPP

#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include "ircline/c++-compat.hpp"

namespace ircline {

/**
 * \brief Maximum number of parameters a line can carry
 * \see http://tools.ietf.org/html/rfc2812#section-2.3
 */
constexpr std::size_t max_params = 14;

/**
 * \brief Whether \p command is a valid command token
 *
 * That is one or more ASCII letters or exactly three digits
 */
bool is_valid_command(const std::string& command);

/**
 * \brief Source of a message (:nick!user@host or :servername)
 */
struct Prefix
{
    Prefix() = default;

    explicit Prefix(std::string nick,
                    Optional<std::string> user = none,
                    Optional<std::string> host = none)
        : nick(std::move(nick)), user(std::move(user)), host(std::move(host))
    {}

    /**
     * \brief Splits \p text into nick, user and host
     *
     * The first \c ! ends the nick, the first \c @ after that ends the user.
     * Text without \c ! or \c @ is all nick (which is how server names end up).
     * Never fails.
     */
    static Prefix parse(const std::string& text);

    /**
     * \brief The complete nick[!user][@host] mask
     */
    std::string mask() const;

    bool operator==(const Prefix& other) const
    {
        return nick == other.nick && user == other.user && host == other.host;
    }

    bool operator!=(const Prefix& other) const
    {
        return !(*this == other);
    }

    std::string nick;
    Optional<std::string> user;
    Optional<std::string> host;
};

/**
 * \brief Message tags with unique keys
 *
 * Keeps the order of insertion, which is used when serializing,
 * but equality doesn't depend on the order.
 */
class TagMap
{
public:
    using value_type = std::pair<std::string, Optional<std::string>>;
    using container = std::vector<value_type>;
    using const_iterator = container::const_iterator;
    using size_type = container::size_type;

    TagMap() = default;
    TagMap(std::initializer_list<value_type> tags);

    /**
     * \brief Sets the value for \p key
     *
     * If \p key is already present its value is replaced in place
     */
    void set(const std::string& key, Optional<std::string> value = none);

    /**
     * \brief Removes \p key
     * \returns Whether the key was present
     */
    bool erase(const std::string& key);

    bool contains(const std::string& key) const
    {
        return find(key) != end();
    }

    /**
     * \brief Value of the given key
     * \returns none if \p key is missing or has no value
     */
    Optional<std::string> get(const std::string& key) const;

    const_iterator find(const std::string& key) const;

    const_iterator begin() const { return tags.begin(); }
    const_iterator end() const { return tags.end(); }
    size_type size() const { return tags.size(); }
    bool empty() const { return tags.empty(); }

    bool operator==(const TagMap& other) const;
    bool operator!=(const TagMap& other) const
    {
        return !(*this == other);
    }

private:
    container tags;
};

/**
 * \brief A single protocol line
 *
 * Messages are immutable, the with_* functions return modified copies.
 */
class Message
{
public:
    Message(std::string command,
            std::vector<std::string> params = {},
            Optional<Prefix> source = none,
            TagMap tags = {})
        : tags_(std::move(tags)),
          source_(std::move(source)),
          command_(std::move(command)),
          params_(std::move(params))
    {}

    const TagMap& tags() const { return tags_; }
    const Optional<Prefix>& source() const { return source_; }
    const std::string& command() const { return command_; }
    const std::vector<std::string>& params() const { return params_; }

    /**
     * \brief Parameter at the given index or an empty string
     */
    std::string param(std::size_t index) const
    {
        return index < params_.size() ? params_[index] : std::string();
    }

    Message with_tag(const std::string& key, Optional<std::string> value = none) const;
    Message without_tag(const std::string& key) const;
    Message with_source(Optional<Prefix> source) const;
    Message with_params(std::vector<std::string> params) const;

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const
    {
        return !(*this == other);
    }

private:
    TagMap tags_;
    Optional<Prefix> source_;
    std::string command_;
    std::vector<std::string> params_;
};

std::ostream& operator<<(std::ostream& stream, const Prefix& prefix);

/**
 * \brief Writes the serialized line
 * \throws SerializeError if the message can't be serialized
 */
std::ostream& operator<<(std::ostream& stream, const Message& message);

} // namespace ircline
#endif // IRCLINE_MESSAGE_HPP
