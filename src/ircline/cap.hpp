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
#ifndef IRCLINE_CAP_HPP
#define IRCLINE_CAP_HPP

#include <iosfwd>
#include <string>
#include <vector>

#include "ircline/c++-compat.hpp"

namespace ircline {

/**
 * \brief Capability as listed in CAP LS/ACK/NAK replies
 * \see http://ircv3.net/specs/core/capability-negotiation-3.2.html
 */
struct Cap
{
    Cap() = default;
    explicit Cap(std::string name, Optional<std::string> value = none)
        : name(std::move(name)), value(std::move(value))
    {}

    /**
     * \brief Parses name[=value], an empty value counts as no value
     */
    static Cap parse(const std::string& text);

    std::string str() const;

    bool operator==(const Cap& other) const
    {
        return name == other.name && value == other.value;
    }

    bool operator!=(const Cap& other) const
    {
        return !(*this == other);
    }

    std::string name;
    Optional<std::string> value;
};

/**
 * \brief Space-separated list of capabilities
 */
class CapList
{
public:
    using container = std::vector<Cap>;
    using const_iterator = container::const_iterator;

    CapList() = default;
    CapList(std::initializer_list<Cap> caps) : caps(caps) {}

    /**
     * \brief Parses a capability list
     *
     * Strips a leading \c : and surrounding whitespace
     * (some networks send a trailing space in CAP ACK)
     */
    static CapList parse(const std::string& text);

    /**
     * \brief Finds a capability by name
     */
    Optional<Cap> find(const std::string& name) const;

    std::string str() const;

    const_iterator begin() const { return caps.begin(); }
    const_iterator end() const { return caps.end(); }
    std::size_t size() const { return caps.size(); }
    bool empty() const { return caps.empty(); }
    const Cap& operator[](std::size_t index) const { return caps[index]; }

    bool operator==(const CapList& other) const
    {
        return caps == other.caps;
    }

    bool operator!=(const CapList& other) const
    {
        return !(*this == other);
    }

private:
    container caps;
};

std::ostream& operator<<(std::ostream& stream, const Cap& cap);

} // namespace ircline
#endif // IRCLINE_CAP_HPP
