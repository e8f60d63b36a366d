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
#ifndef IRCLINE_ERROR_HPP
#define IRCLINE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ircline {

/**
 * \brief Generic ircline-related errors
 */
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Error raised when a line cannot be tokenized into a Message
 */
class ParseError : public Error
{
public:
    enum Kind
    {
        EmptyLine,      ///< Nothing to parse
        MissingCommand, ///< The command token is empty or has the wrong shape
        MalformedTags,  ///< A tag key doesn't follow the tag key grammar
    };

    ParseError(Kind kind, const std::string& msg)
        : Error(msg), kind_(kind)
    {}

    Kind kind() const noexcept
    {
        return kind_;
    }

private:
    Kind kind_;
};

/**
 * \brief Error raised when a Message cannot be represented as a line
 */
class SerializeError : public Error
{
public:
    enum Kind
    {
        InvalidCommand,     ///< Empty command or not letters / 3 digits
        InvalidParameter,   ///< Parameter that would be tokenized differently
        TooManyParameters,  ///< More parameters than a line can distinguish
        InvalidTag,         ///< Tag key not following the tag key grammar
        InvalidPrefix,      ///< Prefix component that would be split differently
    };

    SerializeError(Kind kind, const std::string& msg)
        : Error(msg), kind_(kind)
    {}

    Kind kind() const noexcept
    {
        return kind_;
    }

private:
    Kind kind_;
};

/**
 * \brief Class representing an error occurring during configuration
 */
class ConfigurationError : public Error
{
public:
    ConfigurationError(const std::string& msg = "Invalid configuration parameters")
        : Error(msg)
    {}
};

} // namespace ircline
#endif // IRCLINE_ERROR_HPP
