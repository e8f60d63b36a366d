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
#ifndef IRCLINE_COLOR_HPP
#define IRCLINE_COLOR_HPP

#include <string>

/**
 * \brief Namespace for color operations
 */
namespace color {

/**
 * \brief Terminal color
 */
enum class Color
{
    nocolor,
    dark_red,
    dark_green,
    dark_yellow,
    dark_blue,
    dark_magenta,
    red,
    green,
    yellow,
    blue,
};

/**
 * \brief ANSI escape sequence selecting \p color
 */
inline std::string to_ansi(Color color)
{
    switch ( color )
    {
        case Color::dark_red:     return "\x1b[31m";
        case Color::dark_green:   return "\x1b[32m";
        case Color::dark_yellow:  return "\x1b[33m";
        case Color::dark_blue:    return "\x1b[34m";
        case Color::dark_magenta: return "\x1b[35m";
        case Color::red:          return "\x1b[31;1m";
        case Color::green:        return "\x1b[32;1m";
        case Color::yellow:       return "\x1b[33;1m";
        case Color::blue:         return "\x1b[34;1m";
        case Color::nocolor:      break;
    }
    return "\x1b[0m";
}

constexpr Color nocolor = Color::nocolor;
constexpr Color dark_red = Color::dark_red;
constexpr Color dark_green = Color::dark_green;
constexpr Color dark_yellow = Color::dark_yellow;
constexpr Color dark_blue = Color::dark_blue;
constexpr Color dark_magenta = Color::dark_magenta;
constexpr Color red = Color::red;
constexpr Color green = Color::green;
constexpr Color yellow = Color::yellow;
constexpr Color blue = Color::blue;

} // namespace color
#endif // IRCLINE_COLOR_HPP
