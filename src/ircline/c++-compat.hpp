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
#ifndef IRCLINE_CXX_COMPAT_HPP
#define IRCLINE_CXX_COMPAT_HPP

#include <memory>

#include <boost/optional.hpp>

namespace ircline {

/**
 * \brief Value which may or may not be present
 */
template<class T>
    using Optional = boost::optional<T>;

/**
 * \brief Empty value for Optional
 */
using boost::none;

/**
 * \brief Just a shorter version of std::make_unique
 */
template<class T, class... Args>
auto New (Args&&... args)
{
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace ircline

#endif // IRCLINE_CXX_COMPAT_HPP
