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
#ifndef IRCLINE_HPP
#define IRCLINE_HPP

#include "ircline/cap.hpp"
#include "ircline/casemap.hpp"
#include "ircline/error.hpp"
#include "ircline/mask.hpp"
#include "ircline/message.hpp"
#include "ircline/numerics.hpp"
#include "ircline/parser.hpp"
#include "ircline/serializer.hpp"
#include "ircline/tags.hpp"

#endif // IRCLINE_HPP
