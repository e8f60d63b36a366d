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
#include "logger.hpp"

#include <iomanip>

#include <boost/chrono/io/time_point_io.hpp>

#include "ircline/c++-compat.hpp"
#include "ircline/error.hpp"

namespace ircline {

void Logger::log(const std::string& type, char direction,
                 const std::string& message, int verbosity)
{
    std::lock_guard<std::recursive_mutex> lock(mutex);

    auto type_it = log_types.find(type);
    if ( type_it != log_types.end() && type_it->second.verbosity < verbosity )
        return;

    if ( log_flags & timestamp )
    {
        put_color(color::yellow);
        log_destination << '['
            << boost::chrono::time_fmt(boost::chrono::timezone::local, "%Y-%m-%d %T")
            << boost::chrono::system_clock::now()
            << ']';
        put_color(color::nocolor);
    }

    if ( type_it != log_types.end() )
        put_color(type_it->second.color);
    log_destination << std::setw(log_type_length) << std::left << type;

    put_color(log_directions[direction]);
    log_destination << direction;
    put_color(color::nocolor);
    log_destination << message << std::endl;
}

void Logger::put_color(color::Color color)
{
    if ( log_flags & colors )
        log_destination << color::to_ansi(color);
}

void Logger::register_log_type(const std::string& name, color::Color color)
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    if ( log_type_length < name.size() )
        log_type_length = name.size();
    log_types[name].color = color;
}

void Logger::register_direction(char name, color::Color color)
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    log_directions[name] = color;
}

void Logger::set_log_verbosity(const std::string& name, int level)
{
    std::lock_guard<std::recursive_mutex> lock(mutex);
    log_types[name].verbosity = level;
}

void Logger::load_settings(const Settings& settings)
{
    std::lock_guard<std::recursive_mutex> lock(mutex);

    Settings verbosity = settings.get_child("verbosity", Settings());
    for ( const auto& p : verbosity )
    {
        auto type_it = log_types.find(p.first);
        if ( type_it != log_types.end() )
        {
            type_it->second.verbosity = p.second.get_value(type_it->second.verbosity);
        }
        else
        {
            if ( log_type_length < p.first.size() )
                log_type_length = p.first.size();
            log_types.insert({p.first, LogType(color::nocolor, p.second.get_value(2))});
        }
    }

    bool use_colors = settings.get("colors", bool(log_flags & colors));
    bool use_timestamp = settings.get("timestamp", bool(log_flags & timestamp));

    std::string output = settings.get("logfile", "");
    if ( !output.empty() )
    {
        auto file = New<std::ofstream>(output, std::ios::app);
        if ( !file->is_open() )
            throw ConfigurationError("Cannot open log file: " + output);
        log_file = std::move(file);
        log_destination.rdbuf(log_file->rdbuf());
        use_colors = false;
    }

    log_flags = (use_colors ? colors : 0) | (use_timestamp ? timestamp : 0);
}

} // namespace ircline
