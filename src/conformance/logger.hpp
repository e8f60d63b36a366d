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
#ifndef IRCLINE_LOGGER_HPP
#define IRCLINE_LOGGER_HPP

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

#include "color.hpp"
#include "settings.hpp"

namespace ircline {

/**
 * \brief Singleton class handling logs
 * \see Log for a nicer interface
 */
class Logger
{
public:
    /**
     * \brief Returns the process-wide logger
     */
    static Logger& instance()
    {
        static Logger singleton;
        return singleton;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const int colors    = 0x1;
    static const int timestamp = 0x2;

    /**
     * \brief Register a log "direction"
     *
     * A direction is a simple identifier showing what kind of message
     * has been logged
     */
    void register_direction(char name, color::Color color);

    /**
     * \brief Register a log type
     *
     * A log type is the name of the component which generates the log.
     * Better to keep it short, 4 letters should do.
     * The default verbosity is 2
     */
    void register_log_type(const std::string& name, color::Color color);

    /**
     * \brief Change verbosity level for a given log type
     *
     * Messages of that type with higher verbisity will be discarded
     */
    void set_log_verbosity(const std::string& name, int level);

    /**
     * \brief Log a message
     * \thread any \lock mutex
     */
    void log(const std::string& type, char direction,
             const std::string& message, int verbosity);

    /**
     * \brief Reads verbosity, flags and output file
     * \throws ConfigurationError if the log file cannot be opened
     */
    void load_settings(const Settings& settings);

    int flags() const { return log_flags; }

private:
    /**
     * \brief Data associated with a log type
     */
    struct LogType
    {
        LogType(color::Color color = color::nocolor, int verbosity = 2)
            : color(color), verbosity(verbosity) {}

        color::Color color;
        int verbosity = 2;
    };

    Logger() {}

    void put_color(color::Color color);

    int log_flags = colors|timestamp;
    std::unique_ptr<std::ofstream> log_file;
    std::ostream log_destination {std::clog.rdbuf()};
    std::unordered_map<std::string, LogType> log_types;
    std::unordered_map<char, color::Color> log_directions;
    unsigned log_type_length = 0;
    std::recursive_mutex mutex;
};

/**
 * \brief Simple log stream-like interface
 */
class Log
{
public:
    Log(std::string type, char direction, int verbosity = 2)
        : type(std::move(type)), direction(direction), verbosity(verbosity)
    {}

    Log(const std::string& type, char direction, const std::string& message, int verbosity = 2)
        : Log(type, direction, verbosity)
    {
        stream << message;
    }
    Log(const Log&) = delete;
    Log(Log&&) = delete;
    Log& operator=(const Log&) = delete;
    Log& operator=(Log&&) = delete;

    ~Log()
    {
        if ( colored )
            stream << color::to_ansi(color::nocolor);
        Logger::instance().log(type, direction, stream.str(), verbosity);
    }

    template<class T>
        Log& operator<< ( const T& t )
        {
            stream << t;
            return *this;
        }

    Log& operator<< ( color::Color color )
    {
        if ( Logger::instance().flags() & Logger::colors )
        {
            colored = true;
            stream << color::to_ansi(color);
        }
        return *this;
    }

public:
    std::string type;
    char direction;
    int verbosity;
    std::ostringstream stream;
    bool colored = false;
};

/**
 * \brief Utility for error messages
 */
class ErrorLog : public Log
{
public:
    ErrorLog(const std::string& type,
             const std::string& error = "Error",
             int verbosity = 0 )
        : Log(type, '!', verbosity)
    {
        *this << color::red << error << color::nocolor << ": ";
    }
};

} // namespace ircline
#endif // IRCLINE_LOGGER_HPP
