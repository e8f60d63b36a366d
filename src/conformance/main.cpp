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
#include <sstream>

#include <boost/property_tree/exceptions.hpp>

#include "ircline/error.hpp"
#include "logger.hpp"
#include "settings.hpp"
#include "vectors.hpp"

using namespace ircline;

/**
 * \brief Initializes static components
 */
void initialize_static()
{
    Logger::instance().register_direction('<', color::dark_green);
    Logger::instance().register_direction('>', color::dark_yellow);
    Logger::instance().register_direction('!', color::dark_blue);

    Logger::instance().register_log_type("sys", color::dark_red);
    Logger::instance().register_log_type("conf", color::dark_magenta);
}

int run_vectors(const Settings& settings)
{
    std::string mapping_name = settings.get("casemapping", "ascii");
    auto mapping = casemapping_from_name(mapping_name);
    if ( !mapping )
        throw ConfigurationError("Unknown casemapping: " + mapping_name);

    conformance::SuiteRunner runner(*mapping);
    conformance::Report total;

    Settings files = settings.get_child("vectors");
    for ( const auto& file : files )
        total += runner.run_file(file.second.data());

    Log("sys", '!', 0) << "Total: " << total.passed << " passed, "
        << total.failed << " failed, " << total.lenient << " lenient";

    return total.ok() ? 0 : 1;
}

int main(int argc, char **argv)
{
    initialize_static();

    try
    {
        Settings settings = settings::initialize(argc, argv);
        if ( settings.empty() )
            return settings::global_settings.get("exit_code", 0);

        Logger::instance().load_settings(settings.get_child("log", Settings()));
        std::string config = settings::global_settings.get("config", "");
        if ( !config.empty() )
            Log("sys", '!', 3) << "Configuration from " << config;

        std::ostringstream dump;
        dump << settings;
        Log("sys", '!', 5) << "Settings:\n" << dump.str();

        int exit_code = run_vectors(settings);
        Log("sys", '!', 4) << "Exiting with status " << exit_code;
        return exit_code;
    }
    catch ( const Error& exc )
    {
        ErrorLog("sys", "Configuration Error") << exc.what();
    }
    catch ( const boost::property_tree::ptree_error& exc )
    {
        ErrorLog("sys", "File Error") << exc.what();
    }
    catch ( const std::exception& exc )
    {
        ErrorLog("sys", "Error") << exc.what();
    }

    return 2;
}
