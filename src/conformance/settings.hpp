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
#ifndef IRCLINE_SETTINGS_HPP
#define IRCLINE_SETTINGS_HPP

#include <iosfwd>
#include <string>

#include <boost/property_tree/ptree.hpp>

using PropertyTree = boost::property_tree::ptree;
using Settings = PropertyTree;

namespace ircline {
namespace settings {

/**
 * \brief File format used to open settings and test vectors
 */
enum class FileFormat
{
    AUTO, ///< Deduce automatically
    JSON,
    INI,
    XML,
    INFO,
};

/**
 * \brief Settings with global information
 */
extern Settings global_settings;

/**
 * \brief Parses the program options and returns the configuration
 *
 * Returns an empty tree if the program should exit without doing anything,
 * global_settings.exit_code holds the status to exit with.
 * \throws ConfigurationError
 */
Settings initialize(int argc, char** argv);

/**
 * \brief Tries to find a config file in \p directory
 * \return The path to the file or an empty string
 */
std::string find_config(const std::string& directory = ".", FileFormat format = FileFormat::AUTO);

/**
 * \brief Load settings from file
 * \throws ConfigurationError if the file doesn't exist or has an unknown format
 * \throws boost::property_tree::file_parser_error on syntax errors
 */
Settings load(const std::string& file_name, FileFormat format = FileFormat::AUTO);

} // namespace settings
} // namespace ircline

std::ostream& operator<< ( std::ostream& stream, const Settings& settings );

#endif // IRCLINE_SETTINGS_HPP
