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
#include "settings.hpp"

#include <iostream>
#include <unordered_map>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/info_parser.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "ircline/error.hpp"
#include "ircline/string/stringutils.hpp"

namespace ircline {

static const std::unordered_map<std::string, settings::FileFormat> format_extension = {
    {".json", settings::FileFormat::JSON},
    {".info", settings::FileFormat::INFO},
    {".xml", settings::FileFormat::XML},
    {".ini", settings::FileFormat::INI},
};

Settings settings::global_settings;

Settings settings::initialize(int argc, char** argv)
{
    global_settings.put("exit_code", 0);

    boost::filesystem::path path = argv[0];
    global_settings.put("executable", path.filename().empty() ?
        std::string("ircline-conformance") : path.filename().string() );

    namespace po = boost::program_options;
    po::options_description described_options("Options");
    described_options.add_options()
        ("help", "Print a description of the command-line options")
        ("config", po::value<std::string>(), "Configuration file path")
        ("casemapping", po::value<std::string>(),
            "Casemapping used for mask tests (ascii, rfc1459, strict-rfc1459)")
        ("log.debug", po::value<int>(), "Verbosity of the conformance log")
    ;
    po::options_description hidden_options;
    hidden_options.add_options()
        ("vectors", po::value<std::vector<std::string>>(), "Test vector files")
    ;
    po::options_description options;
    options.add(described_options).add(hidden_options);

    po::positional_options_description positional;
    positional.add("vectors", -1);

    po::parsed_options parsed = po::command_line_parser(argc, argv)
        .options(options).positional(positional).allow_unregistered().run();
    po::variables_map vm;
    po::store(parsed, vm);
    po::notify(vm);

    if ( vm.count("help") )
    {
        std::cout << "Usage:\n";
        std::cout << "  " << global_settings.get("executable", "")
                  << " [option ...] vectors.json ...\n";
        std::cout << described_options;
        std::cout << "  --key=value           Override a configuration key\n";
        return {};
    }

    std::string settings_file;
    if ( vm.count("config") )
        settings_file = vm["config"].as<std::string>();
    else
        settings_file = find_config();
    global_settings.put("config", settings_file);

    Settings settings;
    if ( !settings_file.empty() )
        settings = load(settings_file);

    if ( vm.count("casemapping") )
        settings.put("casemapping", vm["casemapping"].as<std::string>());

    if ( vm.count("log.debug") )
        settings.put("log.verbosity.conf", vm["log.debug"].as<int>());

    if ( vm.count("vectors") )
    {
        for ( const auto& file : vm["vectors"].as<std::vector<std::string>>() )
            settings.add("vectors.file", file);
    }

    // Overwrite config options from the command line
    for ( const auto& opt : parsed.options )
    {
        if ( opt.unregistered && !opt.value.empty() &&
             !string::starts_with(opt.string_key, "vectors") )
            settings.put(opt.string_key, opt.value.front());
    }

    if ( settings.get_child("vectors", {}).empty() )
    {
        global_settings.put("exit_code", 1);
        throw ConfigurationError("No test vectors given");
    }

    return settings;
}

Settings settings::load(const std::string& file_name, FileFormat format)
{
    boost::filesystem::path path = file_name;

    if ( format == FileFormat::AUTO )
    {
        auto it = format_extension.find(path.extension().string());
        if ( it != format_extension.end() )
            format = it->second;
    }

    boost::system::error_code err;
    auto status = boost::filesystem::status(path, err);
    if ( status.type() != boost::filesystem::regular_file || err )
        throw ConfigurationError("Cannot load file: " + file_name);

    Settings ptree;
    switch ( format )
    {
        case FileFormat::INFO:
            boost::property_tree::info_parser::read_info(file_name, ptree);
            break;
        case FileFormat::INI:
            boost::property_tree::ini_parser::read_ini(file_name, ptree);
            break;
        case FileFormat::JSON:
            boost::property_tree::json_parser::read_json(file_name, ptree);
            break;
        case FileFormat::XML:
            boost::property_tree::xml_parser::read_xml(file_name, ptree);
            break;
        case FileFormat::AUTO:
            throw ConfigurationError("Cannot detect file format for " + file_name);
    }
    return ptree;
}

std::string settings::find_config(const std::string& directory, FileFormat format)
{
    boost::system::error_code err;
    auto status = boost::filesystem::status(directory, err);
    if ( status.type() != boost::filesystem::directory_file || err )
        return {};

    for ( const auto& p : format_extension )
    {
        if ( format == FileFormat::AUTO || format == p.second )
        {
            boost::filesystem::path fp = directory + "/ircline" + p.first;
            if ( boost::filesystem::exists(fp) )
            {
                auto canonical = boost::filesystem::canonical(fp, err);
                if ( !err )
                    return canonical.string();
            }
        }
    }

    return {};
}

} // namespace ircline

/**
 * \brief Recustively prints a ptree
 */
static std::ostream& recursive_print(std::ostream& stream,
                                     const boost::property_tree::ptree& tree,
                                     int depth = 0)
{
    for ( const auto& p : tree )
    {
        stream << std::string(depth*2, ' ') << p.first << ": " << p.second.data() << '\n';
        recursive_print(stream, p.second, depth+1);
    }
    return stream;
}

std::ostream& operator<< ( std::ostream& stream, const Settings& settings )
{
    return recursive_print(stream, settings);
}
