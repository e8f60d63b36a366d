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
#ifndef IRCLINE_VECTORS_HPP
#define IRCLINE_VECTORS_HPP

#include <string>

#include "ircline/casemap.hpp"
#include "ircline/message.hpp"
#include "settings.hpp"

namespace ircline {
namespace conformance {

/**
 * \brief Outcome of running test vectors
 */
struct Report
{
    int passed = 0;
    int failed = 0;
    /**
     * \brief Passing tests which needed a lenient recovery
     */
    int lenient = 0;

    bool ok() const
    {
        return failed == 0;
    }

    Report& operator+=(const Report& other)
    {
        passed += other.passed;
        failed += other.failed;
        lenient += other.lenient;
        return *this;
    }
};

/**
 * \brief Builds a message from the "atoms" node of a vector
 *
 * \c tags is a list of objects with \c key and optional \c value,
 * \c source is a prefix string, \c verb the command and \c params a list
 */
Message message_from_atoms(const Settings& atoms);

/**
 * \brief Runs test vector suites through the library and logs the results
 */
class SuiteRunner
{
public:
    explicit SuiteRunner(CaseMapping mapping = CaseMapping::Ascii)
        : mapping(mapping)
    {}

    /**
     * \brief Loads and runs a vector file
     * \throws ConfigurationError if the file can't be loaded or has an unknown suite
     */
    Report run_file(const std::string& file_name);

    /**
     * \brief Runs an already loaded suite
     * \throws ConfigurationError if the suite type is unknown
     */
    Report run(const Settings& suite, const std::string& name);

private:
    Report run_split(const Settings& tests);
    Report run_join(const Settings& tests);
    Report run_mask(const Settings& tests);
    Report run_userhost(const Settings& tests);
    Report run_escape(const Settings& tests);

    CaseMapping mapping;
};

} // namespace conformance
} // namespace ircline
#endif // IRCLINE_VECTORS_HPP
