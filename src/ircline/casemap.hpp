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
#ifndef IRCLINE_CASEMAP_HPP
#define IRCLINE_CASEMAP_HPP

#include <cstddef>
#include <string>

#include "ircline/c++-compat.hpp"

namespace ircline {

/**
 * \brief Rule used to compare nicknames and channels case-insensitively
 * \see http://tools.ietf.org/html/rfc2812#section-2.2
 */
enum class CaseMapping
{
    Ascii,          ///< Only A-Z fold to a-z
    Rfc1459,        ///< A-Z and []\~ fold to a-z and {}|^
    Rfc1459Strict,  ///< A-Z and []\ fold to a-z and {}|
};

/**
 * \brief Converts a string to its lower case form under \p mapping
 */
std::string fold(std::string text, CaseMapping mapping);

/**
 * \brief Converts a string to its upper case form under \p mapping
 */
std::string upper(std::string text, CaseMapping mapping);

/**
 * \brief Whether two identifiers name the same entity under \p mapping
 */
bool fold_equal(const std::string& a, const std::string& b, CaseMapping mapping);

/**
 * \brief Reads the value of the \c CASEMAPPING ISUPPORT token
 * \returns The matching mapping or none if the name isn't supported
 */
Optional<CaseMapping> casemapping_from_name(const std::string& name);

/**
 * \brief Name of the mapping as advertised in \c CASEMAPPING
 */
std::string casemapping_name(CaseMapping mapping);

/**
 * \brief Hash functor consistent with fold_equal()
 */
class FoldedHash
{
public:
    explicit FoldedHash(CaseMapping mapping = CaseMapping::Rfc1459)
        : mapping(mapping)
    {}

    std::size_t operator()(const std::string& text) const;

private:
    CaseMapping mapping;
};

/**
 * \brief Equality functor using fold_equal()
 */
class FoldedEqual
{
public:
    explicit FoldedEqual(CaseMapping mapping = CaseMapping::Rfc1459)
        : mapping(mapping)
    {}

    bool operator()(const std::string& a, const std::string& b) const
    {
        return fold_equal(a, b, mapping);
    }

private:
    CaseMapping mapping;
};

} // namespace ircline
#endif // IRCLINE_CASEMAP_HPP
