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
#define BOOST_TEST_MODULE Test_Mask

#include <boost/test/unit_test.hpp>

#include "ircline/mask.hpp"

using namespace ircline;

BOOST_AUTO_TEST_CASE( test_hostmask )
{
    BOOST_CHECK( matches("Dan!d@host.example.com", "*!*@*.example.com", CaseMapping::Ascii) );
    BOOST_CHECK( !matches("Dan!d@host.example.org", "*!*@*.example.com", CaseMapping::Ascii) );
    BOOST_CHECK( matches("Dan!d@host.example.com", "dan!*@*", CaseMapping::Ascii) );
    BOOST_CHECK( matches("Dan!d@host.example.com", "dan!*", CaseMapping::Ascii) );
    BOOST_CHECK( !matches("Dan!d@host.example.com", "dan!e*", CaseMapping::Ascii) );
}

BOOST_AUTO_TEST_CASE( test_wildcards )
{
    BOOST_CHECK( matches("xaxb", "*a*b", CaseMapping::Ascii) );
    BOOST_CHECK( matches("ab", "*a*b", CaseMapping::Ascii) );
    BOOST_CHECK( !matches("xaxbx", "*a*b", CaseMapping::Ascii) );
    BOOST_CHECK( matches("aaaaab", "*a*ab", CaseMapping::Ascii) );
    BOOST_CHECK( matches("mississippi", "m*iss*ppi", CaseMapping::Ascii) );
    BOOST_CHECK( !matches("mississippi", "m*iss*ppx", CaseMapping::Ascii) );

    BOOST_CHECK( matches("a", "?", CaseMapping::Ascii) );
    BOOST_CHECK( !matches("", "?", CaseMapping::Ascii) );
    BOOST_CHECK( !matches("ab", "?", CaseMapping::Ascii) );
    BOOST_CHECK( matches("abc", "a?c", CaseMapping::Ascii) );
    BOOST_CHECK( matches("abc", "?*?", CaseMapping::Ascii) );
    BOOST_CHECK( !matches("a", "?*?", CaseMapping::Ascii) );

    BOOST_CHECK( matches("", "", CaseMapping::Ascii) );
    BOOST_CHECK( !matches("a", "", CaseMapping::Ascii) );
    BOOST_CHECK( matches("", "***", CaseMapping::Ascii) );
}

BOOST_AUTO_TEST_CASE( test_totality )
{
    for ( auto mapping : {CaseMapping::Ascii, CaseMapping::Rfc1459, CaseMapping::Rfc1459Strict} )
    {
        for ( std::string text : {"", "nick!user@host", "[]\\~", "*?*", "a b"} )
        {
            BOOST_CHECK( matches(text, "*", mapping) );
            BOOST_CHECK( matches(text, text, mapping) );
        }
    }
}

BOOST_AUTO_TEST_CASE( test_casemapping )
{
    BOOST_CHECK( matches("NICK{AWAY}!u@h", "nick[away]!*@*", CaseMapping::Rfc1459) );
    BOOST_CHECK( !matches("NICK{AWAY}!u@h", "nick[away]!*@*", CaseMapping::Ascii) );
    BOOST_CHECK( matches("a^b", "A~B", CaseMapping::Rfc1459) );
    BOOST_CHECK( !matches("a^b", "A~B", CaseMapping::Rfc1459Strict) );
}

BOOST_AUTO_TEST_CASE( test_prefix )
{
    Prefix prefix("Dan", std::string("d"), std::string("host.example.com"));
    BOOST_CHECK( matches(prefix, "*!d@*.example.com") );
    BOOST_CHECK( !matches(prefix, "*!e@*") );
    BOOST_CHECK( matches(Prefix("irc.example.com"), "irc.*") );
}
