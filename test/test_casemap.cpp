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
#define BOOST_TEST_MODULE Test_Casemap

#include <boost/test/unit_test.hpp>

#include <unordered_set>

#include "ircline/casemap.hpp"

using namespace ircline;

BOOST_AUTO_TEST_CASE( test_fold )
{
    BOOST_CHECK( fold("Ni[ck]", CaseMapping::Rfc1459) == "ni{ck}" );
    BOOST_CHECK( fold("Ni[ck]", CaseMapping::Ascii) == "ni[ck]" );
    BOOST_CHECK( fold("Ni[ck]", CaseMapping::Rfc1459Strict) == "ni{ck}" );

    BOOST_CHECK( fold("A\\B~", CaseMapping::Rfc1459) == "a|b^" );
    BOOST_CHECK( fold("A\\B~", CaseMapping::Rfc1459Strict) == "a|b~" );
    BOOST_CHECK( fold("A\\B~", CaseMapping::Ascii) == "a\\b~" );

    BOOST_CHECK( fold("#Chan-1_2", CaseMapping::Ascii) == "#chan-1_2" );
    BOOST_CHECK( fold("", CaseMapping::Rfc1459) == "" );
    // Non-ASCII bytes are left alone
    BOOST_CHECK( fold("\xc3\x80", CaseMapping::Rfc1459) == "\xc3\x80" );
}

BOOST_AUTO_TEST_CASE( test_fold_idempotence )
{
    for ( auto mapping : {CaseMapping::Ascii, CaseMapping::Rfc1459, CaseMapping::Rfc1459Strict} )
    {
        for ( std::string text : {"Hello", "[]\\~{}|^", "MiXeD[Case]~", "#chan", ""} )
        {
            auto folded = fold(text, mapping);
            BOOST_CHECK( fold(folded, mapping) == folded );
        }
    }
}

BOOST_AUTO_TEST_CASE( test_upper )
{
    BOOST_CHECK( upper("ni{ck}|^", CaseMapping::Rfc1459) == "NI[CK]\\~" );
    BOOST_CHECK( upper("ni{ck}|^", CaseMapping::Rfc1459Strict) == "NI[CK]\\^" );
    BOOST_CHECK( upper("ni{ck}|^", CaseMapping::Ascii) == "NI{CK}|^" );
}

BOOST_AUTO_TEST_CASE( test_fold_equal )
{
    BOOST_CHECK( fold_equal("Nick[away]", "nick{AWAY}", CaseMapping::Rfc1459) );
    BOOST_CHECK( !fold_equal("Nick[away]", "nick{AWAY}", CaseMapping::Ascii) );
    BOOST_CHECK( fold_equal("Nick[away]", "NICK[AWAY]", CaseMapping::Ascii) );
    BOOST_CHECK( fold_equal("a~", "A^", CaseMapping::Rfc1459) );
    BOOST_CHECK( !fold_equal("a~", "A^", CaseMapping::Rfc1459Strict) );
    BOOST_CHECK( !fold_equal("nick", "nick_", CaseMapping::Rfc1459) );
}

BOOST_AUTO_TEST_CASE( test_names )
{
    BOOST_CHECK( casemapping_from_name("ascii") == CaseMapping::Ascii );
    BOOST_CHECK( casemapping_from_name("rfc1459") == CaseMapping::Rfc1459 );
    BOOST_CHECK( casemapping_from_name("strict-rfc1459") == CaseMapping::Rfc1459Strict );
    BOOST_CHECK( casemapping_from_name("rfc1459-strict") == CaseMapping::Rfc1459Strict );
    BOOST_CHECK( !casemapping_from_name("rfc7613") );

    BOOST_CHECK( casemapping_name(CaseMapping::Ascii) == "ascii" );
    BOOST_CHECK( casemapping_name(CaseMapping::Rfc1459Strict) == "strict-rfc1459" );
    BOOST_CHECK( casemapping_from_name(casemapping_name(CaseMapping::Rfc1459)) == CaseMapping::Rfc1459 );
}

BOOST_AUTO_TEST_CASE( test_folded_set )
{
    std::unordered_set<std::string, FoldedHash, FoldedEqual> nicks(
        8, FoldedHash(CaseMapping::Rfc1459), FoldedEqual(CaseMapping::Rfc1459));

    nicks.insert("Dan[away]");
    BOOST_CHECK( nicks.count("dan{AWAY}") == 1 );
    BOOST_CHECK( !nicks.insert("DAN{away}").second );
    BOOST_CHECK( nicks.insert("Dan").second );
    BOOST_CHECK( nicks.size() == 2 );
}
