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
#define BOOST_TEST_MODULE Test_Parser

#include <boost/test/unit_test.hpp>

#include "ircline/error.hpp"
#include "ircline/parser.hpp"

using namespace ircline;

/**
 * \brief Kind of the error raised when parsing \p line
 */
static Optional<ParseError::Kind> parse_error(const std::string& line)
{
    try {
        parse(line);
    } catch ( const ParseError& err ) {
        return err.kind();
    }
    return none;
}

BOOST_AUTO_TEST_CASE( test_full_line )
{
    Message msg = parse("@id=234AB;tag2=a\\sb :dan!d@localhost PRIVMSG #chan :Hello");
    BOOST_CHECK( msg.tags().size() == 2 );
    BOOST_CHECK( msg.tags().get("id") == std::string("234AB") );
    BOOST_CHECK( msg.tags().get("tag2") == std::string("a b") );
    BOOST_REQUIRE( msg.source() );
    BOOST_CHECK( *msg.source() == Prefix("dan", std::string("d"), std::string("localhost")) );
    BOOST_CHECK( msg.command() == "PRIVMSG" );
    BOOST_CHECK( msg.params() == std::vector<std::string>({"#chan", "Hello"}) );
}

BOOST_AUTO_TEST_CASE( test_server_prefix )
{
    Message msg = parse(":irc.example.com 001 nick :Welcome");
    BOOST_REQUIRE( msg.source() );
    BOOST_CHECK( msg.source()->nick == "irc.example.com" );
    BOOST_CHECK( !msg.source()->user );
    BOOST_CHECK( !msg.source()->host );
    BOOST_CHECK( msg.command() == "001" );
    BOOST_CHECK( msg.params() == std::vector<std::string>({"nick", "Welcome"}) );
}

BOOST_AUTO_TEST_CASE( test_params )
{
    BOOST_CHECK( parse("PING").params().empty() );
    BOOST_CHECK( parse("PING ").params().empty() );
    BOOST_CHECK( parse("foo bar baz :").params() == std::vector<std::string>({"bar", "baz", ""}) );
    BOOST_CHECK( parse("foo bar baz ::asdf").params() == std::vector<std::string>({"bar", "baz", ":asdf"}) );
    BOOST_CHECK( parse("foo   bar    baz").params() == std::vector<std::string>({"bar", "baz"}) );
    BOOST_CHECK( parse("foo bar : spaced  payload ").params() ==
                 std::vector<std::string>({"bar", " spaced  payload "}) );
    BOOST_CHECK( parse("JOIN :#chan") == parse("JOIN #chan") );
}

BOOST_AUTO_TEST_CASE( test_command_case )
{
    BOOST_CHECK( parse("privmsg #chan :hi").command() == "privmsg" );
}

BOOST_AUTO_TEST_CASE( test_tags )
{
    Message msg = parse("@a=b;c=32;k;rt=ql7;e= foo");
    BOOST_CHECK( msg.tags().size() == 5 );
    BOOST_CHECK( msg.tags().contains("k") );
    BOOST_CHECK( !msg.tags().get("k") );
    BOOST_CHECK( msg.tags().get("e") == std::string() );
    BOOST_CHECK( msg.tags().get("c") == std::string("32") );

    BOOST_CHECK( parse("@ foo").tags().empty() );
    BOOST_CHECK( parse("@a;;b foo").tags().size() == 2 );
    BOOST_CHECK( parse("@+example.com/typing=active TAGMSG #chan").tags().contains("+example.com/typing") );
}

BOOST_AUTO_TEST_CASE( test_diagnostics )
{
    ParseDiagnostics diagnostics;

    parse("@a=1;b=2 foo", diagnostics);
    BOOST_CHECK( !diagnostics.lenient() );

    Message dup = parse("@a=1;b=2;a=3 foo", diagnostics);
    BOOST_CHECK( diagnostics.duplicate_tags );
    BOOST_CHECK( dup.tags().get("a") == std::string("3") );
    BOOST_CHECK( dup.tags().begin()->first == "a" );

    Message escapes = parse("@a=x\\y;b=z\\ foo", diagnostics);
    BOOST_CHECK( diagnostics.dropped_escapes );
    BOOST_CHECK( !diagnostics.duplicate_tags );
    BOOST_CHECK( escapes.tags().get("a") == std::string("xy") );
    BOOST_CHECK( escapes.tags().get("b") == std::string("z") );
}

BOOST_AUTO_TEST_CASE( test_param_overflow )
{
    ParseDiagnostics diagnostics;

    Message msg = parse("CMD 1 2 3 4 5 6 7 8 9 10 11 12 13 14  15 16 ", diagnostics);
    BOOST_CHECK( diagnostics.folded_parameters );
    BOOST_REQUIRE( msg.params().size() == max_params );
    BOOST_CHECK( msg.params()[12] == "13" );
    BOOST_CHECK( msg.params()[13] == "14  15 16" );

    Message exact = parse("CMD 1 2 3 4 5 6 7 8 9 10 11 12 13 14", diagnostics);
    BOOST_CHECK( !diagnostics.folded_parameters );
    BOOST_CHECK( exact.params().size() == max_params );
    BOOST_CHECK( exact.params()[13] == "14" );

    Message trailing = parse("CMD 1 2 3 4 5 6 7 8 9 10 11 12 13 :14 15", diagnostics);
    BOOST_CHECK( !diagnostics.folded_parameters );
    BOOST_CHECK( trailing.params()[13] == "14 15" );
}

BOOST_AUTO_TEST_CASE( test_errors )
{
    BOOST_CHECK( parse_error("") == ParseError::EmptyLine );
    BOOST_CHECK( parse_error(":prefix") == ParseError::MissingCommand );
    BOOST_CHECK( parse_error(":prefix ") == ParseError::MissingCommand );
    BOOST_CHECK( parse_error("@a=b") == ParseError::MissingCommand );
    BOOST_CHECK( parse_error("@a=b :prefix") == ParseError::MissingCommand );
    BOOST_CHECK( parse_error("CMD1 x") == ParseError::MissingCommand );
    BOOST_CHECK( parse_error("12 x") == ParseError::MissingCommand );
    BOOST_CHECK( parse_error("@=x CMD") == ParseError::MalformedTags );
    BOOST_CHECK( parse_error("@bad_key CMD") == ParseError::MalformedTags );
    BOOST_CHECK( !parse_error(": CMD") );

    BOOST_CHECK_THROW( parse(""), Error );
}
