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
#define BOOST_TEST_MODULE Test_Serializer

#include <boost/test/unit_test.hpp>

#include "ircline/error.hpp"
#include "ircline/parser.hpp"
#include "ircline/serializer.hpp"

using namespace ircline;

/**
 * \brief Kind of the error raised when serializing \p message
 */
static Optional<SerializeError::Kind> serialize_error(const Message& message)
{
    try {
        serialize(message);
    } catch ( const SerializeError& err ) {
        return err.kind();
    }
    return none;
}

BOOST_AUTO_TEST_CASE( test_basic )
{
    BOOST_CHECK( serialize(Message("PING")) == "PING" );
    BOOST_CHECK( serialize(Message("foo", {"bar", "baz", "asdf"})) == "foo bar baz asdf" );
    BOOST_CHECK( serialize(Message("PRIVMSG", {"#chan", "Hello"})) == "PRIVMSG #chan Hello" );
    BOOST_CHECK( serialize(Message("PRIVMSG", {"#chan", "Hello world"})) == "PRIVMSG #chan :Hello world" );
    BOOST_CHECK( serialize(Message("foo", {"bar", ""})) == "foo bar :" );
    BOOST_CHECK( serialize(Message("foo", {":bar"})) == "foo ::bar" );
}

BOOST_AUTO_TEST_CASE( test_source_and_tags )
{
    Message msg("PRIVMSG", {"#chan", "hi there"},
                Prefix("dan", std::string("d"), std::string("localhost")),
                TagMap{{"id", std::string("1 2;3")}, {"flag", none}});
    BOOST_CHECK( serialize(msg) ==
        "@id=1\\s2\\:3;flag :dan!d@localhost PRIVMSG #chan :hi there" );

    BOOST_CHECK( serialize(Message("001", {"nick"}, Prefix("irc.example.com"))) ==
        ":irc.example.com 001 nick" );

    BOOST_CHECK( serialize_tags(TagMap{{"a", std::string()}}) == "a=" );
    BOOST_CHECK( serialize_prefix(Prefix("dan", none, std::string("host"))) == "dan@host" );
}

BOOST_AUTO_TEST_CASE( test_round_trip )
{
    const char* lines[] = {
        "@id=234AB;tag2=a\\sb :dan!d@localhost PRIVMSG #chan :Hello",
        ":irc.example.com 001 nick :Welcome to the network",
        "foo bar baz :",
        "foo bar ::asdf",
        "@+example.com/typing=active TAGMSG #chan",
        "CMD 1 2 3 4 5 6 7 8 9 10 11 12 13 :14 15",
    };
    for ( const char* line : lines )
    {
        Message msg = parse(line);
        BOOST_CHECK( parse(serialize(msg)) == msg );
    }
}

BOOST_AUTO_TEST_CASE( test_constructed_round_trip )
{
    std::vector<std::string> fourteen;
    for ( int i = 1; i < 14; i++ )
        fourteen.push_back(std::to_string(i));
    fourteen.push_back("last one");

    std::vector<Message> messages = {
        Message("PING"),
        Message("CMD", {"x"}, Prefix("n")),
        Message("CMD", {"x"}, Prefix("n", std::string("u"))),
        Message("CMD", {"x"}, Prefix("n", none, std::string("h"))),
        Message("CMD", {"x"}, Prefix("")),
        Message("CMD", {"x"}, Prefix("", std::string("u"), std::string("h"))),
        Message("CMD", {"x"}, Prefix("n", std::string(""), std::string(""))),
        Message("CMD", {"x"}, Prefix("n", std::string("u!v"), std::string("h!x"))),
        Message("CMD", {"x"}, Prefix("n", std::string("u!v"))),
        Message("CMD", {"x"}, Prefix("n", none, std::string("h@x"))),
        Message("CMD", {"x"}, Prefix("n", std::string("u"), std::string("h@x"))),
        Message("CMD", {}, none, TagMap{{"empty", std::string()}, {"flag", none}}),
        Message("CMD", {"a"}, none, TagMap{{"k", std::string("a;b c\\d\r\n")}}),
        Message("CMD", fourteen),
        Message("CMD", std::vector<std::string>(14, "x")),
        Message("CMD", {"a", ""}),
        Message("CMD", {""}, Prefix("n", none, std::string("h")),
                TagMap{{"+vendor.example/key", std::string("v")}}),
    };

    for ( const auto& msg : messages )
    {
        std::string line = serialize(msg);
        BOOST_CHECK_MESSAGE( parse(line) == msg, line );
    }
}

BOOST_AUTO_TEST_CASE( test_errors )
{
    BOOST_CHECK( serialize_error(Message("")) == SerializeError::InvalidCommand );
    BOOST_CHECK( serialize_error(Message("PRIV MSG")) == SerializeError::InvalidCommand );
    BOOST_CHECK( serialize_error(Message("12")) == SerializeError::InvalidCommand );

    BOOST_CHECK( serialize_error(Message("CMD", {"a b", "c"})) == SerializeError::InvalidParameter );
    BOOST_CHECK( serialize_error(Message("CMD", {":a", "c"})) == SerializeError::InvalidParameter );
    BOOST_CHECK( serialize_error(Message("CMD", {"", "c"})) == SerializeError::InvalidParameter );
    BOOST_CHECK( serialize_error(Message("CMD", {"a\r\nQUIT"})) == SerializeError::InvalidParameter );
    BOOST_CHECK( serialize_error(Message("CMD", {std::string("a\0b", 3)})) == SerializeError::InvalidParameter );

    std::vector<std::string> params(max_params + 1, "x");
    BOOST_CHECK( serialize_error(Message("CMD", params)) == SerializeError::TooManyParameters );
    params.pop_back();
    BOOST_CHECK( !serialize_error(Message("CMD", params)) );

    BOOST_CHECK( serialize_error(Message("CMD", {}, none, TagMap{{"bad key", none}})) == SerializeError::InvalidTag );
    BOOST_CHECK( serialize_error(Message("CMD", {}, none, TagMap{{"", none}})) == SerializeError::InvalidTag );

    BOOST_CHECK( serialize_error(Message("CMD", {}, Prefix("da n"))) == SerializeError::InvalidPrefix );
    BOOST_CHECK( serialize_error(Message("CMD", {}, Prefix("a!b"))) == SerializeError::InvalidPrefix );
    BOOST_CHECK( serialize_error(Message("CMD", {}, Prefix("a", std::string("b@c")))) == SerializeError::InvalidPrefix );
    BOOST_CHECK( serialize_error(Message("CMD", {}, Prefix("a", none, std::string("h h")))) == SerializeError::InvalidPrefix );
    BOOST_CHECK( serialize_error(Message("CMD", {"x"}, Prefix("n", none, std::string("h!x")))) == SerializeError::InvalidPrefix );
    BOOST_CHECK( !serialize_error(Message("CMD", {"x"}, Prefix("n", std::string("u"), std::string("h!x")))) );

    BOOST_CHECK( serialize_error(Message("PRIVMSG", {"#chan", "hi"}, Prefix("n\r\nQUIT"))) == SerializeError::InvalidPrefix );
    BOOST_CHECK( serialize_error(Message("CMD", {}, Prefix("n", std::string("u\n")))) == SerializeError::InvalidPrefix );
    BOOST_CHECK( serialize_error(Message("CMD", {}, Prefix("n", std::string("u"), std::string("h\r")))) == SerializeError::InvalidPrefix );
    BOOST_CHECK( serialize_error(Message("CMD", {}, Prefix("n", none, std::string("h\0x", 3)))) == SerializeError::InvalidPrefix );

    BOOST_CHECK_THROW( serialize(Message("")), Error );
}
