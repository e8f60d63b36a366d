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
#include "vectors.hpp"

#include <algorithm>
#include <sstream>

#include "ircline/error.hpp"
#include "ircline/mask.hpp"
#include "ircline/parser.hpp"
#include "ircline/serializer.hpp"
#include "ircline/tags.hpp"
#include "logger.hpp"

namespace ircline {
namespace conformance {

/**
 * \brief Default for missing child nodes
 */
static const Settings no_children;

static std::string error_name(ParseError::Kind kind)
{
    switch ( kind )
    {
        case ParseError::EmptyLine:      return "EmptyLine";
        case ParseError::MissingCommand: return "MissingCommand";
        case ParseError::MalformedTags:  return "MalformedTags";
    }
    return "ParseError";
}

static std::string error_name(SerializeError::Kind kind)
{
    switch ( kind )
    {
        case SerializeError::InvalidCommand:    return "InvalidCommand";
        case SerializeError::InvalidParameter:  return "InvalidParameter";
        case SerializeError::TooManyParameters: return "TooManyParameters";
        case SerializeError::InvalidTag:        return "InvalidTag";
        case SerializeError::InvalidPrefix:     return "InvalidPrefix";
    }
    return "SerializeError";
}

/**
 * \brief Values of the children of a list node
 */
static std::vector<std::string> string_list(const Settings& node)
{
    std::vector<std::string> list;
    for ( const auto& child : node )
        list.push_back(child.second.data());
    return list;
}

/**
 * \brief Human-readable dump of a message, used in failure reports
 */
static std::string describe(const Message& message)
{
    std::ostringstream ss;
    ss << "tags={";
    for ( const auto& tag : message.tags() )
    {
        ss << tag.first;
        if ( tag.second )
            ss << "=\"" << *tag.second << '"';
        ss << ';';
    }
    ss << "} source=";
    if ( message.source() )
        ss << '"' << message.source()->mask() << '"';
    else
        ss << "none";
    ss << " verb=" << message.command() << " params=[";
    for ( const auto& param : message.params() )
        ss << '"' << param << "\",";
    ss << ']';
    return ss.str();
}

static void pass(Report& report, const std::string& what)
{
    report.passed++;
    Log("conf", '<', 3) << color::green << "PASS" << color::nocolor << ' ' << what;
}

static void fail(Report& report, const std::string& what, const std::string& why)
{
    report.failed++;
    ErrorLog("conf", "FAIL") << what << " (" << why << ')';
}

Message message_from_atoms(const Settings& atoms)
{
    TagMap tags;
    for ( const auto& tag : atoms.get_child("tags", no_children) )
        tags.set(tag.second.get("key", ""), tag.second.get_optional<std::string>("value"));

    Optional<Prefix> source;
    if ( auto text = atoms.get_optional<std::string>("source") )
        source = Prefix::parse(*text);

    return Message(
        atoms.get("verb", ""),
        string_list(atoms.get_child("params", no_children)),
        std::move(source),
        std::move(tags)
    );
}

Report SuiteRunner::run_file(const std::string& file_name)
{
    Settings suite = settings::load(file_name, settings::FileFormat::JSON);
    return run(suite, file_name);
}

Report SuiteRunner::run(const Settings& suite, const std::string& name)
{
    std::string type = suite.get("suite", "");
    const Settings& tests = suite.get_child("tests", no_children);
    Log("conf", '!', 1) << "Running " << type << " suite from " << name
                        << " (" << tests.size() << " tests)";

    Report report;
    if ( type == "msg-split" )
        report = run_split(tests);
    else if ( type == "msg-join" )
        report = run_join(tests);
    else if ( type == "mask-match" )
        report = run_mask(tests);
    else if ( type == "userhost-split" )
        report = run_userhost(tests);
    else if ( type == "tag-escape" )
        report = run_escape(tests);
    else
        throw ConfigurationError("Unknown test suite \"" + type + "\" in " + name);

    Log("conf", '!', 1) << (report.ok() ? color::green : color::red) << name
        << color::nocolor << ": " << report.passed << " passed, "
        << report.failed << " failed, " << report.lenient << " lenient";
    return report;
}

Report SuiteRunner::run_split(const Settings& tests)
{
    Report report;
    for ( const auto& item : tests )
    {
        const Settings& test = item.second;
        std::string input = test.get("input", "");
        auto expected_error = test.get_optional<std::string>("error");

        ParseDiagnostics diagnostics;
        try
        {
            Message message = parse(input, diagnostics);
            if ( expected_error )
            {
                fail(report, input, "expected " + *expected_error);
                continue;
            }

            Message expected = message_from_atoms(test.get_child("atoms", no_children));
            if ( message != expected )
            {
                fail(report, input, "got " + describe(message) +
                                    " expected " + describe(expected));
                continue;
            }
        }
        catch ( const ParseError& error )
        {
            if ( !expected_error || *expected_error != error_name(error.kind()) )
                fail(report, input, std::string("unexpected error: ") + error.what());
            else
                pass(report, input);
            continue;
        }

        auto expected_lenient = test.get_optional<bool>("lenient");
        if ( expected_lenient && *expected_lenient != diagnostics.lenient() )
        {
            fail(report, input, diagnostics.lenient() ?
                "unexpected lenient parse" : "expected a lenient parse");
            continue;
        }

        if ( diagnostics.lenient() )
        {
            report.lenient++;
            Log log("conf", '!', 2);
            log << color::yellow << "Lenient" << color::nocolor << ':';
            if ( diagnostics.folded_parameters )
                log << " folded parameters";
            if ( diagnostics.dropped_escapes )
                log << " dropped escapes";
            if ( diagnostics.duplicate_tags )
                log << " duplicate tags";
            log << " in " << input;
        }

        pass(report, input);
    }
    return report;
}

Report SuiteRunner::run_join(const Settings& tests)
{
    Report report;
    for ( const auto& item : tests )
    {
        const Settings& test = item.second;
        std::string desc = test.get("desc", "");
        Message message = message_from_atoms(test.get_child("atoms", no_children));
        auto expected_error = test.get_optional<std::string>("error");

        try
        {
            std::string line = serialize(message);
            Log("conf", '>', 4) << line;

            if ( expected_error )
            {
                fail(report, desc, "expected " + *expected_error + ", got " + line);
                continue;
            }

            auto accepted = string_list(test.get_child("matches", no_children));
            if ( std::find(accepted.begin(), accepted.end(), line) == accepted.end() )
            {
                fail(report, desc, "unexpected line " + line);
                continue;
            }

            pass(report, desc);
        }
        catch ( const SerializeError& error )
        {
            if ( !expected_error || *expected_error != error_name(error.kind()) )
                fail(report, desc, std::string("unexpected error: ") + error.what());
            else
                pass(report, desc);
        }
    }
    return report;
}

Report SuiteRunner::run_mask(const Settings& tests)
{
    Report report;
    for ( const auto& item : tests )
    {
        const Settings& test = item.second;
        std::string mask = test.get("mask", "");

        CaseMapping test_mapping = mapping;
        if ( auto name = test.get_optional<std::string>("casemapping") )
        {
            auto parsed = casemapping_from_name(*name);
            if ( !parsed )
                throw ConfigurationError("Unknown casemapping: " + *name);
            test_mapping = *parsed;
        }

        bool ok = true;
        for ( const auto& hostmask : string_list(test.get_child("matches", no_children)) )
        {
            if ( !matches(hostmask, mask, test_mapping) )
            {
                fail(report, mask, hostmask + " should match");
                ok = false;
            }
        }
        for ( const auto& hostmask : string_list(test.get_child("fails", no_children)) )
        {
            if ( matches(hostmask, mask, test_mapping) )
            {
                fail(report, mask, hostmask + " should not match");
                ok = false;
            }
        }

        if ( ok )
            pass(report, mask);
    }
    return report;
}

Report SuiteRunner::run_userhost(const Settings& tests)
{
    Report report;
    for ( const auto& item : tests )
    {
        const Settings& test = item.second;
        std::string source = test.get("source", "");
        const Settings& atoms = test.get_child("atoms", no_children);

        Prefix expected(atoms.get("nick", ""),
                        atoms.get_optional<std::string>("user"),
                        atoms.get_optional<std::string>("host"));
        Prefix prefix = Prefix::parse(source);

        if ( prefix != expected )
            fail(report, source, "got nick=" + prefix.nick +
                                 " user=" + prefix.user.value_or("(none)") +
                                 " host=" + prefix.host.value_or("(none)"));
        else
            pass(report, source);
    }
    return report;
}

Report SuiteRunner::run_escape(const Settings& tests)
{
    Report report;
    for ( const auto& item : tests )
    {
        const Settings& test = item.second;
        std::string raw = test.get("raw", "");
        std::string escaped = test.get("escaped", "");
        std::string direction = test.get("direction", "both");

        if ( direction != "decode" && encode_tag_value(raw) != escaped )
        {
            fail(report, escaped, "encoded as " + encode_tag_value(raw));
            continue;
        }

        if ( direction != "encode" && decode_tag_value(escaped) != raw )
        {
            fail(report, escaped, "decoded as " + decode_tag_value(escaped));
            continue;
        }

        pass(report, escaped);
    }
    return report;
}

} // namespace conformance
} // namespace ircline
