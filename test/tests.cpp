#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "stanza/stanza.hpp"
#include "stanza/char_reader.hpp"
#include "stanza/lexer.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace Catch;

namespace {

    static Stanza::ValueTable parse_ok(std::string_view s, const Stanza::ParseOptions& opts = {}) {
        auto r = Stanza::parse(s, opts);
        REQUIRE(r);
        return std::move(*r);
    }

    static void expect_ok(std::string_view s, const Stanza::ParseOptions& opts = {}) {
        auto r = Stanza::parse(s, opts);
        REQUIRE(r);
    }

    static Stanza::ParseError expect_fail(std::string_view s, Stanza::ParseError::code code, const Stanza::ParseOptions& opts = {}) {
        auto r = Stanza::parse(s, opts);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code);
        return r.error();
    }

    static Stanza::Date at(int y, unsigned m, unsigned d, int hh = 0, int mm = 0, int ss = 0) {
        using namespace std::chrono;
        return sys_days{ year{ y } / month{ m } / day{ d } } + hours{ hh } + minutes{ mm } + seconds{ ss };
    }

    static const char* sample = R"({
        "b": true,
        "n": null,
        "num": 12.5,
        "s": "x",
        "ns": "42",
        "ns2": "+7",
        "bad": "abc",
        "d": "2024-03-01T14:30:00+02:00",
        "arr": [1, "2", null],
        "obj": {"k": 1},
        "one": "solo"
    })";
}


TEST_CASE("Large Text Reads In Chunks") {
    Stanza::LargeText text{ "abcdef" };
    std::size_t ofs = 0;
    std::string chunk;

    REQUIRE(text.next_chunk(ofs, 4, chunk));
    REQUIRE(chunk == "abcd");
    REQUIRE(ofs == 4);
    REQUIRE(text.next_chunk(ofs, 4, chunk));
    REQUIRE(chunk == "ef");
    REQUIRE(ofs == 6);
    REQUIRE_FALSE(text.next_chunk(ofs, 4, chunk));

    ofs = 7;
    REQUIRE_THROWS_AS(text.next_chunk(ofs, 4, chunk), Stanza::ResourceError);
}

TEST_CASE("Large Text Appends Across Pages") {
    Stanza::LargeText text;
    REQUIRE(text.empty());

    std::string page(Stanza::LargeText::page_size, 'a');
    text.append(page);
    text.append("tail");
    REQUIRE(text.size() == page.size() + 4);
    REQUIRE(text.view().ends_with("atail"));
    REQUIRE(text == Stanza::LargeText{ page + "tail" });

    text.free();
    REQUIRE(text.empty());
}

TEST_CASE("Char Reader Tracks Position") {
    auto reader = Stanza::CharReader::from_string("a\nb");

    REQUIRE(reader.read() == 'a');
    REQUIRE(reader.position().line == 1);
    REQUIRE(reader.position().column == 1);
    REQUIRE(reader.position().index == 1);

    REQUIRE(reader.read() == '\n');
    REQUIRE(reader.position().line == 2);
    REQUIRE(reader.position().column == 0);

    reader.unread('\n');
    REQUIRE(reader.position().line == 1);
    REQUIRE(reader.position().column == 1);
    REQUIRE(reader.position().index == 1);

    REQUIRE(reader.read() == '\n');
    REQUIRE(reader.read() == 'b');
    REQUIRE(reader.position().line == 2);
    REQUIRE(reader.position().column == 1);
    REQUIRE(reader.position().index == 3);
    REQUIRE_FALSE(reader.read().has_value());
}

TEST_CASE("Char Reader Joins Lines") {
    std::vector<std::string> lines{ "[1,", "2]", "" };
    auto reader = Stanza::CharReader::from_lines(lines);

    std::string seen;
    while (auto c = reader.read()) seen.push_back(*c);
    REQUIRE(seen == "[1,\n2]\n");
}

TEST_CASE("Char Reader Skips Whitespace") {
    auto reader = Stanza::CharReader::from_string(" \t\r\n x");
    REQUIRE(reader.read_non_ws() == 'x');
    REQUIRE(reader.position().line == 2);
    REQUIRE_FALSE(reader.read_non_ws().has_value());
}

TEST_CASE("Lexer Produces Symbols") {
    auto reader = Stanza::CharReader::from_string(R"([1.5e2, "x", true, null, -3])");
    Stanza::Lexer lex{ reader, true };

    auto next = [&] {
        auto s = lex.next();
        REQUIRE(s);
        return *s;
    };

    REQUIRE(next() == Stanza::Symbol::begin_array);
    REQUIRE(next() == Stanza::Symbol::number);
    REQUIRE(lex.number_value() == ::Approx(150.0));
    REQUIRE(next() == Stanza::Symbol::comma);
    REQUIRE(next() == Stanza::Symbol::string);
    REQUIRE(lex.string_value() == "x");
    REQUIRE(next() == Stanza::Symbol::comma);
    REQUIRE(next() == Stanza::Symbol::true_value);
    REQUIRE(next() == Stanza::Symbol::comma);
    REQUIRE(next() == Stanza::Symbol::null_value);
    REQUIRE(next() == Stanza::Symbol::comma);
    REQUIRE(next() == Stanza::Symbol::number);
    REQUIRE(lex.number_value() == ::Approx(-3.0));
    REQUIRE(next() == Stanza::Symbol::end_array);
    REQUIRE(next() == Stanza::Symbol::eof);

    auto tiny_reader = Stanza::CharReader::from_string("[1e-400, -1e-400, 0.0001e-320]");
    Stanza::Lexer tiny{ tiny_reader, true };
    auto tiny_next = [&] {
        auto s = tiny.next();
        REQUIRE(s);
        return *s;
    };

    REQUIRE(tiny_next() == Stanza::Symbol::begin_array);
    REQUIRE(tiny_next() == Stanza::Symbol::number);
    REQUIRE(tiny.number_value() == 0.0);
    REQUIRE_FALSE(std::signbit(tiny.number_value()));
    REQUIRE(tiny_next() == Stanza::Symbol::comma);
    REQUIRE(tiny_next() == Stanza::Symbol::number);
    REQUIRE(tiny.number_value() == 0.0);
    REQUIRE(std::signbit(tiny.number_value()));
    REQUIRE(tiny_next() == Stanza::Symbol::comma);
    REQUIRE(tiny_next() == Stanza::Symbol::number);
    REQUIRE(tiny.number_value() == 0.0);
    REQUIRE(tiny_next() == Stanza::Symbol::end_array);

    auto t = parse_ok(R"({"a":1e-400})");
    REQUIRE(Stanza::get_number(t, "a") == 0.0);
}

TEST_CASE("Lexer Error Messages") {
    using code = Stanza::ParseError::code;

    REQUIRE(expect_fail("[1.]", code::invalid_number).msg == "Invalid number: 1.]");
    REQUIRE(expect_fail("[1e]", code::invalid_number).msg == "Invalid number: 1e]");
    REQUIRE(expect_fail("[1e400]", code::invalid_number).msg == "Invalid number: 1e400");
    REQUIRE(expect_fail("[-a]", code::invalid_number).msg == "expected 0-9 after minus sign, not \"a\"");
    REQUIRE(expect_fail(R"(["\k"])", code::invalid_escape).msg == "Invalid escape sequence \\k");
    REQUIRE(expect_fail(R"(["abc)", code::invalid_string).msg == "Unterminated quoted string");
    REQUIRE(expect_fail(R"(["\u12G4"])", code::invalid_unicode_escape).msg == "\"\\u12g4\" is not a valid hex string");
    REQUIRE(expect_fail(R"(["\uD800x"])", code::invalid_unicode_escape).msg == "\"\\ud800\" is not a valid hex string");
    REQUIRE(expect_fail(R"(["\uDC00"])", code::invalid_unicode_escape).msg == "\"\\udc00\" is not a valid hex string");
    REQUIRE(expect_fail("[@]", code::unexpected_character).msg == "Unexpected character \"@\"");
    REQUIRE(expect_fail("[abc]", code::unquoted_literal).msg == "strict mode JSON parser does not allow unquoted literals");
}

TEST_CASE("Error Position Points At Token") {
    auto r = Stanza::parse("{\n  \"a\" 1\n}");
    REQUIRE_FALSE(r);

    const auto& e = r.error();
    REQUIRE(e.errc == Stanza::ParseError::code::unexpected_token);
    REQUIRE(e.msg == "Expected \":\", seeing \"<number>\"");
    REQUIRE(e.line == 2);
    REQUIRE(e.column == 7);
    REQUIRE(e.offset == 8);
    REQUIRE(e.describe() == "Error at line 2, col 7: Expected \":\", seeing \"<number>\"");
}

TEST_CASE("Error Position Counts Lines Of Line Input") {
    std::vector<std::string> lines{ "{", "\"a\" 1}" };
    auto r = Stanza::parse(lines);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().line == 2);
    REQUIRE(r.error().column == 5);
}

TEST_CASE("Surrogate Pair Decodes To UTF-8") {
    auto t = parse_ok(R"(["\uD83D\uDE00", "\u00e9"])");
    REQUIRE(Stanza::get_string(t, "[1]") == "\xF0\x9F\x98\x80");
    REQUIRE(Stanza::get_string(t, "[2]") == "\xC3\xA9");
}

TEST_CASE("Parse Builds Path Table") {
    auto t = parse_ok(R"({"foo":3,"bar":[1,2,3,4],"a b":{"x":null}})");

    REQUIRE(Stanza::get_count(t, ".") == 3u);
    REQUIRE(Stanza::get_count(t, "bar") == 4u);
    REQUIRE(t.at("bar[4]").as_number() == ::Approx(4.0));
    REQUIRE(t.at("\"a b\".x").is_null());
    REQUIRE(Stanza::get_members(t, ".") == Stanza::members_t{ "foo", "bar", "\"a b\"" });
    REQUIRE(t.size() == 9);
}

TEST_CASE("Parse Root Array Paths") {
    auto t = parse_ok("[10,[20,{\"k\":[]}]]");

    REQUIRE(Stanza::get_number(t, "[1]") == 10.0);
    REQUIRE(Stanza::get_number(t, "[2][1]") == 20.0);
    REQUIRE(Stanza::get_count(t, "[2][2].k") == 0u);
    REQUIRE(Stanza::get_count(t, ".") == 2u);
}

TEST_CASE("Empty Input Gives Empty Table") {
    REQUIRE(parse_ok("").empty());
    REQUIRE(parse_ok(" \n\t ").empty());
    auto none = Stanza::parse(std::vector<std::string>{});
    REQUIRE(none);
    REQUIRE(none->empty());
}

TEST_CASE("Top-Level Scalars Are Rejected") {
    using code = Stanza::ParseError::code;
    REQUIRE(expect_fail("42", code::unexpected_token).msg == "expected [ or {");
    REQUIRE(expect_fail("\"x\"", code::unexpected_token).msg == "expected [ or {");
}

TEST_CASE("Trailing Content Is Rejected") {
    auto e = expect_fail("{} {", Stanza::ParseError::code::unexpected_token);
    REQUIRE(e.msg == "Expected \"<eof>\", seeing \"{\"");
}

TEST_CASE("Strict And Lax Modes") {
    using code = Stanza::ParseError::code;
    Stanza::ParseOptions lax{ .strict = false };

    expect_fail("{a: 1,}", code::unquoted_literal);
    expect_fail("[1,]", code::dangling_comma);
    expect_fail("{\"a\":1,}", code::dangling_comma);

    auto t = parse_ok("{a: 1,}", lax);
    REQUIRE(Stanza::get_number(t, "a") == 1.0);
    REQUIRE(Stanza::get_count(t, ".") == 1u);

    auto arr = parse_ok("[1,]", lax);
    REQUIRE(Stanza::get_count(arr, ".") == 1u);

    expect_ok("[x_1, y]", lax);
}

TEST_CASE("Parse Into Clears On Failure") {
    Stanza::ValueTable t;
    REQUIRE(Stanza::parse_into(t, "{\"a\":1}"));
    REQUIRE(Stanza::exists(t, "a"));

    REQUIRE_FALSE(Stanza::parse_into(t, "{\"a\":"));
    REQUIRE(t.empty());
}

TEST_CASE("Parse Line Input") {
    std::vector<std::string> lines{ "{\"a\":", "[1,", "2]}" };
    auto r = Stanza::parse(lines);
    REQUIRE(r);
    REQUIRE(Stanza::get_count(*r, "a") == 2u);
}

TEST_CASE("Parse Large Text Input Across Pages") {
    Stanza::LargeText doc{ "[" };
    for (int i = 0; i < 3000; i++) doc.append("\"abcd\",");
    doc.append("\"end\"]");

    auto r = Stanza::parse(doc);
    REQUIRE(r);
    REQUIRE(Stanza::get_count(*r, ".") == 3001u);
    REQUIRE(Stanza::get_string(*r, "[3001]") == "end");
}

TEST_CASE("Long Strings Move To Large Text") {
    std::string big(50000, 'x');
    big[100] = '"';
    big[20000] = '\\';

    auto t = parse_ok("[" + Stanza::stringify(big) + ",\"" + std::string(8190, 'y') + "\"]");

    REQUIRE(t.at("[1]").is_large_text());
    REQUIRE(Stanza::get_large_text(t, "[1]") == big);
    REQUIRE_THROWS_AS(Stanza::get_string(t, "[1]"), Stanza::ValueError);

    REQUIRE(t.at("[2]").is_string());
    REQUIRE(Stanza::get_string(t, "[2]")->size() == 8190);
}

TEST_CASE("XML Rendition") {
    auto xml = Stanza::to_xml(R"({"a":1,"b":[true,"x"],"c d":null})");
    REQUIRE(xml);
    REQUIRE(*xml == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                    "<json><a>1</a>\n"
                    "<b><row>true</row>\n"
                    "<row>x</row>\n"
                    "</b>\n"
                    "</json>");
}

TEST_CASE("XML Names And Text Are Escaped") {
    auto xml = Stanza::to_xml(R"({"a-b":1,"-x":2,"ok":"<&>"})");
    REQUIRE(xml);
    REQUIRE(*xml == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                    "<json><a-b>1</a-b>\n"
                    "<_x>2</_x>\n"
                    "<ok>&lt;&amp;&gt;</ok>\n"
                    "</json>");

    REQUIRE(Stanza::fix_xml_name("a b") == "a_b");
    REQUIRE(Stanza::fix_xml_name("ok_name") == "ok_name");
}

TEST_CASE("XML Prolog Options") {
    auto empty = Stanza::to_xml("");
    REQUIRE(empty);
    REQUIRE(*empty == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n");

    auto latin = Stanza::to_xml("[]", {}, { .encoding = "ISO-8859-1" });
    REQUIRE(latin);
    REQUIRE(*latin == "<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?>\n<json></json>");

    REQUIRE(Stanza::to_xml_sql("{a:1}", "N"));
    REQUIRE_FALSE(Stanza::to_xml_sql("{a:1}"));
    REQUIRE_FALSE(Stanza::to_xml_sql("{a:1}", "x"));
}

TEST_CASE("JSON Escaping") {
    REQUIRE(Stanza::escape_json("a\"b\\c/d\n\t\b") == R"(a\"b\\c\/d\n\t\b)");
    REQUIRE(Stanza::escape_json("<&>'`") == "\\u003C\\u0026\\u003E\\u0027\\u0060");
    REQUIRE(Stanza::escape_json("\f\x7F") == "\\u000C\\u007F");
    REQUIRE(Stanza::escape_json("\xC3\xA9") == "\\u00E9");
    REQUIRE(Stanza::escape_json("\xF0\x9F\x98\x80") == "\\uD83D\\uDE00");
    REQUIRE(Stanza::escape_json("plain") == "plain");
}

TEST_CASE("HTML Escaping") {
    REQUIRE(Stanza::escape_html("<a href='/x'>&\"</a>") == "&lt;a href=&#x27;&#x2F;x&#x27;&gt;&amp;&quot;&lt;&#x2F;a&gt;");
}

TEST_CASE("Stringify Scalars") {
    using namespace std::chrono;

    REQUIRE(Stanza::stringify(-0.005) == "-0.005");
    REQUIRE(Stanza::stringify(0.5) == "0.5");
    REQUIRE(Stanza::stringify(3.0) == "3");
    REQUIRE(Stanza::stringify(std::numeric_limits<double>::infinity()) == "null");
    REQUIRE(Stanza::stringify(std::numeric_limits<double>::quiet_NaN()) == "null");
    REQUIRE(Stanza::stringify(std::optional<double>{}) == "null");
    REQUIRE(Stanza::stringify(true) == "true");
    REQUIRE(Stanza::stringify("a\"b") == "\"a\\\"b\"");
    REQUIRE(Stanza::stringify(std::string_view{}) == "\"\"");

    Stanza::Date d = at(2024, 3, 1, 12, 30);
    Stanza::Timestamp ts = d + milliseconds{ 250 };
    REQUIRE(Stanza::stringify(d) == "\"2024-03-01T12:30:00Z\"");
    REQUIRE(Stanza::stringify(ts) == "\"2024-03-01T12:30:00.250000Z\"");
    REQUIRE(Stanza::stringify(Stanza::TimestampTz{ ts, minutes{ 120 } }) == "\"2024-03-01T14:30:00.250000+02:00\"");
    REQUIRE(Stanza::stringify(Stanza::TimestampTz{ ts, minutes{ -330 } }) == "\"2024-03-01T07:00:00.250000-05:30\"");
}

TEST_CASE("ISO-8601 Parsing") {
    using namespace std::chrono;

    auto tz = Stanza::parse_iso8601("2024-03-01T14:30:00.25+02:00");
    REQUIRE(tz);
    REQUIRE(tz->utc == at(2024, 3, 1, 12, 30) + milliseconds{ 250 });
    REQUIRE(tz->offset == minutes{ 120 });

    auto utc = Stanza::parse_iso8601("2024-03-01T12:30:00Z");
    REQUIRE(utc);
    REQUIRE(utc->offset == minutes{ 0 });

    REQUIRE_FALSE(Stanza::parse_iso8601("2024-03-01"));
    REQUIRE_FALSE(Stanza::parse_iso8601("2024-02-30T00:00:00"));
    REQUIRE_FALSE(Stanza::parse_iso8601("garbage"));
    REQUIRE(Stanza::parse_utc_offset("-05:30") == minutes{ -330 });
    REQUIRE_FALSE(Stanza::parse_utc_offset("+5"));
}

TEST_CASE("Member Names") {
    REQUIRE(Stanza::is_simple_name("foo_1"));
    REQUIRE_FALSE(Stanza::is_simple_name("a b"));
    REQUIRE(Stanza::to_member_name("foo") == "foo");
    REQUIRE(Stanza::to_member_name("a b") == "\"a b\"");
    REQUIRE(Stanza::to_member_name("say \"x\"") == R"("say \"x\"")");
    REQUIRE(Stanza::from_member_name(R"("say \"x\"")") == "say \"x\"");
    REQUIRE(Stanza::from_member_name("foo") == "foo");
}

TEST_CASE("Format Path Placeholders") {
    REQUIRE(Stanza::format_path("a[%d].%s", { "2", "b" }) == "a[2].b");
    REQUIRE(Stanza::format_path("%1-%0", { "x", "y" }) == "y-x");
    REQUIRE(Stanza::format_path("%5", { "x" }) == "");
    REQUIRE(Stanza::format_path("100%%", {}) == "100%");
    REQUIRE(Stanza::format_path("%x", {}) == "x");

    std::vector<std::string> many;
    for (int i = 0; i < 13; i++) many.push_back("v" + std::to_string(i));
    REQUIRE(Stanza::format_path("%12.%1", many) == "v12.v1");
}

TEST_CASE("Format Path Truncates Long Arguments") {
    std::string exact(Stanza::max_path_argument, 'a');
    std::string over(Stanza::max_path_argument + 1, 'a');

    REQUIRE(Stanza::format_path("%s", { exact }) == exact);
    REQUIRE(Stanza::format_path("%s", { over }) == std::string(Stanza::max_path_argument - 1, 'a') + "~");
}

TEST_CASE("Like Matching") {
    REQUIRE(Stanza::like("items[1]", "items[%]"));
    REQUIRE(Stanza::like("abc", "a_c"));
    REQUIRE_FALSE(Stanza::like("abc", "a_"));
    REQUIRE(Stanza::like("", "%"));
    REQUIRE(Stanza::like("a.b.c", "%.c"));
    REQUIRE_FALSE(Stanza::like("a.b.c", "%.b"));
}

TEST_CASE("Boolean Accessor") {
    auto t = parse_ok(sample);

    REQUIRE(Stanza::get_boolean(t, "b") == true);
    REQUIRE_FALSE(Stanza::get_boolean(t, "n").has_value());
    REQUIRE(Stanza::get_boolean(t, "missing", false) == false);
    REQUIRE_THROWS_AS(Stanza::get_boolean(t, "s"), Stanza::ValueError);
}

TEST_CASE("Number Accessor") {
    auto t = parse_ok(sample);

    REQUIRE(Stanza::get_number(t, "num") == 12.5);
    REQUIRE(Stanza::get_number(t, "ns") == 42.0);
    REQUIRE(Stanza::get_number(t, "ns2") == 7.0);
    REQUIRE(Stanza::get_number(t, "missing", 1.0) == 1.0);
    REQUIRE(Stanza::get_number(t, { "arr[%d]", { "1" } }) == 1.0);
    REQUIRE_THROWS_AS(Stanza::get_number(t, "bad"), Stanza::ValueError);
    REQUIRE_THROWS_AS(Stanza::get_number(t, "obj"), Stanza::ValueError);
}

TEST_CASE("String Accessor") {
    auto t = parse_ok(sample);

    REQUIRE(Stanza::get_string(t, "b") == "true");
    REQUIRE(Stanza::get_string(t, "num") == "12.5");
    REQUIRE(Stanza::get_string(t, "s") == "x");
    REQUIRE(Stanza::get_string(t, "missing", "n/a") == "n/a");
    REQUIRE_FALSE(Stanza::get_string(t, "n").has_value());
    REQUIRE_THROWS_AS(Stanza::get_string(t, "obj"), Stanza::ValueError);
}

TEST_CASE("Date Accessors") {
    using namespace std::chrono;
    auto t = parse_ok(sample);

    REQUIRE(Stanza::get_date(t, "d") == at(2024, 3, 1, 12, 30));
    REQUIRE(Stanza::get_timestamp(t, "d") == Stanza::Timestamp{ at(2024, 3, 1, 12, 30) });

    auto tz = Stanza::get_timestamp_tz(t, "d");
    REQUIRE(tz);
    REQUIRE(tz->offset == minutes{ 120 });

    REQUIRE(Stanza::get_date_at(t, "d", minutes{ 60 }) == at(2024, 3, 1, 13, 30));
    REQUIRE(Stanza::get_timestamp_at(t, "d", minutes{ -60 }) == Stanza::Timestamp{ at(2024, 3, 1, 11, 30) });

    REQUIRE_FALSE(Stanza::get_date(t, "missing").has_value());
    REQUIRE_THROWS_AS(Stanza::get_date(t, "s"), Stanza::ValueError);
    REQUIRE_THROWS_AS(Stanza::get_date(t, "num"), Stanza::ValueError);
}

TEST_CASE("Container Accessors") {
    auto t = parse_ok(sample);

    REQUIRE(Stanza::get_count(t, "obj") == 1u);
    REQUIRE(Stanza::get_count(t, "arr") == 3u);
    REQUIRE_FALSE(Stanza::get_count(t, "missing").has_value());
    REQUIRE_THROWS_AS(Stanza::get_count(t, "s"), Stanza::ValueError);

    REQUIRE(Stanza::get_members(t, "obj") == Stanza::members_t{ "k" });
    REQUIRE_THROWS_AS(Stanza::get_members(t, "arr"), Stanza::ValueError);
}

TEST_CASE("Array Accessors") {
    auto t = parse_ok(sample);

    auto strings = Stanza::get_array_of_string(t, "arr");
    REQUIRE(strings);
    REQUIRE(*strings == std::vector<std::optional<std::string>>{ "1", "2", std::nullopt });

    auto numbers = Stanza::get_array_of_number(t, "arr");
    REQUIRE(numbers);
    REQUIRE(*numbers == std::vector<std::optional<double>>{ 1.0, 2.0, std::nullopt });

    auto single = Stanza::get_array_of_string(t, "one");
    REQUIRE(single);
    REQUIRE(*single == std::vector<std::optional<std::string>>{ "solo" });

    REQUIRE_FALSE(Stanza::get_array_of_string(t, "missing").has_value());
    REQUIRE_THROWS_AS(Stanza::get_array_of_string(t, "obj"), Stanza::ValueError);
    REQUIRE_THROWS_AS(Stanza::get_array_of_number(t, "one"), Stanza::ValueError);
}

TEST_CASE("Raw Value Access") {
    auto t = parse_ok(sample);

    REQUIRE(Stanza::get_value(t, "missing").is_null());
    REQUIRE(Stanza::get_value(t, "num").as_number() == ::Approx(12.5));
    REQUIRE(Stanza::get_value(t, "obj").is_object());
    REQUIRE(Stanza::exists(t, "arr[3]"));
    REQUIRE_FALSE(Stanza::exists(t, "arr[4]"));
}

TEST_CASE("Find Paths Like") {
    auto t = parse_ok(R"({
        "items": [
            {"name": "Sword", "magical": true},
            {"name": "Shield", "magical": "rather not"},
            {"name": "Wand", "magical": true}
        ]
    })");

    REQUIRE(Stanza::find_paths_like(t, "items[%]", ".magical", "true") ==
            std::vector<std::string>{ "items[1]", "items[3]" });
    REQUIRE(Stanza::find_paths_like(t, "items[%].name") ==
            std::vector<std::string>{ "items[1].name", "items[2].name", "items[3].name" });
    REQUIRE(Stanza::find_paths_like(t, "items[%]", ".name", "S%") ==
            std::vector<std::string>{ "items[1]", "items[2]" });
    REQUIRE(Stanza::find_paths_like(t, "items[%]", ".color").empty());
    REQUIRE(Stanza::find_paths_like(Stanza::ValueTable{}, "items[%]").empty());
}
