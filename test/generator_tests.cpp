#include <catch2/catch.hpp>

#include "stanza/stanza.hpp"

#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace Catch;

namespace {

    struct rng {
        std::mt19937_64 eng;

        rng() : eng(std::random_device{}()) {}

        size_t uniform_size(size_t min, size_t max) {
            std::uniform_int_distribution<size_t> dist(min, max);
            return dist(eng);
        }

        bool coin(double p = 0.5) {
            std::bernoulli_distribution dist(p);
            return dist(eng);
        }

        double uniform_double() {
            std::uniform_real_distribution dist(-1e6, 1e6);
            return dist(eng);
        }

        std::string random_string(size_t max_len = 16) {
            static constexpr char extra[] = "\"\\/\n\t<>&' ";
            size_t len = uniform_size(0, max_len);
            std::string s;
            for (size_t i = 0; i < len; i++) {
                if (coin(0.1)) s.push_back(extra[uniform_size(0, sizeof(extra) - 2)]);
                else s.push_back(static_cast<char>(uniform_size(32, 126)));
            }
            return s;
        }
    };

    // Random JSON document text; containers at the root.
    std::string random_json(rng& r, int depth = 0, int max_depth = 4) {
        size_t choice = depth == 0 ? r.uniform_size(4, 5) : r.uniform_size(0, depth >= max_depth ? 3 : 5);
        switch (choice) {
        case 0: return "null";
        case 1: return r.coin() ? "true" : "false";
        case 2: return Stanza::stringify(r.uniform_double());
        case 3: return Stanza::stringify(r.random_string());
        case 4: {
            std::string out = "[";
            size_t n = r.uniform_size(0, 6);
            for (size_t i = 0; i < n; i++) {
                if (i) out += ",";
                out += random_json(r, depth + 1, max_depth);
            }
            return out + "]";
        }
        default: {
            std::string out = "{";
            size_t n = r.uniform_size(0, 6);
            for (size_t i = 0; i < n; i++) {
                if (i) out += ",";
                out += Stanza::stringify(r.random_string(8) + std::to_string(i));
                out += ":";
                out += random_json(r, depth + 1, max_depth);
            }
            return out + "}";
        }
        }
    }

    static Stanza::ValueTable parse_ok(std::string_view s) {
        auto r = Stanza::parse(s);
        REQUIRE(r);
        return std::move(*r);
    }

    static void require_same_table(const Stanza::ValueTable& a, const Stanza::ValueTable& b) {
        REQUIRE(a.size() == b.size());
        for (const auto& [path, value] : a) {
            const Stanza::Value* other = b.find(path);
            REQUIRE(other != nullptr);
            REQUIRE(*other == value);
        }
    }

    struct RecordingSink : Stanza::Sink {
        explicit RecordingSink(std::vector<std::string>& units) : m_Units{ units } {}

        void write(std::string_view text) override { m_Units.emplace_back(text); }
        void flush() override { m_Flushes++; }
        void dispose() override {}

        std::vector<std::string>& m_Units;
        int m_Flushes = 0;
    };

    static Stanza::Date at(int y, unsigned m, unsigned d, int hh = 0, int mm = 0) {
        using namespace std::chrono;
        return sys_days{ year{ y } / month{ m } / day{ d } } + hours{ hh } + minutes{ mm };
    }

    static std::shared_ptr<Stanza::RowSet> people() {
        using Stanza::Cell;
        using Stanza::ColumnType;
        return std::make_shared<Stanza::VectorRowSet>(
            std::vector<Stanza::Column>{ { "ID", ColumnType::number }, { "NAME", ColumnType::text } },
            std::vector<std::vector<Cell>>{
                { Cell{ 1.0 }, Cell{ std::string{ "Ann" } } },
                { Cell{ 2.0 }, Cell{} },
            });
    }
}


TEST_CASE("Buffered Writer Hands Bounded Units To Sink") {
    std::vector<std::string> units;
    Stanza::BufferedWriter w{ std::make_unique<RecordingSink>(units) };

    w.write(std::string(32000, 'x'));
    REQUIRE(units.empty());

    w.write(std::string(1000, 'y'));
    REQUIRE(units.size() == 1);
    REQUIRE(units[0].size() == 32000);
    REQUIRE(w.pending() == std::string(1000, 'y'));

    w.write(std::string(40000, 'z'));
    REQUIRE(units.size() == 3);
    REQUIRE(units[1] == std::string(1000, 'y'));
    REQUIRE(units[2].size() == 40000);
    REQUIRE(w.pending().empty());

    w.line("end");
    w.flush();
    REQUIRE(units.back() == "end\n");
    REQUIRE(static_cast<RecordingSink&>(w.sink()).m_Flushes == 3);
}

TEST_CASE("Buffered Writer Formats Into Large Text") {
    Stanza::BufferedWriter w{ std::make_unique<Stanza::LargeTextSink>() };
    auto& sink = static_cast<Stanza::LargeTextSink&>(w.sink());

    w.writef("<%s a=\"%s\">", { "x", "1" });
    w.line("!");
    REQUIRE(w.pending() == "<x a=\"1\">!\n");
    REQUIRE(sink.text() == nullptr);

    w.flush();
    REQUIRE(sink.text() != nullptr);
    REQUIRE(sink.text()->str() == "<x a=\"1\">!\n");

    w.dispose();
    REQUIRE(sink.text() == nullptr);
}

TEST_CASE("Compact Output Layout") {
    Stanza::Generator gen;
    gen.open_object();
    gen.write("a", 1);
    gen.open_array("b");
    gen.write("x");
    gen.write(2.5);
    gen.close_array();
    gen.write_null("c");
    gen.close_object();

    REQUIRE(gen.level() == 0);
    REQUIRE(gen.output() == "{\n\"a\":1\n,\"b\":[\n\"x\"\n,2.5\n]\n,\"c\":null\n}\n");
}

TEST_CASE("Indented Output Layout") {
    Stanza::Generator gen;
    gen.initialize_large_text_output({ .indent = 2 });
    gen.open_object();
    gen.write("a", 1);
    gen.write("b", true);
    gen.open_object("c");
    gen.write("d", "x");
    gen.close_object();
    gen.close_object();

    REQUIRE(gen.output() == "{\n  \"a\":1\n ,\"b\":true\n ,\"c\":{\n    \"d\":\"x\"\n  }\n}\n");
}

TEST_CASE("Member Name Forms") {
    Stanza::Generator gen;
    gen.open_object();
    gen.write("\"pre\"", 1);
    gen.write("a b", 2);
    gen.write("say \"x\"", 3);
    gen.close_object();

    auto t = parse_ok(gen.output());
    REQUIRE(Stanza::get_number(t, "pre") == 1.0);
    REQUIRE(Stanza::get_number(t, "\"a b\"") == 2.0);
    REQUIRE(Stanza::get_number(t, R"("say \"x\"")") == 3.0);
}

TEST_CASE("Nesting Errors") {
    Stanza::Generator gen;
    REQUIRE_THROWS_AS(gen.write("x"), Stanza::WriterError);
    REQUIRE_THROWS_AS(gen.write("a", 1), Stanza::WriterError);
    REQUIRE_THROWS_AS(gen.close_array(), Stanza::WriterError);

    gen.open_object();
    gen.open_array();
    REQUIRE_THROWS_AS(gen.close_object(), Stanza::WriterError);
    REQUIRE(gen.level() == 2);

    gen.close_all();
    REQUIRE(gen.level() == 0);
    REQUIRE(gen.output() == "{\n[\n]\n}\n");
}

TEST_CASE("Close All Balances Output") {
    Stanza::Generator gen;
    gen.open_array();
    gen.open_object();
    gen.open_array("inner");
    gen.write(1);
    gen.open_object();
    gen.write("k", "v");
    gen.close_all();

    auto t = parse_ok(gen.output());
    REQUIRE(Stanza::get_number(t, "[1].inner[1]") == 1.0);
    REQUIRE(Stanza::get_string(t, "[1].inner[2].k") == "v");
}

TEST_CASE("Escaped Strings Read Back Unchanged") {
    const std::string original = "say \"hi\"\\ \x01 tab\t </script> \xC3\xA9";

    Stanza::Generator gen;
    gen.open_array();
    gen.write(original);
    gen.close_array();

    auto t = parse_ok(gen.output());
    REQUIRE(Stanza::get_string(t, "[1]") == original);
}

TEST_CASE("Long Strings Are Written In Pieces") {
    std::string big;
    for (int i = 0; i < 50000; i++) big.push_back(i % 1000 == 0 ? '"' : static_cast<char>('a' + i % 26));
    std::string small = big.substr(0, 100);

    auto expected = [](const std::string& s) { return "[\n\"" + Stanza::escape_json(s) + "\"\n]\n"; };

    Stanza::Generator gen;
    gen.open_array();
    gen.write(small);
    gen.close_array();
    REQUIRE(gen.output() == expected(small));

    gen.initialize_large_text_output();
    gen.open_array();
    gen.write(big);
    gen.close_array();
    std::string out = gen.output();
    REQUIRE(out == expected(big));

    auto t = parse_ok(out);
    REQUIRE(t.at("[1]").is_large_text());
    REQUIRE(Stanza::get_large_text(t, "[1]") == big);
}

TEST_CASE("Multi-Byte Characters Survive Long String Cuts") {
    std::string big;
    while (big.size() < 3 * Stanza::Generator::stringify_length) big += "\xE2\x82\xAC";

    Stanza::Generator gen;
    gen.open_object();
    gen.write("euro", big);
    gen.close_object();

    auto t = parse_ok(gen.output());
    REQUIRE(Stanza::get_large_text(t, "euro") == big);
}

TEST_CASE("Sub-Tree Round Trip") {
    const char* doc = R"({
        "name": "Zetta",
        "n": null,
        "a b": [1, 2.5, -0.005, {"deep": [true, false, null]}],
        "say \"x\"": "back\\slash",
        "empty": {},
        "list": []
    })";
    auto t1 = parse_ok(doc);

    Stanza::Generator gen;
    gen.write(t1);
    auto t2 = parse_ok(gen.output());
    require_same_table(t1, t2);

    gen.initialize_large_text_output();
    gen.open_object();
    gen.write("copy", t1, "\"a b\"");
    gen.write("skip", t1, "n", false);
    gen.write("keep", t1, "n");
    gen.close_object();

    auto t3 = parse_ok(gen.output());
    REQUIRE(Stanza::get_count(t3, "copy") == 4u);
    REQUIRE(Stanza::get_boolean(t3, "copy[4].deep[1]") == true);
    REQUIRE(t3.at("copy[4].deep[3]").is_null());
    REQUIRE_FALSE(Stanza::exists(t3, "skip"));
    REQUIRE(t3.at("keep").is_null());

    gen.open_array();
    REQUIRE_THROWS_AS(gen.write(t1, "missing"), Stanza::ValueError);
}

TEST_CASE("Random Documents Round Trip") {
    struct rng r;
    for (int i = 0; i < 200; i++) {
        std::string text = random_json(r);
        auto t1 = parse_ok(text);

        Stanza::Generator gen;
        gen.write(t1);
        auto t2 = parse_ok(gen.output());
        require_same_table(t1, t2);
    }
}

TEST_CASE("Optional Members") {
    Stanza::Generator gen;
    gen.open_object();
    gen.write("a", std::optional<double>{});
    gen.write("b", std::optional<double>{}, true);
    gen.write("c", std::optional<std::string>{ "x" });
    gen.write("d", std::string{});
    gen.write("e", std::vector<std::string>{});
    gen.write("f", std::vector<double>{ 1.0, 2.0 });
    gen.write("g", std::optional<bool>{ false });
    gen.close_object();

    REQUIRE(gen.output() == "{\n\"b\":null\n,\"c\":\"x\"\n,\"d\":\"\"\n,\"f\":[\n1\n,2\n]\n,\"g\":false\n}\n");
}

TEST_CASE("Dates Are Written As ISO-8601") {
    using namespace std::chrono;
    Stanza::Date d = at(2024, 3, 1, 12, 30);
    Stanza::TimestampTz tz{ d + milliseconds{ 5 }, minutes{ 60 } };

    Stanza::Generator gen;
    gen.open_object();
    gen.write("d", d);
    gen.write("tz", tz);
    gen.close_object();

    auto t = parse_ok(gen.output());
    REQUIRE(Stanza::get_string(t, "d") == "2024-03-01T12:30:00Z");
    REQUIRE(Stanza::get_string(t, "tz") == "2024-03-01T13:30:00.005000+01:00");
    REQUIRE(Stanza::get_timestamp_tz(t, "tz") == tz);
}

TEST_CASE("Raw Fragments") {
    Stanza::Generator gen;
    gen.open_array();
    gen.write_raw("{\"k\":1}");
    gen.write_raw(std::vector<std::string>{ "[1", ",2]" });
    gen.open_object();
    gen.write_raw("r", "[true]");
    gen.close_all();

    auto t = parse_ok(gen.output());
    REQUIRE(Stanza::get_number(t, "[1].k") == 1.0);
    REQUIRE(Stanza::get_count(t, "[2]") == 2u);
    REQUIRE(Stanza::get_boolean(t, "[3].r[1]") == true);
}

TEST_CASE("Stream Output Headers") {
    SECTION("No caching by default") {
        std::ostringstream os;
        Stanza::Generator gen;
        gen.initialize_output(os);
        gen.open_object();
        gen.write("a", 1);
        gen.close_object();
        gen.open_array();
        gen.close_array();
        REQUIRE(os.str() == "Content-Type: application/json\r\nCache-Control: no-cache\r\n\r\n{\n\"a\":1\n}\n[\n]\n");
    }

    SECTION("Public with ETag") {
        std::ostringstream os;
        Stanza::Generator gen;
        gen.initialize_output(os, { .cache_policy = Stanza::CachePolicy::allow, .etag = "\"v1\"" });
        gen.open_array();
        gen.close_array();
        REQUIRE(os.str() == "Content-Type: application/json\r\nCache-Control: public\r\nETag: \"v1\"\r\n\r\n[\n]\n");
    }

    SECTION("Cache header omitted") {
        std::ostringstream os;
        Stanza::Generator gen;
        gen.initialize_output(os, { .cache_policy = Stanza::CachePolicy::omit });
        gen.open_array();
        gen.close_array();
        REQUIRE(os.str() == "Content-Type: application/json\r\n\r\n[\n]\n");
    }

    SECTION("No header") {
        std::ostringstream os;
        Stanza::Generator gen;
        gen.initialize_output(os, { .emit_header = false });
        gen.open_array();
        gen.close_array();
        REQUIRE(os.str() == "[\n]\n");
        REQUIRE_THROWS_AS(gen.output(), Stanza::WriterError);
    }
}

TEST_CASE("Default Indent Follows Log Level") {
    int saved = Stanza::logLevel;

    Stanza::logLevel = Stanza::Silent;
    Stanza::Generator quiet;
    REQUIRE(quiet.indent() == 0);

    Stanza::logLevel = Stanza::Debug;
    Stanza::Generator verbose;
    REQUIRE(verbose.indent() == 2);

    Stanza::logLevel = saved;
}

TEST_CASE("Free Output Drops State") {
    Stanza::Generator gen;
    gen.initialize_large_text_output({ .indent = 3 });
    gen.open_object();
    gen.free_output();

    REQUIRE(gen.level() == 0);
    REQUIRE(gen.indent() == 0);
    REQUIRE(gen.output().empty());
    REQUIRE_THROWS_AS(gen.write("x"), Stanza::WriterError);
    REQUIRE_THROWS_AS(gen.open_object(), Stanza::WriterError);
    REQUIRE(gen.level() == 0);

    auto os = std::make_unique<std::ostringstream>();
    gen.initialize_output(*os, { .emit_header = false, .indent = 0 });
    gen.open_array();
    gen.free_output();
    os.reset();

    REQUIRE_THROWS_AS(gen.open_object(), Stanza::WriterError);
    REQUIRE_THROWS_AS(gen.open_array("x"), Stanza::WriterError);
    REQUIRE_NOTHROW(gen.close_all());
    REQUIRE(gen.output().empty());

    gen.initialize_large_text_output({ .indent = 0 });
    gen.open_object();
    gen.close_object();
    REQUIRE(gen.output() == "{\n}\n");
}

TEST_CASE("Markup Scalars") {
    REQUIRE(Stanza::markup_scalar("") == "null");
    REQUIRE(Stanza::markup_scalar("12") == "12");
    REQUIRE(Stanza::markup_scalar("0") == "0");
    REQUIRE(Stanza::markup_scalar("1.5") == "1.5");
    REQUIRE(Stanza::markup_scalar("-0.5") == "-0.5");
    REQUIRE(Stanza::markup_scalar(".5") == "0.5");
    REQUIRE(Stanza::markup_scalar("-.5") == "-0.5");
    REQUIRE(Stanza::markup_scalar("0123") == "\"0123\"");
    REQUIRE(Stanza::markup_scalar("-0123") == "\"-0123\"");
    REQUIRE(Stanza::markup_scalar("123.") == "\"123.\"");
    REQUIRE(Stanza::markup_scalar(" 12") == "\" 12\"");
    REQUIRE(Stanza::markup_scalar("12 ") == "12 ");
    REQUIRE(Stanza::markup_scalar("TRUE") == "true");
    REQUIRE(Stanza::markup_scalar("False") == "false");
    REQUIRE(Stanza::markup_scalar("a\"b") == "\"a\\\"b\"");
}

TEST_CASE("Markup To JSON") {
    using Stanza::XmlNode;

    XmlNode rowset{ "ROWSET", {}, {
        XmlNode{ "ROW", {}, { XmlNode{ "ID", {}, {}, "1" }, XmlNode{ "NAME", {}, {}, "Ann" } } },
    } };
    REQUIRE(Stanza::markup_to_json(rowset) == "[{\"ID\":1,\"NAME\":\"Ann\"}]");

    XmlNode item{ "item", { { "id", "7" } }, {}, "hello" };
    REQUIRE(Stanza::markup_to_json(item) == "{\"@id\":7,\"@text\":\"hello\"}");

    XmlNode single{ "a", {}, { XmlNode{ "b", {}, {}, "x" } } };
    REQUIRE(Stanza::markup_to_json(single) == "{\"b\":\"x\"}");

    XmlNode repeated{ "list", {}, { XmlNode{ "v", {}, {}, "1" }, XmlNode{ "v", {}, {}, "2" } } };
    REQUIRE(Stanza::markup_to_json(repeated) == "[1,2]");

    XmlNode rows{ "TAGS", {}, { XmlNode{ "TAGS_ROW", {}, { XmlNode{ "T", {}, {}, "a" } } } } };
    REQUIRE(Stanza::markup_to_json(rows) == "[{\"T\":\"a\"}]");

    REQUIRE(Stanza::markup_to_json(XmlNode{ "blank", {}, {}, " \n " }) == "null");
}

TEST_CASE("Row Set Output") {
    using Stanza::Cell;
    using Stanza::ColumnType;

    Stanza::VectorRowSet rows{
        { { "ID", ColumnType::number }, { "NAME", ColumnType::text }, { "ACTIVE", ColumnType::text }, { "SEEN", ColumnType::date } },
        {
            { Cell{ 1.0 }, Cell{ std::string{ "Ann" } }, Cell{ std::string{ "true" } }, Cell{ at(2024, 3, 1) } },
            { Cell{ 2.0 }, Cell{}, Cell{ std::string{ "FALSE" } }, Cell{} },
        },
    };

    Stanza::Generator gen;
    gen.open_object();
    gen.write_row_set("people", rows);
    gen.close_object();

    REQUIRE(gen.output() == "{\n\"people\":[\n{\n\"ID\":1\n,\"NAME\":\"Ann\"\n,\"ACTIVE\":true\n,\"SEEN\":\"2024-03-01T00:00:00Z\"\n}\n"
                            ",{\n\"ID\":2\n,\"ACTIVE\":false\n}\n]\n}\n");
}

TEST_CASE("Row Set Links") {
    Stanza::Links item_links{
        Stanza::link("/people/#ID#/#NAME#", "self"),
        Stanza::link("/x/#MISSING#", "other", true, "application/json", "GET"),
    };

    Stanza::Generator gen;
    gen.write_items(*people(), item_links, { Stanza::link("/people", "collection") });
    REQUIRE(gen.level() == 0);

    auto t = parse_ok(gen.output());
    REQUIRE(Stanza::get_count(t, "items") == 2u);
    REQUIRE(Stanza::get_string(t, "items[1].links[1].href") == "/people/1/Ann");
    REQUIRE(Stanza::get_string(t, "items[1].links[1].rel") == "self");
    REQUIRE_FALSE(Stanza::exists(t, "items[1].links[1].templated"));
    REQUIRE(Stanza::get_string(t, "items[2].links[1].href") == "/people/2/");
    REQUIRE(Stanza::get_string(t, "items[1].links[2].href") == "/x/");
    REQUIRE(Stanza::get_boolean(t, "items[1].links[2].templated") == true);
    REQUIRE(Stanza::get_string(t, "items[1].links[2].mediaType") == "application/json");
    REQUIRE(Stanza::get_string(t, "items[1].links[2].method") == "GET");
    REQUIRE(Stanza::get_string(t, "links[1].href") == "/people");
    REQUIRE(Stanza::get_string(t, "links[1].rel") == "collection");
}

TEST_CASE("Nested Row Sets Go Through Markup") {
    using Stanza::Cell;
    using Stanza::ColumnType;

    std::shared_ptr<Stanza::RowSet> tags = std::make_shared<Stanza::VectorRowSet>(
        std::vector<Stanza::Column>{ { "T", ColumnType::text } },
        std::vector<std::vector<Cell>>{ { Cell{ std::string{ "a" } } }, { Cell{ std::string{ "b" } } } });

    Stanza::VectorRowSet outer{
        { { "ID", ColumnType::number }, { "TAGS", ColumnType::rowset } },
        { { Cell{ 1.0 }, Cell{ tags } } },
    };
    REQUIRE(Stanza::has_nested_columns(outer));

    Stanza::Generator gen;
    gen.open_array();
    gen.write(outer);
    gen.close_array();

    auto t = parse_ok(gen.output());
    REQUIRE(Stanza::get_number(t, "[1][1].ID") == 1.0);
    REQUIRE(Stanza::get_count(t, "[1][1].TAGS") == 2u);
    REQUIRE(Stanza::get_string(t, "[1][1].TAGS[2].T") == "b");
}

TEST_CASE("Empty Nested Row Set Writes Empty Array") {
    Stanza::VectorRowSet outer{ { { "TAGS", Stanza::ColumnType::rowset } }, {} };

    Stanza::Generator gen;
    gen.open_object();
    gen.write("x", outer);
    gen.close_object();

    REQUIRE(gen.output() == "{\n\"x\":[\n]\n}\n");
}

TEST_CASE("Nested Row Sets Cannot Carry Links") {
    Stanza::VectorRowSet outer{ { { "TAGS", Stanza::ColumnType::rowset } }, {} };

    Stanza::Generator gen;
    gen.open_object();
    REQUIRE_THROWS_AS(gen.write_row_set("x", outer, { Stanza::link("/#TAGS#", "self") }), Stanza::WriterError);
}

TEST_CASE("Markup Members") {
    using Stanza::XmlNode;

    Stanza::Generator gen;
    gen.open_object();
    gen.write("doc", XmlNode{ "doc", { { "lang", "en" } }, { XmlNode{ "title", {}, {}, "Hi" } } });
    gen.close_object();

    auto t = parse_ok(gen.output());
    REQUIRE(Stanza::get_string(t, "doc.\"@lang\"") == "en");
    REQUIRE(Stanza::get_string(t, "doc.title") == "Hi");
}
