#pragma once


/*
    -------------------------------------------------------------
    Stanza - JSON engine (flat value tables + streaming writer)
    -------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - The flat document model:      `Stanza::ValueTable`, `Stanza::Value`
        - Error reporting types:        `Stanza::ParseError`, `ValueError`,
                                        `WriterError`, `ResourceError`
        - Parsing functions:            `Stanza::parse(...)`, `parse_into(...)`,
                                        `to_xml(...)`
        - Path queries:                 `get_string(...)`, `get_number(...)`, ...,
                                        `find_paths_like(...)`
        - The streaming writer:         `Stanza::Generator`
        - Configuration options:        `ParseOptions`, `OutputOptions`,
                                        `LargeTextOptions`, `XmlOptions`

    -------------------
    High-Level Overview
    -------------------
    - Reading:
        * A document is parsed once into a `ValueTable` that maps every
          path (`items[2].name`) to its value
        * Accessors read typed values by path, with defaults for missing
          paths, and `find_paths_like` searches paths by LIKE pattern
        * The same parser can emit an XML rendition instead (`to_xml`)
    - Writing:
        * `Generator` writes JSON construct by construct to a stream or a
          large text, including row sets with HATEOAS links
    - Large values:
        * String literals longer than 8190 characters are held as
          `LargeText`, and the readers and writers work in pages

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        int main() {
            auto doc = Stanza::parse(R"({"hello":"world","items":[{"id":7}]})");
            if (!doc) {
                std::cerr << doc.error().describe() << "\n";
                return 1;
            }

            auto id = Stanza::get_number(*doc, "items[1].id");   // 7

            Stanza::Generator gen;
            gen.open_object();
            gen.write("id", id);
            gen.write("items", *doc, "items");
            gen.close_object();
            std::cout << gen.output();
        }

    Include this header if you want the full Stanza API. For finer-grained
    control or faster build times, include individual headers such as
    `parser.hpp`, `query.hpp` or `generator.hpp` directly
*/

#include "stanza/config.hpp"
#include "stanza/datetime.hpp"
#include "stanza/error.hpp"
#include "stanza/escape.hpp"
#include "stanza/generator.hpp"
#include "stanza/large_text.hpp"
#include "stanza/log.hpp"
#include "stanza/markup.hpp"
#include "stanza/options.hpp"
#include "stanza/parser.hpp"
#include "stanza/query.hpp"
#include "stanza/rowset.hpp"
#include "stanza/value.hpp"
#include "stanza/writer.hpp"
