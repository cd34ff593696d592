#pragma once


/*
    ----------------------------------------------
    Stanza parser - JSON text to a ValueTable/XML
    ----------------------------------------------
    One recursive-descent core walks the grammar

        document := array | object
        object   := '{' (member (',' member)*)? '}'
        member   := string ':' value
        array    := '[' (value (',' value)*)? ']'
        value    := object | array | string | number | true | false | null

    and reports every node to a `ParseSink`. Two sinks ship with Stanza:

    - `ValueTableSink` fills a `ValueTable` (see value.hpp for the path
      scheme)
    - `XmlSink` writes an XML rendition of the document:

        {"a":1,"b":[true,"x"],"c d":null}

        <?xml version="1.0" encoding="UTF-8"?>
        <json><a>1</a>
        <b><row>true</row>
        <row>x</row>
        </b>
        </json>

      Null members produce no element. Member names that are not plain
      identifiers are made into valid tag names by replacing every
      character outside `[A-Za-z0-9_-]` with `_`; a leading `-` becomes `_`

    ------------
    Entry points
    ------------
    Input comes as a single string, a `LargeText` (read in pages), or a
    sequence of lines (a line break is assumed between lines). Empty input
    is a valid, empty document. Any grammar violation aborts the parse:

        auto res = Stanza::parse(R"({"a":[1,2]})");
        if (!res) std::cerr << res.error().describe();
        res->at("a[2]").as_number();   // 2

    ---------------
    Strict and lax
    ---------------
    `ParseOptions{ .strict = false }` accepts unquoted words as strings and
    a dangling comma before `]` or `}`:

        {a: 1,}     ->   a = 1
*/

#include <cstddef>
#include <expected>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/large_text.hpp"
#include "stanza/options.hpp"
#include "stanza/value.hpp"
#include "stanza/writer.hpp"

/// @defgroup StanzaParser Parser
/// @ingroup Stanza

namespace Stanza {

    class CharReader;

    /// @ingroup StanzaParser
    /// @brief Where a node sits in its document.
    struct Slot {
        enum class role : uint8_t { root, member, element };

        role kind = role::root;
        std::string_view path;      ///< Path of the node; "." for the root
        std::string_view name;      ///< Raw member name (members only)
        std::size_t index = 0;      ///< 1-based element index (elements only)
    };

    /// @ingroup StanzaParser
    /// @brief Receives the nodes of a document as the parser walks it.
    class ParseSink {
    public:
        virtual ~ParseSink() = default;

        virtual void begin_document() {}
        virtual void end_document() {}

        virtual void begin_object(const Slot& slot) = 0;
        /// @param members Member names in path form, in document order
        virtual void end_object(const Slot& slot, members_t members) = 0;
        virtual void begin_array(const Slot& slot) = 0;
        virtual void end_array(const Slot& slot, std::size_t count) = 0;
        virtual void scalar(const Slot& slot, Value value) = 0;
    };

    /// @ingroup StanzaParser
    /// @brief Sink filling a `ValueTable`.
    class ValueTableSink : public ParseSink {
    public:
        explicit ValueTableSink(ValueTable& table) noexcept : m_Table{ table } {}

        void begin_object(const Slot&) override {}
        STANZA_API void end_object(const Slot& slot, members_t members) override;
        void begin_array(const Slot&) override {}
        STANZA_API void end_array(const Slot& slot, std::size_t count) override;
        STANZA_API void scalar(const Slot& slot, Value value) override;

    private:
        ValueTable& m_Table;
    };

    /// @ingroup StanzaParser
    /// @brief Sink writing the XML rendition of the document.
    class XmlSink : public ParseSink {
    public:
        /// Characters HTML-escaped and written per piece for long text.
        static constexpr std::size_t piece_size = 4000;

        explicit XmlSink(BufferedWriter& out, std::string encoding = "UTF-8")
            : m_Out{ out }, m_Encoding{ std::move(encoding) } {}

        STANZA_API void begin_document() override;
        STANZA_API void end_document() override;
        STANZA_API void begin_object(const Slot& slot) override;
        STANZA_API void end_object(const Slot& slot, members_t members) override;
        STANZA_API void begin_array(const Slot& slot) override;
        STANZA_API void end_array(const Slot& slot, std::size_t count) override;
        STANZA_API void scalar(const Slot& slot, Value value) override;

    private:
        void open_tag(const Slot& slot);
        void close_tag(const Slot& slot);

        BufferedWriter& m_Out;
        std::string m_Encoding;
    };

    /// @ingroup StanzaParser
    /// @brief Tag name used for a member in XML output.
    [[nodiscard]] STANZA_API std::string fix_xml_name(std::string_view name);

    /// @ingroup StanzaParser
    /// @brief Runs the parser over `reader`, reporting to `sink`.
    STANZA_API std::expected<void, ParseError> parse_with(CharReader& reader, ParseSink& sink,
                                                          const ParseOptions& opts = {},
                                                          std::pmr::memory_resource* res = std::pmr::get_default_resource());

    using ParseResult = std::expected<ValueTable, ParseError>;

    /// @ingroup StanzaParser
    /// @brief Parses JSON text into a new table.
    STANZA_API ParseResult parse(std::string_view input, const ParseOptions& opts = {},
                                 std::pmr::memory_resource* res = std::pmr::get_default_resource());
    STANZA_API ParseResult parse(const LargeText& input, const ParseOptions& opts = {},
                                 std::pmr::memory_resource* res = std::pmr::get_default_resource());
    STANZA_API ParseResult parse(const std::vector<std::string>& lines, const ParseOptions& opts = {},
                                 std::pmr::memory_resource* res = std::pmr::get_default_resource());

    /// @ingroup StanzaParser
    /// @brief Parses into an existing table, clearing it first. On error
    ///        the table is left empty.
    STANZA_API std::expected<void, ParseError> parse_into(ValueTable& table, std::string_view input, const ParseOptions& opts = {});
    STANZA_API std::expected<void, ParseError> parse_into(ValueTable& table, const LargeText& input, const ParseOptions& opts = {});
    STANZA_API std::expected<void, ParseError> parse_into(ValueTable& table, const std::vector<std::string>& lines, const ParseOptions& opts = {});

    using XmlResult = std::expected<std::string, ParseError>;

    /// @ingroup StanzaParser
    /// @brief Converts JSON text to its XML rendition.
    STANZA_API XmlResult to_xml(std::string_view input, const ParseOptions& opts = {}, const XmlOptions& xml = {});
    STANZA_API XmlResult to_xml(const LargeText& input, const ParseOptions& opts = {}, const XmlOptions& xml = {});
    STANZA_API XmlResult to_xml(const std::vector<std::string>& lines, const ParseOptions& opts = {}, const XmlOptions& xml = {});

    /// @ingroup StanzaParser
    /// @brief `to_xml` with the strict flag given as `"Y"` or `"N"`.
    ///        Anything other than `"N"` means strict.
    STANZA_API XmlResult to_xml_sql(std::string_view input, std::string_view strict = "Y");

} // namespace Stanza
