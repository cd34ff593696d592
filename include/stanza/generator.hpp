#pragma once


/*
    --------------------------------------------
    Stanza::Generator - streaming JSON writer
    --------------------------------------------
    Writes JSON one construct at a time into a buffered sink, without
    building a document first:

        Stanza::Generator gen;                 // large text output
        gen.open_object();
        gen.write("id", 42);
        gen.open_array("tags");
        gen.write("a");
        gen.write("b");
        gen.close_array();
        gen.close_object();
        std::string json = gen.output();

    With indent 0 the output is line oriented, every value on its own line
    and the comma leading:

        {
        "id":42
        ,"tags":[
        "a"
        ,"b"
        ]
        }

    With indent N, each line is padded to `level * N` characters and the
    comma takes the last column of the padding

    -------
    Outputs
    -------
    - `initialize_output(os, OutputOptions)` writes to a stream, preceded
      by HTTP style headers when `emit_header` is set
    - `initialize_large_text_output(LargeTextOptions)` accumulates into a
      large text, read back with `output()`
    The indent defaults to 2 when the log level is Debug and 0 otherwise

    ------
    Writes
    ------
    - `write(value)` writes an array element, `write(name, value)` an
      object member. Writing while nothing is open throws `WriterError`
    - `std::optional` members are skipped when empty unless `write_null`
      is passed
    - `write(table, path)` writes the sub-tree of a parsed document
    - `write_row_set` writes a `RowSet` as an array of row objects, each
      optionally carrying HATEOAS `links`:

        gen.write_items(rows, { link("/people/#ID#", "self") });

        {"items":[{"ID":1,"links":[{"href":"/people/1","rel":"self"}]}]}

    -------------
    Thread-Safety
    -------------
    - A `Generator` is not thread-safe; use one per output document
*/

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/datetime.hpp"
#include "stanza/large_text.hpp"
#include "stanza/markup.hpp"
#include "stanza/options.hpp"
#include "stanza/query.hpp"
#include "stanza/rowset.hpp"
#include "stanza/value.hpp"
#include "stanza/writer.hpp"

/// @defgroup StanzaGenerator JSON Generator
/// @ingroup Stanza

namespace Stanza {

    /// @ingroup StanzaGenerator
    /// @brief A HATEOAS link written into `links` arrays.
    ///
    /// `href` may hold `#COLUMN#` placeholders, replaced per row when the
    /// link is written by `write_row_set`. Empty fields are not written.
    struct Link {
        std::string href;
        std::string rel;
        std::optional<bool> templated{};
        std::string media_type{};
        std::string method{};
        std::string profile{};
    };

    using Links = std::vector<Link>;

    /// @ingroup StanzaGenerator
    [[nodiscard]] STANZA_API Link link(std::string href, std::string rel, std::optional<bool> templated = std::nullopt,
                                       std::string media_type = {}, std::string method = {}, std::string profile = {});

    /// @ingroup StanzaGenerator
    /// @brief Streaming JSON writer.
    class Generator {
    public:
        /// Nesting state of one level: opened and still empty, or holding data.
        static constexpr int8_t opened_array = -2;
        static constexpr int8_t opened_object = -1;
        static constexpr int8_t in_object = 1;
        static constexpr int8_t in_array = 2;

        /// Strings longer than this are escaped and written in pieces.
        static constexpr std::size_t stringify_length = 5460;

        /// @brief Constructs a generator writing to large text.
        STANZA_API Generator();

        Generator(const Generator&) = delete;
        Generator& operator=(const Generator&) = delete;

#pragma region Output
        /// @brief Directs output to `os`, resetting all state.
        STANZA_API void initialize_output(std::ostream& os, const OutputOptions& opts = {});

        /// @brief Directs output to a new large text, resetting all state.
        STANZA_API void initialize_large_text_output(const LargeTextOptions& opts = {});

        /// @brief Drops the nesting, the options and the output.
        /// Writing afterwards throws `WriterError` until output is initialized again.
        STANZA_API void free_output();

        /// @brief Flushes and returns the accumulated large text output.
        /// Empty once the output has been freed.
        /// @throws WriterError for stream output.
        [[nodiscard]] STANZA_API std::string output();

        STANZA_API void flush();

        [[nodiscard]] std::size_t level() const noexcept { return m_Nesting.size(); }
        [[nodiscard]] std::size_t indent() const noexcept { return m_Indent; }
#pragma endregion

#pragma region Structure
        STANZA_API void open_object(std::string_view name = {});
        /// @throws WriterError if the innermost open construct is not an object.
        STANZA_API void close_object();
        STANZA_API void open_array(std::string_view name = {});
        /// @throws WriterError if the innermost open construct is not an array.
        STANZA_API void close_array();
        /// @brief Closes every open construct and flushes.
        STANZA_API void close_all();
#pragma endregion

#pragma region Elements
        STANZA_API void write(std::string_view value);
        void write(const char* value) { write(std::string_view{ value }); }
        void write(const std::string& value) { write(std::string_view{ value }); }
        STANZA_API void write(const LargeText& value);
        STANZA_API void write(double value);
        STANZA_API void write(bool value);
        STANZA_API void write(Date value);
        STANZA_API void write(Timestamp value);
        STANZA_API void write(const TimestampTz& value);

        template<std::integral I>
            requires (!std::same_as<I, bool>)
        void write(I value) { write_value(std::to_string(value)); }

        STANZA_API void write_null();

        /// @brief Writes the values as a nested array.
        STANZA_API void write(const std::vector<std::string>& values);
        STANZA_API void write(const std::vector<double>& values);

        /// @brief Writes `rows` as an array of row objects.
        STANZA_API void write(RowSet& rows);

        /// @brief Writes the JSON rendition of a markup tree.
        STANZA_API void write(const XmlNode& node);

        /// @brief Writes the sub-tree of `t` rooted at `path`.
        /// @throws ValueError if the path does not exist.
        STANZA_API void write(const ValueTable& t, const Path& path = ".");
#pragma endregion

#pragma region Members
        STANZA_API void write(std::string_view name, std::string_view value);
        void write(std::string_view name, const char* value) { write(name, std::string_view{ value }); }
        void write(std::string_view name, const std::string& value) { write(name, std::string_view{ value }); }
        STANZA_API void write(std::string_view name, const LargeText& value);
        STANZA_API void write(std::string_view name, double value);
        STANZA_API void write(std::string_view name, bool value);
        STANZA_API void write(std::string_view name, Date value);
        STANZA_API void write(std::string_view name, Timestamp value);
        STANZA_API void write(std::string_view name, const TimestampTz& value);

        template<std::integral I>
            requires (!std::same_as<I, bool>)
        void write(std::string_view name, I value) { write_raw(name, std::to_string(value)); }

        STANZA_API void write_null(std::string_view name);

        STANZA_API void write(std::string_view name, const std::optional<std::string>& value, bool write_null = false);
        STANZA_API void write(std::string_view name, const std::optional<double>& value, bool write_null = false);
        STANZA_API void write(std::string_view name, const std::optional<bool>& value, bool write_null = false);
        STANZA_API void write(std::string_view name, const std::optional<Date>& value, bool write_null = false);
        STANZA_API void write(std::string_view name, const std::optional<Timestamp>& value, bool write_null = false);
        STANZA_API void write(std::string_view name, const std::optional<TimestampTz>& value, bool write_null = false);

        /// @brief Writes a member array; an empty list is skipped unless `write_null`.
        STANZA_API void write(std::string_view name, const std::vector<std::string>& values, bool write_null = false);
        STANZA_API void write(std::string_view name, const std::vector<double>& values, bool write_null = false);

        STANZA_API void write(std::string_view name, RowSet& rows);
        STANZA_API void write(std::string_view name, const XmlNode& node);

        /// @brief Writes the sub-tree of `t` at `path` as member `name`.
        /// @param write_null Write a null leaf at `path` itself; null leaves
        ///                   further down are always written.
        STANZA_API void write(std::string_view name, const ValueTable& t, const Path& path = ".", bool write_null = true);
#pragma endregion

#pragma region Raw
        /// @brief Writes a preformatted JSON fragment as an element.
        STANZA_API void write_raw(std::string_view fragment);
        /// @brief Writes the concatenated fragments as one element.
        STANZA_API void write_raw(const std::vector<std::string>& fragments);
        /// @brief Writes a preformatted JSON fragment as member `name`.
        STANZA_API void write_raw(std::string_view name, std::string_view fragment);
#pragma endregion

#pragma region Row sets and links
        /// @brief Writes `"links":[...]`; nothing if `links` is empty.
        STANZA_API void write_links(const Links& links);

        /// @brief Writes `rows` as an array named `name` (unnamed if empty).
        ///
        /// Each row is an object of its non-null cells. Text cells holding
        /// `TRUE` or `FALSE` in any case are written as booleans. When
        /// `links` is given, every row object ends with a `links` array and
        /// `#COLUMN#` placeholders in the hrefs take the row's values.
        ///
        /// @throws WriterError if `rows` has nested row set columns and
        ///         `links` is not empty.
        STANZA_API void write_row_set(std::string_view name, RowSet& rows, const Links& links = {});

        /// @brief Writes `"items":[rows...]` and then `links`, enclosed in
        ///        an object when nothing is open.
        STANZA_API void write_items(RowSet& rows, const Links& item_links = {}, const Links& links = {});
#pragma endregion

    private:
        using substitutions_t = std::vector<std::pair<std::string, std::string>>;

        [[nodiscard]] std::string indent_for(bool comma = true) const;
        void data_written() noexcept;
        void increase_nesting(int8_t value);
        [[nodiscard]] bool decrease_nesting(int8_t value) noexcept;
        void require_open(const char* operation) const;
        void require_output(const char* operation) const;
        [[nodiscard]] BufferedWriter& writer();
        void write_header();

        void write_value(std::string_view fragment);
        void write_name(std::string_view name);
        void finish_long_string(std::string_view text);
        void write_cell(const Column& column, const Cell& cell);
        void write_tree(std::optional<std::string_view> name, const ValueTable& t, std::string_view path);
        void write_links(const Links& links, const substitutions_t& subs);

        std::optional<BufferedWriter> m_Writer;
        LargeTextSink* m_TextSink = nullptr;
        std::vector<int8_t> m_Nesting;
        std::size_t m_Indent = 0;
        bool m_HeaderPending = false;
        CachePolicy m_CachePolicy = CachePolicy::forbid;
        std::string m_ETag;
    };

} // namespace Stanza
