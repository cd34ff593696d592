#pragma once


/*
    -------------------------------------------
    Stanza queries - typed lookups by path
    -------------------------------------------
    Reads values out of a parsed `ValueTable`. Every accessor takes the
    table, a `Path` and, for scalars, a default returned when the path
    does not exist:

        auto t = Stanza::parse(R"({"items":[{"id":7,"tags":["a","b"]}]})").value();

        get_number(t, "items[1].id");                         // 7
        get_number(t, { "items[%d].id", { "1" } });           // 7
        get_string(t, "items[1].missing", "n/a");             // "n/a"
        get_count(t, "items[1].tags");                        // 2
        get_array_of_string(t, "items[1].tags");              // {"a", "b"}

    ------------------
    Path placeholders
    ------------------
    `format_path` fills a pattern from positional arguments:
    - `%s` and `%d` take the next argument in order
    - `%0` .. `%19` take the argument with that 0-based index
    - any other `%x` is written as `x`
    Arguments longer than 1000 characters are cut to 999 followed by `~`

    -------------
    Type handling
    -------------
    - A JSON null yields `std::nullopt`
    - `get_string` also accepts booleans and numbers (their JSON text);
      `get_number` also accepts numeric strings
    - Dates and timestamps are stored as ISO-8601 strings, see datetime.hpp
    - A value of any other kind throws `ValueError`
    - `get_count`, `get_members` and the `get_array_of_*` accessors have no
      default: a missing path yields `std::nullopt`

    -----------------
    Wildcard search
    -----------------
    `find_paths_like` searches the table for paths matching a LIKE
    pattern (`%` any run, `_` one character):

        {"items":[{"name":"A","magical":true},{"name":"B","magical":"rather not"}]}

        find_paths_like(t, "items[%]", ".magical", "true")   // {"items[1]"}

    The first pattern selects the paths returned, the second the subpath
    below them that must exist, and the third the value found there
*/

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/datetime.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaQuery Path Queries
/// @ingroup Stanza

namespace Stanza {

    /// @ingroup StanzaQuery
    /// Longest argument substituted by `format_path` without truncation.
    inline constexpr std::size_t max_path_argument = 1000;

    /// @ingroup StanzaQuery
    /// @brief Substitutes `%s`, `%d` and `%N` placeholders in `pattern`.
    [[nodiscard]] STANZA_API std::string format_path(std::string_view pattern, std::initializer_list<std::string_view> args);
    [[nodiscard]] STANZA_API std::string format_path(std::string_view pattern, const std::vector<std::string>& args);

    /// @ingroup StanzaQuery
    /// @brief A path into a `ValueTable`, optionally built from a pattern.
    struct Path {
        Path(const char* path) : text{ path } {}
        Path(std::string_view path) : text{ path } {}
        Path(std::string path) : text{ std::move(path) } {}

        /// The pattern is formatted only when arguments are given.
        Path(std::string_view pattern, std::initializer_list<std::string_view> args)
            : text{ args.size() ? format_path(pattern, args) : std::string{ pattern } } {}

        std::string text;
    };

    /// @ingroup StanzaQuery
    /// @brief SQL LIKE matching: `%` matches any run, `_` one character.
    [[nodiscard]] STANZA_API bool like(std::string_view text, std::string_view pattern) noexcept;

    [[nodiscard]] STANZA_API bool exists(const ValueTable& t, const Path& p);

    [[nodiscard]] STANZA_API std::optional<bool> get_boolean(const ValueTable& t, const Path& p, std::optional<bool> def = std::nullopt);
    [[nodiscard]] STANZA_API std::optional<double> get_number(const ValueTable& t, const Path& p, std::optional<double> def = std::nullopt);
    [[nodiscard]] STANZA_API std::optional<std::string> get_string(const ValueTable& t, const Path& p, std::optional<std::string> def = std::nullopt);

    /// @ingroup StanzaQuery
    /// @brief As `get_string`, but also returns strings held as large text.
    [[nodiscard]] STANZA_API std::optional<std::string> get_large_text(const ValueTable& t, const Path& p, std::optional<std::string> def = std::nullopt);

    /// @ingroup StanzaQuery
    /// @brief Date stored as ISO-8601 text, normalized to UTC.
    [[nodiscard]] STANZA_API std::optional<Date> get_date(const ValueTable& t, const Path& p, std::optional<Date> def = std::nullopt);
    [[nodiscard]] STANZA_API std::optional<Timestamp> get_timestamp(const ValueTable& t, const Path& p, std::optional<Timestamp> def = std::nullopt);
    [[nodiscard]] STANZA_API std::optional<TimestampTz> get_timestamp_tz(const ValueTable& t, const Path& p, std::optional<TimestampTz> def = std::nullopt);

    /// @ingroup StanzaQuery
    /// @brief Wall-clock date in the zone `offset` east of UTC.
    [[nodiscard]] STANZA_API std::optional<Date> get_date_at(const ValueTable& t, const Path& p, std::chrono::minutes offset,
                                                             std::optional<Date> def = std::nullopt);
    /// @ingroup StanzaQuery
    /// @brief Wall-clock timestamp in the zone `offset` east of UTC.
    [[nodiscard]] STANZA_API std::optional<Timestamp> get_timestamp_at(const ValueTable& t, const Path& p, std::chrono::minutes offset,
                                                                       std::optional<Timestamp> def = std::nullopt);

    /// @ingroup StanzaQuery
    /// @brief Members of an object or elements of an array.
    [[nodiscard]] STANZA_API std::optional<std::size_t> get_count(const ValueTable& t, const Path& p);

    /// @ingroup StanzaQuery
    /// @brief Member names of an object, in path form.
    [[nodiscard]] STANZA_API std::optional<members_t> get_members(const ValueTable& t, const Path& p);

    /// @ingroup StanzaQuery
    /// @brief Elements of an array as text; a scalar gives a list of one.
    [[nodiscard]] STANZA_API std::optional<std::vector<std::optional<std::string>>> get_array_of_string(const ValueTable& t, const Path& p);

    /// @ingroup StanzaQuery
    /// @brief Elements of an array as numbers; a scalar gives a list of one.
    [[nodiscard]] STANZA_API std::optional<std::vector<std::optional<double>>> get_array_of_number(const ValueTable& t, const Path& p);

    /// @ingroup StanzaQuery
    /// @brief Copy of the raw value; a null value if the path does not exist.
    [[nodiscard]] STANZA_API Value get_value(const ValueTable& t, const Path& p);

    /// @ingroup StanzaQuery
    /// @brief Wildcard search over the paths of `t`.
    ///
    /// @param return_pattern  LIKE pattern of the paths to return
    /// @param subpath_pattern LIKE pattern appended to `return_pattern` that
    ///                        must also match; empty for none
    /// @param value_pattern   LIKE pattern the value at the full match must
    ///                        satisfy; empty for any value
    /// @return Matching paths in document order, without duplicates
    [[nodiscard]] STANZA_API std::vector<std::string> find_paths_like(const ValueTable& t, std::string_view return_pattern,
                                                                      std::string_view subpath_pattern = {},
                                                                      std::string_view value_pattern = {});

} // namespace Stanza
