#pragma once


/*
    -------------------------------------------------
    Stanza escaping - JSON text, XML text, stringify
    -------------------------------------------------
    - `escape_json` maps every ASCII character through a precomputed
      128-entry table and writes everything outside ASCII as `\uXXXX`
      (UTF-16 units, surrogate pairs above U+FFFF). Output is plain ASCII
      and safe to embed in HTML `<script>` blocks: `<`, `>`, `&`, `'`,
      backtick and `/` never appear unescaped
    - `escape_html` is used for XML element content
    - `stringify` overloads give the JSON literal of a scalar, including
      the surrounding quotes for strings and dates

    ------------
    Member names
    ------------
    Object members are addressed in paths by name. A name consisting only
    of `[A-Za-z0-9_]` is used as-is; any other name is double-quoted with
    inner quotes written as `\"`:

        to_member_name("foo")      -> foo
        to_member_name("a b")      -> "a b"
        to_member_name("say \"x\"") -> "say \"x\""
*/

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/datetime.hpp"

namespace Stanza {

    /// Appends the JSON-escaped form of `text` (without quotes) to `out`.
    STANZA_API void escape_json(std::string_view text, std::string& out);
    [[nodiscard]] STANZA_API std::string escape_json(std::string_view text);

    /// Appends the XML/HTML-escaped form of `text` to `out`.
    STANZA_API void escape_html(std::string_view text, std::string& out);
    [[nodiscard]] STANZA_API std::string escape_html(std::string_view text);

    [[nodiscard]] STANZA_API std::string stringify(std::string_view value);
    [[nodiscard]] inline std::string stringify(const char* value) { return stringify(std::string_view{ value }); }
    [[nodiscard]] STANZA_API std::string stringify(double value);
    [[nodiscard]] STANZA_API std::string stringify(bool value);
    [[nodiscard]] STANZA_API std::string stringify(Date value);
    [[nodiscard]] STANZA_API std::string stringify(Timestamp value);
    [[nodiscard]] STANZA_API std::string stringify(const TimestampTz& value);

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    [[nodiscard]] std::string stringify(I value) { return std::to_string(value); }

    /// `null` for an empty optional, otherwise the stringified value.
    template<typename T>
    [[nodiscard]] std::string stringify(const std::optional<T>& value) {
        return value ? stringify(*value) : std::string{ "null" };
    }

    /// @brief Largest position <= `pos` that does not split a UTF-8 sequence.
    ///        Used to cut long text into escapable pieces.
    [[nodiscard]] STANZA_API std::size_t utf8_boundary(std::string_view text, std::size_t pos) noexcept;

    /// True if `name` consists only of `[A-Za-z0-9_]`.
    [[nodiscard]] STANZA_API bool is_simple_name(std::string_view name) noexcept;

    /// Path segment for an object member named `name`.
    [[nodiscard]] STANZA_API std::string to_member_name(std::string_view name);

    /// Inverse of `to_member_name`.
    [[nodiscard]] STANZA_API std::string from_member_name(std::string_view member);

} // namespace Stanza
