#pragma once


/*
    -------------------------------------------------------
    Stanza errors - parse failures and misuse exceptions
    -------------------------------------------------------
    Stanza reports problems in two different ways, depending on who is
    at fault

    -------------------------------
    Malformed input - ParseError
    -------------------------------
    Parsing never throws for bad input. Every parse entry point returns
    `std::expected<T, ParseError>` and a failed parse leaves no partial
    results behind

    - `code errc`:
        * Enumerated error category:
            - `unexpected_character`
            - `invalid_number`
            - `invalid_string`
            - `invalid_escape`
            - `invalid_unicode_escape`
            - `unexpected_token`
            - `dangling_comma`
            - `unquoted_literal`
    - `size_t offset`:
        * Character offset from the start of the input of the token being
          lexed when the error was detected
    - `size_t line`, `size_t column`:
        * 1-based position of that token
    - `std::string msg`:
        * Human-readable description, e.g. `Expected ":", seeing ","`
    - `describe()` renders the canonical one-liner
      `Error at line 3, col 7: Unterminated quoted string`

    ----------------------------------------
    Misuse and type mismatches - exceptions
    ----------------------------------------
    - `ValueError`: an accessor found a value of an incompatible kind at a
      path (e.g. a count of a string), or a sub-tree write named a path
      that does not exist
    - `WriterError`: the generator was driven into an invalid state
      (writing with nothing open, closing the wrong construct)
    - `ResourceError`: reading a large text object out of its bounds

    Missing paths are never an error for scalar accessors; they yield the
    caller's default
*/

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error codes and exception types produced by Stanza
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced during JSON parsing.
    ///
    /// @details
    /// A `ParseError` is returned whenever a parse or XML conversion fails.
    /// The position always refers to the first character of the token the
    /// lexer was working on, which is where a reader should look.
    struct ParseError {
        /// @ingroup StanzaError
        /// @brief Enumeration of possible error categories detected by the parser.
        ///
        /// Members:
        /// - `unexpected_character`
        ///     A character that cannot start any token, e.g. `@`.
        ///
        /// - `invalid_number`
        ///     Number text does not match `-?digit+('.'digit+)?([eE][+-]?digit+)?`.
        ///
        /// - `invalid_string`
        ///     A quoted string is not terminated before the input ends.
        ///
        /// - `invalid_escape`
        ///     Unknown escape sequence inside a string (e.g. `\k`).
        ///
        /// - `invalid_unicode_escape`
        ///     Bad hex digits in `\uXXXX`, or an unpaired surrogate.
        ///
        /// - `unexpected_token`
        ///     The token is valid but not allowed here by the grammar.
        ///
        /// - `dangling_comma`
        ///     A comma directly before `]` or `}` in strict mode.
        ///
        /// - `unquoted_literal`
        ///     An unquoted word other than `true`, `false`, `null` in strict mode.
        enum class code : uint8_t {
            unexpected_character,   ///< Invalid or unexpected character.
            invalid_number,         ///< Malformed numeric literal.
            invalid_string,         ///< Unterminated string literal.
            invalid_escape,         ///< Invalid escape sequence.
            invalid_unicode_escape, ///< Invalid or malformed Unicode escape.
            unexpected_token,       ///< Grammar violation.
            dangling_comma,         ///< Trailing comma in strict mode.
            unquoted_literal,       ///< Unquoted word in strict mode.
        };

        code errc{};          ///< The classification of the parsing error.
        std::size_t offset{}; ///< Character offset of the offending token.
        std::size_t line{};   ///< Line number of the offending token (1-based).
        std::size_t column{}; ///< Column number of the offending token (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup StanzaError
        /// @brief Constructs a fully-populated `ParseError` instance.
        ///
        /// @param c    The error code describing the category of failure.
        /// @param o    Character offset from the start of the input.
        /// @param l    Line number (1-based).
        /// @param col  Column number (1-based).
        /// @param m    Human-readable error message.
        /// @return A fully constructed `ParseError`.
        STANZA_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);

        /// @ingroup StanzaError
        /// @brief Formats the error as `Error at line L, col C: msg`.
        [[nodiscard]] STANZA_API std::string describe() const;
    };

    /// @ingroup StanzaError
    /// @brief Thrown when a value of an incompatible kind is found at a path.
    class ValueError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @ingroup StanzaError
    /// @brief Thrown when the JSON generator is used out of order.
    class WriterError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    /// @ingroup StanzaError
    /// @brief Thrown when a large text object is read out of its bounds.
    class ResourceError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace Stanza
