#pragma once


/*
    ------------------------------------
    Stanza::Lexer - JSON token stream
    ------------------------------------
    Pulls characters from a `CharReader` and classifies them into symbols.
    The lexer is pull-driven: each `next()` produces one symbol, and the
    literal of the last number or string stays available until the next
    call

    -------
    Symbols
    -------
        eof  [  {  ]  }  :  ,  false  true  null  <number>  <string>

    -------
    Numbers
    -------
    `-?digit+('.'digit+)?([eE][+-]?digit+)?`, matched by a small state
    machine. The character that ends a number is handed back to the reader.
    Conversion uses `std::from_chars`, so the decimal point is always `.`
    whatever the global locale says

    -------
    Strings
    -------
    - Escapes: `\" \\ \/ \b \f \n \r \t \uXXXX`; UTF-16 surrogate pairs
      must be written as two consecutive `\u` escapes
    - The decoded text is UTF-8
    - Once a literal grows past `spill_threshold` characters it is moved
      into a `LargeText`; `spilled()` then reports true and the text is
      collected with `take_large_text()`

    --------
    Lax mode
    --------
    With `strict == false` an unquoted word such as `abc` is a string.
    In strict mode only `true`, `false` and `null` are allowed
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/char_reader.hpp"
#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/large_text.hpp"
#include "stanza/writer.hpp"

namespace Stanza {

    using expected_void = std::expected<void, ParseError>;
    template<typename T>
    using expected_t = std::expected<T, ParseError>;

    /// @brief Token classes produced by the lexer
    enum class Symbol : uint8_t {
        eof,
        begin_array,
        begin_object,
        end_array,
        end_object,
        colon,
        comma,
        false_value,
        true_value,
        null_value,
        number,
        string,
    };

    /// @brief Spelling of a symbol in diagnostics: `<eof>`, `[`, ... `<string>`
    [[nodiscard]] STANZA_API std::string_view to_string(Symbol s) noexcept;

    class Lexer {
    public:
        /// Longest literal kept in memory before it moves to a large text.
        static constexpr std::size_t spill_threshold = 8190;

        STANZA_API Lexer(CharReader& reader, bool strict,
                         std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Reads the next symbol.
        STANZA_API expected_t<Symbol> next();

        [[nodiscard]] double number_value() const noexcept { return m_Number; }
        [[nodiscard]] const std::string& string_value() const noexcept { return m_Literal; }

        /// True if the last string literal was moved to a large text.
        [[nodiscard]] bool spilled() const noexcept { return m_Spilled.has_value(); }

        /// @brief Moves the spilled literal out. Only valid while `spilled()`.
        [[nodiscard]] STANZA_API LargeText take_large_text();

        /// @brief Error positioned at the start of the current token.
        [[nodiscard]] STANZA_API ParseError make_error(ParseError::code code, std::string_view msg) const;

        [[nodiscard]] bool strict() const noexcept { return m_Strict; }

    private:
        expected_t<Symbol> lex_number(char first);
        expected_t<Symbol> lex_string();
        expected_t<Symbol> lex_word(char first);
        expected_t<uint32_t> read_hex4();
        void spill();

        CharReader& m_Reader;
        bool m_Strict;
        std::pmr::memory_resource* m_MemRes;
        Position m_Start;
        double m_Number = 0;
        std::string m_Literal;
        std::optional<BufferedWriter> m_Spill;
        LargeTextSink* m_SpillSink = nullptr;
        std::optional<LargeText> m_Spilled;
    };

} // namespace Stanza
