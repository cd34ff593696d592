#pragma once


/*
    ----------------------------------------------
    Stanza::CharReader - chunked character stream
    ----------------------------------------------
    Presents one or more bounded text chunks as a single character stream
    with exact line/column/index tracking for error messages

    -----
    Modes
    -----
    - Line separated: a synthetic line break sits between successive
      chunks. Used for input supplied as a sequence of lines, where the
      lines themselves carry no terminator
    - Raw: chunks are concatenated as-is. Used when paging through a
      large text object, where a page boundary can fall anywhere, even in
      the middle of a token

    --------
    Pushback
    --------
    `unread(c)` hands back the character most recently returned by
    `read()` and rewinds the position. It exists so the lexer can stop on
    the first character after a number or word without consuming it
*/

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"

namespace Stanza {

    class LargeText;

    /// @brief Position of the reader in its input.
    struct Position {
        std::size_t line = 1;   ///< 1-based line number.
        std::size_t column = 0; ///< Characters read so far on the current line.
        std::size_t index = 0;  ///< Characters read so far in total.
    };

    class CharReader {
    public:
        STANZA_API CharReader(std::vector<std::string_view> chunks, bool line_separated);

        /// A single chunk in raw mode.
        STANZA_API static CharReader from_string(std::string_view text);
        /// One chunk per line, line separated. `lines` must outlive the reader.
        STANZA_API static CharReader from_lines(const std::vector<std::string>& lines);
        /// Pages of `LargeText::page_size` characters, raw. `text` must outlive the reader.
        STANZA_API static CharReader from_large_text(const LargeText& text);

        /// @brief Next character, or `std::nullopt` at the end of all chunks.
        STANZA_API std::optional<char> read();

        /// @brief Next character that is not space, tab, LF or CR.
        STANZA_API std::optional<char> read_non_ws();

        /// @brief Pushes back the character most recently read.
        STANZA_API void unread(char c);

        [[nodiscard]] const Position& position() const noexcept { return m_Position; }

    private:
        void advance(char c) noexcept;

        std::vector<std::string_view> m_Chunks;
        bool m_LineSeparated;
        std::size_t m_Chunk = 0;
        std::size_t m_Offset = 0;
        std::string m_Putback;
        Position m_Position;
        std::size_t m_PrevColumn = 0;
    };

} // namespace Stanza
