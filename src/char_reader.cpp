#include "stanza/char_reader.hpp"
#include "stanza/large_text.hpp"

#include <algorithm>


namespace Stanza {

    CharReader::CharReader(std::vector<std::string_view> chunks, bool line_separated)
        : m_Chunks{ std::move(chunks) }, m_LineSeparated{ line_separated } {}

    CharReader CharReader::from_string(std::string_view text) {
        return CharReader{ { text }, false };
    }

    CharReader CharReader::from_lines(const std::vector<std::string>& lines) {
        std::vector<std::string_view> chunks;
        chunks.reserve(lines.size());
        for (const auto& l : lines) chunks.emplace_back(l);
        return CharReader{ std::move(chunks), true };
    }

    CharReader CharReader::from_large_text(const LargeText& text) {
        std::vector<std::string_view> pages;
        std::string_view all = text.view();
        for (std::size_t ofs = 0; ofs < all.size(); ofs += LargeText::page_size) {
            pages.push_back(all.substr(ofs, std::min(LargeText::page_size, all.size() - ofs)));
        }
        return CharReader{ std::move(pages), false };
    }

    void CharReader::advance(char c) noexcept {
        m_PrevColumn = m_Position.column;
        m_Position.index++;
        if (c == '\n') {
            m_Position.line++;
            m_Position.column = 0;
        } else m_Position.column++;
    }

    std::optional<char> CharReader::read() {
        if (!m_Putback.empty()) {
            char c = m_Putback.back();
            m_Putback.pop_back();
            advance(c);
            return c;
        }

        while (m_Chunk < m_Chunks.size()) {
            std::string_view chunk = m_Chunks[m_Chunk];
            if (m_Offset < chunk.size()) {
                char c = chunk[m_Offset++];
                advance(c);
                return c;
            }
            m_Chunk++;
            m_Offset = 0;
            if (m_LineSeparated && m_Chunk < m_Chunks.size()) {
                advance('\n');
                return '\n';
            }
        }
        return std::nullopt;
    }

    std::optional<char> CharReader::read_non_ws() {
        while (true) {
            auto c = read();
            if (!c) return c;
            if (*c != ' ' && *c != '\t' && *c != '\n' && *c != '\r') return c;
        }
    }

    void CharReader::unread(char c) {
        m_Putback.push_back(c);
        if (m_Position.index > 0) m_Position.index--;
        if (c == '\n') {
            m_Position.line--;
            m_Position.column = m_PrevColumn;
        } else if (m_Position.column > 0) m_Position.column--;
    }

} // namespace Stanza
