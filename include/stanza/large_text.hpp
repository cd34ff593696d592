#pragma once


/*
    ------------------------------------------------
    Stanza::LargeText - owned growable text storage
    ------------------------------------------------
    `LargeText` holds character data that is too large to be treated as an
    ordinary bounded string: the spill-over of very long string literals in
    the lexer, and the accumulated output of the generator in large-text
    mode

    - Storage is allocated from a `std::pmr::memory_resource`
    - It is read back in pages with `next_chunk(...)`, so consumers never
      need to materialize the whole text at once
    - `free()` releases the storage explicitly; the destructor releases it
      on every other path
*/

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "stanza/config.hpp"

/// @defgroup StanzaLargeText Large Text
/// @ingroup Stanza

namespace Stanza {

    /// @ingroup StanzaLargeText
    /// @brief Owned, growable character store read back in pages.
    class LargeText {
    public:
        /// Characters per page when a large text is read back for parsing.
        static constexpr std::size_t page_size = 8191;

        STANZA_API explicit LargeText(std::pmr::memory_resource* res = std::pmr::get_default_resource());
        STANZA_API LargeText(std::string_view text, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API void append(std::string_view text);
        STANZA_API void reserve(std::size_t n);

        /// @brief Copies up to `amount` characters starting at `offset` into
        ///        `chunk` and advances `offset`.
        /// @return false once `offset` has reached the end of the text.
        /// @throws ResourceError if `offset` lies beyond the end or `amount` is 0.
        STANZA_API bool next_chunk(std::size_t& offset, std::size_t amount, std::string& chunk) const;

        /// @brief Releases the storage. The object stays usable and empty.
        STANZA_API void free() noexcept;

        [[nodiscard]] std::size_t size() const noexcept { return m_Text.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_Text.empty(); }
        [[nodiscard]] std::string_view view() const noexcept { return m_Text; }
        [[nodiscard]] std::string str() const { return std::string{ m_Text }; }
        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_Text.get_allocator().resource(); }

        bool operator==(const LargeText& other) const noexcept { return m_Text == other.m_Text; }

    private:
        std::pmr::string m_Text;
    };

} // namespace Stanza
