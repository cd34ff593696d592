#include "stanza/large_text.hpp"
#include "stanza/error.hpp"

#include <algorithm>


namespace Stanza {

    LargeText::LargeText(std::pmr::memory_resource* res)
        : m_Text{ res } {}

    LargeText::LargeText(std::string_view text, std::pmr::memory_resource* res)
        : m_Text{ text.begin(), text.end(), res } {}

    void LargeText::append(std::string_view text) {
        m_Text.append(text.begin(), text.end());
    }

    void LargeText::reserve(std::size_t n) {
        m_Text.reserve(n);
    }

    bool LargeText::next_chunk(std::size_t& offset, std::size_t amount, std::string& chunk) const {
        if (amount == 0 || offset > m_Text.size()) {
            throw ResourceError{ "next_chunk(ofs=" + std::to_string(offset) + ",amt=" + std::to_string(amount) +
                                 "): offset beyond end of text" };
        }
        if (offset == m_Text.size()) {
            chunk.clear();
            return false;
        }
        std::size_t n = std::min(amount, m_Text.size() - offset);
        chunk.assign(m_Text.data() + offset, n);
        offset += n;
        return true;
    }

    void LargeText::free() noexcept {
        std::pmr::string empty{ m_Text.get_allocator() };
        m_Text.swap(empty);
    }

} // namespace Stanza
