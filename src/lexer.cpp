#include "stanza/lexer.hpp"
#include "stanza/log.hpp"

#include <charconv>


namespace Stanza {

    namespace detail {
        constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
        constexpr bool is_word_start(char c) noexcept {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        }
        constexpr bool is_word_char(char c) noexcept { return is_word_start(c) || is_digit(c); }
        constexpr bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

        // True when a number literal out of double range is too small rather than too large.
        bool underflows(std::string_view literal) noexcept {
            std::size_t i = literal.starts_with('-') ? 1 : 0;
            long order = -1;
            bool seen = false;
            for (; i < literal.size() && is_digit(literal[i]); i++) {
                if (literal[i] != '0') seen = true;
                if (seen) order++;
            }
            if (i < literal.size() && literal[i] == '.') {
                for (long pos = 1; ++i < literal.size() && is_digit(literal[i]); pos++) {
                    if (!seen && literal[i] != '0') {
                        seen = true;
                        order = -pos;
                    }
                }
            }
            if (!seen) return true;
            long exponent = 0;
            if (i < literal.size() && (literal[i] == 'e' || literal[i] == 'E')) {
                bool negative = ++i < literal.size() && literal[i] == '-';
                if (i < literal.size() && (literal[i] == '-' || literal[i] == '+')) i++;
                for (; i < literal.size() && is_digit(literal[i]); i++) {
                    if (exponent < 100000) exponent = exponent * 10 + (literal[i] - '0');
                }
                if (negative) exponent = -exponent;
            }
            return order + exponent < 0;
        }

        void append_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        std::string quoted(std::optional<char> c) {
            std::string out = "\"";
            if (c) out.push_back(*c);
            out.push_back('"');
            return out;
        }
    } // namespace detail

    std::string_view to_string(Symbol s) noexcept {
        switch (s) {
        case Symbol::eof: return "<eof>";
        case Symbol::begin_array: return "[";
        case Symbol::begin_object: return "{";
        case Symbol::end_array: return "]";
        case Symbol::end_object: return "}";
        case Symbol::colon: return ":";
        case Symbol::comma: return ",";
        case Symbol::false_value: return "false";
        case Symbol::true_value: return "true";
        case Symbol::null_value: return "null";
        case Symbol::number: return "<number>";
        case Symbol::string: return "<string>";
        }
        return "<unknown>";
    }

    Lexer::Lexer(CharReader& reader, bool strict, std::pmr::memory_resource* res)
        : m_Reader{ reader }, m_Strict{ strict }, m_MemRes{ res } {}

    ParseError Lexer::make_error(ParseError::code code, std::string_view msg) const {
        std::size_t offset = m_Start.index > 0 ? m_Start.index - 1 : 0;
        return ParseError::make(code, offset, m_Start.line, m_Start.column, msg);
    }

    LargeText Lexer::take_large_text() {
        LargeText out = m_Spilled ? std::move(*m_Spilled) : LargeText{ m_MemRes };
        m_Spilled.reset();
        return out;
    }

    expected_t<Symbol> Lexer::next() {
        auto c = m_Reader.read_non_ws();
        m_Start = m_Reader.position();
        m_Number = 0;
        m_Literal.clear();
        m_Spilled.reset();

        if (!c) return Symbol::eof;

        switch (*c) {
        case '[': return Symbol::begin_array;
        case '{': return Symbol::begin_object;
        case ']': return Symbol::end_array;
        case '}': return Symbol::end_object;
        case ':': return Symbol::colon;
        case ',': return Symbol::comma;
        case '"': return lex_string();
        case '-': {
            m_Literal.push_back('-');
            auto d = m_Reader.read();
            if (!d || !detail::is_digit(*d)) {
                return std::unexpected(make_error(ParseError::code::invalid_number,
                    "expected 0-9 after minus sign, not " + detail::quoted(d)));
            }
            return lex_number(*d);
        }
        default:
            if (detail::is_digit(*c)) return lex_number(*c);
            if (detail::is_word_start(*c)) return lex_word(*c);
            return std::unexpected(make_error(ParseError::code::unexpected_character,
                "Unexpected character " + detail::quoted(c)));
        }
    }

    expected_t<Symbol> Lexer::lex_number(char first) {
        // 1 integer, 2 after '.', 3 fraction, 4 after 'e', 5 exponent sign, 6 exponent
        int state = 1;
        m_Literal.push_back(first);

        while (true) {
            auto c = m_Reader.read();
            char ch = c.value_or('\0');
            bool digit = c && detail::is_digit(ch);

            if ((state == 1 || state == 3 || state == 6) && digit) {
            } else if (state == 1 && ch == '.') {
                state = 2;
            } else if (state == 2 && digit) {
                state = 3;
            } else if ((state == 1 || state == 3) && (ch == 'e' || ch == 'E')) {
                state = 4;
            } else if (state == 4 && (ch == '-' || ch == '+')) {
                state = 5;
            } else if ((state == 4 || state == 5) && digit) {
                state = 6;
            } else if (state == 1 || state == 3 || state == 6) {
                if (c) m_Reader.unread(ch);
                break;
            } else {
                std::string msg = "Invalid number: " + m_Literal;
                if (c) msg.push_back(ch);
                return std::unexpected(make_error(ParseError::code::invalid_number, msg));
            }
            m_Literal.push_back(ch);
        }

        auto [ptr, ec] = std::from_chars(m_Literal.data(), m_Literal.data() + m_Literal.size(), m_Number);
        if (ec == std::errc::result_out_of_range && ptr == m_Literal.data() + m_Literal.size()
            && detail::underflows(m_Literal)) {
            // Underflow rounds to a signed zero.
            m_Number = m_Literal.front() == '-' ? -0.0 : 0.0;
            ec = std::errc{};
        }
        if (ec != std::errc{} || ptr != m_Literal.data() + m_Literal.size()) {
            return std::unexpected(make_error(ParseError::code::invalid_number, "Invalid number: " + m_Literal));
        }
        return Symbol::number;
    }

    expected_t<uint32_t> Lexer::read_hex4() {
        uint32_t val = 0;
        std::string hex = "\\u";
        bool ok = true;
        for (int i = 0; i < 4; i++) {
            auto h = m_Reader.read();
            if (!h) return std::unexpected(make_error(ParseError::code::invalid_string, "Unterminated quoted string"));
            char ch = *h;
            hex.push_back(static_cast<char>(ch >= 'A' && ch <= 'Z' ? ch - 'A' + 'a' : ch));
            unsigned digit = 0;
            if (ch >= '0' && ch <= '9') digit = ch - '0';
            else if (ch >= 'A' && ch <= 'F') digit = 10 + (ch - 'A');
            else if (ch >= 'a' && ch <= 'f') digit = 10 + (ch - 'a');
            else ok = false;
            val = (val << 4) | digit;
        }
        if (!ok) {
            return std::unexpected(make_error(ParseError::code::invalid_unicode_escape,
                "\"" + hex + "\" is not a valid hex string"));
        }
        return val;
    }

    void Lexer::spill() {
        if (!m_Spill) {
            auto sink = std::make_unique<LargeTextSink>(0, m_MemRes);
            m_SpillSink = sink.get();
            m_Spill.emplace(std::move(sink));
            log(Debug, "Lexer: string literal at line %zu exceeds %zu characters, moving to large text",
                m_Start.line, spill_threshold);
        }
        m_Spill->write(m_Literal);
        m_Literal.clear();
    }

    expected_t<Symbol> Lexer::lex_string() {
        auto unterminated = [&] {
            m_Spill.reset();
            return std::unexpected(make_error(ParseError::code::invalid_string, "Unterminated quoted string"));
        };

        while (true) {
            auto c = m_Reader.read();
            if (!c) return unterminated();
            if (*c == '"') break;

            if (*c != '\\') {
                m_Literal.push_back(*c);
            } else {
                auto esc = m_Reader.read();
                if (!esc) return unterminated();
                switch (*esc) {
                case '"': m_Literal.push_back('"'); break;
                case '\\': m_Literal.push_back('\\'); break;
                case '/': m_Literal.push_back('/'); break;
                case 'b': m_Literal.push_back('\b'); break;
                case 'f': m_Literal.push_back('\f'); break;
                case 'n': m_Literal.push_back('\n'); break;
                case 'r': m_Literal.push_back('\r'); break;
                case 't': m_Literal.push_back('\t'); break;
                case 'u': {
                    auto hi = read_hex4();
                    if (!hi) { m_Spill.reset(); return std::unexpected(hi.error()); }
                    uint32_t cp = *hi;

                    auto bad_surrogate = [&](uint32_t unit) {
                        static constexpr char digits[] = "0123456789abcdef";
                        std::string hex = "\\u";
                        for (int shift = 12; shift >= 0; shift -= 4) hex.push_back(digits[(unit >> shift) & 0xF]);
                        m_Spill.reset();
                        return std::unexpected(make_error(ParseError::code::invalid_unicode_escape,
                            "\"" + hex + "\" is not a valid hex string"));
                    };

                    if (cp >= 0xDC00 && cp <= 0xDFFF) return bad_surrogate(cp);
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        auto b = m_Reader.read();
                        auto u = b && *b == '\\' ? m_Reader.read() : std::optional<char>{};
                        if (!u || *u != 'u') return bad_surrogate(cp);
                        auto lo = read_hex4();
                        if (!lo) { m_Spill.reset(); return std::unexpected(lo.error()); }
                        if (*lo < 0xDC00 || *lo > 0xDFFF) return bad_surrogate(cp);
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (*lo - 0xDC00);
                    }
                    detail::append_utf8(cp, m_Literal);
                    break;
                }
                default:
                    m_Spill.reset();
                    return std::unexpected(make_error(ParseError::code::invalid_escape,
                        std::string{ "Invalid escape sequence \\" } + *esc));
                }
            }

            if (m_Literal.size() > spill_threshold) spill();
        }

        if (m_Spill) {
            m_Spill->write(m_Literal);
            m_Spill->flush();
            m_Literal.clear();
            m_Spilled.emplace(m_SpillSink->take());
            m_Spill.reset();
            m_SpillSink = nullptr;
        }
        return Symbol::string;
    }

    expected_t<Symbol> Lexer::lex_word(char first) {
        m_Literal.push_back(first);
        while (true) {
            auto c = m_Reader.read();
            if (!c) break;
            if (detail::is_word_char(*c)) {
                m_Literal.push_back(*c);
                continue;
            }
            if (!detail::is_ws(*c)) m_Reader.unread(*c);
            break;
        }

        if (m_Literal == "null") return Symbol::null_value;
        if (m_Literal == "true") return Symbol::true_value;
        if (m_Literal == "false") return Symbol::false_value;

        if (m_Strict) {
            return std::unexpected(make_error(ParseError::code::unquoted_literal,
                "strict mode JSON parser does not allow unquoted literals"));
        }
        log(Debug, "Lexer: accepting unquoted literal \"%s\" at line %zu, col %zu",
            m_Literal.c_str(), m_Start.line, m_Start.column);
        return Symbol::string;
    }

} // namespace Stanza
