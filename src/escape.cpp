#include "stanza/escape.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>


namespace Stanza {

    namespace detail {
        constexpr char hex_digits[] = "0123456789ABCDEF";

        std::string u_escape(uint32_t unit) {
            std::string out = "\\u";
            out.push_back(hex_digits[(unit >> 12) & 0xF]);
            out.push_back(hex_digits[(unit >> 8) & 0xF]);
            out.push_back(hex_digits[(unit >> 4) & 0xF]);
            out.push_back(hex_digits[unit & 0xF]);
            return out;
        }

        const std::array<std::string, 128>& json_escape_map() {
            static const std::array<std::string, 128> map = [] {
                std::array<std::string, 128> m;
                for (uint32_t c = 0; c < 128; c++) {
                    char ch = static_cast<char>(c);
                    switch (ch) {
                    case '"': m[c] = "\\\""; break;
                    case '\\': m[c] = "\\\\"; break;
                    case '/': m[c] = "\\/"; break;
                    case '\b': m[c] = "\\b"; break;
                    case '\n': m[c] = "\\n"; break;
                    case '\r': m[c] = "\\r"; break;
                    case '\t': m[c] = "\\t"; break;
                    case '&': case '<': case '>': case '\'': case '`':
                        m[c] = u_escape(c);
                        break;
                    default:
                        if (c < 0x20 || c == 0x7F) m[c] = u_escape(c);
                        else m[c] = std::string(1, ch);
                    }
                }
                return m;
            }();
            return map;
        }

        // Decodes one UTF-8 sequence starting at text[i]; 0xFFFD for malformed input.
        uint32_t decode_utf8(std::string_view text, std::size_t& i) {
            auto byte = [&](std::size_t k) { return static_cast<unsigned char>(text[k]); };
            unsigned char c = byte(i);
            std::size_t len = 0;
            uint32_t cp = 0;
            if (c >= 0xC2 && c <= 0xDF) { len = 2; cp = c & 0x1F; }
            else if (c >= 0xE0 && c <= 0xEF) { len = 3; cp = c & 0x0F; }
            else if (c >= 0xF0 && c <= 0xF4) { len = 4; cp = c & 0x07; }
            else { i++; return 0xFFFDu; }

            if (i + len > text.size()) { i++; return 0xFFFDu; }
            for (std::size_t k = 1; k < len; k++) {
                unsigned char cc = byte(i + k);
                if ((cc & 0xC0) != 0x80) { i++; return 0xFFFDu; }
                cp = (cp << 6) | (cc & 0x3F);
            }
            i += len;
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0xFFFDu;
            return cp;
        }
    } // namespace detail

    void escape_json(std::string_view text, std::string& out) {
        const auto& map = detail::json_escape_map();
        std::size_t i = 0;
        while (i < text.size()) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            if (c < 0x80) {
                out.append(map[c]);
                i++;
                continue;
            }
            uint32_t cp = detail::decode_utf8(text, i);
            if (cp >= 0x10000) {
                cp -= 0x10000;
                out.append(detail::u_escape(0xD800 + (cp >> 10)));
                out.append(detail::u_escape(0xDC00 + (cp & 0x3FF)));
            } else out.append(detail::u_escape(cp));
        }
    }

    std::string escape_json(std::string_view text) {
        std::string out;
        out.reserve(text.size() + text.size() / 8);
        escape_json(text, out);
        return out;
    }

    void escape_html(std::string_view text, std::string& out) {
        std::size_t i = 0;
        while (i < text.size()) {
            char c = text[i];
            switch (c) {
            case '&': out.append("&amp;"); break;
            case '"': out.append("&quot;"); break;
            case '<': out.append("&lt;"); break;
            case '>': out.append("&gt;"); break;
            case '\'': out.append("&#x27;"); break;
            case '/': out.append("&#x2F;"); break;
            default:
                if (static_cast<unsigned char>(c) >= 0x80) {
                    uint32_t cp = detail::decode_utf8(text, i);
                    char buf[16];
                    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), cp, 16);
                    out.append("&#x");
                    for (char* p = buf; p != ptr; ++p) out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
                    out.push_back(';');
                    continue;
                }
                out.push_back(c);
            }
            i++;
        }
    }

    std::string escape_html(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        escape_html(text, out);
        return out;
    }

    std::string stringify(std::string_view value) {
        std::string out;
        out.reserve(value.size() + 2);
        out.push_back('"');
        escape_json(value, out);
        out.push_back('"');
        return out;
    }

    std::string stringify(double value) {
        if (!std::isfinite(value)) return "null";
        char buf[64];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        if (ec != std::errc{}) return "null";
        return std::string(buf, ptr);
    }

    std::string stringify(bool value) {
        return value ? "true" : "false";
    }

    std::string stringify(Date value) {
        return "\"" + format_iso8601(value) + "\"";
    }

    std::string stringify(Timestamp value) {
        return "\"" + format_iso8601(value) + "\"";
    }

    std::string stringify(const TimestampTz& value) {
        return "\"" + format_iso8601(value) + "\"";
    }

    std::size_t utf8_boundary(std::string_view text, std::size_t pos) noexcept {
        if (pos >= text.size()) return text.size();
        std::size_t p = pos;
        // at most three continuation bytes precede a sequence start
        for (int i = 0; i < 3 && p > 0 && (static_cast<unsigned char>(text[p]) & 0xC0) == 0x80; i++) p--;
        return (static_cast<unsigned char>(text[p]) & 0xC0) == 0x80 ? pos : p;
    }

    bool is_simple_name(std::string_view name) noexcept {
        for (char c : name) {
            bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
            if (!ok) return false;
        }
        return true;
    }

    std::string to_member_name(std::string_view name) {
        if (is_simple_name(name)) return std::string{ name };
        std::string out = "\"";
        for (char c : name) {
            if (c == '"') out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }

    std::string from_member_name(std::string_view member) {
        if (member.size() < 2 || member.front() != '"' || member.back() != '"') return std::string{ member };
        std::string out;
        std::string_view inner = member.substr(1, member.size() - 2);
        for (std::size_t i = 0; i < inner.size(); i++) {
            if (inner[i] == '\\' && i + 1 < inner.size() && inner[i + 1] == '"') continue;
            out.push_back(inner[i]);
        }
        return out;
    }

} // namespace Stanza
