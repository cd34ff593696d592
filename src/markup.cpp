#include "stanza/markup.hpp"
#include "stanza/escape.hpp"

#include <algorithm>
#include <cctype>


namespace Stanza {

    namespace detail {
        bool iequals(std::string_view a, std::string_view b) noexcept {
            return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
            });
        }

        bool is_blank(std::string_view text) noexcept {
            return std::all_of(text.begin(), text.end(), [](char c) {
                return c == ' ' || c == '\t' || c == '\n' || c == '\r';
            });
        }

        // Number grammar of markup text: optional blanks, an optional minus,
        // digits with at most one dot, at least one digit.
        bool looks_numeric(std::string_view text) noexcept {
            std::size_t b = text.find_first_not_of(" \t\r\n");
            if (b == std::string_view::npos) return false;
            std::size_t e = text.find_last_not_of(" \t\r\n");
            std::string_view t = text.substr(b, e - b + 1);

            if (!t.empty() && t.front() == '-') t.remove_prefix(1);
            bool digits = false, dot = false;
            for (char c : t) {
                if (c >= '0' && c <= '9') digits = true;
                else if (c == '.' && !dot) dot = true;
                else return false;
            }
            return digits;
        }

        void quote(std::string_view text, std::string& out) {
            out.push_back('"');
            escape_json(text, out);
            out.push_back('"');
        }

        bool is_markup_array(const XmlNode& node) {
            const auto& kids = node.children;
            if (kids.empty() || kids.front().name != kids.back().name) return false;
            if (kids.size() > 1 || iequals(node.name, "rowset")) return true;

            std::string_view first = kids.front().name;
            if (first.find("x0028__x0027") != std::string_view::npos) return true;
            return first.size() >= 4 && iequals(first.substr(first.size() - 4), "_row");
        }
    } // namespace detail

    std::string markup_scalar(std::string_view text) {
        if (text.empty()) return "null";

        if (detail::looks_numeric(text)) {
            if (std::string_view{ "1234567890" }.find(text) != std::string_view::npos) return std::string{ text };

            bool as_string = std::string_view{ "1234567890.-" }.find(text.front()) == std::string_view::npos
                          || (text.starts_with("-0") && !text.starts_with("-0."))
                          || (text.starts_with("0") && !text.starts_with("0."))
                          || std::count(text.begin(), text.end(), '.') > 1
                          || text.back() == '.';
            if (as_string) {
                std::string out;
                detail::quote(text, out);
                return out;
            }
            if (text.starts_with(".")) return "0" + std::string{ text };
            if (text.starts_with("-.")) return "-0." + std::string{ text.substr(2) };
            return std::string{ text };
        }

        if (detail::iequals(text, "true")) return "true";
        if (detail::iequals(text, "false")) return "false";

        std::string out;
        detail::quote(text, out);
        return out;
    }

    void markup_to_json(const XmlNode& node, std::string& out) {
        if (detail::is_markup_array(node)) {
            out.push_back('[');
            bool first = true;
            for (const auto& [name, value] : node.attributes) {
                if (!first) out.push_back(',');
                first = false;
                out.push_back('{');
                detail::quote("@" + name, out);
                out.push_back(':');
                out += markup_scalar(value);
                out.push_back('}');
            }
            for (const auto& child : node.children) {
                if (!first) out.push_back(',');
                first = false;
                markup_to_json(child, out);
            }
            out.push_back(']');
            return;
        }

        if (!node.attributes.empty() || !node.children.empty()) {
            out.push_back('{');
            bool first = true;
            for (const auto& [name, value] : node.attributes) {
                if (!first) out.push_back(',');
                first = false;
                detail::quote("@" + name, out);
                out.push_back(':');
                out += markup_scalar(value);
            }
            for (const auto& child : node.children) {
                if (!first) out.push_back(',');
                first = false;
                detail::quote(child.name, out);
                out.push_back(':');
                markup_to_json(child, out);
            }
            if (!detail::is_blank(node.text)) {
                out += ",\"@text\":";
                out += markup_scalar(node.text);
            }
            out.push_back('}');
            return;
        }

        if (!detail::is_blank(node.text)) {
            out += markup_scalar(node.text);
            return;
        }
        out += "null";
    }

    std::string markup_to_json(const XmlNode& node) {
        std::string out;
        markup_to_json(node, out);
        return out;
    }

} // namespace Stanza
