#include "stanza/query.hpp"
#include "stanza/error.hpp"
#include "stanza/escape.hpp"

#include <algorithm>
#include <charconv>


namespace Stanza {

    namespace detail {
        std::string limit_argument(std::string_view arg) {
            if (arg.size() > max_path_argument) return std::string{ arg.substr(0, max_path_argument - 1) } + "~";
            return std::string{ arg };
        }

        template<typename Args>
        std::string format_impl(std::string_view pattern, const Args& args) {
            auto arg_at = [&](std::size_t i) -> std::string {
                if (i >= args.size()) return {};
                return limit_argument(*(std::begin(args) + i));
            };

            std::string out;
            out.reserve(pattern.size());
            std::size_t next = 0;
            std::size_t start = 0;
            while (true) {
                std::size_t found = pattern.find('%', start);
                if (found == std::string_view::npos) {
                    out.append(pattern.substr(start));
                    return out;
                }
                out.append(pattern.substr(start, found - start));
                if (found + 1 >= pattern.size()) return out;

                char code = pattern[found + 1];
                if (code == 's' || code == 'd') {
                    out += arg_at(next++);
                    start = found + 2;
                } else if (code >= '0' && code <= '9') {
                    std::size_t index = static_cast<std::size_t>(code - '0');
                    start = found + 2;
                    if (code == '1' && start < pattern.size() && pattern[start] >= '0' && pattern[start] <= '9') {
                        index = 10 + static_cast<std::size_t>(pattern[start] - '0');
                        start++;
                    }
                    out += arg_at(index);
                } else {
                    out.push_back(code);
                    start = found + 2;
                }
            }
        }

        std::string_view kind_name(kind k) noexcept {
            switch (k) {
            case kind::null: return "null";
            case kind::true_value: return "true";
            case kind::false_value: return "false";
            case kind::number: return "number";
            case kind::string: return "string";
            case kind::object: return "object";
            case kind::array: return "array";
            case kind::large_text: return "large text";
            }
            return "unknown";
        }

        [[noreturn]] void type_error(std::string_view accessor, std::string_view path, const Value& v) {
            std::string msg{ accessor };
            msg += "(";
            msg += path;
            msg += "): unexpected value of kind ";
            msg += kind_name(v.type());
            throw ValueError(msg);
        }

        std::optional<double> to_number(std::string_view accessor, std::string_view path, const Value& v) {
            switch (v.type()) {
            case kind::null: return std::nullopt;
            case kind::number: return v.as_number();
            case kind::string: {
                std::string_view text = v.as_string();
                if (!text.empty() && text.front() == '+') text.remove_prefix(1);
                double d = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
                if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
                    throw ValueError(std::string{ accessor } + "(" + std::string{ path } + "): \"" +
                                     std::string{ v.as_string() } + "\" is not a number");
                }
                return d;
            }
            default: type_error(accessor, path, v);
            }
        }

        std::optional<std::string> to_text(std::string_view accessor, std::string_view path, const Value& v, bool large) {
            switch (v.type()) {
            case kind::null: return std::nullopt;
            case kind::true_value:
            case kind::false_value:
            case kind::number:
            case kind::string:
                return v.text();
            case kind::large_text:
                if (large) return v.as_large_text().str();
                [[fallthrough]];
            default: type_error(accessor, path, v);
            }
        }

        std::optional<TimestampTz> to_timestamp(std::string_view accessor, std::string_view path, const Value& v) {
            if (v.is_null()) return std::nullopt;
            if (!v.is_string()) type_error(accessor, path, v);
            auto ts = parse_iso8601(v.as_string());
            if (!ts) {
                throw ValueError(std::string{ accessor } + "(" + std::string{ path } + "): \"" +
                                 std::string{ v.as_string() } + "\" is not an ISO-8601 date");
            }
            return ts;
        }

        // Searches the table with the cumulative patterns in `parts`. Children are
        // explored only when they reach the best match index among their siblings.
        struct PathSearch {
            const ValueTable& table;
            std::vector<std::string> parts;
            std::size_t return_parts = 0;
            std::string_view value_pattern;
            std::optional<std::string> return_path;
            std::vector<std::string> found;

            std::size_t count() const noexcept { return parts.size(); }

            bool value_matches(const Value& v) const {
                switch (v.type()) {
                case kind::true_value:
                case kind::false_value:
                case kind::number:
                case kind::string:
                    return like(v.text(), value_pattern);
                default:
                    return false;
                }
            }

            std::size_t match_index(std::string_view path, std::size_t parent) const {
                std::size_t idx = parent + 1;
                if (idx < count() && like(path, parts[idx - 1])) {
                    if (like(path, parts.back())) idx = count();
                    return idx;
                }
                if (idx == count() && like(path, parts.back())) return idx;
                return parent;
            }

            void append(const std::string& path) {
                if (std::find(found.begin(), found.end(), path) == found.end()) found.push_back(path);
            }

            void walk(const std::string& path, std::size_t idx) {
                const Value* current = table.find(path);
                if (!current) return;

                bool set_here = false;
                if (!return_path && idx >= return_parts) {
                    return_path = path;
                    set_here = true;
                }

                if (idx == count() && (value_pattern.empty() || value_matches(*current))) {
                    if (return_path) append(*return_path);
                    return_path.reset();
                    return;
                }

                std::vector<std::pair<std::string, std::size_t>> candidates;
                std::size_t best = 0;
                if (current->is_array()) {
                    for (std::size_t i = 1; i <= current->count(); i++) {
                        std::string child = element_path(path, i);
                        std::size_t m = match_index(child, idx);
                        best = std::max(best, m);
                        candidates.emplace_back(std::move(child), m);
                    }
                } else if (current->is_object()) {
                    for (const auto& member : current->members()) {
                        std::string child = member_path(path, member);
                        std::size_t m = match_index(child, idx);
                        best = std::max(best, m);
                        candidates.emplace_back(std::move(child), m);
                    }
                }

                for (const auto& [child, m] : candidates) {
                    if (m == best) walk(child, m);
                }

                if (set_here) return_path.reset();
            }
        };

        std::vector<std::string> split_query(std::string_view query) {
            std::vector<std::string> parts;
            std::string current;
            auto cut = [&] {
                if (!current.empty()) parts.push_back(std::move(current));
                current.clear();
            };

            for (std::size_t i = 0; i < query.size(); i++) {
                char c = query[i];
                if (c == '[') {
                    cut();
                    std::size_t end = query.find(']', i);
                    if (end == std::string_view::npos) end = query.size();
                    current.assign(query.substr(i, end - i));
                    i = end - 1;
                } else if (c == '%' || c == '.') {
                    cut();
                    current.push_back(c);
                } else {
                    current.push_back(c);
                }
            }
            cut();
            return parts;
        }
    } // namespace detail

    std::string format_path(std::string_view pattern, std::initializer_list<std::string_view> args) {
        return detail::format_impl(pattern, args);
    }

    std::string format_path(std::string_view pattern, const std::vector<std::string>& args) {
        return detail::format_impl(pattern, args);
    }

    bool like(std::string_view text, std::string_view pattern) noexcept {
        std::size_t t = 0, p = 0;
        std::size_t star = std::string_view::npos, mark = 0;
        while (t < text.size()) {
            if (p < pattern.size() && (pattern[p] == '_' || pattern[p] == text[t]) && pattern[p] != '%') {
                t++;
                p++;
            } else if (p < pattern.size() && pattern[p] == '%') {
                star = p++;
                mark = t;
            } else if (star != std::string_view::npos) {
                p = star + 1;
                t = ++mark;
            } else return false;
        }
        while (p < pattern.size() && pattern[p] == '%') p++;
        return p == pattern.size();
    }

    bool exists(const ValueTable& t, const Path& p) {
        return t.contains(p.text);
    }

    std::optional<bool> get_boolean(const ValueTable& t, const Path& p, std::optional<bool> def) {
        const Value* v = t.find(p.text);
        if (!v) return def;
        switch (v->type()) {
        case kind::null: return std::nullopt;
        case kind::true_value: return true;
        case kind::false_value: return false;
        default: detail::type_error("get_boolean", p.text, *v);
        }
    }

    std::optional<double> get_number(const ValueTable& t, const Path& p, std::optional<double> def) {
        const Value* v = t.find(p.text);
        if (!v) return def;
        return detail::to_number("get_number", p.text, *v);
    }

    std::optional<std::string> get_string(const ValueTable& t, const Path& p, std::optional<std::string> def) {
        const Value* v = t.find(p.text);
        if (!v) return def;
        return detail::to_text("get_string", p.text, *v, false);
    }

    std::optional<std::string> get_large_text(const ValueTable& t, const Path& p, std::optional<std::string> def) {
        const Value* v = t.find(p.text);
        if (!v) return def;
        return detail::to_text("get_large_text", p.text, *v, true);
    }

    std::optional<Date> get_date(const ValueTable& t, const Path& p, std::optional<Date> def) {
        const Value* v = t.find(p.text);
        if (!v) return def;
        auto ts = detail::to_timestamp("get_date", p.text, *v);
        if (!ts) return std::nullopt;
        return std::chrono::floor<std::chrono::seconds>(ts->utc);
    }

    std::optional<Timestamp> get_timestamp(const ValueTable& t, const Path& p, std::optional<Timestamp> def) {
        const Value* v = t.find(p.text);
        if (!v) return def;
        auto ts = detail::to_timestamp("get_timestamp", p.text, *v);
        if (!ts) return std::nullopt;
        return ts->utc;
    }

    std::optional<TimestampTz> get_timestamp_tz(const ValueTable& t, const Path& p, std::optional<TimestampTz> def) {
        const Value* v = t.find(p.text);
        if (!v) return def;
        return detail::to_timestamp("get_timestamp_tz", p.text, *v);
    }

    std::optional<Date> get_date_at(const ValueTable& t, const Path& p, std::chrono::minutes offset, std::optional<Date> def) {
        const Value* v = t.find(p.text);
        if (!v) return def;
        auto ts = detail::to_timestamp("get_date", p.text, *v);
        if (!ts) return std::nullopt;
        return std::chrono::floor<std::chrono::seconds>(ts->utc + offset);
    }

    std::optional<Timestamp> get_timestamp_at(const ValueTable& t, const Path& p, std::chrono::minutes offset, std::optional<Timestamp> def) {
        const Value* v = t.find(p.text);
        if (!v) return def;
        auto ts = detail::to_timestamp("get_timestamp", p.text, *v);
        if (!ts) return std::nullopt;
        return ts->utc + offset;
    }

    std::optional<std::size_t> get_count(const ValueTable& t, const Path& p) {
        const Value* v = t.find(p.text);
        if (!v) return std::nullopt;
        if (!v->is_container()) detail::type_error("get_count", p.text, *v);
        return v->count();
    }

    std::optional<members_t> get_members(const ValueTable& t, const Path& p) {
        const Value* v = t.find(p.text);
        if (!v) return std::nullopt;
        if (!v->is_object()) detail::type_error("get_members", p.text, *v);
        return v->members();
    }

    std::optional<std::vector<std::optional<std::string>>> get_array_of_string(const ValueTable& t, const Path& p) {
        const Value* v = t.find(p.text);
        if (!v) return std::nullopt;

        std::vector<std::optional<std::string>> out;
        if (!v->is_array()) {
            out.push_back(detail::to_text("get_array_of_string", p.text, *v, false));
            return out;
        }
        for (std::size_t i = 1; i <= v->count(); i++) {
            std::string path = element_path(p.text, i);
            const Value* e = t.find(path);
            if (!e) return std::nullopt;
            out.push_back(detail::to_text("get_array_of_string", path, *e, false));
        }
        return out;
    }

    std::optional<std::vector<std::optional<double>>> get_array_of_number(const ValueTable& t, const Path& p) {
        const Value* v = t.find(p.text);
        if (!v) return std::nullopt;

        std::vector<std::optional<double>> out;
        if (!v->is_array()) {
            out.push_back(detail::to_number("get_array_of_number", p.text, *v));
            return out;
        }
        for (std::size_t i = 1; i <= v->count(); i++) {
            std::string path = element_path(p.text, i);
            const Value* e = t.find(path);
            if (!e) return std::nullopt;
            out.push_back(detail::to_number("get_array_of_number", path, *e));
        }
        return out;
    }

    Value get_value(const ValueTable& t, const Path& p) {
        if (const Value* v = t.find(p.text)) return *v;
        return Value{ t.resource() };
    }

    std::vector<std::string> find_paths_like(const ValueTable& t, std::string_view return_pattern,
                                             std::string_view subpath_pattern, std::string_view value_pattern) {
        detail::PathSearch search{ t, detail::split_query(return_pattern) };
        search.return_parts = search.parts.size();
        for (auto& part : detail::split_query(subpath_pattern)) search.parts.push_back(std::move(part));
        for (std::size_t i = 1; i < search.parts.size(); i++) search.parts[i] = search.parts[i - 1] + search.parts[i];
        search.value_pattern = value_pattern;

        search.walk(std::string{ ValueTable::root }, 0);
        return std::move(search.found);
    }

} // namespace Stanza
