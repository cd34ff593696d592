#include "stanza/generator.hpp"
#include "stanza/error.hpp"
#include "stanza/escape.hpp"
#include "stanza/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <type_traits>


namespace Stanza {

    namespace detail {
        std::size_t default_indent() noexcept {
            return logLevel <= Debug ? 2 : 0;
        }

        std::optional<bool> text_boolean(std::string_view text) noexcept {
            auto upper_equals = [&](std::string_view word) {
                return text.size() == word.size() && std::equal(text.begin(), text.end(), word.begin(), [](char a, char b) {
                    return std::toupper(static_cast<unsigned char>(a)) == b;
                });
            };
            if (upper_equals("TRUE")) return true;
            if (upper_equals("FALSE")) return false;
            return std::nullopt;
        }

        // Placeholder names `#name#` in the hrefs of `links`, each once.
        std::vector<std::pair<std::string, std::string>> link_placeholders(const Links& links) {
            std::vector<std::pair<std::string, std::string>> subs;
            for (const auto& l : links) {
                std::size_t pos = 0;
                while (true) {
                    std::size_t open = l.href.find('#', pos);
                    if (open == std::string::npos) break;
                    std::size_t close = l.href.find('#', open + 1);
                    if (close == std::string::npos) break;
                    if (close == open + 1) {
                        pos = close;
                        continue;
                    }
                    std::string name = l.href.substr(open + 1, close - open - 1);
                    auto known = std::find_if(subs.begin(), subs.end(), [&](const auto& s) { return s.first == name; });
                    if (known == subs.end()) subs.emplace_back(std::move(name), std::string{});
                    pos = close + 1;
                }
            }
            return subs;
        }

        std::string substitute(std::string href, const std::vector<std::pair<std::string, std::string>>& subs) {
            for (const auto& [name, value] : subs) {
                std::string pattern = "#" + name + "#";
                std::size_t pos = 0;
                while ((pos = href.find(pattern, pos)) != std::string::npos) {
                    href.replace(pos, pattern.size(), value);
                    pos += value.size();
                }
            }
            return href;
        }
    } // namespace detail

    Link link(std::string href, std::string rel, std::optional<bool> templated,
              std::string media_type, std::string method, std::string profile) {
        return Link{ std::move(href), std::move(rel), templated, std::move(media_type), std::move(method), std::move(profile) };
    }

    Generator::Generator() {
        initialize_large_text_output();
    }

#pragma region Output
    void Generator::initialize_output(std::ostream& os, const OutputOptions& opts) {
        free_output();
        m_Indent = opts.indent.value_or(detail::default_indent());
        m_HeaderPending = opts.emit_header;
        m_CachePolicy = opts.cache_policy;
        m_ETag = opts.etag;
        m_Writer.emplace(std::make_unique<StreamSink>(os));
        m_TextSink = nullptr;
        log(Debug, "Generator: stream output, indent %zu", m_Indent);
    }

    void Generator::initialize_large_text_output(const LargeTextOptions& opts) {
        free_output();
        m_Indent = opts.indent.value_or(detail::default_indent());
        auto sink = std::make_unique<LargeTextSink>(opts.reserve);
        m_TextSink = sink.get();
        m_Writer.emplace(std::move(sink));
        log(Debug, "Generator: large text output, indent %zu", m_Indent);
    }

    void Generator::free_output() {
        m_Nesting.clear();
        m_HeaderPending = false;
        m_CachePolicy = CachePolicy::forbid;
        m_ETag.clear();
        m_Indent = 0;
        if (m_Writer) m_Writer->dispose();
        m_Writer.reset();
        m_TextSink = nullptr;
    }

    std::string Generator::output() {
        if (!m_Writer) return {};
        if (!m_TextSink) {
            log(Error, "Generator: output() requested from stream output");
            throw WriterError("output: generator is not writing to large text");
        }
        flush();
        const LargeText* text = m_TextSink->text();
        return text ? text->str() : std::string{};
    }

    void Generator::flush() {
        if (m_Writer) m_Writer->flush();
    }
#pragma endregion

#pragma region Nesting
    std::string Generator::indent_for(bool comma) const {
        if (m_Nesting.empty()) return {};
        bool due = comma && m_Nesting.back() > 0;
        if (m_Indent > 0) {
            std::string out(m_Nesting.size() * m_Indent, ' ');
            if (due) out.back() = ',';
            return out;
        }
        return due ? "," : "";
    }

    void Generator::data_written() noexcept {
        if (!m_Nesting.empty() && m_Nesting.back() < 0) m_Nesting.back() = static_cast<int8_t>(-m_Nesting.back());
    }

    void Generator::increase_nesting(int8_t value) {
        require_output("open");
        if (!m_Nesting.empty()) data_written();
        else if (m_HeaderPending) write_header();
        m_Nesting.push_back(value);
    }

    bool Generator::decrease_nesting(int8_t value) noexcept {
        if (m_Nesting.empty() || std::abs(m_Nesting.back()) != std::abs(value)) return false;
        m_Nesting.pop_back();
        return true;
    }

    void Generator::require_open(const char* operation) const {
        if (!m_Nesting.empty()) return;
        log(Error, "Generator: %s with no object or array open", operation);
        throw WriterError(std::string{ operation } + ": no object or array is open");
    }

    void Generator::require_output(const char* operation) const {
        if (m_Writer) return;
        log(Error, "Generator: %s after the output was freed", operation);
        throw WriterError(std::string{ operation } + ": no output is initialized");
    }

    BufferedWriter& Generator::writer() {
        require_output("write");
        return *m_Writer;
    }

    void Generator::write_header() {
        m_HeaderPending = false;
        writer().write("Content-Type: application/json\r\n");
        switch (m_CachePolicy) {
        case CachePolicy::forbid:
            writer().write("Cache-Control: no-cache\r\n");
            break;
        case CachePolicy::allow:
            writer().write("Cache-Control: public\r\n");
            if (!m_ETag.empty()) writer().writef("ETag: %s\r\n", { m_ETag });
            break;
        case CachePolicy::omit:
            break;
        }
        writer().write("\r\n");
    }
#pragma endregion

#pragma region Structure
    void Generator::open_object(std::string_view name) {
        std::string out = indent_for();
        increase_nesting(opened_object);
        if (!name.empty()) out += stringify(name) + ":";
        out.push_back('{');
        writer().line(out);
    }

    void Generator::close_object() {
        if (!decrease_nesting(opened_object)) {
            log(Error, "Generator: close_object() without a matching open_object()");
            throw WriterError("close_object: innermost open construct is not an object");
        }
        writer().line(indent_for(false) + "}");
        if (m_Nesting.empty()) writer().flush();
    }

    void Generator::open_array(std::string_view name) {
        std::string out = indent_for();
        increase_nesting(opened_array);
        if (!name.empty()) out += stringify(name) + ":";
        out.push_back('[');
        writer().line(out);
    }

    void Generator::close_array() {
        if (!decrease_nesting(opened_array)) {
            log(Error, "Generator: close_array() without a matching open_array()");
            throw WriterError("close_array: innermost open construct is not an array");
        }
        writer().line(indent_for(false) + "]");
        if (m_Nesting.empty()) writer().flush();
    }

    void Generator::close_all() {
        while (!m_Nesting.empty()) {
            int8_t state = m_Nesting.back();
            m_Nesting.pop_back();
            writer().line(indent_for(false) + (std::abs(state) == in_object ? "}" : "]"));
        }
        if (m_Writer) m_Writer->flush();
    }
#pragma endregion

#pragma region Primitives
    void Generator::write_value(std::string_view fragment) {
        require_open("write");
        writer().write(indent_for());
        writer().line(fragment);
        data_written();
    }

    void Generator::write_name(std::string_view name) {
        require_open("write");
        std::string out = indent_for();
        if (is_simple_name(name)) {
            out += "\"";
            out += name;
            out += "\":";
        } else if (name.starts_with('"')) {
            out += name;
            out += ":";
        } else {
            out += stringify(name) + ":";
        }
        writer().write(out);
    }

    void Generator::finish_long_string(std::string_view text) {
        std::string piece;
        std::size_t pos = 0;
        while (pos < text.size()) {
            std::size_t end = utf8_boundary(text, pos + stringify_length);
            if (end <= pos) end = std::min(text.size(), pos + stringify_length);
            piece.clear();
            escape_json(text.substr(pos, end - pos), piece);
            writer().write(piece);
            pos = end;
        }
        writer().line("\"");
        data_written();
    }
#pragma endregion

#pragma region Elements
    void Generator::write(std::string_view value) {
        if (value.size() <= stringify_length) {
            write_value(stringify(value));
            return;
        }
        require_open("write");
        writer().write(indent_for() + "\"");
        finish_long_string(value);
    }

    void Generator::write(const LargeText& value) {
        require_open("write");
        writer().write(indent_for() + "\"");
        finish_long_string(value.view());
    }

    void Generator::write(double value) { write_value(stringify(value)); }
    void Generator::write(bool value) { write_value(stringify(value)); }
    void Generator::write(Date value) { write_value(stringify(value)); }
    void Generator::write(Timestamp value) { write_value(stringify(value)); }
    void Generator::write(const TimestampTz& value) { write_value(stringify(value)); }

    void Generator::write_null() { write_value("null"); }

    void Generator::write(const std::vector<std::string>& values) {
        open_array();
        for (const auto& v : values) write(std::string_view{ v });
        close_array();
    }

    void Generator::write(const std::vector<double>& values) {
        open_array();
        for (double v : values) write(v);
        close_array();
    }

    void Generator::write(RowSet& rows) {
        write_row_set({}, rows);
    }

    void Generator::write(const XmlNode& node) {
        write_value(markup_to_json(node));
    }

    void Generator::write(const ValueTable& t, const Path& path) {
        write_tree(std::nullopt, t, path.text);
    }
#pragma endregion

#pragma region Members
    void Generator::write(std::string_view name, std::string_view value) {
        if (value.size() <= stringify_length) {
            write_raw(name, stringify(value));
            return;
        }
        write_name(name);
        writer().write("\"");
        finish_long_string(value);
    }

    void Generator::write(std::string_view name, const LargeText& value) {
        write_name(name);
        writer().write("\"");
        finish_long_string(value.view());
    }

    void Generator::write(std::string_view name, double value) { write_raw(name, stringify(value)); }
    void Generator::write(std::string_view name, bool value) { write_raw(name, stringify(value)); }
    void Generator::write(std::string_view name, Date value) { write_raw(name, stringify(value)); }
    void Generator::write(std::string_view name, Timestamp value) { write_raw(name, stringify(value)); }
    void Generator::write(std::string_view name, const TimestampTz& value) { write_raw(name, stringify(value)); }

    void Generator::write_null(std::string_view name) { write_raw(name, "null"); }

    void Generator::write(std::string_view name, const std::optional<std::string>& value, bool write_null) {
        if (value) write(name, std::string_view{ *value });
        else if (write_null) this->write_null(name);
    }

    void Generator::write(std::string_view name, const std::optional<double>& value, bool write_null) {
        if (value) write(name, *value);
        else if (write_null) this->write_null(name);
    }

    void Generator::write(std::string_view name, const std::optional<bool>& value, bool write_null) {
        if (value) write(name, *value);
        else if (write_null) this->write_null(name);
    }

    void Generator::write(std::string_view name, const std::optional<Date>& value, bool write_null) {
        if (value) write(name, *value);
        else if (write_null) this->write_null(name);
    }

    void Generator::write(std::string_view name, const std::optional<Timestamp>& value, bool write_null) {
        if (value) write(name, *value);
        else if (write_null) this->write_null(name);
    }

    void Generator::write(std::string_view name, const std::optional<TimestampTz>& value, bool write_null) {
        if (value) write(name, *value);
        else if (write_null) this->write_null(name);
    }

    void Generator::write(std::string_view name, const std::vector<std::string>& values, bool write_null) {
        if (values.empty() && !write_null) return;
        open_array(name);
        for (const auto& v : values) write(std::string_view{ v });
        close_array();
    }

    void Generator::write(std::string_view name, const std::vector<double>& values, bool write_null) {
        if (values.empty() && !write_null) return;
        open_array(name);
        for (double v : values) write(v);
        close_array();
    }

    void Generator::write(std::string_view name, RowSet& rows) {
        write_row_set(name, rows);
    }

    void Generator::write(std::string_view name, const XmlNode& node) {
        write_raw(name, markup_to_json(node));
    }

    void Generator::write(std::string_view name, const ValueTable& t, const Path& path, bool write_null) {
        const Value* v = t.find(path.text);
        if (v && v->is_null() && !write_null) return;
        std::string raw = from_member_name(name);
        write_tree(std::string_view{ raw }, t, path.text);
    }
#pragma endregion

#pragma region Raw
    void Generator::write_raw(std::string_view fragment) {
        write_value(fragment);
    }

    void Generator::write_raw(const std::vector<std::string>& fragments) {
        require_open("write_raw");
        writer().write(indent_for());
        for (const auto& f : fragments) writer().write(f);
        writer().line();
        data_written();
    }

    void Generator::write_raw(std::string_view name, std::string_view fragment) {
        write_name(name);
        writer().line(fragment);
        data_written();
    }
#pragma endregion

    void Generator::write_tree(std::optional<std::string_view> name, const ValueTable& t, std::string_view path) {
        const Value* v = t.find(path);
        if (!v) {
            log(Error, "Generator: sub-tree path %.*s not found", static_cast<int>(path.size()), path.data());
            throw ValueError("write: path not found: " + std::string{ path });
        }

        // Member names arrive unquoted; the quoted key passes write_name as is.
        std::string key = name ? stringify(*name) : std::string{};
        auto scalar = [&](auto&& value) {
            if (name) write(std::string_view{ key }, value);
            else write(value);
        };

        switch (v->type()) {
        case kind::null:
            if (name) write_null(std::string_view{ key });
            else write_null();
            break;
        case kind::true_value: scalar(true); break;
        case kind::false_value: scalar(false); break;
        case kind::number: scalar(v->as_number()); break;
        case kind::string: scalar(std::string_view{ v->as_string() }); break;
        case kind::large_text: scalar(v->as_large_text()); break;
        case kind::object:
            open_object(name.value_or(std::string_view{}));
            for (const auto& member : v->members()) {
                std::string raw = from_member_name(member);
                write_tree(std::string_view{ raw }, t, member_path(path, member));
            }
            close_object();
            break;
        case kind::array:
            open_array(name.value_or(std::string_view{}));
            for (std::size_t i = 1; i <= v->count(); i++) write_tree(std::nullopt, t, element_path(path, i));
            close_array();
            break;
        }
    }

#pragma region Row sets and links
    void Generator::write_links(const Links& links) {
        write_links(links, {});
    }

    void Generator::write_links(const Links& links, const substitutions_t& subs) {
        if (links.empty()) return;
        open_array("links");
        for (const auto& l : links) {
            std::string href = detail::substitute(l.href, subs);
            open_object();
            if (!href.empty()) write("href", std::string_view{ href });
            if (!l.rel.empty()) write("rel", std::string_view{ l.rel });
            write("templated", l.templated);
            if (!l.media_type.empty()) write("mediaType", std::string_view{ l.media_type });
            if (!l.method.empty()) write("method", std::string_view{ l.method });
            if (!l.profile.empty()) write("profile", std::string_view{ l.profile });
            close_object();
        }
        close_array();
    }

    void Generator::write_cell(const Column& column, const Cell& cell) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return;
            } else if constexpr (std::is_same_v<T, std::string>) {
                if (auto b = detail::text_boolean(v)) write(column.name, *b);
                else if (!v.empty()) write(column.name, std::string_view{ v });
            } else if constexpr (std::is_same_v<T, std::shared_ptr<RowSet>>) {
                if (v) write_row_set(column.name, *v);
            } else {
                write(column.name, v);
            }
        }, cell);
    }

    void Generator::write_row_set(std::string_view name, RowSet& rows, const Links& links) {
        if (has_nested_columns(rows)) {
            if (!links.empty()) {
                log(Error, "Generator: row set with nested columns cannot carry links");
                throw WriterError("implementation restriction: nested type and cursor columns not supported");
            }
            XmlNode set = row_set_to_markup(rows);
            open_array(name);
            for (const auto& row : set.children) write(row);
            close_array();
            log(Debug, "Generator: wrote %zu rows through markup", set.children.size());
            return;
        }

        const auto& cols = rows.columns();
        substitutions_t subs = detail::link_placeholders(links);
        std::vector<std::optional<std::size_t>> captured(cols.size());
        for (std::size_t i = 0; i < cols.size(); i++) {
            auto it = std::find_if(subs.begin(), subs.end(), [&](const auto& s) { return s.first == cols[i].name; });
            if (it != subs.end()) captured[i] = static_cast<std::size_t>(it - subs.begin());
        }

        open_array(name);
        std::size_t count = 0;
        while (rows.fetch()) {
            open_object();
            for (std::size_t i = 0; i < cols.size(); i++) {
                const Cell& cell = rows.value(i);
                write_cell(cols[i], cell);
                if (captured[i]) subs[*captured[i]].second = cell_text(cell);
            }
            write_links(links, subs);
            close_object();
            count++;
        }
        close_array();
        log(Debug, "Generator: wrote %zu rows", count);
    }

    void Generator::write_items(RowSet& rows, const Links& item_links, const Links& links) {
        bool enclose = m_Nesting.empty();
        if (enclose) open_object();
        write_row_set("items", rows, item_links);
        write_links(links);
        if (enclose) close_object();
    }
#pragma endregion

} // namespace Stanza
