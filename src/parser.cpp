#include "stanza/parser.hpp"
#include "stanza/char_reader.hpp"
#include "stanza/escape.hpp"
#include "stanza/lexer.hpp"
#include "stanza/log.hpp"

#include <algorithm>
#include <type_traits>


namespace Stanza {

#pragma region Parser
    // ================================
    // Internal parser implementation
    // ================================

    namespace detail {
        struct Parser {
            Lexer& lex;
            ParseSink& sink;
            std::pmr::memory_resource* mem_res;
            Symbol sym = Symbol::eof;

            Parser(Lexer& l, ParseSink& s, std::pmr::memory_resource* r)
                : lex{ l }, sink{ s }, mem_res{ r } {}

            expected_void advance() {
                auto next = lex.next();
                if (!next) return std::unexpected(std::move(next.error()));
                sym = *next;
                return {};
            }

            expected_void eat(Symbol expected) {
                if (sym != expected) {
                    std::string msg = "Expected \"";
                    msg += to_string(expected);
                    msg += "\", seeing \"";
                    msg += to_string(sym);
                    msg += "\"";
                    return std::unexpected(lex.make_error(ParseError::code::unexpected_token, msg));
                }
                return advance();
            }

            // Called right after a comma; true if the container ends here.
            expected_t<bool> dangling(Symbol close) {
                if (sym != close) return false;
                if (lex.strict()) {
                    return std::unexpected(lex.make_error(ParseError::code::dangling_comma, "Strict JSON forbids dangling comma"));
                }
                log(Debug, "Parser: accepting dangling comma before \"%s\"", std::string{ to_string(close) }.c_str());
                return true;
            }

            expected_void parse_value(const Slot& slot);
            expected_void parse_array(const Slot& slot);
            expected_void parse_object(const Slot& slot);
            expected_void parse_member(const Slot& parent, members_t& members);
            expected_void parse_document();
        };

        expected_void Parser::parse_value(const Slot& slot) {
            switch (sym) {
            case Symbol::begin_array: return parse_array(slot);
            case Symbol::begin_object: return parse_object(slot);
            case Symbol::false_value: sink.scalar(slot, Value{ false, mem_res }); break;
            case Symbol::true_value: sink.scalar(slot, Value{ true, mem_res }); break;
            case Symbol::null_value: sink.scalar(slot, Value{ nullptr, mem_res }); break;
            case Symbol::number: sink.scalar(slot, Value{ lex.number_value(), mem_res }); break;
            case Symbol::string:
                if (lex.spilled()) sink.scalar(slot, Value{ lex.take_large_text(), mem_res });
                else sink.scalar(slot, Value{ std::string_view{ lex.string_value() }, mem_res });
                break;
            default:
                return std::unexpected(lex.make_error(ParseError::code::unexpected_token,
                    "Expected value (null, false, true, number, string)"));
            }
            return advance();
        }

        expected_void Parser::parse_array(const Slot& slot) {
            sink.begin_array(slot);
            if (auto r = eat(Symbol::begin_array); !r) return r;

            std::size_t index = 0;
            if (sym != Symbol::end_array) {
                while (true) {
                    index++;
                    std::string path = element_path(slot.path, index);
                    Slot child{ Slot::role::element, path, {}, index };
                    if (auto r = parse_value(child); !r) return r;

                    if (sym != Symbol::comma) break;
                    if (auto r = eat(Symbol::comma); !r) return r;
                    auto done = dangling(Symbol::end_array);
                    if (!done) return std::unexpected(std::move(done.error()));
                    if (*done) break;
                }
            }

            if (auto r = eat(Symbol::end_array); !r) return r;
            sink.end_array(slot, index);
            return {};
        }

        expected_void Parser::parse_member(const Slot& parent, members_t& members) {
            if (sym != Symbol::string) {
                return std::unexpected(lex.make_error(ParseError::code::unexpected_token, "Expected string (object member name)"));
            }
            std::string name = lex.spilled() ? lex.take_large_text().str() : lex.string_value();
            std::string member = to_member_name(name);
            if (auto r = advance(); !r) return r;
            if (auto r = eat(Symbol::colon); !r) return r;

            std::string path = member_path(parent.path, member);
            Slot child{ Slot::role::member, path, name, 0 };
            if (auto r = parse_value(child); !r) return r;
            members.push_back(std::move(member));
            return {};
        }

        expected_void Parser::parse_object(const Slot& slot) {
            sink.begin_object(slot);
            if (auto r = eat(Symbol::begin_object); !r) return r;

            members_t members;
            if (sym != Symbol::end_object) {
                while (true) {
                    if (auto r = parse_member(slot, members); !r) return r;

                    if (sym != Symbol::comma) break;
                    if (auto r = eat(Symbol::comma); !r) return r;
                    auto done = dangling(Symbol::end_object);
                    if (!done) return std::unexpected(std::move(done.error()));
                    if (*done) break;
                }
            }

            if (auto r = eat(Symbol::end_object); !r) return r;
            sink.end_object(slot, std::move(members));
            return {};
        }

        expected_void Parser::parse_document() {
            sink.begin_document();
            if (auto r = advance(); !r) return r;

            Slot root{ Slot::role::root, ValueTable::root, {}, 0 };
            switch (sym) {
            case Symbol::begin_array:
                if (auto r = parse_array(root); !r) return r;
                if (auto r = eat(Symbol::eof); !r) return r;
                break;
            case Symbol::begin_object:
                if (auto r = parse_object(root); !r) return r;
                if (auto r = eat(Symbol::eof); !r) return r;
                break;
            case Symbol::eof:
                break;
            default:
                return std::unexpected(lex.make_error(ParseError::code::unexpected_token, "expected [ or {"));
            }
            sink.end_document();
            return {};
        }

        template<typename Input>
        CharReader make_reader(const Input& input) {
            if constexpr (std::is_same_v<Input, LargeText>) return CharReader::from_large_text(input);
            else if constexpr (std::is_same_v<Input, std::vector<std::string>>) return CharReader::from_lines(input);
            else return CharReader::from_string(input);
        }

        template<typename Input>
        std::expected<void, ParseError> parse_into_impl(ValueTable& table, const Input& input, const ParseOptions& opts) {
            table.clear();
            CharReader reader = make_reader(input);
            ValueTableSink sink{ table };
            auto r = parse_with(reader, sink, opts, table.resource());
            if (!r) table.clear();
            return r;
        }

        template<typename Input>
        XmlResult to_xml_impl(const Input& input, const ParseOptions& opts, const XmlOptions& xml) {
            auto owned = std::make_unique<LargeTextSink>();
            LargeTextSink* text_sink = owned.get();
            BufferedWriter out{ std::move(owned) };

            CharReader reader = make_reader(input);
            XmlSink sink{ out, xml.encoding };
            auto r = parse_with(reader, sink, opts);
            if (!r) {
                out.dispose();
                return std::unexpected(std::move(r.error()));
            }
            out.flush();

            std::string result = text_sink->text() ? text_sink->text()->str() : std::string{};
            out.dispose();
            return result;
        }
    } // namespace detail

#pragma endregion

    std::expected<void, ParseError> parse_with(CharReader& reader, ParseSink& sink,
                                               const ParseOptions& opts, std::pmr::memory_resource* res) {
        log(Debug, "Parser: starting %s parse", opts.strict ? "strict" : "lax");
        Lexer lex{ reader, opts.strict, res };
        detail::Parser p{ lex, sink, res };
        auto r = p.parse_document();
        if (!r) log(Debug, "Parser: failed, %s", r.error().describe().c_str());
        else log(Debug, "Parser: finished after %zu characters", reader.position().index);
        return r;
    }

    ParseResult parse(std::string_view input, const ParseOptions& opts, std::pmr::memory_resource* res) {
        ValueTable table{ res };
        if (auto r = detail::parse_into_impl(table, input, opts); !r) return std::unexpected(std::move(r.error()));
        return table;
    }

    ParseResult parse(const LargeText& input, const ParseOptions& opts, std::pmr::memory_resource* res) {
        ValueTable table{ res };
        if (auto r = detail::parse_into_impl(table, input, opts); !r) return std::unexpected(std::move(r.error()));
        return table;
    }

    ParseResult parse(const std::vector<std::string>& lines, const ParseOptions& opts, std::pmr::memory_resource* res) {
        ValueTable table{ res };
        if (auto r = detail::parse_into_impl(table, lines, opts); !r) return std::unexpected(std::move(r.error()));
        return table;
    }

    std::expected<void, ParseError> parse_into(ValueTable& table, std::string_view input, const ParseOptions& opts) {
        return detail::parse_into_impl(table, input, opts);
    }

    std::expected<void, ParseError> parse_into(ValueTable& table, const LargeText& input, const ParseOptions& opts) {
        return detail::parse_into_impl(table, input, opts);
    }

    std::expected<void, ParseError> parse_into(ValueTable& table, const std::vector<std::string>& lines, const ParseOptions& opts) {
        return detail::parse_into_impl(table, lines, opts);
    }

    XmlResult to_xml(std::string_view input, const ParseOptions& opts, const XmlOptions& xml) {
        return detail::to_xml_impl(input, opts, xml);
    }

    XmlResult to_xml(const LargeText& input, const ParseOptions& opts, const XmlOptions& xml) {
        return detail::to_xml_impl(input, opts, xml);
    }

    XmlResult to_xml(const std::vector<std::string>& lines, const ParseOptions& opts, const XmlOptions& xml) {
        return detail::to_xml_impl(lines, opts, xml);
    }

    XmlResult to_xml_sql(std::string_view input, std::string_view strict) {
        return to_xml(input, ParseOptions{ .strict = strict != "N" });
    }

#pragma region Sinks

    void ValueTableSink::end_object(const Slot& slot, members_t members) {
        m_Table.set(slot.path, Value{ std::move(members), m_Table.resource() });
    }

    void ValueTableSink::end_array(const Slot& slot, std::size_t count) {
        m_Table.set(slot.path, Value::array(count, m_Table.resource()));
    }

    void ValueTableSink::scalar(const Slot& slot, Value value) {
        m_Table.set(slot.path, std::move(value));
    }

    std::string fix_xml_name(std::string_view name) {
        std::string out;
        out.reserve(name.size());
        for (std::size_t i = 0; i < name.size(); i++) {
            char c = name[i];
            bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
            if (i == 0 && c == '-') ok = false;
            out.push_back(ok ? c : '_');
        }
        return out;
    }

    namespace detail {
        std::string xml_tag(const Slot& slot) {
            switch (slot.kind) {
            case Slot::role::element: return "row";
            case Slot::role::member:
                if (to_member_name(slot.name) == slot.name) return std::string{ slot.name };
                return fix_xml_name(slot.name);
            default: return "json";
            }
        }
    }

    void XmlSink::begin_document() {
        m_Out.writef("<?xml version=\"1.0\" encoding=\"%s\"?>", { m_Encoding });
        m_Out.line();
    }

    void XmlSink::end_document() {}

    void XmlSink::open_tag(const Slot& slot) {
        std::string tag = detail::xml_tag(slot);
        // an empty member name gets no element of its own
        if (tag.empty()) return;
        m_Out.writef("<%s>", { tag });
    }

    void XmlSink::close_tag(const Slot& slot) {
        std::string tag = detail::xml_tag(slot);
        if (tag.empty()) return;
        if (slot.kind == Slot::role::root) m_Out.writef("</%s>", { tag });
        else m_Out.line("</" + tag + ">");
    }

    void XmlSink::begin_object(const Slot& slot) { open_tag(slot); }
    void XmlSink::end_object(const Slot& slot, members_t) { close_tag(slot); }
    void XmlSink::begin_array(const Slot& slot) { open_tag(slot); }
    void XmlSink::end_array(const Slot& slot, std::size_t) { close_tag(slot); }

    void XmlSink::scalar(const Slot& slot, Value value) {
        if (value.is_null()) return;

        open_tag(slot);
        std::string owned = value.is_large_text() ? std::string{} : value.text();
        std::string_view text = value.is_large_text() ? value.as_large_text().view() : std::string_view{ owned };
        std::size_t pos = 0;
        while (pos < text.size()) {
            std::size_t end = utf8_boundary(text, pos + piece_size);
            if (end <= pos) end = std::min(text.size(), pos + piece_size);
            m_Out.write(escape_html(text.substr(pos, end - pos)));
            pos = end;
        }
        close_tag(slot);
    }

#pragma endregion

} // namespace Stanza
