#include "stanza/value.hpp"
#include "stanza/escape.hpp"

#include <stdexcept>


namespace Stanza {

    Value::Value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    Value::Value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    Value::Value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::in_place_type<bool>, b } {}

    Value::Value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::in_place_type<double>, d } {}

    Value::Value(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, s, res } {}

    Value::Value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, sv.begin(), sv.end(), res } {}

    Value::Value(LargeText text, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<LargeText>, std::move(text) } {}

    Value::Value(members_t members, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<members_t>, std::move(members) } {}

    Value Value::array(std::size_t count, std::pmr::memory_resource* res) {
        Value v{ res };
        v.m_Storage.emplace<std::size_t>(count);
        return v;
    }

    kind Value::type() const noexcept {
        switch (m_Storage.index()) {
        case 0: return kind::null;
        case 1: return std::get<bool>(m_Storage) ? kind::true_value : kind::false_value;
        case 2: return kind::number;
        case 3: return kind::string;
        case 4: return kind::large_text;
        case 5: return kind::object;
        case 6: return kind::array;
        }
        return kind::null;
    }

    bool Value::as_bool() const { return std::get<bool>(m_Storage); }
    double Value::as_number() const { return std::get<double>(m_Storage); }
    const string& Value::as_string() const { return std::get<string>(m_Storage); }
    const LargeText& Value::as_large_text() const { return std::get<LargeText>(m_Storage); }
    const members_t& Value::members() const { return std::get<members_t>(m_Storage); }

    std::size_t Value::count() const {
        if (is_object()) return members().size();
        return std::get<std::size_t>(m_Storage);
    }

    std::string Value::text() const {
        switch (type()) {
        case kind::true_value: return "true";
        case kind::false_value: return "false";
        case kind::number: return stringify(as_number());
        case kind::string: return std::string{ as_string() };
        case kind::large_text: return as_large_text().str();
        default: return {};
        }
    }

    bool operator==(const Value& lhs, const Value& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

    ValueTable::ValueTable(std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Map{ res } {}

    const Value* ValueTable::find(std::string_view path) const {
        auto it = m_Map.find(path);
        return it == m_Map.end() ? nullptr : &it->second;
    }

    const Value& ValueTable::at(std::string_view path) const {
        if (auto* v = find(path)) return *v;
        throw std::out_of_range("path not found: " + std::string{ path });
    }

    void ValueTable::set(std::string_view path, Value v) {
        auto it = m_Map.find(path);
        if (it != m_Map.end()) it->second = std::move(v);
        else m_Map.emplace(string{ path.begin(), path.end(), m_MemRes }, std::move(v));
    }

    std::string member_path(std::string_view parent, std::string_view member) {
        std::string out;
        if (parent != ValueTable::root && !parent.empty()) {
            out.assign(parent);
            out.push_back('.');
        }
        out.append(member);
        return out;
    }

    std::string element_path(std::string_view parent, std::size_t index) {
        std::string out;
        if (parent != ValueTable::root) out.assign(parent);
        out.push_back('[');
        out += std::to_string(index);
        out.push_back(']');
        return out;
    }

} // namespace Stanza
