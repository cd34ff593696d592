#pragma once


/*
    ----------------------------------------------------
    Stanza::Value / Stanza::ValueTable - flat JSON tree
    ----------------------------------------------------
    A parsed document is not a tree of owned nodes. Every node is stored
    in one `ValueTable` under a path string, and containers only record
    enough to find their children:

        {"foo":3,"bar":[1,2],"a b":{"x":null}}

        .          object   members: foo, bar, "a b"
        foo        number   3
        bar        array    count: 2
        bar[1]     number   1
        bar[2]     number   2
        "a b"      object   members: x
        "a b".x    null

    -----
    Paths
    -----
    - `"."` is the root
    - Members append `.name` (no dot at the root); names that are not
      plain identifiers are double-quoted, see `to_member_name`
    - Array elements append `[i]`, 1-based

    -----------------
    Kinds and Queries
    -----------------
    - `kind type() const` returns the current kind: null, true_value,
      false_value, number, string, object, array, large_text
    - Scalar accessors `as_bool()`, `as_number()`, `as_string()`,
      `as_large_text()` assume the kind matches and throw
      `std::bad_variant_access` otherwise
    - `members()` and `count()` serve objects and arrays
    - `text()` is the textual form of a scalar; it is what wildcard value
      matching compares against

    -------------
    Thread-Safety
    -------------
    - A `ValueTable` is not thread-safe; use one per logical document
*/

/// @defgroup Stanza Stanza JSON Engine
/// @brief Core types and functions for Stanza

/// @defgroup StanzaValue Value Table
/// @ingroup Stanza

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/large_text.hpp"

namespace Stanza {
    /// @brief Enumerates the possible kinds held by Stanza::Value
    enum class kind : uint8_t {
        null,        ///< JSON null
        true_value,  ///< JSON true
        false_value, ///< JSON false
        number,      ///< JSON number (stored as `double`)
        string,      ///< JSON string held in memory
        object,      ///< JSON object; holds its member names
        array,       ///< JSON array; holds its element count
        large_text,  ///< JSON string too long for memory, held as `LargeText`
    };

    /// @ingroup StanzaValue
    /// @brief String type used by Stanza::Value (allocator-aware)
    using string = std::pmr::string;

    /// @ingroup StanzaValue
    /// @brief Ordered member names of an object, in path form
    using members_t = std::vector<std::string>;

    /// @ingroup StanzaValue
    /// @brief Variant storage used internally by Stanza::Value
    /// @details `std::size_t` is the element count of an array
    using storage_t = std::variant<
        std::monostate,
        bool,
        double,
        string,
        LargeText,
        members_t,
        std::size_t
    >;

    /// @ingroup StanzaValue
    /// @brief One node of a flattened JSON document.
    struct Value {
        /// @brief Constructs a null value
        STANZA_API explicit Value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        STANZA_API Value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        STANZA_API Value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        STANZA_API Value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        template<std::integral I>
            requires (!std::same_as<I, bool>)
        explicit Value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<double>(i) } {}

        STANZA_API Value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        STANZA_API Value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        STANZA_API Value(LargeText text, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        STANZA_API Value(members_t members, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs an array value recording `count` elements
        [[nodiscard]] STANZA_API static Value array(std::size_t count,
                                                    std::pmr::memory_resource* res = std::pmr::get_default_resource());

        [[nodiscard]] STANZA_API kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null; }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::true_value || type() == kind::false_value; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number; }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string; }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object; }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array; }
        [[nodiscard]] bool is_large_text() const noexcept { return type() == kind::large_text; }
        [[nodiscard]] bool is_container() const noexcept { return is_object() || is_array(); }

        [[nodiscard]] STANZA_API bool as_bool() const;
        [[nodiscard]] STANZA_API double as_number() const;
        [[nodiscard]] STANZA_API const string& as_string() const;
        [[nodiscard]] STANZA_API const LargeText& as_large_text() const;
        [[nodiscard]] STANZA_API const members_t& members() const;

        /// @brief Member count of an object or element count of an array
        [[nodiscard]] STANZA_API std::size_t count() const;

        /// @brief Textual form of a scalar: `true`, `false`, the stringified
        ///        number, or the string itself. Empty for null and containers.
        [[nodiscard]] STANZA_API std::string text() const;

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }
        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

        STANZA_API friend bool operator==(const Value& lhs, const Value& rhs);

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};
    };

    namespace detail {
        struct path_hash {
            using is_transparent = void;
            std::size_t operator()(std::string_view sv) const noexcept { return std::hash<std::string_view>{}(sv); }
        };
    }

    /// @ingroup StanzaValue
    /// @brief Path-keyed table holding one flattened document.
    class ValueTable {
    public:
        using map_t = std::pmr::unordered_map<string, Value, detail::path_hash, std::equal_to<>>;
        using const_iterator = map_t::const_iterator;

        STANZA_API explicit ValueTable(std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Pointer to the value at `path`, or nullptr
        [[nodiscard]] STANZA_API const Value* find(std::string_view path) const;

        /// @brief Value at `path`
        /// @throws std::out_of_range if the path does not exist
        [[nodiscard]] STANZA_API const Value& at(std::string_view path) const;

        [[nodiscard]] bool contains(std::string_view path) const { return find(path) != nullptr; }

        /// @brief Inserts or replaces the value at `path`
        STANZA_API void set(std::string_view path, Value v);

        void clear() noexcept { m_Map.clear(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_Map.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_Map.empty(); }

        [[nodiscard]] const_iterator begin() const noexcept { return m_Map.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return m_Map.end(); }

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// Path of the document root.
        static constexpr std::string_view root = ".";

    private:
        std::pmr::memory_resource* m_MemRes;
        map_t m_Map;
    };

    /// @ingroup StanzaValue
    /// @brief Path of a member of the node at `parent`.
    /// @param member The member name in path form, as returned by `to_member_name`
    [[nodiscard]] STANZA_API std::string member_path(std::string_view parent, std::string_view member);

    /// @ingroup StanzaValue
    /// @brief Path of the 1-based element `index` of the array at `parent`.
    [[nodiscard]] STANZA_API std::string element_path(std::string_view parent, std::size_t index);

} // namespace Stanza
