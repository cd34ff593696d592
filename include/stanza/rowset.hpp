#pragma once


/*
    ------------------------------------------
    Stanza row sets - tabular input to writes
    ------------------------------------------
    A `RowSet` is a forward-only cursor over typed rows, the shape of a
    query result. The generator writes it as an array of row objects:

        VectorRowSet rows{
            { { "ID", ColumnType::number }, { "NAME", ColumnType::text } },
            { { 1.0, "Ann" }, { 2.0, Cell{} } },
        };
        gen.write_row_set("people", rows);   // "people":[{"ID":1,"NAME":"Ann"},{"ID":2}]

    A cell holds nothing (SQL NULL) or a value matching its column type.
    A `rowset` column holds a nested cursor; sets with nested cursors are
    written through their markup form, see markup.hpp and `row_set_to_markup`
*/

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/datetime.hpp"
#include "stanza/large_text.hpp"
#include "stanza/markup.hpp"

/// @defgroup StanzaRowSet Row Sets
/// @ingroup Stanza

namespace Stanza {

    class RowSet;

    /// @ingroup StanzaRowSet
    enum class ColumnType : uint8_t {
        text,
        number,
        date,
        timestamp,
        timestamp_tz,
        large_text,
        markup,
        rowset,
    };

    /// @ingroup StanzaRowSet
    struct Column {
        std::string name;
        ColumnType type = ColumnType::text;
    };

    /// @ingroup StanzaRowSet
    /// @brief One field of a row; `std::monostate` is NULL.
    using Cell = std::variant<
        std::monostate,
        std::string,
        double,
        Date,
        Timestamp,
        TimestampTz,
        LargeText,
        XmlNode,
        std::shared_ptr<RowSet>
    >;

    /// @ingroup StanzaRowSet
    /// @brief Forward-only cursor over typed rows.
    class RowSet {
    public:
        virtual ~RowSet() = default;

        [[nodiscard]] virtual const std::vector<Column>& columns() const = 0;

        /// @brief Advances to the next row.
        /// @return false once the rows are exhausted.
        virtual bool fetch() = 0;

        /// @brief Cell `i` (0-based) of the current row.
        [[nodiscard]] virtual const Cell& value(std::size_t i) const = 0;
    };

    /// @ingroup StanzaRowSet
    /// @brief Row set over rows held in memory.
    class VectorRowSet : public RowSet {
    public:
        STANZA_API VectorRowSet(std::vector<Column> columns, std::vector<std::vector<Cell>> rows);

        [[nodiscard]] const std::vector<Column>& columns() const override { return m_Columns; }
        STANZA_API bool fetch() override;
        [[nodiscard]] STANZA_API const Cell& value(std::size_t i) const override;

    private:
        std::vector<Column> m_Columns;
        std::vector<std::vector<Cell>> m_Rows;
        std::size_t m_Next = 0;
    };

    /// @ingroup StanzaRowSet
    /// @brief True if any column of `rows` holds nested row sets.
    [[nodiscard]] STANZA_API bool has_nested_columns(const RowSet& rows);

    /// @ingroup StanzaRowSet
    /// @brief Text of a scalar cell as written into markup and link hrefs.
    ///        Empty for NULL, markup and nested cells.
    [[nodiscard]] STANZA_API std::string cell_text(const Cell& cell);

    /// @ingroup StanzaRowSet
    /// @brief Consumes `rows` into a `ROWSET` element with one `ROW` per row.
    ///
    /// NULL cells produce no element. A nested set in column `C` becomes
    /// `<C><C_ROW>..</C_ROW>..</C>`, markup cells are placed inside their
    /// column element.
    [[nodiscard]] STANZA_API XmlNode row_set_to_markup(RowSet& rows);

} // namespace Stanza
