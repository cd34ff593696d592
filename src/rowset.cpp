#include "stanza/rowset.hpp"
#include "stanza/error.hpp"
#include "stanza/escape.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>


namespace Stanza {

    namespace detail {
        XmlNode rows_element(RowSet& rows, std::string name, const std::string& row_name) {
            XmlNode set{ std::move(name) };
            const auto& cols = rows.columns();

            while (rows.fetch()) {
                XmlNode row{ row_name };
                for (std::size_t i = 0; i < cols.size(); i++) {
                    const Cell& cell = rows.value(i);
                    if (std::holds_alternative<std::monostate>(cell)) continue;

                    if (auto nested = std::get_if<std::shared_ptr<RowSet>>(&cell)) {
                        if (!*nested) continue;
                        row.children.push_back(rows_element(**nested, cols[i].name, cols[i].name + "_ROW"));
                    } else if (auto node = std::get_if<XmlNode>(&cell)) {
                        XmlNode col{ cols[i].name };
                        col.children.push_back(*node);
                        row.children.push_back(std::move(col));
                    } else {
                        row.children.push_back(XmlNode{ cols[i].name, {}, {}, cell_text(cell) });
                    }
                }
                set.children.push_back(std::move(row));
            }
            return set;
        }
    } // namespace detail

    VectorRowSet::VectorRowSet(std::vector<Column> columns, std::vector<std::vector<Cell>> rows)
        : m_Columns{ std::move(columns) }, m_Rows{ std::move(rows) } {}

    bool VectorRowSet::fetch() {
        if (m_Next >= m_Rows.size()) return false;
        m_Next++;
        return true;
    }

    const Cell& VectorRowSet::value(std::size_t i) const {
        if (m_Next == 0) throw WriterError("VectorRowSet::value: no current row, call fetch() first");
        const auto& row = m_Rows[m_Next - 1];
        if (i >= row.size()) throw std::out_of_range("VectorRowSet::value: column index out of range");
        return row[i];
    }

    bool has_nested_columns(const RowSet& rows) {
        const auto& cols = rows.columns();
        return std::any_of(cols.begin(), cols.end(), [](const Column& c) { return c.type == ColumnType::rowset; });
    }

    std::string cell_text(const Cell& cell) {
        return std::visit([](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) return v;
            else if constexpr (std::is_same_v<T, double>) return stringify(v);
            else if constexpr (std::is_same_v<T, Date> || std::is_same_v<T, Timestamp> || std::is_same_v<T, TimestampTz>)
                return format_iso8601(v);
            else if constexpr (std::is_same_v<T, LargeText>) return v.str();
            else return {};
        }, cell);
    }

    XmlNode row_set_to_markup(RowSet& rows) {
        return detail::rows_element(rows, "ROWSET", "ROW");
    }

} // namespace Stanza
