#pragma once


/*
    ----------------------------------------------
    Stanza markup - element trees written as JSON
    ----------------------------------------------
    `XmlNode` is a minimal element tree (name, attributes, children, text).
    The generator writes it as JSON by convention, the same convention
    that renders nested row sets:

        <ROWSET>                       [
          <ROW>                          {"ID":1,
            <ID>1</ID>                    "TAGS":[{"T":"a"},{"T":"b"}]}
            <TAGS>                     ]
              <TAGS_ROW><T>a</T></TAGS_ROW>
              <TAGS_ROW><T>b</T></TAGS_ROW>
            </TAGS>
          </ROW>
        </ROWSET>

    ------
    Arrays
    ------
    A node becomes an array when it has children, its first and last child
    share a name, and at least one of the following holds:
    - it has more than one child
    - its own name is `rowset` (any case)
    - its first child's name contains `x0028__x0027`
    - its first child's name ends in `_row` (any case)
    Attributes come first in the array as `{"@name":value}` objects

    -------
    Objects
    -------
    Any other node with attributes or children is an object: attributes as
    `"@name"`, children by name, and non-blank text as `"@text"`

    -------
    Scalars
    -------
    Leaf text is typed by `markup_scalar`:
    - empty text is `null`
    - numeric text is a number (`.5` -> `0.5`, `-.5` -> `-0.5`), unless it
      has a leading zero, a trailing dot or a leading blank
    - `true` and `false` in any case are booleans
    - everything else is a string
*/

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stanza/config.hpp"

/// @defgroup StanzaMarkup Markup Trees
/// @ingroup Stanza

namespace Stanza {

    /// @ingroup StanzaMarkup
    /// @brief One element of a markup tree.
    struct XmlNode {
        std::string name;
        std::vector<std::pair<std::string, std::string>> attributes{};
        std::vector<XmlNode> children{};
        std::string text{};

        bool operator==(const XmlNode&) const = default;
    };

    /// @ingroup StanzaMarkup
    /// @brief JSON literal for the leaf text `text`.
    [[nodiscard]] STANZA_API std::string markup_scalar(std::string_view text);

    /// @ingroup StanzaMarkup
    /// @brief Appends the JSON rendition of `node` to `out`.
    STANZA_API void markup_to_json(const XmlNode& node, std::string& out);
    [[nodiscard]] STANZA_API std::string markup_to_json(const XmlNode& node);

} // namespace Stanza
