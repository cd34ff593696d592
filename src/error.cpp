#include "stanza/error.hpp"

namespace Stanza {

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string ParseError::describe() const {
        std::string out = "Error at line ";
        out += std::to_string(line);
        out += ", col ";
        out += std::to_string(column);
        out += ": ";
        out += msg;
        return out;
    }

} // namespace Stanza
