#pragma once


/*
    ----------------------------------
    Stanza parsing and output options
    ----------------------------------
    This header defines configuration structures that control parsing
    (JSON -> value table / XML) and generation (calls -> JSON text)

    --------------------------------------
    Parsing Options - Stanza::ParseOptions
    --------------------------------------
    - `bool strict`:
        * When true (default), the parser enforces RFC 8259 grammar
        * When false ("lax" mode), unquoted words become string values and
          a dangling comma before `]` or `}` is accepted

    ----------------------------------------
    Output Options - Stanza::OutputOptions
    ----------------------------------------
    Used by `Generator::initialize_output(std::ostream&, ...)`:

    - `bool emit_header`:
        * Write `Content-Type: application/json` (and cache headers) before
          the first top-level construct
    - `CachePolicy cache_policy`:
        * `forbid` (default) writes `Cache-Control: no-cache`
        * `allow` writes `Cache-Control: public`, plus `ETag` if `etag`
          is set
        * `omit` writes no Cache-Control header
    - `std::string etag`:
        * ETag literal, only used with `CachePolicy::allow`
    - `std::optional<size_t> indent`:
        * 0 = compact, N = N spaces per nesting level
        * Unset means 2 when the log level is Debug, 0 otherwise

    ----------------------------------------------
    Large Text Options - Stanza::LargeTextOptions
    ----------------------------------------------
    Used by `Generator::initialize_large_text_output(...)`:

    - `size_t reserve`:
        * Capacity hint for the large text object allocated on first flush
    - `std::optional<size_t> indent`: as above

    ---------------------------------
    XML Options - Stanza::XmlOptions
    ---------------------------------
    - `std::string encoding`: written in the `<?xml ...?>` prolog

    These option structures are plain aggregates suitable for
    brace-initialization
*/


#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

/// @defgroup StanzaOptions Parsing and Output Options
/// @ingroup Stanza
/// @brief Configuration objects controlling parsing and generation

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling JSON parsing behavior
    ///
    /// Example:
    /// @code
    /// auto table = Stanza::parse("{a: 1,}", { .strict = false });
    /// @endcode
    struct ParseOptions {
        bool strict = true; ///< Enforce RFC 8259 grammar if true
    };

    /// @ingroup StanzaOptions
    /// @brief Which Cache-Control header stream output writes.
    enum class CachePolicy : uint8_t {
        forbid, ///< `Cache-Control: no-cache`
        allow,  ///< `Cache-Control: public` and optional ETag
        omit,   ///< No Cache-Control header
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration for generator output to a stream.
    struct OutputOptions {
        bool emit_header = true;                        ///< Write mime and cache headers first.
        CachePolicy cache_policy = CachePolicy::forbid; ///< Cache-Control header to write.
        std::string etag{};                             ///< ETag value for `CachePolicy::allow`.
        std::optional<std::size_t> indent{};            ///< Spaces per nesting level.
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration for generator output to a large text object.
    struct LargeTextOptions {
        std::size_t reserve = 0;             ///< Capacity hint for the output text.
        std::optional<std::size_t> indent{}; ///< Spaces per nesting level.
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration for JSON to XML conversion.
    struct XmlOptions {
        std::string encoding = "UTF-8"; ///< Encoding named in the XML prolog.
    };

} // namespace Stanza
