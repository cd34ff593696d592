#pragma once


/*
    ------------------------------------------------------
    Stanza buffered writers - where generated text goes
    ------------------------------------------------------
    Generated text (JSON from the generator, XML from the parser, the
    lexer's long-string spill) is accumulated in a `BufferedWriter` and
    handed to a `Sink` in units of at most `buffer_limit` characters

    -----
    Sinks
    -----
    - `Sink` is the destination interface: `write`, `flush`, `dispose`
    - `StreamSink` forwards to a `std::ostream` (console, HTTP response
      body, file)
    - `LargeTextSink` accumulates into a `LargeText` that is allocated on
      the first write and released by `dispose()`

    The writer owns its sink; the destination is chosen by whoever
    constructs the writer

    -----
    Usage
    -----
        BufferedWriter w{ std::make_unique<LargeTextSink>() };
        w.write("{");
        w.writef("\"%s\":%s", { "a", "1" });
        w.line("}");
        w.flush();
*/

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/large_text.hpp"

/// @defgroup StanzaWriter Buffered Writers
/// @ingroup Stanza

namespace Stanza {

    /// @ingroup StanzaWriter
    /// @brief Destination of buffered output.
    class Sink {
    public:
        virtual ~Sink() = default;

        /// Receives one unit of flushed output.
        virtual void write(std::string_view text) = 0;
        /// Pushes anything the destination buffers on its own.
        virtual void flush() = 0;
        /// Releases resources held by the destination.
        virtual void dispose() = 0;
    };

    /// @ingroup StanzaWriter
    /// @brief Sink writing to a `std::ostream` it does not own.
    class StreamSink : public Sink {
    public:
        explicit StreamSink(std::ostream& os) noexcept : m_Os{ os } {}

        STANZA_API void write(std::string_view text) override;
        STANZA_API void flush() override;
        void dispose() override {}

    private:
        std::ostream& m_Os;
    };

    /// @ingroup StanzaWriter
    /// @brief Sink accumulating into a `LargeText` allocated on first write.
    class LargeTextSink : public Sink {
    public:
        explicit LargeTextSink(std::size_t reserve = 0,
                               std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_Reserve{ reserve }, m_MemRes{ res } {}

        STANZA_API void write(std::string_view text) override;
        void flush() override {}
        STANZA_API void dispose() override;

        /// The accumulated text, or nullptr if nothing was written yet.
        [[nodiscard]] const LargeText* text() const noexcept { return m_Text ? &*m_Text : nullptr; }

        /// Moves the accumulated text out, leaving the sink unallocated.
        [[nodiscard]] STANZA_API LargeText take();

    private:
        std::optional<LargeText> m_Text;
        std::size_t m_Reserve;
        std::pmr::memory_resource* m_MemRes;
    };

    /// @ingroup StanzaWriter
    /// @brief Accumulates text and forwards it to its sink in bounded units.
    class BufferedWriter {
    public:
        /// Largest unit handed to the sink in one call.
        static constexpr std::size_t buffer_limit = 32767;
        /// Page size used when copying a `LargeText` into the writer.
        static constexpr std::size_t chunk_size = 8191;

        STANZA_API explicit BufferedWriter(std::unique_ptr<Sink> sink);

        BufferedWriter(const BufferedWriter&) = delete;
        BufferedWriter& operator=(const BufferedWriter&) = delete;
        BufferedWriter(BufferedWriter&&) noexcept = default;
        BufferedWriter& operator=(BufferedWriter&&) noexcept = default;

        /// @brief Appends text, flushing first if the buffer would overflow.
        STANZA_API void write(std::string_view text);

        /// @brief Appends a large text, page by page.
        STANZA_API void write(const LargeText& text);

        /// @brief Appends text followed by a line feed.
        STANZA_API void line(std::string_view text = {});

        /// @brief Appends `format` with each `%s` replaced by the next argument.
        STANZA_API void writef(std::string_view format, std::initializer_list<std::string_view> args);

        /// @brief Hands the buffer to the sink and flushes the sink.
        STANZA_API void flush();

        /// @brief Drops unflushed text and disposes the sink.
        STANZA_API void dispose();

        /// Text accumulated since the last flush.
        [[nodiscard]] std::string_view pending() const noexcept { return m_Buffer; }

        [[nodiscard]] Sink& sink() noexcept { return *m_Sink; }

    private:
        std::unique_ptr<Sink> m_Sink;
        std::string m_Buffer;
    };

} // namespace Stanza
