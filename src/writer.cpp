#include "stanza/writer.hpp"


namespace Stanza {

    void StreamSink::write(std::string_view text) {
        m_Os.write(text.data(), static_cast<std::streamsize>(text.size()));
    }

    void StreamSink::flush() {
        m_Os.flush();
    }

    void LargeTextSink::write(std::string_view text) {
        if (!m_Text) {
            m_Text.emplace(m_MemRes);
            if (m_Reserve) m_Text->reserve(m_Reserve);
        }
        m_Text->append(text);
    }

    void LargeTextSink::dispose() {
        if (m_Text) m_Text->free();
        m_Text.reset();
    }

    LargeText LargeTextSink::take() {
        LargeText out = m_Text ? std::move(*m_Text) : LargeText{ m_MemRes };
        m_Text.reset();
        return out;
    }

    BufferedWriter::BufferedWriter(std::unique_ptr<Sink> sink)
        : m_Sink{ std::move(sink) } {
        m_Buffer.reserve(buffer_limit);
    }

    void BufferedWriter::write(std::string_view text) {
        if (m_Buffer.size() + text.size() > buffer_limit) {
            flush();
            if (text.size() > buffer_limit) {
                m_Sink->write(text);
                return;
            }
        }
        m_Buffer.append(text);
    }

    void BufferedWriter::write(const LargeText& text) {
        std::size_t offset = 0;
        std::string chunk;
        while (!text.empty() && text.next_chunk(offset, chunk_size, chunk)) write(chunk);
    }

    void BufferedWriter::line(std::string_view text) {
        if (m_Buffer.size() + text.size() + 1 > buffer_limit) {
            write(text);
            write("\n");
            return;
        }
        m_Buffer.append(text);
        m_Buffer.push_back('\n');
    }

    void BufferedWriter::writef(std::string_view format, std::initializer_list<std::string_view> args) {
        auto arg = args.begin();
        std::size_t start = 0;
        while (true) {
            std::size_t found = format.find("%s", start);
            if (found == std::string_view::npos || arg == args.end()) {
                write(format.substr(start));
                return;
            }
            write(format.substr(start, found - start));
            write(*arg++);
            start = found + 2;
        }
    }

    void BufferedWriter::flush() {
        if (!m_Buffer.empty()) {
            m_Sink->write(m_Buffer);
            m_Buffer.clear();
        }
        m_Sink->flush();
    }

    void BufferedWriter::dispose() {
        m_Buffer.clear();
        m_Sink->dispose();
    }

} // namespace Stanza
