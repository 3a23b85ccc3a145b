//
// Sequential chunk walk over an in-memory PNG buffer.
//

#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/exceptions.hh>
#include "input.hh"

namespace pngmsg {

    chunk_iterator::chunk_iterator(std::span<const std::byte> bytes, std::size_t start_offset)
        : chunk_iterator(bytes, start_offset, parse_options{}) {
    }

    chunk_iterator::chunk_iterator(std::span<const std::byte> bytes, std::size_t start_offset,
                                   const parse_options& options)
        : m_reader(std::make_unique<reader>(bytes, start_offset))
        , m_ended(false)
        , m_options(options) {
        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::next() {
        if (m_ended) {
            return;
        }
        if (!read_next_chunk()) {
            m_current.reset();
            m_ended = true;
        }
    }

    bool chunk_iterator::read_next_chunk() {
        if (m_reader->at_end()) {
            return false;
        }

        const std::size_t start_pos = m_reader->tell();
        THROW_TOO_SHORT_IF(m_reader->remaining() < chunk::overhead,
                           "Truncated chunk at offset ", start_pos, ": ", m_reader->remaining(),
                           " bytes left, a chunk needs at least ", chunk::overhead);

        const std::uint32_t chunk_size = m_reader->read_u32be();
        const chunk_type type = m_reader->read_chunk_type();

        // The declared length frames the record; it must fit in what is left
        const std::size_t available = m_reader->remaining();
        if (static_cast<std::uint64_t>(chunk_size) + 4 > available) {
            THROW_TOO_SHORT("Chunk '", type.to_string(), "' at offset ", start_pos,
                            " declares ", chunk_size, " payload bytes but only ",
                            available < 4 ? 0 : available - 4, " remain before the CRC");
        }

        // Check size limit
        if (chunk_size > m_options.max_chunk_size) {
            if (m_options.strict) {
                THROW_PARSE("Chunk '", type.to_string(), "' at offset ", start_pos,
                            " has size ", chunk_size, " bytes, which exceeds maximum allowed size of ",
                            m_options.max_chunk_size, " bytes");
            }
            m_options.warn(start_pos, "size_limit",
                build_error_msg("Chunk '", type.to_string(), "' size ", chunk_size,
                                " exceeds maximum ", m_options.max_chunk_size));
        }

        m_reader->seek(start_pos);
        auto record = m_reader->read_exact(chunk::overhead + chunk_size);

        auto parsed = chunk::parse(record, m_options);
        chunk_header header{
            .type = parsed.type(),
            .length = chunk_size,
            .crc = parsed.crc(),
            .file_offset = start_pos
        };
        m_current.emplace(chunk_info{header, std::move(parsed)});
        return true;
    }

} // namespace pngmsg
