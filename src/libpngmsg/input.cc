//
// Bounds-checked cursor over an in-memory buffer.
//

#include "input.hh"

#include <pngmsg/endian.hh>

namespace pngmsg {

    reader::reader(std::span<const std::byte> data, std::size_t position)
        : m_data(data), m_position(0) {
        seek(position);
    }

    std::span<const std::byte> reader::peek(std::size_t size) const {
        THROW_TOO_SHORT_IF(size > remaining(),
                           "Unexpected end of data at offset ", m_position, ": requested ", size,
                           " bytes, only ", remaining(), " available");
        return m_data.subspan(m_position, size);
    }

    std::span<const std::byte> reader::read_exact(std::size_t size) {
        auto view = peek(size);
        m_position += size;
        return view;
    }

    std::uint32_t reader::read_u32be() {
        return load_be32(read_exact(4).data());
    }

    chunk_type reader::read_chunk_type() {
        return chunk_type::from_bytes(read_exact(4).data());
    }

    void reader::seek(std::size_t offset) {
        THROW_TOO_SHORT_IF(offset > m_data.size(),
                           "Cannot seek to offset ", offset, " - buffer size is only ", m_data.size(), " bytes");
        m_position = offset;
    }
}
