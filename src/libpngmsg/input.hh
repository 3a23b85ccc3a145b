//
// Bounds-checked cursor over an in-memory buffer.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <span>

#include <pngmsg/exceptions.hh>
#include <pngmsg/chunk_type.hh>

namespace pngmsg {

    class reader {
        public:
            explicit reader(std::span<const std::byte> data, std::size_t position = 0);

            // Returns a view of the next size bytes and advances; throws too_short_error
            std::span<const std::byte> read_exact(std::size_t size);

            // Returns a view of the next size bytes without advancing
            std::span<const std::byte> peek(std::size_t size) const;

            std::uint32_t read_u32be();
            chunk_type read_chunk_type();

            void seek(std::size_t offset);
            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_data.size() - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_data.size(); }

        private:
            std::span<const std::byte> m_data;
            std::size_t m_position; // Current offset from the start of m_data
    };
}
