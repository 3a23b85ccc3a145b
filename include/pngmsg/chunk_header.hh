/**
 * @file chunk_header.hh
 * @brief Framing information for a chunk in a PNG buffer
 */

#pragma once

#include <cstdint>
#include <pngmsg/chunk_type.hh>

namespace pngmsg {

    /**
     * @struct chunk_header
     * @brief Where a chunk sits in the buffer and what its framing fields say
     */
    struct chunk_header {
        chunk_type type;                  ///< Chunk type code
        std::uint32_t length = 0;         ///< Declared payload length
        std::uint32_t crc = 0;            ///< Stored CRC (verified)
        std::uint64_t file_offset = 0;    ///< Absolute offset of the length field

        /// Offset one past the CRC field
        [[nodiscard]] std::uint64_t end_offset() const { return file_offset + 12 + length; }
    };

} // namespace pngmsg
