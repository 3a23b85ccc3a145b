/**
 * @file crc.hh
 * @brief CRC-32 (ISO-HDLC, as used by PNG) over byte ranges
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <span>
#include <pngmsg/export_pngmsg.h>

namespace pngmsg {

    /**
     * @class crc32
     * @brief Incremental CRC-32 accumulator
     *
     * Feed the chunk type and the payload with update(), then read value().
     */
    class PNGMSG_EXPORT crc32 {
    public:
        crc32();

        crc32& update(const void* data, std::size_t size);
        crc32& update(std::span<const std::byte> data) {
            return update(data.data(), data.size());
        }

        [[nodiscard]] std::uint32_t value() const { return m_value; }

    private:
        std::uint32_t m_value;
    };

} // namespace pngmsg
