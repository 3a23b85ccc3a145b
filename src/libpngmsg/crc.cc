//
// CRC-32 backed by zlib.
//

#include <pngmsg/crc.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngmsg {

    crc32::crc32()
        : m_value(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {
    }

    crc32& crc32::update(const void* data, std::size_t size) {
        auto* p = static_cast<const Bytef*>(data);
        // zlib takes a uInt length
        constexpr std::size_t max_block = std::numeric_limits<uInt>::max();
        while (size > 0) {
            auto block = std::min(size, max_block);
            m_value = static_cast<std::uint32_t>(::crc32(m_value, p, static_cast<uInt>(block)));
            p += block;
            size -= block;
        }
        return *this;
    }

} // namespace pngmsg
