/**
 * @file chunk.hh
 * @brief A single PNG chunk record
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>
#include <pngmsg/export_pngmsg.h>
#include <pngmsg/chunk_type.hh>
#include <pngmsg/parse_options.hh>

namespace pngmsg {

    /**
     * @class chunk
     * @brief One (type, payload) record of a PNG file
     *
     * On disk a chunk is laid out as
     * length (u32 BE) | type (4 bytes) | payload | crc (u32 BE),
     * where the CRC covers the type and the payload. The length and CRC
     * are never stored; they are derived from the type and payload.
     */
    class PNGMSG_EXPORT chunk {
    public:
        /// Size of the length, type and CRC fields around the payload
        static constexpr std::size_t overhead = 12;

        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Parse one complete chunk record
         * @param bytes Exactly one record: length, type, payload and CRC
         * @throws too_short_error if fewer than 12 bytes are given
         * @throws invalid_type_code_error if the type is not four ASCII letters
         * @throws checksum_mismatch_error if the stored CRC is wrong
         *
         * The payload spans everything between the type and the trailing CRC.
         * The declared length is not used for framing here; a disagreement is
         * reported as a "length_mismatch" warning.
         */
        static chunk parse(std::span<const std::byte> bytes);
        static chunk parse(std::span<const std::byte> bytes, const parse_options& options);

        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] std::span<const std::byte> data() const { return m_data; }

        /// CRC-32 over type and payload
        [[nodiscard]] std::uint32_t crc() const;

        /**
         * @brief Payload as text
         * @throws encoding_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Serialized record: length, type, payload, crc
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        /// Append the serialized record to an existing buffer
        void write_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
    };

    PNGMSG_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    /// True if the bytes form well-formed UTF-8
    PNGMSG_EXPORT bool is_valid_utf8(std::span<const std::byte> bytes);

} // namespace pngmsg
