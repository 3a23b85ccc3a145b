/**
 * @file chunk_iterator.hh
 * @brief Sequential walk over the chunk records of a PNG buffer
 */

#pragma once

#include <memory>
#include <optional>
#include <span>
#include <pngmsg/export_pngmsg.h>
#include <pngmsg/chunk.hh>
#include <pngmsg/chunk_header.hh>
#include <pngmsg/parse_options.hh>

namespace pngmsg {

    class reader;

    /**
     * @class chunk_iterator
     * @brief Iterator over the chunk records that follow the PNG signature
     *
     * Each record is framed by its declared length and fully validated
     * (type code and CRC) before it becomes current. The first invalid
     * record throws; the iterator never yields a partially read chunk.
     */
    class PNGMSG_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief Information about the current chunk being iterated
         */
        struct chunk_info {
            chunk_header header;   ///< Framing information
            chunk data;            ///< Parsed and CRC-checked record
        };

        /**
         * @brief Start iterating at an offset of a buffer
         * @param bytes Whole buffer; offsets in headers are relative to it
         * @param start_offset Offset of the first chunk record
         * @param options Size limits and warning handler
         * @throws parse_error (or a subclass) if the first record is invalid
         */
        chunk_iterator(std::span<const std::byte> bytes, std::size_t start_offset);
        chunk_iterator(std::span<const std::byte> bytes, std::size_t start_offset, const parse_options& options);

        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator=(const chunk_iterator&) = delete;

        /**
         * @brief Get current chunk information
         * @return Const reference to current chunk information
         */
        const chunk_info& current() const { return *m_current; }

        /**
         * @brief Advance to the next chunk
         */
        void next();

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        bool read_next_chunk();

        std::unique_ptr<reader> m_reader;
        std::optional<chunk_info> m_current;
        bool m_ended;
        parse_options m_options;
    };

} // namespace pngmsg
