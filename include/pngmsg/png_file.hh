/**
 * @file png_file.hh
 * @brief A PNG file as a signature followed by an ordered list of chunks
 */

#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <span>
#include <string_view>
#include <vector>
#include <pngmsg/export_pngmsg.h>
#include <pngmsg/chunk.hh>
#include <pngmsg/parse_options.hh>

namespace pngmsg {

    /**
     * @class png_file
     * @brief In-memory chunk container for a whole PNG file
     *
     * Chunk order is the on-disk order. Nothing below the chunk level is
     * interpreted: IHDR, IDAT and IEND are ordinary chunks here.
     */
    class PNGMSG_EXPORT png_file {
    public:
        /// The 8-byte PNG signature
        static constexpr std::array<std::byte, 8> signature = {
            std::byte{0x89}, std::byte{'P'}, std::byte{'N'}, std::byte{'G'},
            std::byte{'\r'}, std::byte{'\n'}, std::byte{0x1A}, std::byte{'\n'}
        };

        /**
         * @brief Parse a complete PNG file
         * @param bytes Whole file contents
         * @param options Size limits and warning handler
         * @throws bad_signature_error if the buffer does not start with the signature
         * @throws parse_error (or a subclass) for the first invalid chunk
         *
         * Chunks are read until the buffer is exhausted. Missing IHDR/IEND
         * and chunks after IEND are reported as warnings.
         */
        static png_file parse(std::span<const std::byte> bytes);
        static png_file parse(std::span<const std::byte> bytes, const parse_options& options);

        /// Build a file from an existing chunk list
        static png_file from_chunks(std::vector<chunk> chunks);

        /// Add a chunk after the last one
        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk whose type text equals type
         * @return The removed chunk
         * @throws not_found_error if no chunk matches; the file is left unchanged
         */
        chunk remove_chunk(std::string_view type);

        /// First chunk whose type text equals type, or nullptr
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::span<const std::byte> header() const { return signature; }

        /// Signature followed by every chunk record in order
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

    private:
        explicit png_file(std::vector<chunk> chunks);

        std::vector<chunk> m_chunks;
    };

    PNGMSG_EXPORT std::ostream& operator<<(std::ostream& os, const png_file& png);

} // namespace pngmsg
