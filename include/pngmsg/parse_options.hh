/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngmsg {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG files
     *
     * Controls size limits, strictness and warning handling.
     * Structural errors (bad signature, truncation, CRC mismatch,
     * invalid type codes) are always fatal regardless of these options.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk larger than max_chunk_size is an error.
         * When false, it is reported as a "size_limit" warning and parsing
         * continues.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload size in bytes
         *
         * Default is the PNG limit of 2^31-1 bytes.
         */
        std::uint64_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where warning occurred
         * @param category Warning category (e.g., "size_limit", "missing_iend")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;

        /// Report a warning if a handler is installed
        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
            if (on_warning) {
                on_warning(offset, category, message);
            }
        }
    };

} // namespace pngmsg
