/**
 * @file commands.hh
 * @brief Hide, read and remove messages in PNG files
 *
 * Each command reads the whole file, works on it in memory and writes
 * the result only after every check has passed, so a failing command
 * never leaves a partially written file behind.
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <pngmsg/export_pngmsg.h>
#include <pngmsg/parse_options.hh>

namespace pngmsg {

    /**
     * @brief Append a chunk carrying message to a PNG file
     * @param path Input file
     * @param type Four-letter chunk type for the message
     * @param message Payload text
     * @param output Where to write the result; the input file when empty
     * @param options Parse options for reading the input
     */
    PNGMSG_EXPORT void encode(const std::filesystem::path& path,
                              std::string_view type,
                              std::string_view message,
                              const std::optional<std::filesystem::path>& output = std::nullopt,
                              const parse_options& options = {});

    /**
     * @brief Read the message from the first chunk of a type
     * @throws not_found_error if there is no chunk of that type
     * @throws encoding_error if the payload is not text
     *
     * Never writes to the file.
     */
    PNGMSG_EXPORT std::string decode(const std::filesystem::path& path,
                                     std::string_view type,
                                     const parse_options& options = {});

    /**
     * @brief Remove the first chunk of a type and save the file in place
     * @return Description of the removed chunk
     * @throws not_found_error if there is no chunk of that type
     */
    PNGMSG_EXPORT std::string remove(const std::filesystem::path& path,
                                     std::string_view type,
                                     const parse_options& options = {});

    /**
     * @brief Print every chunk of a file
     */
    PNGMSG_EXPORT void inspect(const std::filesystem::path& path,
                               std::ostream& os,
                               const parse_options& options = {});

} // namespace pngmsg
