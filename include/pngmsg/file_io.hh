/**
 * @file file_io.hh
 * @brief Whole-file read and write
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>
#include <pngmsg/export_pngmsg.h>

namespace pngmsg {

    /**
     * @brief Read a complete file into memory
     * @throws io_error if the file cannot be opened or read
     */
    PNGMSG_EXPORT std::vector<std::byte> read_file(const std::filesystem::path& path);

    /**
     * @brief Replace the contents of a file
     * @throws io_error if the file cannot be opened or written
     */
    PNGMSG_EXPORT void write_file(const std::filesystem::path& path, std::span<const std::byte> data);

} // namespace pngmsg
