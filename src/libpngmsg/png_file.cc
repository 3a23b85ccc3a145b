//
// PNG chunk container.
//

#include <pngmsg/png_file.hh>
#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/exceptions.hh>

#include <algorithm>
#include <optional>
#include <ostream>

namespace pngmsg {

    png_file::png_file(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png_file png_file::parse(std::span<const std::byte> bytes) {
        return parse(bytes, parse_options{});
    }

    png_file png_file::parse(std::span<const std::byte> bytes, const parse_options& options) {
        if (bytes.size() < signature.size() ||
            !std::equal(signature.begin(), signature.end(), bytes.begin())) {
            throw bad_signature_error("Not a PNG file: signature mismatch");
        }

        std::vector<chunk> chunks;
        std::optional<std::uint64_t> iend_offset;

        for (chunk_iterator it(bytes, signature.size(), options); it.has_next(); it.next()) {
            const auto& info = it.current();

            if (chunks.empty() && info.header.type != chunk_types::IHDR) {
                options.warn(info.header.file_offset, "missing_ihdr",
                    build_error_msg("First chunk is '", info.header.type.to_string(), "', expected 'IHDR'"));
            }
            if (iend_offset) {
                options.warn(info.header.file_offset, "trailing_chunk",
                    build_error_msg("Chunk '", info.header.type.to_string(), "' follows IEND at offset ",
                                    *iend_offset));
            } else if (info.header.type == chunk_types::IEND) {
                iend_offset = info.header.file_offset;
            }

            chunks.push_back(info.data);
        }

        if (!iend_offset) {
            options.warn(bytes.size(), "missing_iend", "File has no IEND chunk");
        }

        return png_file(std::move(chunks));
    }

    png_file png_file::from_chunks(std::vector<chunk> chunks) {
        return png_file(std::move(chunks));
    }

    void png_file::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png_file::remove_chunk(std::string_view type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        if (it == m_chunks.end()) {
            THROW_NOT_FOUND("No chunk of type '", type, "' in file");
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png_file::chunk_by_type(std::string_view type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<std::byte> png_file::as_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += chunk::overhead + c.length();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        out.insert(out.end(), signature.begin(), signature.end());
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const png_file& png) {
        os << "PNG file, " << png.chunks().size() << " chunk(s)\n";
        std::uint64_t offset = png_file::signature.size();
        std::size_t index = 0;
        for (const auto& c : png.chunks()) {
            os << "  #" << index++ << " @" << offset << "  " << c << "\n";
            offset += chunk::overhead + c.length();
        }
        return os;
    }

} // namespace pngmsg
