//
// Chunk record codec.
//

#include <pngmsg/chunk.hh>
#include <pngmsg/crc.hh>
#include <pngmsg/endian.hh>
#include <pngmsg/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace pngmsg {

    namespace {
        constexpr std::size_t preview_limit = 64;

        std::string flags_string(const chunk_type& t) {
            std::string s = t.is_critical() ? "critical" : "ancillary";
            s += t.is_public() ? ",public" : ",private";
            if (!t.is_reserved_bit_valid()) {
                s += ",reserved-bit-set";
            }
            s += t.is_safe_to_copy() ? ",safe-to-copy" : ",unsafe-to-copy";
            return s;
        }

        // Drops a multi-byte sequence cut off at the end of bytes
        std::span<const std::byte> trim_partial_utf8(std::span<const std::byte> bytes) {
            const std::size_t n = bytes.size();
            for (std::size_t back = 1; back <= std::min<std::size_t>(n, 4); ++back) {
                auto c = static_cast<unsigned char>(bytes[n - back]);
                if ((c & 0xC0) == 0x80) {
                    continue;
                }
                std::size_t len = 1;
                if ((c & 0xE0) == 0xC0) {
                    len = 2;
                } else if ((c & 0xF0) == 0xE0) {
                    len = 3;
                } else if ((c & 0xF8) == 0xF0) {
                    len = 4;
                }
                return len > back ? bytes.first(n - back) : bytes;
            }
            return bytes;
        }

        bool is_printable_text(std::span<const std::byte> bytes) {
            return std::all_of(bytes.begin(), bytes.end(), [](std::byte b) {
                auto c = static_cast<unsigned char>(b);
                return c >= 32 || c == '\n' || c == '\r' || c == '\t';
            });
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data)) {
        if (m_data.size() > std::numeric_limits<std::uint32_t>::max()) {
            THROW_PARSE("Chunk '", m_type.to_string(), "' payload of ", m_data.size(),
                        " bytes does not fit a 32-bit length field");
        }
    }

    chunk chunk::parse(std::span<const std::byte> bytes) {
        return parse(bytes, parse_options{});
    }

    chunk chunk::parse(std::span<const std::byte> bytes, const parse_options& options) {
        THROW_TOO_SHORT_IF(bytes.size() < overhead,
                           "Chunk record needs at least ", overhead, " bytes, got ", bytes.size());

        const std::size_t payload_size = bytes.size() - overhead;
        const std::uint32_t declared = load_be32(bytes.data());
        auto type = chunk_type::from_bytes(bytes.data() + 4);

        if (declared != payload_size) {
            options.warn(0, "length_mismatch",
                build_error_msg("Chunk '", type.to_string(), "' declares length ", declared,
                                " but carries ", payload_size, " payload bytes"));
        }

        auto payload = bytes.subspan(8, payload_size);
        chunk result(type, std::vector<std::byte>(payload.begin(), payload.end()));

        const std::uint32_t expected = load_be32(bytes.data() + 8 + payload_size);
        const std::uint32_t actual = result.crc();
        if (expected != actual) {
            throw checksum_mismatch_error(
                build_error_msg("CRC mismatch in chunk '", type.to_string(), "': stored 0x",
                                std::hex, std::setw(8), std::setfill('0'), expected,
                                ", computed 0x", std::setw(8), actual),
                expected, actual);
        }
        return result;
    }

    std::uint32_t chunk::crc() const {
        std::array<char, 4> type_bytes;
        m_type.to_bytes(type_bytes.data());
        return crc32{}
            .update(type_bytes.data(), type_bytes.size())
            .update(m_data)
            .value();
    }

    std::string chunk::data_as_string() const {
        if (!is_valid_utf8(m_data)) {
            throw encoding_error(build_error_msg("Chunk '", m_type.to_string(),
                                                 "' payload is not valid UTF-8"));
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::as_bytes() const {
        std::vector<std::byte> out;
        out.reserve(overhead + m_data.size());
        write_to(out);
        return out;
    }

    void chunk::write_to(std::vector<std::byte>& out) const {
        std::array<std::byte, 4> field;

        store_be32(length(), field.data());
        out.insert(out.end(), field.begin(), field.end());

        m_type.to_bytes(field.data());
        out.insert(out.end(), field.begin(), field.end());

        out.insert(out.end(), m_data.begin(), m_data.end());

        store_be32(crc(), field.data());
        out.insert(out.end(), field.begin(), field.end());
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        std::ostringstream line;
        line << c.type() << "  length=" << c.length()
             << "  crc=0x" << std::hex << std::setw(8) << std::setfill('0') << c.crc() << std::dec
             << "  [" << flags_string(c.type()) << "]";

        auto data = c.data();
        auto preview = data.first(std::min(data.size(), preview_limit));
        bool truncated = preview.size() < data.size();
        if (truncated) {
            preview = trim_partial_utf8(preview);
        }

        if (!data.empty()) {
            if (is_valid_utf8(preview) && is_printable_text(preview)) {
                line << "  \"" << std::string_view(reinterpret_cast<const char*>(preview.data()), preview.size())
                     << (truncated ? "...\"" : "\"");
            } else {
                line << " ";
                for (auto b : preview.first(std::min<std::size_t>(preview.size(), 16))) {
                    line << ' ' << std::hex << std::setw(2) << std::setfill('0')
                         << static_cast<unsigned>(b) << std::dec;
                }
                if (data.size() > 16) {
                    line << " ...";
                }
            }
        }
        return os << line.str();
    }

    bool is_valid_utf8(std::span<const std::byte> bytes) {
        std::size_t i = 0;
        const std::size_t n = bytes.size();
        while (i < n) {
            auto c = static_cast<unsigned char>(bytes[i]);
            std::size_t extra;
            std::uint32_t cp;
            if (c < 0x80) {
                ++i;
                continue;
            } else if ((c & 0xE0) == 0xC0) {
                extra = 1;
                cp = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
                cp = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3;
                cp = c & 0x07;
            } else {
                return false;
            }
            if (n - i <= extra) {
                return false;
            }
            for (std::size_t k = 1; k <= extra; ++k) {
                auto cc = static_cast<unsigned char>(bytes[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }
            // Reject overlong forms, surrogates and values past U+10FFFF
            static constexpr std::uint32_t min_for_length[] = {0, 0x80, 0x800, 0x10000};
            if (cp < min_for_length[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

} // namespace pngmsg
