//
// Message commands on top of the chunk container.
//

#include <pngmsg/commands.hh>
#include <pngmsg/file_io.hh>
#include <pngmsg/png_file.hh>
#include <pngmsg/exceptions.hh>

#include <ostream>
#include <sstream>

namespace pngmsg {

    namespace {
        png_file load(const std::filesystem::path& path, const parse_options& options) {
            auto bytes = read_file(path);
            return png_file::parse(bytes, options);
        }

        std::vector<std::byte> to_bytes(std::string_view text) {
            const auto* p = reinterpret_cast<const std::byte*>(text.data());
            return {p, p + text.size()};
        }
    }

    void encode(const std::filesystem::path& path,
                std::string_view type,
                std::string_view message,
                const std::optional<std::filesystem::path>& output,
                const parse_options& options) {
        // Validate the type before touching the file
        auto ctype = chunk_type::from_string(type);
        auto png = load(path, options);

        png.append_chunk(chunk(ctype, to_bytes(message)));

        auto bytes = png.as_bytes();
        write_file(output.value_or(path), bytes);
    }

    std::string decode(const std::filesystem::path& path,
                       std::string_view type,
                       const parse_options& options) {
        auto png = load(path, options);

        const chunk* found = png.chunk_by_type(type);
        if (!found) {
            THROW_NOT_FOUND("No chunk of type '", type, "' in '", path.string(), "'");
        }
        return found->data_as_string();
    }

    std::string remove(const std::filesystem::path& path,
                       std::string_view type,
                       const parse_options& options) {
        auto png = load(path, options);
        chunk removed = png.remove_chunk(type);

        auto bytes = png.as_bytes();
        write_file(path, bytes);

        std::ostringstream oss;
        oss << removed;
        return oss.str();
    }

    void inspect(const std::filesystem::path& path,
                 std::ostream& os,
                 const parse_options& options) {
        auto png = load(path, options);
        os << path.string() << ": " << png;
    }

} // namespace pngmsg
