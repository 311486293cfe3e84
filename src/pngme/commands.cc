//
// encode / decode / remove / print over PNG files
//

#include <fstream>
#include <ostream>
#include <string>

#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include "commands.hh"

namespace pngme::cli {

    std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Failed to open file: ", path.string());

        file.seekg(0, std::ios::end);
        auto size = file.tellg();
        THROW_IO_IF(size == std::streampos(-1), "Failed to get size of ", path.string());
        file.seekg(0, std::ios::beg);

        std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        THROW_IO_IF(static_cast<std::size_t>(file.gcount()) != data.size(),
                    "Failed to read ", path.string(), ": got ", file.gcount(), " of ", data.size(), " bytes");
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Failed to create file: ", path.string());

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        THROW_IO_UNLESS(file, "Failed to write ", bytes.size(), " bytes to ", path.string());
    }

    png load_png(const std::filesystem::path& path, const parse_options& options) {
        return png::parse(read_file(path), options);
    }

    void encode(const std::filesystem::path& file,
                std::string_view type,
                std::string_view message,
                const std::optional<std::filesystem::path>& output,
                const parse_options& options) {
        // Validate the type before touching any file
        auto ct = chunk_type::from_string(type);

        auto image = load_png(file, options);
        image.append_chunk(chunk(ct, std::vector<std::uint8_t>(message.begin(), message.end())));

        write_file(output.value_or(file), image.to_bytes());
    }

    void decode(const std::filesystem::path& file,
                std::string_view type,
                std::ostream& out,
                std::ostream& err,
                const parse_options& options) {
        auto image = load_png(file, options);

        if (const chunk* c = image.chunk_by_type(type)) {
            out << *c << "\n";
        } else {
            err << "Chunk type: " << type << " not found\n";
        }
    }

    void remove(const std::filesystem::path& file,
                std::string_view type,
                const parse_options& options) {
        auto image = load_png(file, options);
        image.remove_first_chunk(type);
        write_file(file, image.to_bytes());
    }

    void print(const std::filesystem::path& file,
               std::ostream& out,
               const parse_options& options) {
        out << load_png(file, options) << "\n";
    }
}
