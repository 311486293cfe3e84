//
// encode / decode / remove / print over PNG files
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>

#include <pngme/png.hh>
#include <pngme/parse_options.hh>

namespace pngme::cli {

    // Whole file into memory; throws io_error
    std::vector<std::uint8_t> read_file(const std::filesystem::path& path);

    // Replace the file contents; throws io_error
    void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes);

    png load_png(const std::filesystem::path& path, const parse_options& options);

    /**
     * @brief Append a chunk carrying @p message
     *
     * The result is written to @p output, or back to @p file when no
     * output is given.
     */
    void encode(const std::filesystem::path& file,
                std::string_view type,
                std::string_view message,
                const std::optional<std::filesystem::path>& output,
                const parse_options& options);

    /**
     * @brief Print the first chunk of @p type to @p out
     *
     * A missing chunk is not an error; it is reported on @p err.
     */
    void decode(const std::filesystem::path& file,
                std::string_view type,
                std::ostream& out,
                std::ostream& err,
                const parse_options& options);

    // Remove the first chunk of @p type and rewrite @p file
    void remove(const std::filesystem::path& file,
                std::string_view type,
                const parse_options& options);

    void print(const std::filesystem::path& file,
               std::ostream& out,
               const parse_options& options);
}
