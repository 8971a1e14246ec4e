/**
 * @file png.hh
 * @brief PNG container: signature followed by a sequence of chunks
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string_view>
#include <vector>
#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief An editable list of chunks behind the PNG signature
     *
     * Image data is never interpreted; IHDR, IDAT and friends are carried
     * as opaque chunks and written back byte for byte.
     */
    class PNGME_EXPORT png {
    public:
        using header_type = std::array<std::uint8_t, 8>;

        /// The 8-byte signature every PNG file starts with
        static constexpr header_type STANDARD_HEADER = {137, 80, 78, 71, 13, 10, 26, 10};

        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete file held in memory
         * @throws png_error on a bad signature or container violation
         * @throws chunk_error on a malformed chunk
         */
        static png from_bytes(const std::vector<std::byte>& buffer);
        static png from_bytes(const std::vector<std::byte>& buffer, const parse_options& options);

        static png from_stream(std::istream& stream);
        static png from_stream(std::istream& stream, const parse_options& options);

        /**
         * @brief Read and parse a file from disk
         * @throws io_error if the file cannot be opened
         */
        static png from_file(const std::filesystem::path& path);
        static png from_file(const std::filesystem::path& path, const parse_options& options);

        [[nodiscard]] const header_type& header() const { return STANDARD_HEADER; }
        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /**
         * @brief Add a chunk
         *
         * Goes in front of a final IEND chunk if there is one, at the end
         * otherwise, so a well formed file stays well formed.
         */
        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk of the given type
         * @param type_label Chunk type, e.g. "ruSt"
         * @return The removed chunk
         * @throws png_error if no chunk has that type
         * @throws chunk_type_error if the label is not a valid chunk type
         */
        chunk remove_first_chunk(std::string_view type_label);

        /**
         * @brief Find the first chunk of the given type
         * @return Pointer into chunks(), or nullptr; invalidated by
         *         append_chunk/remove_first_chunk
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type_label) const;

        // Signature followed by every chunk in wire form
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        void write(std::ostream& os) const;
        void write_file(const std::filesystem::path& path) const;

    private:
        std::vector<chunk> m_chunks;
    };

    // One line per chunk: index, type, length, crc
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngme
