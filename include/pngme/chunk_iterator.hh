/**
 * @file chunk_iterator.hh
 * @brief Sequential chunk iterator over a PNG stream
 * @author Igor
 * @date 13/08/2025
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <cstdint>
#include <string>
#include <string_view>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    class reader;

    /**
     * @class chunk_iterator
     * @brief Reads the chunks of a PNG stream one at a time
     *
     * The constructor checks the 8-byte signature and positions the
     * iterator on the first chunk. Each record goes through
     * chunk::from_bytes, so tag and CRC rules are those of the in-memory
     * parser. Iteration ends after IEND or when the stream runs out.
     */
    class PNGME_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief The chunk under the iterator and where it was found
         */
        struct chunk_info {
            pngme::chunk chunk;             ///< Parsed record
            std::uint64_t file_offset = 0;  ///< Offset of the length field in the stream
            std::size_t index = 0;          ///< Position among the file's chunks (0 = first)
        };

        /**
         * @brief Start iterating with default options
         * @throws png_error if the signature is missing or wrong
         */
        explicit chunk_iterator(std::istream& stream);

        /**
         * @brief Start iterating with custom options
         * @param stream Input stream positioned at the signature
         * @param options Limits and strictness
         */
        chunk_iterator(std::istream& stream, const parse_options& options);

        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator = (const chunk_iterator&) = delete;

        /**
         * @brief Get current chunk information
         * @return Const reference to current chunk information
         */
        const chunk_info& current() const { return *m_current; }

        /**
         * @brief Advance to the next chunk
         */
        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        void read_signature();
        void advance();
        void violation(std::uint64_t offset, std::string_view category, const std::string& message);

        std::unique_ptr<reader> m_reader;
        parse_options m_options;
        std::optional<chunk_info> m_current;
        std::size_t m_index;
        bool m_seen_iend;
        bool m_ended;
    };

} // namespace pngme
