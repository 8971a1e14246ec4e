/**
 * @file chunk.hh
 * @brief Length-prefixed, CRC protected PNG chunk record
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief One chunk record
     *
     * Wire layout, all integers big-endian:
     *
     *     offset  size  field
     *     0       4     length (N)
     *     4       4     chunk type
     *     8       N     data
     *     8+N     4     CRC-32 of (chunk type, data)
     *
     * A chunk always satisfies crc() == chunk_crc(type(), data()). Freshly
     * built chunks compute it; parsed chunks are rejected unless the stored
     * value matches. Instances are immutable.
     */
    class PNGME_EXPORT chunk {
    public:
        static constexpr std::size_t length_field_size = 4;
        static constexpr std::size_t type_field_size = 4;
        static constexpr std::size_t crc_field_size = 4;
        /// Bytes a record occupies besides its data
        static constexpr std::size_t overhead = length_field_size + type_field_size + crc_field_size;

        /**
         * @brief Build a chunk from a type and its data
         *
         * The length is data.size() truncated to 32 bits; callers must keep
         * data below 2^32 bytes.
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Parse one record from a buffer
         * @param data Start of the record (length field)
         * @param size Bytes available; anything past the record is ignored
         * @throws chunk_error if the buffer is too short for the declared
         *         layout, the type tag is invalid, or the CRC does not match
         */
        static chunk from_bytes(const std::byte* data, std::size_t size);

        static chunk from_bytes(const std::vector<std::byte>& buffer) {
            return from_bytes(buffer.data(), buffer.size());
        }

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Data as UTF-8 text
         * @throws chunk_error if the data is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Data as text for display; never throws on bad text
         * @return The text, or invalid_text_placeholder
         */
        [[nodiscard]] std::string to_string() const;

        // Copy of the data only (no length, type or CRC)
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        // Full wire form: length, type, data, CRC
        [[nodiscard]] std::vector<std::byte> encode() const;

        // Size of encode()
        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_data.size(); }

        bool operator==(const chunk& o) const {
            return m_length == o.m_length && m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

        friend std::ostream& operator<<(std::ostream& os, const chunk& c) {
            return os << c.to_string();
        }

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

} // namespace pngme
