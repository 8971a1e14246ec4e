//
// Created by igor on 14/08/2025.
//

#include <pngme/chunk.hh>
#include <pngme/crc.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>
#include <cstring>
#include <utility>

#include "utf8.hh"

namespace pngme {

    namespace {
        chunk_type read_type(const std::byte* p) {
            try {
                return chunk_type::from_bytes(p);
            } catch (const chunk_type_error& e) {
                THROW_CHUNK("Invalid chunk: ", e.what());
            }
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(static_cast<std::uint32_t>(data.size()))
        , m_type(std::move(type))
        , m_data(std::move(data))
        , m_crc(chunk_crc(m_type, m_data.data(), m_data.size())) {
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length)
        , m_type(std::move(type))
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::from_bytes(const std::byte* data, std::size_t size) {
        THROW_CHUNK_IF(size < length_field_size,
                       "Chunk buffer of ", size, " bytes is too short for the length field");
        const std::uint32_t length = load_be32(data);

        THROW_CHUNK_IF(size < length_field_size + type_field_size,
                       "Chunk buffer of ", size, " bytes is too short for the chunk type");
        chunk_type type = read_type(data + length_field_size);

        // 64-bit arithmetic: 8 + length cannot wrap
        const std::uint64_t data_offset = length_field_size + type_field_size;
        const std::uint64_t data_end = data_offset + length;
        THROW_CHUNK_IF(size < data_end,
                       "Chunk ", type, " declares ", length, " data bytes but only ",
                       size - data_offset, " are available");
        THROW_CHUNK_IF(size - data_end < crc_field_size,
                       "Chunk ", type, " is missing its CRC field");

        const std::byte* payload = data + data_offset;
        const std::uint32_t stored = load_be32(payload + length);
        const std::uint32_t expected = chunk_crc(type, payload, length);
        THROW_CHUNK_IF(stored != expected,
                       "CRC mismatch in chunk ", type, ": stored ", stored, ", computed ", expected);

        return chunk(length, std::move(type), std::vector<std::byte>(payload, payload + length), stored);
    }

    std::string chunk::data_as_string() const {
        THROW_CHUNK_UNLESS(detail::is_valid_utf8(m_data.data(), m_data.size()),
                           "Data of chunk ", m_type, " is not valid UTF-8");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::string chunk::to_string() const {
        if (!detail::is_valid_utf8(m_data.data(), m_data.size())) {
            return std::string(invalid_text_placeholder);
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::as_bytes() const {
        return m_data;
    }

    std::vector<std::byte> chunk::encode() const {
        std::vector<std::byte> out(encoded_size());
        std::byte* p = out.data();

        store_be32(p, m_length);
        p += length_field_size;
        m_type.to_bytes(p);
        p += type_field_size;
        if (!m_data.empty()) {
            std::memcpy(p, m_data.data(), m_data.size());
        }
        p += m_data.size();
        store_be32(p, m_crc);

        return out;
    }

} // namespace pngme
