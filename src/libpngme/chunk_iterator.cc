//
// Created by igor on 13/08/2025.
//

#include <pngme/chunk_iterator.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>
#include <pngme/png.hh>
#include <array>
#include <istream>
#include <vector>
#include "input.hh"

namespace pngme {

    chunk_iterator::chunk_iterator(std::istream& stream)
        : chunk_iterator(stream, parse_options{}) {
    }

    chunk_iterator::chunk_iterator(std::istream& stream, const parse_options& options)
        : m_reader(std::make_unique<reader>(stream))
        , m_options(options)
        , m_index(0)
        , m_seen_iend(false)
        , m_ended(false) {
        read_signature();
        advance();
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::read_signature() {
        std::array<std::uint8_t, 8> signature{};
        std::size_t actual = m_reader->read(signature.data(), signature.size());
        THROW_PNG_IF(actual != signature.size(), "File too short for PNG signature: ", actual, " bytes");
        THROW_PNG_UNLESS(signature == png::STANDARD_HEADER, "Not a PNG file: signature mismatch");
    }

    void chunk_iterator::violation(std::uint64_t offset, std::string_view category, const std::string& message) {
        if (m_options.strict) {
            THROW_PNG(message, " at offset ", offset);
        }
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

    void chunk_iterator::advance() {
        m_current.reset();

        while (!m_ended) {
            // Taken before at_end(): the stream position is unreadable once EOF is hit
            const std::uint64_t offset = m_reader->tell();

            if (m_seen_iend) {
                m_ended = true;
                if (!m_reader->at_end()) {
                    violation(offset, "trailing_data", "Data after IEND chunk");
                }
                return;
            }

            if (m_reader->at_end()) {
                m_ended = true;
                if (m_options.require_iend) {
                    violation(offset, "missing_iend", "Stream ended without an IEND chunk");
                }
                return;
            }

            std::vector<std::byte> record;
            m_reader->append_exact(record, chunk::length_field_size);
            const std::uint32_t length = load_be32(record.data());

            if (length > m_options.max_chunk_size) {
                violation(offset, "size_limit",
                          build_error_msg("Chunk length ", length, " exceeds limit of ",
                                          m_options.max_chunk_size, " bytes"));
                // Lenient: skip type, data and CRC
                m_reader->skip(chunk::type_field_size + std::uint64_t(length) + chunk::crc_field_size);
                continue;
            }

            m_reader->append_exact(record, chunk::type_field_size + std::size_t(length) + chunk::crc_field_size);

            auto parsed = chunk::from_bytes(record);
            if (parsed.type() == chunk_id::IEND) {
                m_seen_iend = true;
            }
            m_current = chunk_info{std::move(parsed), offset, m_index++};
            return;
        }
    }

} // namespace pngme
