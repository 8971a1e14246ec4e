//
// Created by igor on 10/08/2025.
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

#include "utf8.hh"

namespace pngme {

    namespace {
        bool is_ascii_upper(std::uint8_t c) {
            return c >= 'A' && c <= 'Z';
        }

        bool is_ascii_lower(std::uint8_t c) {
            return c >= 'a' && c <= 'z';
        }

        // Printable form of arbitrary tag bytes for error messages
        std::string quote(const chunk_type::bytes_type& bytes) {
            std::ostringstream os;
            os << '\'';
            for (std::uint8_t c : bytes) {
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c) << std::dec;
                }
            }
            os << '\'';
            return os.str();
        }

        chunk_type::bytes_type bytes_from_label(std::string_view label) {
            THROW_CHUNK_TYPE_IF(label.size() < 4,
                                "Chunk type label '", label, "' is shorter than 4 bytes");
            chunk_type::bytes_type bytes{};
            std::memcpy(bytes.data(), label.data(), 4);
            return bytes;
        }

        std::string_view checked_label(const char* label) {
            THROW_CHUNK_TYPE_UNLESS(label, "Chunk type label is a null pointer");
            return label;
        }
    }

    chunk_type::chunk_type(const bytes_type& bytes)
        : m_bytes(bytes) {
        THROW_CHUNK_TYPE_UNLESS(is_valid_bytes(bytes),
                                "Invalid chunk type ", quote(bytes), ": all 4 bytes must be ASCII letters");

        m_is_valid = true;
        m_is_critical = is_ascii_upper(bytes[0]);
        m_is_public = is_ascii_upper(bytes[1]);
        m_is_reserved_bit_valid = is_ascii_upper(bytes[2]);
        m_is_safe_to_copy = is_ascii_lower(bytes[3]);
    }

    chunk_type::chunk_type(char c0, char c1, char c2, char c3)
        : chunk_type(bytes_type{static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                                static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3)}) {}

    chunk_type::chunk_type(std::string_view label)
        : chunk_type(bytes_from_label(label)) {}

    chunk_type::chunk_type(const char* label)
        : chunk_type(checked_label(label)) {}

    chunk_type chunk_type::from_bytes(const void* data) {
        bytes_type bytes{};
        std::memcpy(bytes.data(), data, 4);
        return chunk_type(bytes);
    }

    bool chunk_type::is_valid_bytes(const bytes_type& bytes) noexcept {
        return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t c) {
            return is_ascii_upper(c) || is_ascii_lower(c);
        });
    }

    std::string chunk_type::to_string() const {
        if (!detail::is_valid_utf8(m_bytes.data(), m_bytes.size())) {
            return std::string(invalid_text_placeholder);
        }
        return {reinterpret_cast<const char*>(m_bytes.data()), m_bytes.size()};
    }

    void chunk_type::to_bytes(void* dest) const {
        std::memcpy(dest, m_bytes.data(), 4);
    }

} // namespace pngme
