/**
 * @file chunk_type.hh
 * @brief Four-letter chunk type tag with case-encoded property bits
 * @author Igor
 * @date 10/08/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>
#include <pngme/export_pngme.h>

namespace pngme {

    /// Rendered instead of text that is not valid UTF-8.
    inline constexpr std::string_view invalid_text_placeholder = "Invalid UTF-8";

    /**
     * @class chunk_type
     * @brief Four ASCII letters identifying a chunk
     *
     * The case of each letter carries one property bit (bit 5 of the byte):
     *
     * | byte | uppercase            | lowercase             |
     * |------|----------------------|-----------------------|
     * | 0    | critical             | ancillary             |
     * | 1    | public               | private               |
     * | 2    | reserved bit valid   | reserved bit set      |
     * | 3    | unsafe to copy       | safe to copy          |
     *
     * The properties are decoded once at construction. A chunk_type always
     * holds four ASCII letters; any other input is rejected with
     * chunk_type_error.
     */
    class PNGME_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        /**
         * @brief Construct from four raw bytes
         * @throws chunk_type_error if any byte is not an ASCII letter
         */
        explicit chunk_type(const bytes_type& bytes);

        // Constructor from 4 individual chars
        chunk_type(char c0, char c1, char c2, char c3);

        /**
         * @brief Construct from a textual label
         *
         * Only the first four bytes are used; anything after them is
         * ignored, so "RuStacean" yields "RuSt".
         *
         * @throws chunk_type_error if the label has fewer than four bytes
         *         or the first four are not ASCII letters
         */
        explicit chunk_type(std::string_view label);

        // Constructor from C-string (same rules as the label constructor).
        // Throws chunk_type_error on a null pointer.
        chunk_type(const char* label);

        // Constructor from raw bytes (reads exactly 4)
        static chunk_type from_bytes(const void* data);

        // True if all four bytes are ASCII letters
        [[nodiscard]] static bool is_valid_bytes(const bytes_type& bytes) noexcept;

        [[nodiscard]] const bytes_type& bytes() const noexcept { return m_bytes; }

        [[nodiscard]] bool is_valid() const noexcept { return m_is_valid; }
        [[nodiscard]] bool is_critical() const noexcept { return m_is_critical; }
        [[nodiscard]] bool is_public() const noexcept { return m_is_public; }
        [[nodiscard]] bool is_reserved_bit_valid() const noexcept { return m_is_reserved_bit_valid; }
        [[nodiscard]] bool is_safe_to_copy() const noexcept { return m_is_safe_to_copy; }

        /**
         * @brief The four bytes as text
         * @return The tag, or invalid_text_placeholder if the bytes are
         *         not valid UTF-8
         */
        [[nodiscard]] std::string to_string() const;

        // Write to bytes
        void to_bytes(void* dest) const;

        // Comparison operators (raw bytes only, flags are derived)
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << t.to_string();
        }

    private:
        bytes_type m_bytes;
        bool m_is_valid = false;
        bool m_is_critical = false;
        bool m_is_public = false;
        bool m_is_reserved_bit_valid = false;
        bool m_is_safe_to_copy = false;
    };

    // Well known chunk types
    namespace chunk_id {
        inline const chunk_type IHDR('I', 'H', 'D', 'R');
        inline const chunk_type IEND('I', 'E', 'N', 'D');
    }

} // namespace pngme
