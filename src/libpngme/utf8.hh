//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>

namespace pngme {
    namespace detail {

        // Strict UTF-8 validation: rejects overlong forms, surrogates
        // (U+D800..U+DFFF), code points above U+10FFFF and truncated
        // sequences.
        inline bool is_valid_utf8(const void* data, std::size_t size) {
            const auto* p = static_cast<const std::uint8_t*>(data);
            std::size_t i = 0;

            while (i < size) {
                const std::uint8_t c = p[i];

                if (c < 0x80) {
                    ++i;
                    continue;
                }

                std::size_t extra;
                std::uint8_t lo = 0x80;
                std::uint8_t hi = 0xBF;

                if (c >= 0xC2 && c <= 0xDF) {
                    extra = 1;
                } else if (c == 0xE0) {
                    extra = 2;
                    lo = 0xA0;
                } else if (c == 0xED) {
                    extra = 2;
                    hi = 0x9F;
                } else if (c >= 0xE1 && c <= 0xEF) {
                    extra = 2;
                } else if (c == 0xF0) {
                    extra = 3;
                    lo = 0x90;
                } else if (c >= 0xF1 && c <= 0xF3) {
                    extra = 3;
                } else if (c == 0xF4) {
                    extra = 3;
                    hi = 0x8F;
                } else {
                    return false;
                }

                if (size - i <= extra) {
                    return false;
                }

                // Only the first continuation byte has a narrowed range
                if (p[i + 1] < lo || p[i + 1] > hi) {
                    return false;
                }
                for (std::size_t k = 2; k <= extra; ++k) {
                    if ((p[i + k] & 0xC0) != 0x80) {
                        return false;
                    }
                }

                i += extra + 1;
            }

            return true;
        }

    } // namespace detail
} // namespace pngme
