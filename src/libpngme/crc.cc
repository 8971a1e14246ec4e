//
// Created by igor on 15/08/2025.
//

#include <pngme/crc.hh>
#include <pngme/chunk_type.hh>
#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngme {

    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size) {
        const auto* p = static_cast<const Bytef*>(data);
        uLong value = crc;

        // zlib takes a 32-bit length per call
        while (size > 0) {
            const auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            value = ::crc32(value, p, n);
            p += n;
            size -= n;
        }

        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t crc32(const void* data, std::size_t size) {
        const auto initial = static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0));
        return crc32_update(initial, data, size);
    }

    std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size) {
        const auto& tag = type.bytes();
        return crc32_update(crc32(tag.data(), tag.size()), data, size);
    }

} // namespace pngme
