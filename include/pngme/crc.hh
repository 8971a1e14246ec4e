/**
 * @file crc.hh
 * @brief CRC-32 used by PNG chunk records
 * @author Igor
 * @date 15/08/2025
 *
 * PNG uses CRC-32/ISO-HDLC: reflected polynomial 0xEDB88320, initial
 * value 0xFFFFFFFF, final XOR 0xFFFFFFFF. This is the same checksum zlib
 * exports as crc32(), which does the actual work here.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <pngme/export_pngme.h>

namespace pngme {

    class chunk_type;

    /**
     * @brief Continue a CRC-32 over another block of bytes
     * @param crc Value returned by a previous call (or crc32 of nothing)
     * @param data Bytes to add
     * @param size Number of bytes
     * @return Updated checksum
     */
    PNGME_EXPORT std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size);

    /**
     * @brief CRC-32 of a single block
     */
    PNGME_EXPORT std::uint32_t crc32(const void* data, std::size_t size);

    /**
     * @brief CRC of a chunk record: covers the type tag followed by the payload
     *
     * The length field is not part of the checksum.
     */
    PNGME_EXPORT std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size);

} // namespace pngme
