/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG streams
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for reading PNG files chunk by chunk
     *
     * Controls strictness, size limits, and warning handling. Chunk level
     * integrity (type tag rules, CRC) is always enforced; these options
     * only govern container level checks.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, container violations (oversized chunk, missing IEND,
         * bytes after IEND) throw png_error. When false, they are reported
         * through on_warning and parsing continues where possible.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * Default is 2^31 - 1, the largest length PNG permits. In lenient
         * mode a larger chunk is skipped with a "size_limit" warning.
         */
        std::uint64_t max_chunk_size = (std::uint64_t(1) << 31) - 1;

        /**
         * @brief Require the stream to end with an IEND chunk
         *
         * A stream that runs out before IEND is a "missing_iend" violation.
         */
        bool require_iend = true;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset where warning occurred
         * @param category Warning category ("size_limit", "missing_iend",
         *                 "trailing_data")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
