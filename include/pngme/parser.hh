/**
 * @file parser.hh
 * @brief PNG stream parsing utilities
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <iosfwd>
#include <pngme/chunk_iterator.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @brief Simple functional interface for iterating chunks with custom options
     *
     * Calls the provided function for each chunk in the stream, in file
     * order, IEND included.
     *
     * @tparam Func Callable type accepting const chunk_iterator::chunk_info&
     * @param stream Input stream containing a PNG file
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func, const parse_options& options) {
        chunk_iterator it(stream, options);

        while (it.has_next()) {
            func(it.current());
            it.next();
        }
    }

    /**
     * @brief Simple functional interface for iterating chunks
     *
     * Uses default parse options.
     *
     * @tparam Func Callable type accepting const chunk_iterator::chunk_info&
     * @param stream Input stream containing a PNG file
     * @param func Function to call for each chunk
     */
    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func) {
        for_each_chunk(stream, func, parse_options{});
    }

} // namespace pngme
