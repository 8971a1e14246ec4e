//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <pngme/exceptions.hh>

namespace pngme {

    // Reads from a stream without limits - throws on I/O failure
    class reader {
        public:
            // Upper bound on a single buffer growth step in append_exact
            static constexpr std::size_t block_size = 64 * 1024;

            explicit reader(std::istream& is);

            reader(const reader&) = delete;
            reader& operator = (const reader&) = delete;

            // Returns the number of bytes read; short only at end of stream
            std::size_t read(void* dst, std::size_t size);

            // Moves the read position forward by count bytes
            void skip(std::uint64_t count);
            std::uint64_t tell() const;

            // True when no further byte can be read
            bool at_end();

            // Appends exactly size bytes to out. The buffer grows block by
            // block as data arrives, so a bogus size fails on the short read
            // instead of on the allocation.
            void append_exact(std::vector<std::byte>& out, std::size_t size);

        private:
            std::istream& m_stream;
    };
}
