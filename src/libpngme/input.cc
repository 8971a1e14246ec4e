//
// Created by igor on 12/08/2025.
//

#include <algorithm>
#include <istream>
#include <limits>

#include "input.hh"

namespace pngme {

    reader::reader(std::istream& is) : m_stream(is) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        return bytes_read;
    }

    void reader::skip(std::uint64_t count) {
        THROW_IO_IF(count > static_cast<std::uint64_t>(std::numeric_limits<std::streamoff>::max()),
                    "Cannot skip ", count, " bytes");
        m_stream.clear();
        m_stream.seekg(static_cast<std::streamoff>(count), std::ios_base::cur);
        THROW_IO_IF(m_stream.fail(), "Cannot skip ", count, " bytes (relative)");
    }

    std::uint64_t reader::tell() const {
        std::streampos pos = const_cast<std::istream&>(m_stream).tellg();
        THROW_IO_IF(pos == std::streampos(-1), "Tell failed");
        return static_cast<std::uint64_t>(pos);
    }

    bool reader::at_end() {
        if (!m_stream.good()) {
            return true;
        }
        return m_stream.peek() == std::istream::traits_type::eof();
    }

    void reader::append_exact(std::vector<std::byte>& out, std::size_t size) {
        std::size_t done = 0;
        while (done < size) {
            const std::size_t step = std::min(block_size, size - done);
            const std::size_t old_size = out.size();
            out.resize(old_size + step);
            const std::size_t actual = read(out.data() + old_size, step);
            if (actual != step) {
                out.resize(old_size + actual);
                THROW_IO("Unexpected EOF: requested ", size, " got ", done + actual);
            }
            done += step;
        }
    }
}
