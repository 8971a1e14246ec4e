//
// Created by igor on 16/08/2025.
//

#include <pngme/png.hh>
#include <pngme/parser.hh>
#include <pngme/exceptions.hh>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace pngme {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::from_bytes(const std::vector<std::byte>& buffer) {
        return from_bytes(buffer, parse_options{});
    }

    png png::from_bytes(const std::vector<std::byte>& buffer, const parse_options& options) {
        std::istringstream stream(std::string(reinterpret_cast<const char*>(buffer.data()), buffer.size()));
        return from_stream(stream, options);
    }

    png png::from_stream(std::istream& stream) {
        return from_stream(stream, parse_options{});
    }

    png png::from_stream(std::istream& stream, const parse_options& options) {
        std::vector<chunk> chunks;
        for_each_chunk(stream, [&chunks](const chunk_iterator::chunk_info& info) {
            chunks.push_back(info.chunk);
        }, options);
        return png(std::move(chunks));
    }

    png png::from_file(const std::filesystem::path& path) {
        return from_file(path, parse_options{});
    }

    png png::from_file(const std::filesystem::path& path, const parse_options& options) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file '", path.string(), "'");
        return from_stream(file, options);
    }

    void png::append_chunk(chunk c) {
        if (!m_chunks.empty() && m_chunks.back().type() == chunk_id::IEND) {
            m_chunks.insert(m_chunks.end() - 1, std::move(c));
        } else {
            m_chunks.push_back(std::move(c));
        }
    }

    chunk png::remove_first_chunk(std::string_view type_label) {
        const chunk_type wanted(type_label);
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&wanted](const chunk& c) {
            return c.type() == wanted;
        });
        THROW_PNG_IF(it == m_chunks.end(), "No chunk of type ", wanted, " found");

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::chunk_by_type(std::string_view type_label) const {
        const chunk_type wanted(type_label);
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&wanted](const chunk& c) {
            return c.type() == wanted;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<std::byte> png::as_bytes() const {
        std::size_t total = STANDARD_HEADER.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        for (std::uint8_t b : STANDARD_HEADER) {
            out.push_back(std::byte(b));
        }
        for (const auto& c : m_chunks) {
            auto encoded = c.encode();
            out.insert(out.end(), encoded.begin(), encoded.end());
        }
        return out;
    }

    void png::write(std::ostream& os) const {
        auto bytes = as_bytes();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(os, "Failed to write ", bytes.size(), " bytes");
    }

    void png::write_file(const std::filesystem::path& path) const {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Cannot open file '", path.string(), "' for writing");
        write(file);
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        const auto& chunks = p.chunks();
        for (std::size_t i = 0; i < chunks.size(); i++) {
            const auto& c = chunks[i];
            auto flags = os.flags();
            auto fill = os.fill();
            os << std::setw(3) << i << ": " << c.type()
               << " length=" << c.length()
               << " crc=0x" << std::hex << std::setfill('0') << std::setw(8) << c.crc() << '\n';
            os.flags(flags);
            os.fill(fill);
        }
        return os;
    }

} // namespace pngme
