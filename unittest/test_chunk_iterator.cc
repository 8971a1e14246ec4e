//
// Streaming iteration, container checks and warning callbacks
//

#include <doctest/doctest.h>
#include <pngme/chunk_iterator.hh>
#include <pngme/parser.hh>
#include <pngme/exceptions.hh>
#include <pngme/png.hh>

#include <algorithm>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngme;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }
};

static std::vector<std::string> chunk_types(std::istream& stream, const parse_options& options) {
    std::vector<std::string> types;
    for_each_chunk(stream, [&types](const chunk_iterator::chunk_info& info) {
        types.push_back(info.chunk.type().to_string());
    }, options);
    return types;
}

TEST_CASE("chunk iterator - well formed files") {
    SUBCASE("yields every chunk in order") {
        auto data = sample_png();
        auto stream = as_stream(data);

        chunk_iterator it(stream);
        std::vector<std::string> types;
        std::vector<std::size_t> indices;
        while (it.has_next()) {
            types.push_back(it.current().chunk.type().to_string());
            indices.push_back(it.current().index);
            it.next();
        }

        CHECK(it.at_end());
        CHECK(types == std::vector<std::string>{"IHDR", "IDAT", "IEND"});
        CHECK(indices == std::vector<std::size_t>{0, 1, 2});
    }

    SUBCASE("reports file offsets") {
        auto ihdr = make_chunk("IHDR", std::string(13, '\0'));
        auto data = make_png({ihdr, make_chunk("IEND", "")});
        auto stream = as_stream(data);

        std::vector<std::uint64_t> offsets;
        for_each_chunk(stream, [&offsets](const auto& info) {
            offsets.push_back(info.file_offset);
        });

        REQUIRE(offsets.size() == 2);
        CHECK(offsets[0] == 8);
        CHECK(offsets[1] == 8 + ihdr.encoded_size());
    }

    SUBCASE("chunks compare equal to what was written") {
        auto hidden = make_chunk("ruSt", "hidden");
        auto data = make_png({make_chunk("IHDR", std::string(13, '\0')), hidden, make_chunk("IEND", "")});
        auto stream = as_stream(data);

        chunk_iterator it(stream);
        it.next();
        REQUIRE(it.has_next());
        CHECK(it.current().chunk == hidden);
        CHECK(it.current().chunk.data_as_string() == "hidden");
    }

    SUBCASE("empty chunk data") {
        auto data = make_png({make_chunk("emPt", ""), make_chunk("IEND", "")});
        auto stream = as_stream(data);
        CHECK(chunk_types(stream, parse_options{}) == std::vector<std::string>{"emPt", "IEND"});
    }
}

TEST_CASE("chunk iterator - signature") {
    SUBCASE("wrong signature") {
        auto data = sample_png();
        data[1] = std::byte('Q');
        auto stream = as_stream(data);
        CHECK_THROWS_AS(chunk_iterator{stream}, png_error);
    }

    SUBCASE("too short for a signature") {
        std::vector<std::byte> data = {std::byte(137), std::byte('P'), std::byte('N')};
        auto stream = as_stream(data);
        CHECK_THROWS_AS(chunk_iterator{stream}, png_error);
    }

    SUBCASE("empty stream") {
        std::vector<std::byte> data;
        auto stream = as_stream(data);
        CHECK_THROWS_AS(chunk_iterator{stream}, png_error);
    }
}

TEST_CASE("chunk iterator - corrupted records") {
    SUBCASE("crc mismatch surfaces as chunk_error") {
        auto data = sample_png();
        // Last byte of the IDAT data (just before its CRC)
        const std::size_t idat_end = 8 + make_chunk("IHDR", std::string(13, '\0')).encoded_size()
                                   + 8 + std::string("not really deflate").size() - 1;
        data[idat_end] ^= std::byte(0x01);
        auto stream = as_stream(data);

        auto consume = [&stream]() {
            for_each_chunk(stream, [](const auto&) {});
        };
        CHECK_THROWS_AS(consume(), chunk_error);
    }

    SUBCASE("truncated record surfaces as io_error") {
        auto data = sample_png();
        data.resize(data.size() - 6);
        auto stream = as_stream(data);

        auto consume = [&stream]() {
            for_each_chunk(stream, [](const auto&) {});
        };
        CHECK_THROWS_AS(consume(), io_error);
    }

    SUBCASE("partial length field surfaces as io_error") {
        auto data = make_png({make_chunk("IHDR", std::string(13, '\0'))});
        data.push_back(std::byte(0));
        data.push_back(std::byte(0));
        auto stream = as_stream(data);

        auto consume = [&stream]() {
            for_each_chunk(stream, [](const auto&) {});
        };
        CHECK_THROWS_AS(consume(), io_error);
    }

    SUBCASE("huge declared length on a short stream surfaces as io_error") {
        // Signature, length 0x7fffffff, "IDAT", then nothing
        std::vector<std::byte> data(png::STANDARD_HEADER.size());
        std::transform(png::STANDARD_HEADER.begin(), png::STANDARD_HEADER.end(), data.begin(),
                       [](std::uint8_t b) { return std::byte(b); });
        append(data, {std::byte(0x7f), std::byte(0xff), std::byte(0xff), std::byte(0xff)});
        append(data, to_bytes("IDAT"));
        REQUIRE(data.size() == 16);
        auto stream = as_stream(data);

        auto consume = [&stream]() {
            for_each_chunk(stream, [](const auto&) {});
        };
        CHECK_THROWS_AS(consume(), io_error);
    }
}

TEST_CASE("chunk iterator - IEND handling") {
    SUBCASE("missing IEND in strict mode") {
        auto data = make_png({make_chunk("IHDR", std::string(13, '\0'))});
        auto stream = as_stream(data);
        CHECK_THROWS_AS(chunk_types(stream, parse_options{}), png_error);
    }

    SUBCASE("missing IEND in lenient mode") {
        auto data = make_png({make_chunk("IHDR", std::string(13, '\0'))});
        auto stream = as_stream(data);

        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        CHECK(chunk_types(stream, opts) == std::vector<std::string>{"IHDR"});
        CHECK(tracker.has_warning("missing_iend"));
    }

    SUBCASE("missing IEND allowed") {
        auto data = make_png({make_chunk("IHDR", std::string(13, '\0'))});
        auto stream = as_stream(data);

        warning_tracker tracker;
        parse_options opts;
        opts.require_iend = false;
        opts.on_warning = std::ref(tracker);

        CHECK(chunk_types(stream, opts) == std::vector<std::string>{"IHDR"});
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("iteration stops at IEND") {
        auto data = make_png({make_chunk("IHDR", std::string(13, '\0')), make_chunk("IEND", ""),
                              make_chunk("afTr", "after the end")});
        auto stream = as_stream(data);

        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        CHECK(chunk_types(stream, opts) == std::vector<std::string>{"IHDR", "IEND"});
        REQUIRE(tracker.has_warning("trailing_data"));
        CHECK(tracker.warnings[0].offset == data.size() - make_chunk("afTr", "after the end").encoded_size());
    }

    SUBCASE("trailing data in strict mode") {
        auto data = sample_png();
        data.push_back(std::byte(0));
        auto stream = as_stream(data);
        CHECK_THROWS_AS(chunk_types(stream, parse_options{}), png_error);
    }
}

TEST_CASE("chunk iterator - size limit") {
    auto big = make_chunk("biGg", std::string(100, 'x'));
    auto data = make_png({make_chunk("IHDR", std::string(13, '\0')), big, make_chunk("IEND", "")});

    SUBCASE("strict mode refuses oversized chunks") {
        auto stream = as_stream(data);
        parse_options opts;
        opts.max_chunk_size = 64;
        CHECK_THROWS_AS(chunk_types(stream, opts), png_error);
    }

    SUBCASE("lenient mode skips oversized chunks") {
        auto stream = as_stream(data);

        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.max_chunk_size = 64;
        opts.on_warning = std::ref(tracker);

        CHECK(chunk_types(stream, opts) == std::vector<std::string>{"IHDR", "IEND"});
        CHECK(tracker.has_warning("size_limit"));
    }

    SUBCASE("limit is inclusive") {
        auto stream = as_stream(data);
        parse_options opts;
        opts.max_chunk_size = 100;
        CHECK(chunk_types(stream, opts) == std::vector<std::string>{"IHDR", "biGg", "IEND"});
    }
}
