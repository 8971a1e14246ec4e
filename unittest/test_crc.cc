#include <doctest/doctest.h>
#include <pngme/crc.hh>
#include <pngme/chunk_type.hh>

#include <string>
#include <vector>

using namespace pngme;

TEST_SUITE("CRC") {
    TEST_CASE("CRC-32/ISO-HDLC reference values") {
        SUBCASE("check value") {
            const std::string s = "123456789";
            CHECK(crc32(s.data(), s.size()) == 0xCBF43926u);
        }

        SUBCASE("empty input") {
            CHECK(crc32(nullptr, 0) == 0u);
        }

        SUBCASE("IEND chunk") {
            // Every PNG ends with 00 00 00 00 'IEND' AE 42 60 82
            CHECK(chunk_crc(chunk_id::IEND, nullptr, 0) == 0xAE426082u);
        }
    }

    TEST_CASE("incremental update matches one-shot") {
        const std::string s = "This is where your secret message will be!";
        const std::uint32_t whole = crc32(s.data(), s.size());

        for (std::size_t split = 0; split <= s.size(); split += 7) {
            std::uint32_t crc = crc32(s.data(), split);
            crc = crc32_update(crc, s.data() + split, s.size() - split);
            CHECK(crc == whole);
        }
    }

    TEST_CASE("chunk_crc covers type then data") {
        const std::string message = "This is where your secret message will be!";
        CHECK(chunk_crc(chunk_type("RuSt"), message.data(), message.size()) == 2882656334u);

        const std::string joined = "RuSt" + message;
        CHECK(crc32(joined.data(), joined.size()) == 2882656334u);

        // Changing only the tag changes the checksum
        CHECK(chunk_crc(chunk_type("RuST"), message.data(), message.size()) != 2882656334u);
    }
}
