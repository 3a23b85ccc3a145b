//
// Test that error messages carry enough context to locate the problem
//

#include <doctest/doctest.h>
#include <string>
#include <vector>

#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/exceptions.hh>
#include <pngmsg/parse_options.hh>
#include <pngmsg/png_file.hh>
#include "test_utils.hh"

using namespace pngmsg;

TEST_CASE("Error messages") {
    SUBCASE("chunk size limit exceeded - shows chunk details") {
        auto data = png_file::from_chunks({chunk("ruSt"_ctype, std::vector<std::byte>(2000))}).as_bytes();

        parse_options opts;
        opts.max_chunk_size = 1024;

        try {
            png_file::parse(data, opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("ruSt") != std::string::npos);
            CHECK(msg.find("offset 8") != std::string::npos);
            CHECK(msg.find("2000") != std::string::npos);
            CHECK(msg.find("1024") != std::string::npos);
        }
    }

    SUBCASE("truncated chunk - shows declared and available sizes") {
        auto data = load_test_data("pixel.png");
        data.resize(33 + 20);  // IDAT record cut short

        try {
            png_file::parse(data);
            FAIL("Should have thrown exception");
        } catch (const too_short_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("IDAT") != std::string::npos);
            CHECK(msg.find("offset 33") != std::string::npos);
            CHECK(msg.find("17") != std::string::npos);
        }
    }

    SUBCASE("crc mismatch - shows both values") {
        auto record = make_record(5, "ruSt", "hello", 0x12345678u);
        try {
            (void)chunk::parse(record);
            FAIL("Should have thrown exception");
        } catch (const checksum_mismatch_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("ruSt") != std::string::npos);
            CHECK(msg.find("0x12345678") != std::string::npos);
        }
    }

    SUBCASE("invalid type code - shows offending byte") {
        try {
            (void)chunk_type::from_string("Ru1t");
            FAIL("Should have thrown exception");
        } catch (const invalid_type_code_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("Ru1t") != std::string::npos);
            CHECK(msg.find("0x31") != std::string::npos);
            CHECK(msg.find("position 2") != std::string::npos);
        }
    }

    SUBCASE("not found - names the type") {
        auto png = png_file::from_chunks({});
        try {
            png.remove_chunk("ruSt");
            FAIL("Should have thrown exception");
        } catch (const not_found_error& e) {
            CHECK(std::string(e.what()).find("ruSt") != std::string::npos);
        }
    }
}
