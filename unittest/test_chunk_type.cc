#include <doctest/doctest.h>
#include <pngmsg/chunk_type.hh>
#include <pngmsg/exceptions.hh>

#include <sstream>
#include <unordered_set>

using namespace pngmsg;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from bytes") {
            std::array<std::uint8_t, 4> expected = {82, 117, 83, 116};
            auto actual = chunk_type::from_bytes(expected);
            CHECK(actual.bytes() == expected);
            CHECK(actual.to_string() == "RuSt");
        }

        SUBCASE("from string") {
            auto expected = chunk_type::from_bytes(std::array<std::uint8_t, 4>{82, 117, 83, 116});
            auto actual = chunk_type::from_string("RuSt");
            CHECK(actual == expected);
        }

        SUBCASE("from raw pointer") {
            const char raw[] = {'t', 'E', 'X', 't'};
            auto t = chunk_type::from_bytes(raw);
            CHECK(t.to_string_view() == "tEXt");
        }

        SUBCASE("individual chars") {
            chunk_type t('I', 'D', 'A', 'T');
            CHECK(t == chunk_types::IDAT);
            CHECK(t[0] == 'I');
            CHECK(t[3] == 'T');
        }

        SUBCASE("user-defined literal") {
            constexpr auto iend = "IEND"_ctype;
            CHECK(iend == chunk_types::IEND);
            CHECK(iend.to_string() == "IEND");
        }
    }

    TEST_CASE("chunk_type validation") {
        SUBCASE("four letters accepted") {
            CHECK_NOTHROW(chunk_type::from_string("RuSt"));
            CHECK_NOTHROW(chunk_type::from_string("abcd"));
            CHECK_NOTHROW(chunk_type::from_string("ZZZZ"));
        }

        SUBCASE("digit rejected") {
            CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), invalid_type_code_error);
            try {
                (void)chunk_type::from_string("Ru1t");
            } catch (const invalid_type_code_error& e) {
                CHECK(e.reason() == invalid_type_code_error::reason_t::non_alphabetic);
            }
        }

        SUBCASE("wrong length rejected") {
            CHECK_THROWS_AS(chunk_type::from_string("Ru"), invalid_type_code_error);
            CHECK_THROWS_AS(chunk_type::from_string(""), invalid_type_code_error);
            CHECK_THROWS_AS(chunk_type::from_string("RuStRuSt"), invalid_type_code_error);
            try {
                (void)chunk_type::from_string("Ru");
            } catch (const invalid_type_code_error& e) {
                CHECK(e.reason() == invalid_type_code_error::reason_t::invalid_length);
            }
        }

        SUBCASE("raw bytes are validated too") {
            CHECK_THROWS_AS(chunk_type::from_bytes(std::array<std::uint8_t, 4>{82, 117, 0, 116}),
                            invalid_type_code_error);
            CHECK_THROWS_AS(chunk_type::from_bytes(std::array<std::uint8_t, 4>{'R', 'u', ' ', 't'}),
                            invalid_type_code_error);
            // Neighbours of the letter ranges
            CHECK_THROWS_AS(chunk_type::from_string("@aaa"), invalid_type_code_error);
            CHECK_THROWS_AS(chunk_type::from_string("[aaa"), invalid_type_code_error);
            CHECK_THROWS_AS(chunk_type::from_string("`aaa"), invalid_type_code_error);
            CHECK_THROWS_AS(chunk_type::from_string("{aaa"), invalid_type_code_error);
        }

        SUBCASE("invalid type is a parse error") {
            CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), parse_error);
            CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), pngmsg_error);
        }
    }

    TEST_CASE("chunk_type flags") {
        SUBCASE("RuSt") {
            auto t = chunk_type::from_string("RuSt");
            CHECK(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy());
        }

        SUBCASE("ancillary") {
            CHECK_FALSE(chunk_type::from_string("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_string("RUSt").is_public());
        }

        SUBCASE("reserved bit set") {
            CHECK_FALSE(chunk_type::from_string("Rust").is_reserved_bit_valid());
        }

        SUBCASE("unsafe to copy") {
            CHECK_FALSE(chunk_type::from_string("RuST").is_safe_to_copy());
        }

        SUBCASE("standard chunks") {
            CHECK(chunk_types::IHDR.is_critical());
            CHECK(chunk_types::IHDR.is_public());
            CHECK_FALSE(chunk_types::IHDR.is_safe_to_copy());
            auto text = "tEXt"_ctype;
            CHECK_FALSE(text.is_critical());
            CHECK(text.is_public());
            CHECK(text.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk_type validity rules") {
        SUBCASE("private with reserved bit clear") {
            auto t = chunk_type::from_string("RuSt");
            CHECK(t.is_valid());
            CHECK(t.is_valid(validity_rule::private_and_reserved));
            CHECK(t.is_valid(validity_rule::reserved_only));
        }

        SUBCASE("reserved bit set is invalid under both rules") {
            auto t = chunk_type::from_string("Rust");
            CHECK_FALSE(t.is_valid());
            CHECK_FALSE(t.is_valid(validity_rule::reserved_only));
        }

        SUBCASE("public chunks differ between rules") {
            // The default rule only accepts private chunks
            auto t = chunk_type::from_string("IHDR");
            CHECK_FALSE(t.is_valid());
            CHECK(t.is_valid(validity_rule::reserved_only));
        }
    }

    TEST_CASE("chunk_type comparison and output") {
        SUBCASE("equality") {
            CHECK(chunk_type::from_string("RuSt") == chunk_type::from_string("RuSt"));
            CHECK(chunk_type::from_string("RuSt") != chunk_type::from_string("rust"));
            CHECK(chunk_type::from_string("RuSt") == std::string_view("RuSt"));
            CHECK(chunk_type::from_string("RuSt") != std::string_view("RUST"));
        }

        SUBCASE("ordering") {
            CHECK(chunk_type::from_string("AAAA") < chunk_type::from_string("AAAB"));
            CHECK_FALSE(chunk_type::from_string("AAAB") < chunk_type::from_string("AAAA"));
        }

        SUBCASE("stream output") {
            std::ostringstream oss;
            oss << chunk_type::from_string("RuSt");
            CHECK(oss.str() == "RuSt");
        }

        SUBCASE("hashing") {
            std::unordered_set<chunk_type> set;
            set.insert(chunk_types::IHDR);
            set.insert(chunk_types::IEND);
            set.insert("IHDR"_ctype);
            CHECK(set.size() == 2);
            CHECK(set.count(chunk_types::IEND) == 1);
        }
    }
}
