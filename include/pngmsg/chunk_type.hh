//
// PNG chunk type code: four ASCII letters whose case bits carry flags.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>

#include <pngmsg/exceptions.hh>

namespace pngmsg {

    /**
     * @enum validity_rule
     * @brief Selects what chunk_type::is_valid() checks
     */
    enum class validity_rule {
        private_and_reserved, ///< valid iff the chunk is private and the reserved bit is clear
        reserved_only         ///< valid iff the reserved bit is clear (PNG 1.2 meaning)
    };

    constexpr bool is_ascii_alpha(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    namespace detail {
        [[noreturn]] inline void throw_non_alphabetic(std::string_view text, std::size_t index) {
            throw invalid_type_code_error(
                build_error_msg("Chunk type '", text, "' has a non-alphabetic byte 0x",
                                std::hex, std::setw(2), std::setfill('0'),
                                static_cast<unsigned>(static_cast<unsigned char>(text[index])),
                                std::dec, " at position ", index),
                invalid_type_code_error::reason_t::non_alphabetic);
        }

        [[noreturn]] inline void throw_invalid_length(std::string_view text) {
            throw invalid_type_code_error(
                build_error_msg("Chunk type '", text, "' must be exactly 4 characters, got ", text.size()),
                invalid_type_code_error::reason_t::invalid_length);
        }
    }

    /**
     * @class chunk_type
     * @brief Validated 4-byte chunk type code
     *
     * Every construction path checks that all four bytes are ASCII letters,
     * so a chunk_type object always holds a well-formed code.
     */
    class chunk_type {
    public:
        // Constructor from 4 individual chars
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {
            for (std::size_t i = 0; i < b.size(); ++i) {
                if (!is_ascii_alpha(b[i])) {
                    detail::throw_non_alphabetic(to_string_view(), i);
                }
            }
        }

        // Constructor from raw bytes
        static chunk_type from_bytes(const void* data) {
            const auto* p = static_cast<const char*>(data);
            return { p[0], p[1], p[2], p[3] };
        }

        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes) {
            return from_bytes(bytes.data());
        }

        // Constructor from text, which must be exactly four letters
        static chunk_type from_string(std::string_view sv) {
            if (sv.size() != 4) {
                detail::throw_invalid_length(sv);
            }
            return from_bytes(sv.data());
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] constexpr std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::array<std::uint8_t, 4> bytes() const {
            std::array<std::uint8_t, 4> result;
            std::memcpy(result.data(), b.data(), 4);
            return result;
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Ancillary chunks (lowercase first letter) may be dropped by decoders
        [[nodiscard]] constexpr bool is_critical() const { return is_upper(b[0]); }
        [[nodiscard]] constexpr bool is_public() const { return is_upper(b[1]); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return is_upper(b[2]); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return !is_upper(b[3]); }

        /**
         * @brief Check the type code flags
         * @param rule private_and_reserved (default) also rejects public chunks;
         *             reserved_only checks the reserved bit alone
         */
        [[nodiscard]] constexpr bool is_valid(validity_rule rule = validity_rule::private_and_reserved) const {
            switch (rule) {
                case validity_rule::reserved_only:
                    return is_reserved_bit_valid();
                case validity_rule::private_and_reserved:
                    break;
            }
            return !is_public() && is_reserved_bit_valid();
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }

        bool operator==(std::string_view text) const { return to_string_view() == text; }
        bool operator!=(std::string_view text) const { return !(*this == text); }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << t.to_string_view();
        }

    private:
        // Bit 5 selects case for ASCII letters
        static constexpr bool is_upper(char c) {
            return (static_cast<unsigned char>(c) & 0x20u) == 0;
        }

        std::array<char, 4> b;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            t.to_bytes(&v);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for chunk type constants, e.g. "IEND"_ctype
    constexpr chunk_type operator""_ctype(const char* str, std::size_t len) {
        if (len != 4) {
            detail::throw_invalid_length(std::string_view(str, len));
        }
        return { str[0], str[1], str[2], str[3] };
    }

    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
    }

}
// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngmsg::chunk_type> {
        std::size_t operator()(const pngmsg::chunk_type& t) const noexcept {
            return pngmsg::chunk_type_hash{}(t);
        }
    };
}
