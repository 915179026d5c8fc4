//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <iosfwd>
#include <type_traits>
#include <functional>

#include <fcc/export_fcc.h>
#include <fcc/endian.hh>
#include <fcc/exceptions.hh>

namespace fcc {
    class FCC_EXPORT fourcc {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;
        using const_iterator = bytes_type::const_iterator;

        static constexpr std::size_t length = 4;

        // Default constructor - four zero bytes
        constexpr fourcc() = default;

        // Constructor from 4 individual chars
        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b_{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                  static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        // Constructor from raw bytes, stored as given
        constexpr explicit fourcc(const bytes_type& bytes)
            : b_(bytes) {}

        // Constructor from uint32_t (big-endian: first byte is the most significant)
        explicit fourcc(std::uint32_t value) {
            store_be32(value, b_.data());
        }

        // Constructor from the first 4 bytes of a string.
        // Throws short_input_error if fewer than 4 bytes are available.
        explicit fourcc(std::string_view sv);

        explicit fourcc(const std::string& str) : fourcc(std::string_view(str)) {}

        // Constructor from C-string, a null pointer counts as empty
        fourcc(const char* str) : fourcc(str ? std::string_view(str) : std::string_view()) {}

        // A literal 0 or NULL is not a string; this makes such conversions ambiguous
        fourcc(std::nullptr_t) = delete;

        static fourcc from_bytes(const bytes_type& bytes) {
            return fourcc(bytes);
        }

        // Copies exactly 4 bytes from data
        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b_.data(), data, length);
            return result;
        }

        // Copies the first 4 bytes of a sized buffer
        static fourcc from_bytes(const void* data, std::size_t len) {
            THROW_SHORT_INPUT_IF(len, length, "byte buffer");
            return from_bytes(data);
        }

        static fourcc from_string(std::string_view sv) {
            return fourcc(sv);
        }

        // Same as from_string, but reports short input as nullopt
        static std::optional<fourcc> try_from_string(std::string_view sv) noexcept;

        static fourcc from_uint32(std::uint32_t value) {
            return fourcc(value);
        }

        [[nodiscard]] constexpr bytes_type to_bytes() const noexcept {
            return b_;
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b_.data(), length);
        }

        // Convert to uint32_t (big-endian)
        [[nodiscard]] std::uint32_t to_uint32() const noexcept {
            return load_be32(b_.data());
        }

        explicit operator std::uint32_t() const noexcept { return to_uint32(); }
        explicit operator bytes_type() const noexcept { return b_; }

        // Raw bytes as 4 characters, no escaping
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] std::string_view to_string_view() const noexcept {
            return {reinterpret_cast<const char*>(b_.data()), length};
        }

        // Raw bytes wrapped in single quotes: 'RGBA'
        [[nodiscard]] std::string to_debug_string() const;

        // Each byte as the code point of the same value (Latin-1), UTF-8 encoded
        [[nodiscard]] std::string to_utf8() const;

        // Trim trailing spaces
        [[nodiscard]] std::string to_string_trimmed() const;

        // Access individual bytes
        constexpr std::uint8_t operator[](std::size_t i) const { return b_[i]; }

        [[nodiscard]] constexpr const std::uint8_t* data() const noexcept { return b_.data(); }
        [[nodiscard]] static constexpr std::size_t size() noexcept { return length; }

        // Iterators
        [[nodiscard]] constexpr const_iterator begin() const noexcept { return b_.begin(); }
        [[nodiscard]] constexpr const_iterator end() const noexcept { return b_.end(); }

        // All four bytes are visible ASCII (0x21..0x7E)
        [[nodiscard]] bool is_valid() const noexcept {
            return std::all_of(b_.begin(), b_.end(), [](std::uint8_t c) {
                return c >= 0x21 && c <= 0x7E;
            });
        }

        // Like is_valid, but space is allowed
        [[nodiscard]] bool is_printable() const noexcept {
            return std::all_of(b_.begin(), b_.end(), [](std::uint8_t c) {
                return c >= 0x20 && c <= 0x7E;
            });
        }

        // Check if contains spaces (padding)
        [[nodiscard]] bool has_padding() const noexcept {
            return std::any_of(b_.begin(), b_.end(), [](std::uint8_t c) {
                return c == ' ';
            });
        }

        // Comparison operators, unsigned byte-wise
        friend bool operator==(const fourcc& a, const fourcc& o) noexcept { return a.b_ == o.b_; }
        friend bool operator!=(const fourcc& a, const fourcc& o) noexcept { return a.b_ != o.b_; }
        friend bool operator<(const fourcc& a, const fourcc& o) noexcept { return a.b_ < o.b_; }
        friend bool operator<=(const fourcc& a, const fourcc& o) noexcept { return a.b_ <= o.b_; }
        friend bool operator>(const fourcc& a, const fourcc& o) noexcept { return a.b_ > o.b_; }
        friend bool operator>=(const fourcc& a, const fourcc& o) noexcept { return a.b_ >= o.b_; }

    private:
        bytes_type b_{};
    };

    // Quoted form by default, 0x%08x of to_uint32() when std::hex is set
    FCC_EXPORT std::ostream& operator<<(std::ostream& os, const fourcc& f);

    namespace detail {
        // Representations a fourcc can be compared against
        template<typename T>
        struct is_fourcc_source : std::false_type {};

        template<> struct is_fourcc_source<fourcc::bytes_type> : std::true_type {};
        template<> struct is_fourcc_source<std::string_view> : std::true_type {};
        template<> struct is_fourcc_source<std::string> : std::true_type {};
        template<> struct is_fourcc_source<const char*> : std::true_type {};
        template<> struct is_fourcc_source<char*> : std::true_type {};
        template<> struct is_fourcc_source<std::uint32_t> : std::true_type {};

        template<typename T>
        inline constexpr bool is_fourcc_source_v = is_fourcc_source<std::decay_t<T>>::value;

        template<typename T>
        using enable_if_source_t = std::enable_if_t<is_fourcc_source_v<T>, int>;

        inline fourcc to_fourcc(const fourcc::bytes_type& bytes) { return fourcc(bytes); }
        inline fourcc to_fourcc(std::string_view sv) { return fourcc(sv); }
        inline fourcc to_fourcc(const char* str) { return fourcc(str); }
        inline fourcc to_fourcc(std::uint32_t value) { return fourcc(value); }
    }

    // Heterogeneous comparisons: the foreign operand is converted with the
    // same rule as construction, so a short string throws short_input_error.
    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator==(const fourcc& a, const T& b) { return a == detail::to_fourcc(b); }
    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator==(const T& a, const fourcc& b) { return detail::to_fourcc(a) == b; }

    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator!=(const fourcc& a, const T& b) { return a != detail::to_fourcc(b); }
    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator!=(const T& a, const fourcc& b) { return detail::to_fourcc(a) != b; }

    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator<(const fourcc& a, const T& b) { return a < detail::to_fourcc(b); }
    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator<(const T& a, const fourcc& b) { return detail::to_fourcc(a) < b; }

    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator<=(const fourcc& a, const T& b) { return a <= detail::to_fourcc(b); }
    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator<=(const T& a, const fourcc& b) { return detail::to_fourcc(a) <= b; }

    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator>(const fourcc& a, const T& b) { return a > detail::to_fourcc(b); }
    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator>(const T& a, const fourcc& b) { return detail::to_fourcc(a) > b; }

    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator>=(const fourcc& a, const T& b) { return a >= detail::to_fourcc(b); }
    template<typename T, detail::enable_if_source_t<T> = 0>
    bool operator>=(const T& a, const fourcc& b) { return detail::to_fourcc(a) >= b; }

    // Hash function
    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            // Multiplicative mixing with the 32-bit golden ratio
            return (static_cast<std::size_t>(f.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    inline namespace literals {
        // User-defined literal for compile-time fourcc creation.
        // Characters past the fourth are ignored, fewer than four do not compile.
        constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
            if (len < fourcc::length) {
                THROW_SHORT_INPUT(len, "fourcc literal must have at least 4 characters, got ", len);
            }
            return { str[0], str[1], str[2], str[3] };
        }
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<fcc::fourcc> {
        std::size_t operator()(const fcc::fourcc& f) const noexcept {
            return fcc::fourcc_hash{}(f);
        }
    };
}
