//
// Created by igor on 14/08/2025.
//

#include <fcc/format.hh>

namespace fcc {

    namespace {
        constexpr const char* lower_digits = "0123456789abcdef";
        constexpr const char* upper_digits = "0123456789ABCDEF";

        void append_hex(std::string& out, std::uint32_t value, int digits, bool upper) {
            const char* table = upper ? upper_digits : lower_digits;
            for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
                out += table[(value >> shift) & 0xF];
            }
        }
    }

    std::string format_fourcc(const fourcc& f, const format_options& opts) {
        std::string out;
        switch (opts.style) {
            case render_style::plain:
                return f.to_string();

            case render_style::quoted:
                out += opts.quote;
                out.append(f.to_string_view());
                out += opts.quote;
                return out;

            case render_style::escaped:
                out += opts.quote;
                for (std::uint8_t c : f) {
                    if (c >= 0x20 && c <= 0x7E) {
                        out += static_cast<char>(c);
                    } else {
                        out += "\\x";
                        append_hex(out, c, 2, opts.uppercase_hex);
                    }
                }
                out += opts.quote;
                return out;

            case render_style::hex:
                out += "0x";
                append_hex(out, f.to_uint32(), 8, opts.uppercase_hex);
                return out;
        }
        // make compiler happy
        return f.to_string();
    }

} // namespace fcc
