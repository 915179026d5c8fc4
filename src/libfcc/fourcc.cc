//
// Created by igor on 10/08/2025.
//

#include <fcc/fourcc.hh>
#include <ostream>
#include <iomanip>

namespace fcc {

    fourcc::fourcc(std::string_view sv) {
        THROW_SHORT_INPUT_IF(sv.size(), length, "string");
        // only the encoded bytes matter, a multi-byte sequence may be cut
        std::memcpy(b_.data(), sv.data(), length);
    }

    std::optional<fourcc> fourcc::try_from_string(std::string_view sv) noexcept {
        if (sv.size() < length) {
            return std::nullopt;
        }
        return from_bytes(sv.data());
    }

    std::string fourcc::to_string() const {
        return std::string(to_string_view());
    }

    std::string fourcc::to_debug_string() const {
        std::string out;
        out.reserve(length + 2);
        out += '\'';
        out.append(to_string_view());
        out += '\'';
        return out;
    }

    std::string fourcc::to_utf8() const {
        std::string out;
        out.reserve(length * 2);
        for (std::uint8_t c : b_) {
            if (c < 0x80) {
                out += static_cast<char>(c);
            } else {
                out += static_cast<char>(0xC0 | (c >> 6));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
        }
        return out;
    }

    std::string fourcc::to_string_trimmed() const {
        auto str = to_string();
        str.erase(str.find_last_not_of(' ') + 1);
        return str;
    }

    std::ostream& operator<<(std::ostream& os, const fourcc& f) {
        if (os.flags() & std::ios::hex) {
            // Save and restore format flags
            auto flags = os.flags();
            auto fill = os.fill();
            os << "0x" << std::hex << std::setfill('0') << std::setw(8)
               << f.to_uint32();
            os.flags(flags);
            os.fill(fill);
        } else {
            os << '\'';
            os.write(reinterpret_cast<const char*>(f.data()), fourcc::length);
            os << '\'';
        }
        return os;
    }
}
