#include <core/util/text.h>
#include <cstdint>

namespace tailkit::core {

namespace text {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

} // namespace

std::string_view Trim(std::string_view value) {
    auto begin = value.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = value.find_last_not_of(kWhitespace);
    return value.substr(begin, end - begin + 1);
}

bool IsValidUtf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        auto lead = static_cast<std::uint8_t>(bytes[i]);
        std::size_t length = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + length > bytes.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            auto continuation = static_cast<std::uint8_t>(bytes[i + k]);
            if ((continuation & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (continuation & 0x3F);
        }
        // overlong forms, UTF-16 surrogates and values past U+10FFFF
        if ((length == 2 && code_point < 0x80) || (length == 3 && code_point < 0x800)
            || (length == 4 && code_point < 0x10000) || code_point > 0x10FFFF
            || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string JoinCommandLine(std::string_view program, const std::vector<std::string>& args) {
    std::string line(program);
    for (const auto& arg : args) {
        line += ' ';
        line += arg;
    }
    return line;
}

} // namespace text

} // namespace tailkit::core
