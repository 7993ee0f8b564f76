#include "beacon_presence/text_decoding.hpp"

#include <cstdint>
#include <optional>

namespace beacon_presence {

namespace {

constexpr std::uint32_t k_replacement_character{0xFFFD};
constexpr std::size_t k_escape_length{6};  // "\uXXXX"

std::optional<std::uint32_t> parse_escape(std::string_view text, std::size_t offset) {
    if (offset + k_escape_length > text.size() || text[offset] != '\\' || (text[offset + 1] != 'u' && text[offset + 1] != 'U')) {
        return std::nullopt;
    }
    std::uint32_t code_unit = 0;
    for (std::size_t index = offset + 2; index < offset + k_escape_length; ++index) {
        const char digit = text[index];
        code_unit <<= 4;
        if (digit >= '0' && digit <= '9') {
            code_unit |= static_cast<std::uint32_t>(digit - '0');
        } else if (digit >= 'a' && digit <= 'f') {
            code_unit |= static_cast<std::uint32_t>(digit - 'a' + 10);
        } else if (digit >= 'A' && digit <= 'F') {
            code_unit |= static_cast<std::uint32_t>(digit - 'A' + 10);
        } else {
            return std::nullopt;
        }
    }
    return code_unit;
}

void append_utf8(std::string& output, std::uint32_t code_point) {
    if (code_point < 0x80) {
        output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        output.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        output.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        output.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        output.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

bool is_high_surrogate(std::uint32_t code_unit) {
    return code_unit >= 0xD800 && code_unit <= 0xDBFF;
}

bool is_low_surrogate(std::uint32_t code_unit) {
    return code_unit >= 0xDC00 && code_unit <= 0xDFFF;
}

}  // namespace

std::string decode_unicode_escapes(std::string_view text) {
    if (text.find('\\') == std::string_view::npos) {
        return std::string{text};
    }

    std::string output;
    output.reserve(text.size());
    std::size_t offset = 0;
    while (offset < text.size()) {
        const std::optional<std::uint32_t> code_unit = parse_escape(text, offset);
        if (!code_unit.has_value()) {
            output.push_back(text[offset]);
            ++offset;
            continue;
        }
        offset += k_escape_length;

        if (is_high_surrogate(*code_unit)) {
            const std::optional<std::uint32_t> trailing = parse_escape(text, offset);
            if (trailing.has_value() && is_low_surrogate(*trailing)) {
                offset += k_escape_length;
                append_utf8(output, 0x10000 + ((*code_unit - 0xD800) << 10) + (*trailing - 0xDC00));
                continue;
            }
            append_utf8(output, k_replacement_character);
            continue;
        }
        if (is_low_surrogate(*code_unit)) {
            append_utf8(output, k_replacement_character);
            continue;
        }
        append_utf8(output, *code_unit);
    }
    return output;
}

Json::Value decode_text_fields(const Json::Value& value) {
    switch (value.type()) {
        case Json::stringValue:
            return Json::Value{decode_unicode_escapes(value.asString())};
        case Json::arrayValue: {
            Json::Value decoded{Json::arrayValue};
            for (const Json::Value& item : value) {
                decoded.append(decode_text_fields(item));
            }
            return decoded;
        }
        case Json::objectValue: {
            Json::Value decoded{Json::objectValue};
            for (const std::string& key : value.getMemberNames()) {
                decoded[key] = decode_text_fields(value[key]);
            }
            return decoded;
        }
        default:
            return value;
    }
}

}  // namespace beacon_presence
