#include "srcfmt/core/encoding.hpp"
#include "srcfmt/core/string_utils.hpp"
#include "srcfmt/errors.hpp"

namespace srcfmt::encodings {

namespace {

auto is_valid_utf8(std::string_view text) -> bool {
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t continuation = 0;
        unsigned int code_point = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            continuation = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            continuation = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            continuation = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + continuation >= text.size()) {
            return false;
        }
        for (size_t k = 1; k <= continuation; ++k) {
            auto byte = static_cast<unsigned char>(text[i + k]);
            if ((byte & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (byte & 0x3F);
        }

        // Overlong forms, surrogates and out-of-range values
        if ((continuation == 1 && code_point < 0x80) || (continuation == 2 && code_point < 0x800)
            || (continuation == 3 && code_point < 0x10000) || code_point > 0x10FFFF
            || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += continuation + 1;
    }
    return true;
}

} // namespace

auto parse(std::string_view name) -> Encoding {
    auto lowered = StringUtils::to_lowercase(StringUtils::trim(name));
    if (lowered == "utf-8" || lowered == "utf8") return Encoding::UTF8;
    if (lowered == "us-ascii" || lowered == "ascii") return Encoding::US_ASCII;
    if (lowered == "iso-8859-1" || lowered == "latin1" || lowered == "iso8859-1") {
        return Encoding::ISO_8859_1;
    }
    throw ConfigError("Encoding '" + std::string(name) + "' is not supported");
}

auto name(Encoding encoding) -> std::string {
    switch (encoding) {
    case Encoding::UTF8:
        return "UTF-8";
    case Encoding::US_ASCII:
        return "US-ASCII";
    case Encoding::ISO_8859_1:
        return "ISO-8859-1";
    }
    return "UTF-8";
}

auto platform_default() -> Encoding { return Encoding::UTF8; }

auto is_valid(std::string_view text, Encoding encoding) -> bool {
    switch (encoding) {
    case Encoding::UTF8:
        return is_valid_utf8(text);
    case Encoding::US_ASCII:
        for (char c : text) {
            if (static_cast<unsigned char>(c) > 0x7F) {
                return false;
            }
        }
        return true;
    case Encoding::ISO_8859_1:
        return true;
    }
    return false;
}

} // namespace srcfmt::encodings
