#include "srcfmt/core/line_ending.hpp"
#include "srcfmt/core/string_utils.hpp"
#include "srcfmt/errors.hpp"

namespace srcfmt::line_endings {

auto parse(std::string_view name) -> LineEnding {
    auto lowered = StringUtils::to_lowercase(StringUtils::trim(name));
    if (lowered == "auto") return LineEnding::AUTO;
    if (lowered == "keep") return LineEnding::KEEP;
    if (lowered == "lf") return LineEnding::LF;
    if (lowered == "crlf") return LineEnding::CRLF;
    if (lowered == "cr") return LineEnding::CR;
    throw ConfigError("Unknown line ending '" + std::string(name)
                      + "', expected one of AUTO, KEEP, LF, CRLF, CR");
}

auto name(LineEnding ending) -> std::string {
    switch (ending) {
    case LineEnding::AUTO:
        return "AUTO";
    case LineEnding::KEEP:
        return "KEEP";
    case LineEnding::LF:
        return "LF";
    case LineEnding::CRLF:
        return "CRLF";
    case LineEnding::CR:
        return "CR";
    }
    return "AUTO";
}

auto native_separator() -> std::string {
#ifdef _WIN32
    return "\r\n";
#else
    return "\n";
#endif
}

auto separator(LineEnding ending) -> std::string {
    switch (ending) {
    case LineEnding::LF:
        return "\n";
    case LineEnding::CRLF:
        return "\r\n";
    case LineEnding::CR:
        return "\r";
    case LineEnding::AUTO:
    case LineEnding::KEEP:
        break;
    }
    return native_separator();
}

auto detect(std::string_view text) -> std::optional<LineEnding> {
    size_t lf_count = 0;
    size_t crlf_count = 0;
    size_t cr_count = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                crlf_count++;
                ++i;
            } else {
                cr_count++;
            }
        } else if (text[i] == '\n') {
            lf_count++;
        }
    }

    int styles_seen = (lf_count > 0) + (crlf_count > 0) + (cr_count > 0);
    if (styles_seen != 1) {
        return std::nullopt;
    }
    if (lf_count > 0) return LineEnding::LF;
    if (crlf_count > 0) return LineEnding::CRLF;
    return LineEnding::CR;
}

auto resolve_separator(LineEnding policy, std::string_view text) -> std::string {
    if (policy == LineEnding::KEEP) {
        if (auto detected = detect(text)) {
            return separator(*detected);
        }
        return native_separator();
    }
    return separator(policy);
}

} // namespace srcfmt::line_endings
