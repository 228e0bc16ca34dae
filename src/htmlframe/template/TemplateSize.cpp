#include <htmlframe/template/TemplateSize.hpp>

#include <charconv>
#include <system_error>

namespace HF::Template {

namespace {

auto parse_dimension(std::string_view digits) -> std::optional<int> {
    if (digits.empty()) {
        return std::nullopt;
    }
    for (char ch : digits) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
    }
    int  value  = 0;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec != std::errc{} || value <= 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto ParseSizeToken(std::string_view token) -> std::optional<FrameSize> {
    auto separator = token.find('x');
    if (separator == std::string_view::npos) {
        return std::nullopt;
    }
    auto width  = parse_dimension(token.substr(0, separator));
    auto height = parse_dimension(token.substr(separator + 1));
    if (!width || !height) {
        return std::nullopt;
    }
    return FrameSize{*width, *height};
}

auto FormatSizeToken(FrameSize size) -> std::string {
    return std::to_string(size.width) + "x" + std::to_string(size.height);
}

auto ResolveTemplateSize(std::string_view template_path, FrameSize fallback) -> FrameSize {
    // Walk directory segments from the file name towards the root; both
    // separators are accepted so template keys and native paths behave alike.
    auto end = template_path.find_last_of("/\\");
    while (end != std::string_view::npos) {
        auto segment_path = template_path.substr(0, end);
        auto begin        = segment_path.find_last_of("/\\");
        auto segment      = begin == std::string_view::npos ? segment_path : segment_path.substr(begin + 1);
        if (auto size = ParseSizeToken(segment)) {
            return *size;
        }
        end = begin;
    }
    return fallback;
}

} // namespace HF::Template
