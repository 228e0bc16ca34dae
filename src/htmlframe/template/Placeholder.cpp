#include <htmlframe/template/Placeholder.hpp>

namespace HF::Template {

namespace {

constexpr auto is_name_start(char ch) -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

constexpr auto is_name_char(char ch) -> bool {
    return is_name_start(ch) || (ch >= '0' && ch <= '9');
}

constexpr auto is_type_char(char ch) -> bool {
    return ch >= 'a' && ch <= 'z';
}

} // namespace

auto MatchPlaceholderAt(std::string_view text, std::size_t offset) -> std::optional<PlaceholderMatch> {
    if (offset + 2 > text.size() || text[offset] != '{' || text[offset + 1] != '{') {
        return std::nullopt;
    }
    std::size_t pos = offset + 2;

    if (pos >= text.size() || !is_name_start(text[pos])) {
        return std::nullopt;
    }
    std::size_t const name_begin = pos;
    while (pos < text.size() && is_name_char(text[pos])) {
        ++pos;
    }

    PlaceholderMatch match{};
    match.offset = offset;
    match.name   = text.substr(name_begin, pos - name_begin);

    if (pos < text.size() && text[pos] == ':') {
        std::size_t const type_begin = pos + 1;
        std::size_t       type_end   = type_begin;
        while (type_end < text.size() && is_type_char(text[type_end])) {
            ++type_end;
        }
        // ":" without a type can never be followed by "=" or "}}".
        if (type_end == type_begin) {
            return std::nullopt;
        }
        match.type = text.substr(type_begin, type_end - type_begin);
        pos        = type_end;
    }

    if (pos < text.size() && text[pos] == '=') {
        std::size_t const default_begin = pos + 1;
        std::size_t       default_end   = text.find('}', default_begin);
        if (default_end == std::string_view::npos || default_end == default_begin) {
            return std::nullopt;
        }
        match.default_literal = text.substr(default_begin, default_end - default_begin);
        pos                   = default_end;
    }

    if (pos + 2 > text.size() || text[pos] != '}' || text[pos + 1] != '}') {
        return std::nullopt;
    }
    match.length = pos + 2 - offset;
    return match;
}

auto ScanPlaceholders(std::string_view text) -> std::vector<PlaceholderMatch> {
    std::vector<PlaceholderMatch> matches;
    std::size_t                   pos = text.find("{{");
    while (pos != std::string_view::npos) {
        if (auto match = MatchPlaceholderAt(text, pos)) {
            matches.push_back(*match);
            pos = text.find("{{", pos + match->length);
        } else {
            pos = text.find("{{", pos + 1);
        }
    }
    return matches;
}

} // namespace HF::Template
