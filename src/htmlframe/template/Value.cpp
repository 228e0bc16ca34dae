#include <htmlframe/template/Value.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <iostream>
#include <iterator>
#include <optional>
#include <system_error>

namespace HF::Template {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto strip_plus(std::string_view text) -> std::string_view {
    if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    return text;
}

template <typename T>
auto parse_full(std::string_view text) -> std::optional<T> {
    T value{};
    auto const* begin  = text.data();
    auto const* end    = text.data() + text.size();
    auto        result = std::from_chars(begin, end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto parse_number(std::string_view literal) -> std::optional<Value> {
    auto text = strip_plus(trim(literal));
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.find('.') == std::string_view::npos) {
        if (auto parsed = parse_full<std::int64_t>(text)) {
            return Value{*parsed};
        }
        return std::nullopt;
    }
    if (auto parsed = parse_full<double>(text)) {
        return Value{*parsed};
    }
    return std::nullopt;
}

auto chars_of(double value, std::chars_format format) -> std::optional<std::string> {
    std::array<char, 400> buffer{};
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, format);
    if (result.ec != std::errc{}) {
        return std::nullopt;
    }
    return std::string{buffer.data(), result.ptr};
}

// Shortest round-trip digits; positional notation for decimal exponents in
// [-4, 16), scientific otherwise. Whole positional values keep a ".0".
auto format_double(double value) -> std::string {
    auto scientific = chars_of(value, std::chars_format::scientific);
    if (!scientific) {
        return std::to_string(value);
    }
    auto marker = scientific->find('e');
    if (marker == std::string::npos) {
        return *scientific;
    }
    int exponent = 0;
    auto const* first = scientific->data() + marker + 1;
    auto const* last  = scientific->data() + scientific->size();
    if (*first == '+') {
        ++first;
    }
    if (std::from_chars(first, last, exponent).ec != std::errc{} || exponent < -4 || exponent >= 16) {
        return *scientific;
    }
    auto text = chars_of(value, std::chars_format::fixed);
    if (!text) {
        return *scientific;
    }
    bool integral = std::all_of(text->begin(), text->end(), [](unsigned char ch) {
        return std::isdigit(ch) || ch == '-';
    });
    if (integral) {
        text->append(".0");
    }
    return *text;
}

} // namespace

auto ParamTypeName(ParamType type) -> std::string_view {
    switch (type) {
    case ParamType::Text:
        return "text";
    case ParamType::Number:
        return "number";
    case ParamType::Color:
        return "color";
    case ParamType::Boolean:
        return "bool";
    }
    return "text";
}

auto ParseParamType(std::string_view token) -> std::optional<ParamType> {
    if (token == "text") {
        return ParamType::Text;
    }
    if (token == "number") {
        return ParamType::Number;
    }
    if (token == "color") {
        return ParamType::Color;
    }
    if (token == "bool") {
        return ParamType::Boolean;
    }
    return std::nullopt;
}

auto ParseBoolLiteral(std::string_view literal) -> bool {
    std::string lowered;
    lowered.reserve(literal.size());
    std::transform(literal.begin(), literal.end(), std::back_inserter(lowered), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on";
}

auto CoerceDefault(ParamType type, std::optional<std::string_view> literal) -> Value {
    if (!literal) {
        switch (type) {
        case ParamType::Text:
            return Value{std::string{}};
        case ParamType::Number:
            return Value{std::int64_t{0}};
        case ParamType::Color:
            return Value{std::string{"#000000"}};
        case ParamType::Boolean:
            return Value{false};
        }
        return Value{std::string{}};
    }

    switch (type) {
    case ParamType::Number: {
        if (auto parsed = parse_number(*literal)) {
            return *parsed;
        }
        std::cerr << "template: invalid number value '" << *literal << "', using 0\n";
        return Value{std::int64_t{0}};
    }
    case ParamType::Boolean:
        return Value{ParseBoolLiteral(*literal)};
    case ParamType::Color:
        if (literal->starts_with('#')) {
            return Value{std::string{*literal}};
        }
        return Value{"#" + std::string{*literal}};
    case ParamType::Text:
        break;
    }
    return Value{std::string{*literal}};
}

auto StringifyValue(Value const& value) -> std::string {
    struct Visitor {
        auto operator()(std::monostate) const -> std::string { return {}; }
        auto operator()(std::string const& text) const -> std::string { return text; }
        auto operator()(std::int64_t number) const -> std::string { return std::to_string(number); }
        auto operator()(double number) const -> std::string { return format_double(number); }
        auto operator()(bool flag) const -> std::string { return flag ? "true" : "false"; }
    };
    return std::visit(Visitor{}, value);
}

} // namespace HF::Template
