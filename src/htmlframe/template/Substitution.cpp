#include <htmlframe/template/Substitution.hpp>

#include <htmlframe/template/Placeholder.hpp>

namespace HF::Template {

auto SubstituteParameters(std::string_view text, VariableContext const& context) -> std::string {
    std::string output;
    output.reserve(text.size());

    std::size_t cursor = 0;
    for (auto const& match : ScanPlaceholders(text)) {
        output.append(text.substr(cursor, match.offset - cursor));
        if (auto const* value = context.find(match.name)) {
            output.append(StringifyValue(*value));
        } else if (match.default_literal) {
            output.append(*match.default_literal);
        }
        cursor = match.offset + match.length;
    }
    output.append(text.substr(cursor));
    return output;
}

} // namespace HF::Template
