#include <htmlframe/template/ParameterSchema.hpp>

#include <htmlframe/template/Placeholder.hpp>

#include "log/TaggedLogger.hpp"

#include <array>
#include <algorithm>
#include <iostream>

namespace HF::Template {

namespace {

constexpr std::array<std::string_view, 7> kReservedNames{
    "title",
    "text",
    "image",
    "content_title",
    "content_author",
    "content_subtitle",
    "content_genre",
};

} // namespace

auto ParameterSchema::contains(std::string_view name) const -> bool {
    return index_.contains(std::string{name});
}

auto ParameterSchema::find(std::string_view name) const -> ParameterDeclaration const* {
    auto it = index_.find(std::string{name});
    if (it == index_.end()) {
        return nullptr;
    }
    return &declarations_[it->second];
}

auto ParameterSchema::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(declarations_.size());
    for (auto const& declaration : declarations_) {
        result.push_back(declaration.name);
    }
    return result;
}

auto ParameterSchema::add(ParameterDeclaration declaration) -> bool {
    if (index_.contains(declaration.name)) {
        return false;
    }
    index_.emplace(declaration.name, declarations_.size());
    declarations_.push_back(std::move(declaration));
    return true;
}

auto IsReservedParameterName(std::string_view name) -> bool {
    return std::find(kReservedNames.begin(), kReservedNames.end(), name) != kReservedNames.end();
}

auto ParseTemplateParameters(std::string_view text) -> ParameterSchema {
    ParameterSchema schema;
    for (auto const& match : ScanPlaceholders(text)) {
        if (IsReservedParameterName(match.name) || schema.contains(match.name)) {
            continue;
        }

        auto type = ParamType::Text;
        if (match.type) {
            if (auto parsed = ParseParamType(*match.type)) {
                type = *parsed;
            } else {
                std::cerr << "template: unknown parameter type '" << *match.type << "' for '" << match.name
                          << "', defaulting to 'text'\n";
            }
        }

        ParameterDeclaration declaration{};
        declaration.name          = std::string{match.name};
        declaration.type          = type;
        declaration.default_value = CoerceDefault(type, match.default_literal);
        declaration.label         = declaration.name;
        schema.add(std::move(declaration));
    }

    if (!schema.empty()) {
        hf_log("Parsed " + std::to_string(schema.size()) + " custom parameter(s) from template", "Template");
    }
    return schema;
}

} // namespace HF::Template
