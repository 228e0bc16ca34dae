#pragma once

#include <htmlframe/template/Value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace HF::Template {

struct ParameterDeclaration {
    std::string name;
    ParamType   type = ParamType::Text;
    Value       default_value;
    std::string label;

    auto operator==(ParameterDeclaration const&) const -> bool = default;
};

// Declared parameters of a template, ordered by first occurrence.
class ParameterSchema {
public:
    [[nodiscard]] auto size() const -> std::size_t { return declarations_.size(); }
    [[nodiscard]] auto empty() const -> bool { return declarations_.empty(); }
    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto find(std::string_view name) const -> ParameterDeclaration const*;
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto begin() const { return declarations_.begin(); }
    [[nodiscard]] auto end() const { return declarations_.end(); }

    // Returns false and leaves the schema unchanged when the name is taken.
    auto add(ParameterDeclaration declaration) -> bool;

    auto operator==(ParameterSchema const& other) const -> bool {
        return declarations_ == other.declarations_;
    }

private:
    std::vector<ParameterDeclaration>            declarations_;
    std::unordered_map<std::string, std::size_t> index_;
};

// Names filled by the render request itself; never declared parameters.
[[nodiscard]] auto IsReservedParameterName(std::string_view name) -> bool;

// Builds the schema of a template body. The first occurrence of a name fixes
// its type and default; unsupported type tokens warn and fall back to text.
[[nodiscard]] auto ParseTemplateParameters(std::string_view text) -> ParameterSchema;

} // namespace HF::Template
