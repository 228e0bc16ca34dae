#pragma once

#include <htmlframe/template/Value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace HF::Template {

// Runtime values for one render call, keyed by placeholder name.
class VariableContext {
public:
    VariableContext() = default;

    auto set(std::string name, Value value) -> void;
    auto erase(std::string_view name) -> void;

    // Copies every entry of `other`, replacing existing keys.
    auto merge(VariableContext const& other) -> void;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto find(std::string_view name) const -> Value const*;
    [[nodiscard]] auto size() const -> std::size_t { return values_.size(); }
    [[nodiscard]] auto empty() const -> bool { return values_.empty(); }

    [[nodiscard]] auto begin() const { return values_.begin(); }
    [[nodiscard]] auto end() const { return values_.end(); }

private:
    std::unordered_map<std::string, Value> values_;
};

} // namespace HF::Template
