#include <htmlframe/template/VariableContext.hpp>

namespace HF::Template {

auto VariableContext::set(std::string name, Value value) -> void {
    values_.insert_or_assign(std::move(name), std::move(value));
}

auto VariableContext::erase(std::string_view name) -> void {
    values_.erase(std::string{name});
}

auto VariableContext::merge(VariableContext const& other) -> void {
    for (auto const& [name, value] : other.values_) {
        values_.insert_or_assign(name, value);
    }
}

auto VariableContext::contains(std::string_view name) const -> bool {
    return values_.contains(std::string{name});
}

auto VariableContext::find(std::string_view name) const -> Value const* {
    auto it = values_.find(std::string{name});
    if (it == values_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace HF::Template
