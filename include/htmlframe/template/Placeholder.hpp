#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace HF::Template {

// One textual occurrence of `{{name[:type][=default]}}`.
// Views point into the scanned text and share its lifetime.
struct PlaceholderMatch {
    std::size_t                     offset = 0; // position of the opening "{{"
    std::size_t                     length = 0; // through the closing "}}"
    std::string_view                name;
    std::optional<std::string_view> type;          // absent means "text"
    std::optional<std::string_view> default_literal;
};

/*
 * Placeholder grammar:
 *   placeholder := "{{" name [ ":" type ] [ "=" default ] "}}"
 *   name        := [A-Za-z_][A-Za-z0-9_]*
 *   type        := [a-z]+
 *   default     := [^}]+
 *
 * Matching is leftmost and non-overlapping. Text that does not match the
 * grammar exactly (an empty default, an upper-case type, whitespace inside the
 * braces) is not a placeholder.
 */
[[nodiscard]] auto MatchPlaceholderAt(std::string_view text, std::size_t offset) -> std::optional<PlaceholderMatch>;

[[nodiscard]] auto ScanPlaceholders(std::string_view text) -> std::vector<PlaceholderMatch>;

} // namespace HF::Template
