#pragma once

#include <htmlframe/template/VariableContext.hpp>

#include <string>
#include <string_view>

namespace HF::Template {

/*
 * Replaces every placeholder occurrence in `text`:
 *   1. a context value for the name, stringified;
 *   2. else the inline default literal exactly as written in the template;
 *   3. else the empty string.
 *
 * Inline defaults are emitted verbatim, not in their coerced form, so
 * `{{accent:color=ff0000}}` renders as `ff0000` while the schema reports
 * `#ff0000`. No escaping is applied to context values.
 */
[[nodiscard]] auto SubstituteParameters(std::string_view text, VariableContext const& context) -> std::string;

} // namespace HF::Template
