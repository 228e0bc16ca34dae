#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace HF::Template {

struct FrameSize {
    int width  = 1080;
    int height = 1920;

    auto operator==(FrameSize const&) const -> bool = default;
};

// Parses a whole "WIDTHxHEIGHT" token such as "1080x1920". Zero or
// out-of-range dimensions are rejected.
[[nodiscard]] auto ParseSizeToken(std::string_view token) -> std::optional<FrameSize>;

[[nodiscard]] auto FormatSizeToken(FrameSize size) -> std::string;

// Size encoded in a template path ("templates/1080x1920/default.html"). The
// size directory nearest to the file name wins; paths without one resolve to
// `fallback`.
[[nodiscard]] auto ResolveTemplateSize(std::string_view template_path, FrameSize fallback) -> FrameSize;

} // namespace HF::Template
