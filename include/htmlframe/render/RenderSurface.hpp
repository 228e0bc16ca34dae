#pragma once

#include <htmlframe/core/Error.hpp>
#include <htmlframe/template/TemplateSize.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HF::Render {

struct RenderSurfaceConfig {
    Template::FrameSize                  size{};
    std::optional<std::filesystem::path> browser_executable;
    std::vector<std::string>             flags;
    std::filesystem::path                working_directory;
    std::chrono::milliseconds            timeout{30000};
};

// A rasterization session bound to one viewport size.
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    // Rasterizes `html` into `working_directory / filename` and returns that path.
    [[nodiscard]] virtual auto screenshot(std::string_view html, std::string const& filename)
        -> Expected<std::filesystem::path> = 0;

    [[nodiscard]] virtual auto config() const -> RenderSurfaceConfig const& = 0;
};

using RenderSurfaceFactory = std::function<Expected<std::unique_ptr<RenderSurface>>(RenderSurfaceConfig const&)>;

// Flags passed to every browser session: transparent background, no sandbox
// or GPU, no background work or first-run UI.
[[nodiscard]] auto StabilityFlags() -> std::vector<std::string> const&;

} // namespace HF::Render
