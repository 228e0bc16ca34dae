#pragma once

#include <htmlframe/render/RenderSurface.hpp>

namespace HF::Render {

// Runs a headless Chrome/Chromium once per screenshot.
class HeadlessBrowserSurface final : public RenderSurface {
public:
    // Uses config.browser_executable, else the first browser found on PATH.
    // Error::Code::RendererUnavailable when neither exists.
    [[nodiscard]] static auto Create(RenderSurfaceConfig const& config) -> Expected<std::unique_ptr<RenderSurface>>;

    [[nodiscard]] auto screenshot(std::string_view html, std::string const& filename)
        -> Expected<std::filesystem::path> override;

    [[nodiscard]] auto config() const -> RenderSurfaceConfig const& override { return config_; }
    [[nodiscard]] auto executable() const -> std::filesystem::path const& { return executable_; }

    [[nodiscard]] auto commandLine(std::filesystem::path const& markup_file, std::filesystem::path const& output) const
        -> std::vector<std::string>;

    // Browser names searched on PATH when no executable is configured.
    [[nodiscard]] static auto PathFallbackNames() -> std::vector<std::string> const&;

private:
    HeadlessBrowserSurface(RenderSurfaceConfig config, std::filesystem::path executable);

    RenderSurfaceConfig   config_;
    std::filesystem::path executable_;
};

} // namespace HF::Render
