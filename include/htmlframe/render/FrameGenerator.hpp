#pragma once

#include <htmlframe/config/FrameConfig.hpp>
#include <htmlframe/core/Error.hpp>
#include <htmlframe/render/RenderSurface.hpp>
#include <htmlframe/template/ParameterSchema.hpp>
#include <htmlframe/template/TemplateSize.hpp>
#include <htmlframe/template/VariableContext.hpp>

#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace HF::Render {

struct FrameRequest {
    std::string                          title;
    std::string                          text;
    std::string                          image;
    Template::VariableContext            ext;
    std::optional<std::filesystem::path> output_path;
};

// Seams for tests and embedders. Empty members fall back to the headless
// browser surface and the process-wide renderer discovery.
struct FrameGeneratorHooks {
    RenderSurfaceFactory                                 surface_factory;
    std::function<std::optional<std::filesystem::path>()> discover_renderer;
};

/*
 * Renders one template into PNG frames.
 *
 * The browser session is created on the first render and reused until the
 * generator is destroyed. One render may be in flight per generator; callers
 * serialize. A generator must outlive every future returned by
 * generateFrameAsync and must not be moved while one is pending.
 */
class FrameGenerator {
public:
    [[nodiscard]] static auto Create(std::filesystem::path const& template_path,
                                     FrameConfig config,
                                     FrameGeneratorHooks hooks = {}) -> Expected<FrameGenerator>;

    // Resolves `key` through the configured template roots first.
    [[nodiscard]] static auto FromKey(std::string_view key, FrameConfig config, FrameGeneratorHooks hooks = {})
        -> Expected<FrameGenerator>;

    FrameGenerator(FrameGenerator&&) noexcept            = default;
    FrameGenerator& operator=(FrameGenerator&&) noexcept = default;
    FrameGenerator(FrameGenerator const&)                = delete;
    FrameGenerator& operator=(FrameGenerator const&)     = delete;
    ~FrameGenerator();

    [[nodiscard]] auto templatePath() const -> std::filesystem::path const& { return templatePath_; }
    [[nodiscard]] auto templateBody() const -> std::string const& { return body_; }
    [[nodiscard]] auto size() const -> Template::FrameSize { return size_; }
    [[nodiscard]] auto width() const -> int { return size_.width; }
    [[nodiscard]] auto height() const -> int { return size_.height; }
    [[nodiscard]] auto config() const -> FrameConfig const& { return config_; }
    [[nodiscard]] auto parameters() const -> Template::ParameterSchema;
    [[nodiscard]] auto hasSession() const -> bool { return session_ != nullptr; }

    // {title, text, image} with the image normalized, then `ext` on top.
    [[nodiscard]] auto buildContext(FrameRequest const& request) const -> Template::VariableContext;
    [[nodiscard]] auto renderMarkup(FrameRequest const& request) const -> std::string;

    // Errors are Error::Code::RenderFailed with "HTML rendering failed: <cause>".
    [[nodiscard]] auto generateFrame(FrameRequest const& request) -> Expected<std::filesystem::path>;
    [[nodiscard]] auto generateFrameAsync(FrameRequest request) -> std::future<Expected<std::filesystem::path>>;

private:
    FrameGenerator(FrameConfig config, FrameGeneratorHooks hooks);

    auto ensureSession() -> Expected<RenderSurface*>;
    auto nextOutputPath() const -> Expected<std::filesystem::path>;

    FrameConfig                    config_;
    FrameGeneratorHooks            hooks_;
    std::filesystem::path          templatePath_;
    std::filesystem::path          workingDirectory_;
    std::string                    body_;
    Template::FrameSize            size_{};
    std::unique_ptr<RenderSurface> session_;
};

// "frame_<16 hex digits>.png"
[[nodiscard]] auto MakeFrameFileName() -> std::string;

} // namespace HF::Render
