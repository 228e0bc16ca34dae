#include <htmlframe/render/FrameGenerator.hpp>

#include <htmlframe/render/FontCheck.hpp>
#include <htmlframe/render/HeadlessBrowserSurface.hpp>
#include <htmlframe/render/ImageReference.hpp>
#include <htmlframe/render/RendererDiscovery.hpp>
#include <htmlframe/template/Substitution.hpp>
#include <htmlframe/template/TemplateStore.hpp>

#include "log/TaggedLogger.hpp"

#include <array>
#include <random>
#include <system_error>

namespace HF::Render {

namespace {

auto render_failure(Error const& cause) -> Error {
    return Error{Error::Code::RenderFailed, "HTML rendering failed: " + describeError(cause)};
}

auto io_failure(std::string const& what, std::error_code const& ec) -> Error {
    return Error{Error::Code::IoFailure, what + ": " + ec.message()};
}

auto same_location(std::filesystem::path const& lhs, std::filesystem::path const& rhs) -> bool {
    std::error_code ec;
    auto left = std::filesystem::weakly_canonical(lhs, ec);
    if (ec) {
        return false;
    }
    auto right = std::filesystem::weakly_canonical(rhs, ec);
    if (ec) {
        return false;
    }
    return left == right;
}

// rename(2) cannot cross filesystems; fall back to copy and remove.
auto relocate(std::filesystem::path const& from, std::filesystem::path const& to) -> Expected<void> {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return {};
    }
    hf_log("rename failed (" + ec.message() + "), copying " + from.string(), "Render");
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return std::unexpected(io_failure("cannot move frame to " + to.string(), ec));
    }
    std::filesystem::remove(from, ec);
    return {};
}

} // namespace

auto MakeFrameFileName() -> std::string {
    static constexpr std::array<char, 16> hex{'0', '1', '2', '3', '4', '5', '6', '7',
                                              '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    thread_local std::mt19937_64 engine{std::random_device{}()};
    auto bits = engine();
    std::string name{"frame_"};
    for (int i = 0; i < 16; ++i) {
        name.push_back(hex[bits & 0x0F]);
        bits >>= 4;
    }
    name.append(".png");
    return name;
}

FrameGenerator::FrameGenerator(FrameConfig config, FrameGeneratorHooks hooks)
    : config_(std::move(config))
    , hooks_(std::move(hooks)) {
    if (!hooks_.surface_factory) {
        hooks_.surface_factory = &HeadlessBrowserSurface::Create;
    }
    if (!hooks_.discover_renderer) {
        hooks_.discover_renderer = [] { return DiscoveredRenderer(); };
    }
}

FrameGenerator::~FrameGenerator() = default;

auto FrameGenerator::Create(std::filesystem::path const& template_path, FrameConfig config, FrameGeneratorHooks hooks)
    -> Expected<FrameGenerator> {
    auto loaded = Template::LoadTemplate(template_path, config.default_size);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }

    bool const check_fonts = config.check_fonts;
    FrameGenerator generator{std::move(config), std::move(hooks)};
    generator.templatePath_     = std::move(loaded->source_path);
    generator.body_             = std::move(loaded->body);
    generator.size_             = loaded->size;
    generator.workingDirectory_ = ResolveWorkingDirectory(generator.config_);
    hf_log("Frame generator for " + generator.templatePath_.string() + " at "
               + Template::FormatSizeToken(generator.size_), "Render");

    if (check_fonts) {
        CheckFontEnvironment();
    }
    return generator;
}

auto FrameGenerator::FromKey(std::string_view key, FrameConfig config, FrameGeneratorHooks hooks)
    -> Expected<FrameGenerator> {
    auto path = Template::ResolveTemplatePath(key, config.template_roots, config.default_size);
    if (!path) {
        return std::unexpected(path.error());
    }
    return Create(*path, std::move(config), std::move(hooks));
}

auto FrameGenerator::parameters() const -> Template::ParameterSchema {
    return Template::ParseTemplateParameters(body_);
}

auto FrameGenerator::buildContext(FrameRequest const& request) const -> Template::VariableContext {
    Template::VariableContext context;
    context.set("title", request.title);
    context.set("text", request.text);
    context.set("image", NormalizeImageReference(request.image, workingDirectory_));
    context.merge(request.ext);
    return context;
}

auto FrameGenerator::renderMarkup(FrameRequest const& request) const -> std::string {
    return Template::SubstituteParameters(body_, buildContext(request));
}

auto FrameGenerator::ensureSession() -> Expected<RenderSurface*> {
    if (session_) {
        return session_.get();
    }
    RenderSurfaceConfig surface{};
    surface.size               = size_;
    surface.browser_executable = config_.browser_executable;
    if (!surface.browser_executable) {
        surface.browser_executable = hooks_.discover_renderer();
    }
    surface.flags = StabilityFlags();
    surface.flags.insert(surface.flags.end(), config_.browser_flags.begin(), config_.browser_flags.end());
    surface.working_directory = workingDirectory_;
    surface.timeout           = std::chrono::milliseconds{config_.render_timeout_ms};

    auto created = hooks_.surface_factory(surface);
    if (!created) {
        return std::unexpected(created.error());
    }
    session_ = std::move(*created);
    hf_log("Render session ready", "Render");
    return session_.get();
}

auto FrameGenerator::nextOutputPath() const -> Expected<std::filesystem::path> {
    std::error_code ec;
    std::filesystem::create_directories(config_.output_dir, ec);
    if (ec) {
        return std::unexpected(io_failure("cannot create " + config_.output_dir.string(), ec));
    }
    return config_.output_dir / MakeFrameFileName();
}

auto FrameGenerator::generateFrame(FrameRequest const& request) -> Expected<std::filesystem::path> {
    std::filesystem::path output;
    if (request.output_path) {
        output = *request.output_path;
        if (output.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(output.parent_path(), ec);
            if (ec) {
                return std::unexpected(render_failure(io_failure("cannot create " + output.parent_path().string(), ec)));
            }
        }
    } else {
        auto next = nextOutputPath();
        if (!next) {
            return std::unexpected(render_failure(next.error()));
        }
        output = std::move(*next);
    }

    auto markup  = renderMarkup(request);
    auto session = ensureSession();
    if (!session) {
        return std::unexpected(render_failure(session.error()));
    }

    // Outside the working directory the browser writes a scratch file, so a
    // same-named file there is never overwritten.
    std::error_code ec;
    auto destination_dir = std::filesystem::absolute(output, ec).parent_path();
    auto shot_name       = same_location(destination_dir, workingDirectory_) ? output.filename().string()
                                                                             : "." + MakeFrameFileName();
    auto produced = (*session)->screenshot(markup, shot_name);
    if (!produced) {
        return std::unexpected(render_failure(produced.error()));
    }
    if (!same_location(*produced, output)) {
        if (auto moved = relocate(*produced, output); !moved) {
            if (shot_name != output.filename().string()) {
                std::filesystem::remove(*produced, ec);
            }
            return std::unexpected(render_failure(moved.error()));
        }
    }
    hf_log("Frame generated: " + output.string(), "Render");
    return output;
}

auto FrameGenerator::generateFrameAsync(FrameRequest request) -> std::future<Expected<std::filesystem::path>> {
    return std::async(std::launch::async,
                      [this, request = std::move(request)]() { return this->generateFrame(request); });
}

} // namespace HF::Render
