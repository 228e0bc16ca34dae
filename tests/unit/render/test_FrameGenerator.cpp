#include <htmlframe/render/FrameGenerator.hpp>

#include "../HtmlFrameTestHelper.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace HF;
using namespace HF::Render;
using HF::Test::readFile;
using HF::Test::TempDir;
using HF::Test::writeFile;

namespace {

struct SurfaceLog {
    int                              created = 0;
    std::vector<RenderSurfaceConfig> configs;
    std::vector<std::string>         markup;
    std::optional<Error>             failure;
};

// Writes the markup it receives as the "image".
class FakeSurface final : public RenderSurface {
public:
    FakeSurface(RenderSurfaceConfig config, std::shared_ptr<SurfaceLog> log)
        : config_(std::move(config))
        , log_(std::move(log)) {}

    auto screenshot(std::string_view html, std::string const& filename) -> Expected<std::filesystem::path> override {
        log_->markup.emplace_back(html);
        if (log_->failure) {
            return std::unexpected(*log_->failure);
        }
        auto path = config_.working_directory / filename;
        writeFile(path, std::string{html});
        return path;
    }

    auto config() const -> RenderSurfaceConfig const& override { return config_; }

private:
    RenderSurfaceConfig         config_;
    std::shared_ptr<SurfaceLog> log_;
};

auto fakeHooks(std::shared_ptr<SurfaceLog> log) -> FrameGeneratorHooks {
    FrameGeneratorHooks hooks{};
    hooks.surface_factory = [log](RenderSurfaceConfig const& config) -> Expected<std::unique_ptr<RenderSurface>> {
        ++log->created;
        log->configs.push_back(config);
        return std::unique_ptr<RenderSurface>(std::make_unique<FakeSurface>(config, log));
    };
    hooks.discover_renderer = [] { return std::optional<std::filesystem::path>{"/opt/discovered/chrome"}; };
    return hooks;
}

struct Fixture {
    TempDir                     dir;
    std::shared_ptr<SurfaceLog> log = std::make_shared<SurfaceLog>();
    FrameConfig                 config;
    std::filesystem::path       templatePath;

    Fixture() {
        config.check_fonts    = false;
        config.working_dir    = dir / "work";
        config.output_dir     = dir / "output";
        config.template_roots = {dir / "data/templates", dir / "templates"};
        std::filesystem::create_directories(*config.working_dir);
        templatePath = dir / "templates/720x1280/default.html";
        writeFile(templatePath, "<h1>{{title}}</h1><p>{{text}}</p><img src=\"{{image}}\"><i>{{mood:text=calm}}</i>");
    }

    auto make() -> FrameGenerator {
        auto generator = FrameGenerator::Create(templatePath, config, fakeHooks(log));
        REQUIRE(generator);
        return std::move(*generator);
    }
};

auto isFrameName(std::string const& name) -> bool {
    if (name.size() != 26 || !name.starts_with("frame_") || !name.ends_with(".png")) {
        return false;
    }
    return std::all_of(name.begin() + 6, name.begin() + 22, [](unsigned char ch) {
        return std::isdigit(ch) || (ch >= 'a' && ch <= 'f');
    });
}

} // namespace

TEST_SUITE("render.frame_generator") {

TEST_CASE("Generator exposes template size and parameters") {
    Fixture fx;
    auto generator = fx.make();
    CHECK(generator.width() == 720);
    CHECK(generator.height() == 1280);
    CHECK(generator.templatePath() == fx.templatePath);
    auto schema = generator.parameters();
    CHECK(schema.names() == std::vector<std::string>{"mood"});
    CHECK_FALSE(generator.hasSession());
}

TEST_CASE("Missing template fails at construction") {
    Fixture fx;
    auto generator = FrameGenerator::Create(fx.dir / "templates/none.html", fx.config, fakeHooks(fx.log));
    REQUIRE_FALSE(generator);
    CHECK(generator.error().code == Error::Code::NotFound);
}

TEST_CASE("Template keys resolve through the configured roots") {
    Fixture fx;
    auto generator = FrameGenerator::FromKey("720x1280/default.html", fx.config, fakeHooks(fx.log));
    REQUIRE(generator);
    CHECK(generator->size() == Template::FrameSize{720, 1280});

    auto missing = FrameGenerator::FromKey("ghost.html", fx.config, fakeHooks(fx.log));
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == Error::Code::NotFound);
}

TEST_CASE("Auto-generated output lands in the output dir") {
    Fixture fx;
    auto generator = fx.make();
    FrameRequest request{.title = "Hello", .text = "World", .image = "https://cdn/x.png", .ext = {}, .output_path = {}};

    auto frame = generator.generateFrame(request);
    REQUIRE(frame);
    CHECK(frame->parent_path() == fx.config.output_dir);
    CHECK(isFrameName(frame->filename().string()));
    CHECK(std::filesystem::exists(*frame));
    CHECK_FALSE(std::filesystem::exists(*fx.config.working_dir / frame->filename()));
    CHECK(readFile(*frame) == "<h1>Hello</h1><p>World</p><img src=\"https://cdn/x.png\"><i>calm</i>");
}

TEST_CASE("Explicit output path is created and filled") {
    Fixture fx;
    auto generator = fx.make();
    auto target    = fx.dir / "exports/deep/nested/cover.png";
    FrameRequest request{};
    request.text        = "body";
    request.output_path = target;

    auto frame = generator.generateFrame(request);
    REQUIRE(frame);
    CHECK(*frame == target);
    CHECK(std::filesystem::exists(target));
    CHECK_FALSE(std::filesystem::exists(*fx.config.working_dir / "cover.png"));
}

TEST_CASE("Same-named file in the working directory is left alone") {
    Fixture fx;
    auto generator = fx.make();
    auto bystander = *fx.config.working_dir / "notes.png";
    writeFile(bystander, "keep me");
    FrameRequest request{};
    request.text        = "elsewhere";
    request.output_path = fx.dir / "backup/notes.png";

    auto frame = generator.generateFrame(request);
    REQUIRE(frame);
    CHECK(readFile(fx.dir / "backup/notes.png").find("elsewhere") != std::string::npos);
    CHECK(readFile(bystander) == "keep me");
    auto leftovers = std::distance(std::filesystem::directory_iterator{*fx.config.working_dir},
                                   std::filesystem::directory_iterator{});
    CHECK(leftovers == 1);
}

TEST_CASE("Output inside the working directory is not moved") {
    Fixture fx;
    auto generator = fx.make();
    FrameRequest request{};
    request.text        = "same place";
    request.output_path = *fx.config.working_dir / "here.png";

    auto frame = generator.generateFrame(request);
    REQUIRE(frame);
    CHECK(std::filesystem::exists(*fx.config.working_dir / "here.png"));
}

TEST_CASE("Session is created once and configured from the template") {
    Fixture fx;
    fx.config.browser_flags = {"--lang=en-US"};
    auto generator = fx.make();

    FrameRequest request{};
    request.text = "one";
    REQUIRE(generator.generateFrame(request));
    CHECK(generator.hasSession());
    request.text = "two";
    REQUIRE(generator.generateFrame(request));

    CHECK(fx.log->created == 1);
    CHECK(fx.log->markup.size() == 2);
    auto const& config = fx.log->configs.front();
    CHECK(config.size == Template::FrameSize{720, 1280});
    CHECK(config.browser_executable == std::filesystem::path{"/opt/discovered/chrome"});
    CHECK(config.working_directory == *fx.config.working_dir);
    CHECK(config.timeout == std::chrono::milliseconds{30000});
    REQUIRE(config.flags.size() == StabilityFlags().size() + 1);
    CHECK(config.flags.back() == "--lang=en-US");
}

TEST_CASE("Configured executable bypasses discovery") {
    Fixture fx;
    fx.config.browser_executable = "/custom/chrome";
    int  probes = 0;
    auto hooks  = fakeHooks(fx.log);
    hooks.discover_renderer = [&probes] {
        ++probes;
        return std::optional<std::filesystem::path>{};
    };
    auto generator = FrameGenerator::Create(fx.templatePath, fx.config, hooks);
    REQUIRE(generator);
    FrameRequest request{};
    request.text = "x";
    REQUIRE(generator->generateFrame(request));
    CHECK(probes == 0);
    CHECK(fx.log->configs.front().browser_executable == std::filesystem::path{"/custom/chrome"});
}

TEST_CASE("Surface failures are wrapped") {
    Fixture fx;
    fx.log->failure = Error{Error::Code::Timeout, "chrome timed out after 30000 ms"};
    auto generator  = fx.make();
    FrameRequest request{};
    request.text = "x";

    auto frame = generator.generateFrame(request);
    REQUIRE_FALSE(frame);
    CHECK(frame.error().code == Error::Code::RenderFailed);
    auto message = frame.error().message.value_or("");
    CHECK(message.starts_with("HTML rendering failed: "));
    CHECK(message.find("timed out") != std::string::npos);
}

TEST_CASE("Unavailable renderer is wrapped and retried on the next call") {
    Fixture fx;
    int  attempts = 0;
    auto hooks    = fakeHooks(fx.log);
    hooks.surface_factory = [&attempts](RenderSurfaceConfig const&) -> Expected<std::unique_ptr<RenderSurface>> {
        ++attempts;
        return std::unexpected(Error{Error::Code::RendererUnavailable, "no Chrome/Chromium executable found on PATH"});
    };
    auto generator = FrameGenerator::Create(fx.templatePath, fx.config, hooks);
    REQUIRE(generator);
    FrameRequest request{};
    request.text = "x";

    auto first = generator->generateFrame(request);
    REQUIRE_FALSE(first);
    CHECK(first.error().code == Error::Code::RenderFailed);
    CHECK(first.error().message.value_or("").find("renderer_unavailable") != std::string::npos);
    CHECK_FALSE(generator->hasSession());

    (void)generator->generateFrame(request);
    CHECK(attempts == 2);
}

TEST_CASE("Context holds request fields with extensions on top") {
    Fixture fx;
    writeFile(*fx.config.working_dir / "assets/pic.png", "png");
    auto generator = fx.make();

    FrameRequest request{};
    request.title = "Original";
    request.text  = "Body";
    request.image = "assets/pic.png";
    request.ext.set("title", std::string{"Replaced"});
    request.ext.set("mood", std::string{"bright"});

    auto context = generator.buildContext(request);
    CHECK(*context.find("title") == Template::Value{std::string{"Replaced"}});
    CHECK(*context.find("text") == Template::Value{std::string{"Body"}});

    auto markup = generator.renderMarkup(request);
    CHECK(markup.find("<h1>Replaced</h1>") != std::string::npos);
    CHECK(markup.find("<i>bright</i>") != std::string::npos);
    CHECK(markup.find("src=\"file:///") != std::string::npos);
    CHECK(markup.find("/work/assets/pic.png\"") != std::string::npos);
}

TEST_CASE("Asynchronous render yields the same result") {
    Fixture fx;
    auto generator = fx.make();
    FrameRequest request{};
    request.text        = "async";
    request.output_path = fx.dir / "async/frame.png";

    auto future = generator.generateFrameAsync(request);
    auto frame  = future.get();
    REQUIRE(frame);
    CHECK(*frame == fx.dir / "async/frame.png");
    CHECK(std::filesystem::exists(*frame));
}

TEST_CASE("Frame file names are random hex") {
    auto first  = MakeFrameFileName();
    auto second = MakeFrameFileName();
    CHECK(isFrameName(first));
    CHECK(isFrameName(second));
    CHECK(first != second);
}

} // TEST_SUITE
