#include <htmlframe/render/HeadlessBrowserSurface.hpp>

#include <htmlframe/render/ImageReference.hpp>

#include "log/TaggedLogger.hpp"
#include "process/Subprocess.hpp"

#include <fstream>
#include <system_error>

#include <unistd.h>

namespace HF::Render {

namespace {

// Removes the markup file once the screenshot is done.
class ScopedFile {
public:
    explicit ScopedFile(std::filesystem::path path)
        : path_(std::move(path)) {}
    ScopedFile(ScopedFile const&)            = delete;
    ScopedFile& operator=(ScopedFile const&) = delete;
    ~ScopedFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    auto path() const -> std::filesystem::path const& { return path_; }

private:
    std::filesystem::path path_;
};

auto tail(std::string const& text, std::size_t limit) -> std::string {
    if (text.size() <= limit) {
        return text;
    }
    return "..." + text.substr(text.size() - limit);
}

auto resolve_executable(std::filesystem::path const& configured) -> std::optional<std::filesystem::path> {
    if (configured.has_parent_path()) {
        if (Process::IsExecutableFile(configured)) {
            return configured;
        }
        return std::nullopt;
    }
    return Process::FindExecutableInPath(configured.string());
}

} // namespace

auto StabilityFlags() -> std::vector<std::string> const& {
    static std::vector<std::string> const flags{
        "--default-background-color=00000000",
        "--no-sandbox",
        "--disable-dev-shm-usage",
        "--disable-gpu",
        "--disable-software-rasterizer",
        "--disable-extensions",
        "--disable-setuid-sandbox",
        "--disable-dbus",
        "--hide-scrollbars",
        "--mute-audio",
        "--disable-background-networking",
        "--disable-features=TranslateUI",
        "--disable-ipc-flooding-protection",
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-backgrounding-occluded-windows",
        "--disable-renderer-backgrounding",
    };
    return flags;
}

auto HeadlessBrowserSurface::PathFallbackNames() -> std::vector<std::string> const& {
    static std::vector<std::string> const names{
        "google-chrome", "google-chrome-stable", "chromium", "chromium-browser", "chrome",
    };
    return names;
}

HeadlessBrowserSurface::HeadlessBrowserSurface(RenderSurfaceConfig config, std::filesystem::path executable)
    : config_(std::move(config))
    , executable_(std::move(executable)) {}

auto HeadlessBrowserSurface::Create(RenderSurfaceConfig const& config) -> Expected<std::unique_ptr<RenderSurface>> {
    std::optional<std::filesystem::path> executable;
    if (config.browser_executable) {
        executable = resolve_executable(*config.browser_executable);
        if (!executable) {
            return std::unexpected(Error{Error::Code::RendererUnavailable,
                                         "browser not executable: " + config.browser_executable->string()});
        }
    } else {
        for (auto const& name : PathFallbackNames()) {
            executable = Process::FindExecutableInPath(name);
            if (executable) {
                break;
            }
        }
        if (!executable) {
            return std::unexpected(Error{Error::Code::RendererUnavailable,
                                         "no Chrome/Chromium executable found on PATH"});
        }
    }
    hf_log("Browser session using " + executable->string() + " at "
               + Template::FormatSizeToken(config.size), "Render");
    return std::unique_ptr<RenderSurface>(new HeadlessBrowserSurface(config, std::move(*executable)));
}

auto HeadlessBrowserSurface::commandLine(std::filesystem::path const& markup_file,
                                         std::filesystem::path const& output) const -> std::vector<std::string> {
    std::vector<std::string> argv;
    argv.reserve(config_.flags.size() + 5);
    argv.push_back(executable_.string());
    argv.emplace_back("--headless");
    argv.push_back("--screenshot=" + output.string());
    argv.push_back("--window-size=" + std::to_string(config_.size.width) + "," + std::to_string(config_.size.height));
    argv.insert(argv.end(), config_.flags.begin(), config_.flags.end());
    argv.push_back(ToFileUri(markup_file));
    return argv;
}

auto HeadlessBrowserSurface::screenshot(std::string_view html, std::string const& filename)
    -> Expected<std::filesystem::path> {
    if (filename.empty()) {
        return std::unexpected(Error{Error::Code::InvalidPath, "screenshot file name must not be empty"});
    }

    std::error_code ec;
    auto scratch = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoFailure, "no temporary directory: " + ec.message()});
    }
    scratch /= "htmlframe";
    std::filesystem::create_directories(scratch, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot create " + scratch.string() + ": " + ec.message()});
    }

    auto stem = std::filesystem::path{filename}.stem().string();
    ScopedFile markup{scratch / (stem + "_" + std::to_string(::getpid()) + ".html")};
    {
        std::ofstream stream(markup.path(), std::ios::binary | std::ios::trunc);
        stream.write(html.data(), static_cast<std::streamsize>(html.size()));
        if (!stream) {
            return std::unexpected(Error{Error::Code::IoFailure, "cannot write " + markup.path().string()});
        }
    }

    auto output = std::filesystem::absolute(config_.working_directory / filename, ec);
    if (ec) {
        output = config_.working_directory / filename;
    }
    std::filesystem::remove(output, ec);

    Process::ProcessOptions options{};
    options.working_directory = config_.working_directory;
    options.timeout           = config_.timeout;
    auto result = Process::RunProcess(commandLine(markup.path(), output), options);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->succeeded()) {
        return std::unexpected(Error{Error::Code::RenderFailed,
                                     executable_.filename().string() + " exited with status "
                                         + std::to_string(result->exit_code) + ": " + tail(result->stderr_text, 400)});
    }
    if (!std::filesystem::is_regular_file(output, ec)) {
        return std::unexpected(Error{Error::Code::RenderFailed, "browser produced no screenshot at " + output.string()});
    }
    hf_log("Screenshot written to " + output.string(), "Render");
    return output;
}

} // namespace HF::Render
