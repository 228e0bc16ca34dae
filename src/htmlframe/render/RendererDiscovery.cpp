#include <htmlframe/render/RendererDiscovery.hpp>

#include "log/TaggedLogger.hpp"
#include "process/Subprocess.hpp"

#include <iostream>
#include <mutex>
#include <system_error>

namespace HF::Render {

ChromiumLocator::ChromiumLocator()
    : candidates_(DefaultCandidates()) {}

ChromiumLocator::ChromiumLocator(std::vector<std::filesystem::path> candidates)
    : candidates_(std::move(candidates)) {}

auto ChromiumLocator::DefaultCandidates() -> std::vector<std::filesystem::path> {
    return {
        "/usr/bin/google-chrome",
        "/usr/bin/google-chrome-stable",
        "/usr/bin/chromium",
        "/usr/bin/chromium-browser",
        "/usr/local/bin/chrome",
        "/usr/local/bin/chromium",
    };
}

auto ChromiumLocator::locate() const -> std::optional<std::filesystem::path> {
    for (auto const& candidate : candidates_) {
        if (!Process::IsExecutableFile(candidate)) {
            continue;
        }
        std::error_code ec;
        auto real = std::filesystem::canonical(candidate, ec);
        if (ec) {
            hf_log("Cannot resolve " + candidate.string() + ": " + ec.message(), "Discovery");
            continue;
        }
        if (IsSandboxedInstall(real)) {
            hf_log("Skipping snap-confined browser " + candidate.string() + " -> " + real.string(), "Discovery");
            continue;
        }
        hf_log("Using browser " + candidate.string(), "Discovery");
        return candidate;
    }
    std::cerr << "render: no usable Chrome/Chromium found in standard locations\n";
    return std::nullopt;
}

auto IsSandboxedInstall(std::filesystem::path const& real_path) -> bool {
    return real_path.generic_string().find("/snap/") != std::string::npos;
}

auto MakeDefaultRendererLocator() -> std::unique_ptr<RendererLocator> {
#if defined(__unix__) || defined(__APPLE__)
    return std::make_unique<ChromiumLocator>();
#else
    return std::make_unique<NullRendererLocator>();
#endif
}

auto DiscoveredRenderer() -> std::optional<std::filesystem::path> const& {
    static std::once_flag                       once;
    static std::optional<std::filesystem::path> discovered;
    std::call_once(once, [] { discovered = MakeDefaultRendererLocator()->locate(); });
    return discovered;
}

} // namespace HF::Render
