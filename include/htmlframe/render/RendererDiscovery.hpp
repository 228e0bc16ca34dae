#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace HF::Render {

// Finds a browser executable able to rasterize markup.
class RendererLocator {
public:
    virtual ~RendererLocator() = default;

    [[nodiscard]] virtual auto locate() const -> std::optional<std::filesystem::path> = 0;
};

// Used where no probe is meaningful; always reports nothing.
class NullRendererLocator final : public RendererLocator {
public:
    [[nodiscard]] auto locate() const -> std::optional<std::filesystem::path> override { return std::nullopt; }
};

// Probes well-known Chrome/Chromium install locations in order. Candidates
// whose symlinks resolve into /snap/ are skipped: snap confinement blocks the
// headless screenshot path.
class ChromiumLocator final : public RendererLocator {
public:
    ChromiumLocator();
    explicit ChromiumLocator(std::vector<std::filesystem::path> candidates);

    [[nodiscard]] auto locate() const -> std::optional<std::filesystem::path> override;
    [[nodiscard]] auto candidates() const -> std::vector<std::filesystem::path> const& { return candidates_; }

    [[nodiscard]] static auto DefaultCandidates() -> std::vector<std::filesystem::path>;

private:
    std::vector<std::filesystem::path> candidates_;
};

[[nodiscard]] auto IsSandboxedInstall(std::filesystem::path const& real_path) -> bool;

// ChromiumLocator on POSIX hosts, NullRendererLocator elsewhere.
[[nodiscard]] auto MakeDefaultRendererLocator() -> std::unique_ptr<RendererLocator>;

// Result of the default locator, probed on first call and shared by every
// caller in the process afterwards.
[[nodiscard]] auto DiscoveredRenderer() -> std::optional<std::filesystem::path> const&;

} // namespace HF::Render
