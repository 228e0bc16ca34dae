#pragma once

#include <htmlframe/core/Error.hpp>
#include <htmlframe/template/TemplateSize.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace HF {

struct FrameConfig {
    Template::FrameSize                  default_size{};
    std::vector<std::filesystem::path>   template_roots{"data/templates", "templates"};
    std::filesystem::path                output_dir{"output"};
    std::optional<std::filesystem::path> working_dir;
    std::optional<std::filesystem::path> browser_executable;
    std::vector<std::string>             browser_flags;
    std::int64_t                         render_timeout_ms = 30000;
    bool                                 check_fonts       = true;
};

// Overlays the keys present in `json` onto `base`. Unknown keys are ignored;
// a key with the wrong JSON type is Error::Code::MalformedInput.
[[nodiscard]] auto FrameConfigFromJson(nlohmann::json const& json, FrameConfig base = {}) -> Expected<FrameConfig>;

[[nodiscard]] auto LoadFrameConfigFile(std::filesystem::path const& path, FrameConfig base = {})
    -> Expected<FrameConfig>;

// Applies HTMLFRAME_* environment variables. Prints the offending variable to
// stderr and returns false when a value cannot be used.
bool ApplyFrameConfigEnvOverrides(FrameConfig& config);

[[nodiscard]] auto ValidateFrameConfig(FrameConfig const& config) -> std::optional<std::string>;

// Explicit working directory, or the process working directory.
[[nodiscard]] auto ResolveWorkingDirectory(FrameConfig const& config) -> std::filesystem::path;

} // namespace HF
