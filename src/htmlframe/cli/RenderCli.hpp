#pragma once

#include <htmlframe/config/FrameConfig.hpp>
#include <htmlframe/core/Error.hpp>
#include <htmlframe/render/FrameGenerator.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace HF::Cli {

struct RenderCliOptions {
    std::string                                      template_key;
    std::string                                      title;
    std::string                                      text;
    std::string                                      image;
    std::vector<std::pair<std::string, std::string>> assignments;
    std::optional<std::filesystem::path>             vars_file;
    std::optional<std::filesystem::path>             output;
    std::optional<std::filesystem::path>             config_file;
    std::optional<int>                               timeout_ms;
    bool                                             schema = false;
    bool                                             show_help = false;
};

// Returns nullopt after printing the problem to stderr.
[[nodiscard]] auto ParseRenderCliArguments(int argc, char** argv) -> std::optional<RenderCliOptions>;

void PrintRenderCliUsage(std::ostream& out);

// Defaults, then --config, then HTMLFRAME_* variables, then --timeout-ms.
[[nodiscard]] auto BuildFrameConfig(RenderCliOptions const& options) -> Expected<FrameConfig>;

// --vars first, --set on top. Extension values never override title/text/image
// unless named explicitly.
[[nodiscard]] auto BuildFrameRequest(RenderCliOptions const& options) -> Expected<Render::FrameRequest>;

[[nodiscard]] auto MakeSuccessResponse(std::filesystem::path const& frame, Template::FrameSize size)
    -> nlohmann::ordered_json;
[[nodiscard]] auto MakeFailureResponse(std::string const& message) -> nlohmann::ordered_json;

// Prints the JSON response to `out`; returns the process exit code.
[[nodiscard]] auto RunRenderCli(RenderCliOptions const& options,
                                std::ostream& out,
                                Render::FrameGeneratorHooks hooks = {}) -> int;

} // namespace HF::Cli
