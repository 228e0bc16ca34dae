#pragma once

#include <htmlframe/core/Error.hpp>
#include <htmlframe/template/TemplateSize.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace HF::Template {

struct LoadedTemplate {
    std::filesystem::path source_path;
    std::string           body;
    FrameSize             size;
};

/*
 * Resolves a template key against `roots`, earlier roots taking priority:
 *   - an absolute path that exists is returned unchanged;
 *   - otherwise `root / key` is tried for each root;
 *   - a bare file name is additionally tried as `root / "<WxH>" / key` using
 *     the fallback size directory.
 * Returns Error::Code::NotFound naming the key when nothing matches.
 */
[[nodiscard]] auto ResolveTemplatePath(std::string_view key,
                                       std::vector<std::filesystem::path> const& roots,
                                       FrameSize fallback) -> Expected<std::filesystem::path>;

// Reads a template body and resolves its frame size from the path.
[[nodiscard]] auto LoadTemplate(std::filesystem::path const& path, FrameSize fallback) -> Expected<LoadedTemplate>;

} // namespace HF::Template
