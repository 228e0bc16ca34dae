#include <htmlframe/template/TemplateStore.hpp>

#include "log/TaggedLogger.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace HF::Template {

namespace {

auto is_regular_file(std::filesystem::path const& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace

auto ResolveTemplatePath(std::string_view key,
                         std::vector<std::filesystem::path> const& roots,
                         FrameSize fallback) -> Expected<std::filesystem::path> {
    if (key.empty()) {
        return std::unexpected(Error{Error::Code::InvalidPath, "template key must not be empty"});
    }

    std::filesystem::path const key_path{std::string{key}};
    if (key_path.is_absolute()) {
        if (HF::Template::is_regular_file(key_path)) {
            return key_path;
        }
        return std::unexpected(Error{Error::Code::NotFound, "Template not found: " + key_path.string()});
    }

    bool const bare_name = !key_path.has_parent_path();
    std::string searched;
    for (auto const& root : roots) {
        auto candidate = (root / key_path).lexically_normal();
        if (HF::Template::is_regular_file(candidate)) {
            hf_log("Resolved template '" + std::string{key} + "' to " + candidate.string(), "TemplateStore");
            return candidate;
        }
        if (bare_name) {
            auto sized = (root / FormatSizeToken(fallback) / key_path).lexically_normal();
            if (HF::Template::is_regular_file(sized)) {
                hf_log("Resolved template '" + std::string{key} + "' to " + sized.string(), "TemplateStore");
                return sized;
            }
        }
        if (!searched.empty()) {
            searched.append(", ");
        }
        searched.append(root.string());
    }
    return std::unexpected(Error{Error::Code::NotFound,
                                 "Template not found: " + std::string{key} + " (searched: " + searched + ")"});
}

auto LoadTemplate(std::filesystem::path const& path, FrameSize fallback) -> Expected<LoadedTemplate> {
    if (!HF::Template::is_regular_file(path)) {
        return std::unexpected(Error{Error::Code::NotFound, "Template not found: " + path.string()});
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "Template not readable: " + path.string()});
    }
    LoadedTemplate loaded{};
    loaded.source_path = path;
    loaded.body.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed reading template: " + path.string()});
    }
    loaded.size = ResolveTemplateSize(path.generic_string(), fallback);
    hf_log("Template loaded: " + std::to_string(loaded.body.size()) + " chars", "TemplateStore");
    return loaded;
}

} // namespace HF::Template
