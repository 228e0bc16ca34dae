#include <htmlframe/config/FrameConfig.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <ranges>
#include <string_view>
#include <system_error>

namespace HF {

namespace {

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto split_list(std::string_view text, char separator) -> std::vector<std::string> {
    std::vector<std::string> parts;
    for (auto part : text | std::views::split(separator)) {
        std::string_view piece{part.begin(), part.end()};
        if (!piece.empty()) {
            parts.emplace_back(piece);
        }
    }
    return parts;
}

auto malformed(std::string const& key, char const* expected) -> Error {
    return Error{Error::Code::MalformedInput, "config key '" + key + "' must be " + expected};
}

auto read_positive_int(nlohmann::json const& json, char const* key, int& out) -> std::optional<Error> {
    auto it = json.find(key);
    if (it == json.end()) {
        return std::nullopt;
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0
        || it->get<std::int64_t>() > std::numeric_limits<int>::max()) {
        return malformed(key, "a positive integer");
    }
    out = it->get<int>();
    return std::nullopt;
}

auto read_path(nlohmann::json const& json, char const* key, std::filesystem::path& out) -> std::optional<Error> {
    auto it = json.find(key);
    if (it == json.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return malformed(key, "a string");
    }
    out = it->get<std::string>();
    return std::nullopt;
}

auto read_optional_path(nlohmann::json const& json, char const* key, std::optional<std::filesystem::path>& out)
    -> std::optional<Error> {
    auto it = json.find(key);
    if (it == json.end()) {
        return std::nullopt;
    }
    if (it->is_null()) {
        out.reset();
        return std::nullopt;
    }
    if (!it->is_string()) {
        return malformed(key, "a string or null");
    }
    out = std::filesystem::path{it->get<std::string>()};
    return std::nullopt;
}

auto read_string_array(nlohmann::json const& json, char const* key) -> Expected<std::optional<std::vector<std::string>>> {
    auto it = json.find(key);
    if (it == json.end()) {
        return std::optional<std::vector<std::string>>{};
    }
    if (!it->is_array()) {
        return std::unexpected(malformed(key, "an array of strings"));
    }
    std::vector<std::string> values;
    for (auto const& entry : *it) {
        if (!entry.is_string()) {
            return std::unexpected(malformed(key, "an array of strings"));
        }
        values.push_back(entry.get<std::string>());
    }
    return std::optional<std::vector<std::string>>{std::move(values)};
}

} // namespace

auto FrameConfigFromJson(nlohmann::json const& json, FrameConfig base) -> Expected<FrameConfig> {
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "config must be a JSON object"});
    }

    FrameConfig config = std::move(base);
    if (auto error = read_positive_int(json, "default_width", config.default_size.width)) {
        return std::unexpected(*error);
    }
    if (auto error = read_positive_int(json, "default_height", config.default_size.height)) {
        return std::unexpected(*error);
    }

    auto roots = read_string_array(json, "template_roots");
    if (!roots) {
        return std::unexpected(roots.error());
    }
    if (*roots) {
        config.template_roots.assign((*roots)->begin(), (*roots)->end());
    }

    if (auto error = read_path(json, "output_dir", config.output_dir)) {
        return std::unexpected(*error);
    }
    if (auto error = read_optional_path(json, "working_dir", config.working_dir)) {
        return std::unexpected(*error);
    }
    if (auto error = read_optional_path(json, "browser_executable", config.browser_executable)) {
        return std::unexpected(*error);
    }

    auto flags = read_string_array(json, "browser_flags");
    if (!flags) {
        return std::unexpected(flags.error());
    }
    if (*flags) {
        config.browser_flags = std::move(**flags);
    }

    if (auto it = json.find("render_timeout_ms"); it != json.end()) {
        if (!it->is_number_integer()) {
            return std::unexpected(malformed("render_timeout_ms", "an integer"));
        }
        config.render_timeout_ms = it->get<std::int64_t>();
    }
    if (auto it = json.find("check_fonts"); it != json.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(malformed("check_fonts", "a boolean"));
        }
        config.check_fonts = it->get<bool>();
    }
    return config;
}

auto LoadFrameConfigFile(std::filesystem::path const& path, FrameConfig base) -> Expected<FrameConfig> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "config file not readable: " + path.string()});
    }
    auto json = nlohmann::json::parse(stream, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "config file is not valid JSON: " + path.string()});
    }
    hf_log("Loading frame config " + path.string(), "Config");
    return FrameConfigFromJson(json, std::move(base));
}

bool ApplyFrameConfigEnvOverrides(FrameConfig& config) {
    if (!apply_env("HTMLFRAME_DEFAULT_SIZE", [&](std::string_view value) {
            auto size = Template::ParseSizeToken(value);
            if (!size) {
                std::cerr << "HTMLFRAME_DEFAULT_SIZE must look like 1080x1920\n";
                return false;
            }
            config.default_size = *size;
            return true;
        })) {
        return false;
    }

    if (!apply_env("HTMLFRAME_TEMPLATE_ROOTS", [&](std::string_view value) {
            auto roots = split_list(value, ':');
            if (roots.empty()) {
                std::cerr << "HTMLFRAME_TEMPLATE_ROOTS must name at least one directory\n";
                return false;
            }
            config.template_roots.assign(roots.begin(), roots.end());
            return true;
        })) {
        return false;
    }

    if (!apply_env("HTMLFRAME_OUTPUT_DIR", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "HTMLFRAME_OUTPUT_DIR must not be empty\n";
                return false;
            }
            config.output_dir = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("HTMLFRAME_WORKING_DIR", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "HTMLFRAME_WORKING_DIR must not be empty\n";
                return false;
            }
            config.working_dir = std::filesystem::path{std::string{value}};
            return true;
        })) {
        return false;
    }

    if (!apply_env("HTMLFRAME_BROWSER", [&](std::string_view value) {
            if (value.empty()) {
                config.browser_executable.reset();
            } else {
                config.browser_executable = std::filesystem::path{std::string{value}};
            }
            return true;
        })) {
        return false;
    }

    if (!apply_env("HTMLFRAME_BROWSER_FLAGS", [&](std::string_view value) {
            config.browser_flags = split_list(value, ' ');
            return true;
        })) {
        return false;
    }

    if (!apply_env("HTMLFRAME_RENDER_TIMEOUT_MS", [&](std::string_view value) {
            std::int64_t parsed = 0;
            auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (result.ec != std::errc{} || result.ptr != value.data() + value.size() || parsed <= 0) {
                std::cerr << "HTMLFRAME_RENDER_TIMEOUT_MS must be a positive integer\n";
                return false;
            }
            config.render_timeout_ms = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("HTMLFRAME_CHECK_FONTS", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "HTMLFRAME_CHECK_FONTS must be a boolean (1/0, true/false, yes/no, on/off)\n";
                return false;
            }
            config.check_fonts = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

auto ValidateFrameConfig(FrameConfig const& config) -> std::optional<std::string> {
    if (config.default_size.width <= 0 || config.default_size.height <= 0) {
        return std::string{"default size must be positive"};
    }
    if (config.template_roots.empty()) {
        return std::string{"at least one template root is required"};
    }
    if (config.output_dir.empty()) {
        return std::string{"output dir must not be empty"};
    }
    if (config.render_timeout_ms <= 0) {
        return std::string{"render timeout must be > 0"};
    }
    return std::nullopt;
}

auto ResolveWorkingDirectory(FrameConfig const& config) -> std::filesystem::path {
    if (config.working_dir) {
        return *config.working_dir;
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return std::filesystem::path{"."};
    }
    return cwd;
}

} // namespace HF
