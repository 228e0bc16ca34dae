#pragma once

#include <htmlframe/core/Error.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HF::Process {

struct ProcessOptions {
    std::optional<std::filesystem::path> working_directory;
    std::chrono::milliseconds            timeout{30000};
};

struct ProcessResult {
    int         exit_code   = -1;
    int         term_signal = 0;
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] auto succeeded() const -> bool { return term_signal == 0 && exit_code == 0; }
};

// Runs argv[0] (searched on PATH when it has no '/') and waits for it.
// Errors: NotFound when the program cannot be executed, Timeout when it
// outlives options.timeout (the child is killed), SpawnFailed otherwise.
// A non-zero exit is reported through ProcessResult, not as an error.
[[nodiscard]] auto RunProcess(std::vector<std::string> const& argv, ProcessOptions const& options = {})
    -> Expected<ProcessResult>;

[[nodiscard]] auto IsExecutableFile(std::filesystem::path const& path) -> bool;

[[nodiscard]] auto FindExecutableInPath(std::string_view name) -> std::optional<std::filesystem::path>;

} // namespace HF::Process
