#pragma once

#include <chrono>
#include <string>

namespace HF::Render {

enum class FontCheckStatus {
    Ok,
    NoFonts,
    ToolMissing,
    ToolFailed,
    Skipped,
};

[[nodiscard]] auto FontCheckStatusName(FontCheckStatus status) -> std::string;

// Runs `fc-list` and warns on stderr when the host has no usable fonts.
// Never fails the caller.
auto CheckFontEnvironment(std::chrono::milliseconds timeout = std::chrono::seconds{2}) -> FontCheckStatus;

} // namespace HF::Render
