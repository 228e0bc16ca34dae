#include <htmlframe/render/FontCheck.hpp>

#include "log/TaggedLogger.hpp"
#include "process/Subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace HF::Render {

auto FontCheckStatusName(FontCheckStatus status) -> std::string {
    switch (status) {
    case FontCheckStatus::Ok:
        return "ok";
    case FontCheckStatus::NoFonts:
        return "no_fonts";
    case FontCheckStatus::ToolMissing:
        return "tool_missing";
    case FontCheckStatus::ToolFailed:
        return "tool_failed";
    case FontCheckStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

auto CheckFontEnvironment(std::chrono::milliseconds timeout) -> FontCheckStatus {
#if defined(__unix__) || defined(__APPLE__)
    Process::ProcessOptions options{};
    options.timeout = timeout;
    auto result     = Process::RunProcess({"fc-list"}, options);
    if (!result) {
        if (result.error().code == Error::Code::NotFound) {
            std::cerr << "render: fc-list not found, text may render without fonts\n";
            return FontCheckStatus::ToolMissing;
        }
        std::cerr << "render: font check failed: " << describeError(result.error()) << "\n";
        return FontCheckStatus::ToolFailed;
    }
    if (!result->succeeded()) {
        std::cerr << "render: fc-list exited with status " << result->exit_code << "\n";
        return FontCheckStatus::ToolFailed;
    }
    bool const blank = std::all_of(result->stdout_text.begin(), result->stdout_text.end(),
                                   [](unsigned char ch) { return std::isspace(ch) != 0; });
    if (blank) {
        std::cerr << "render: no fonts installed, text may not render\n";
        return FontCheckStatus::NoFonts;
    }
    hf_log("Font environment ok", "Render");
    return FontCheckStatus::Ok;
#else
    (void)timeout;
    return FontCheckStatus::Skipped;
#endif
}

} // namespace HF::Render
