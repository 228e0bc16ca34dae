#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace HF::Render {

// True for http://, https://, data: and file:// references.
[[nodiscard]] auto IsUriReference(std::string_view reference) -> bool;

// "file://" URI for an absolute path, percent-encoding everything outside the
// unreserved set and '/'.
[[nodiscard]] auto ToFileUri(std::filesystem::path const& absolute_path) -> std::string;

/*
 * Prepares the `image` variable for the browser. URIs and the empty string
 * pass through. Anything else is a filesystem path: relative paths resolve
 * against `working_root` and the result becomes a file:// URI. A missing
 * file only produces a warning on stderr.
 */
[[nodiscard]] auto NormalizeImageReference(std::string_view reference, std::filesystem::path const& working_root)
    -> std::string;

} // namespace HF::Render
