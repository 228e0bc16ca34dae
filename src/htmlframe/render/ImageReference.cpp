#include <htmlframe/render/ImageReference.hpp>

#include "log/TaggedLogger.hpp"

#include <array>
#include <iostream>
#include <system_error>

namespace HF::Render {

namespace {

auto is_unreserved(unsigned char ch) -> bool {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-'
           || ch == '.' || ch == '_' || ch == '~';
}

} // namespace

auto IsUriReference(std::string_view reference) -> bool {
    return reference.starts_with("http://") || reference.starts_with("https://") || reference.starts_with("data:")
           || reference.starts_with("file://");
}

auto ToFileUri(std::filesystem::path const& absolute_path) -> std::string {
    static constexpr std::array<char, 16> hex{'0', '1', '2', '3', '4', '5', '6', '7',
                                              '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};
    auto const text = absolute_path.generic_string();
    std::string uri{"file://"};
    uri.reserve(uri.size() + text.size());
    if (!text.starts_with('/')) {
        uri.push_back('/');
    }
    for (unsigned char ch : text) {
        if (is_unreserved(ch) || ch == '/') {
            uri.push_back(static_cast<char>(ch));
            continue;
        }
        uri.push_back('%');
        uri.push_back(hex[ch >> 4]);
        uri.push_back(hex[ch & 0x0F]);
    }
    return uri;
}

auto NormalizeImageReference(std::string_view reference, std::filesystem::path const& working_root) -> std::string {
    if (reference.empty() || IsUriReference(reference)) {
        return std::string{reference};
    }

    std::filesystem::path path{std::string{reference}};
    if (path.is_relative()) {
        path = working_root / path;
    }
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    absolute = absolute.lexically_normal();

    if (!std::filesystem::exists(absolute, ec)) {
        std::cerr << "render: image file not found: " << absolute.string() << "\n";
    }
    auto uri = ToFileUri(absolute);
    hf_log("Image reference " + std::string{reference} + " -> " + uri, "Render");
    return uri;
}

} // namespace HF::Render
