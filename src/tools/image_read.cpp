#include "image_read.hpp"
#include "tool_util.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sys/stat.h>

namespace toolcore {

namespace {

std::optional<std::string> lowercase_extension(const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext.size() < 2) return std::nullopt;
    ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string supported_formats_list() {
    std::string out;
    for (auto format : all_image_formats()) {
        if (!out.empty()) out += ", ";
        out += to_string(format);
    }
    return out;
}

} // namespace

bool is_supported_image_type(const std::string& path) {
    auto ext = lowercase_extension(path);
    return ext && image_format_from_extension(*ext).has_value();
}

Result<ImageBlock, std::string> read_image(const std::string& path) {
    auto ext = lowercase_extension(path);
    if (!ext) return std::string("missing extension");
    auto format = image_format_from_extension(*ext);
    if (!format) return "unsupported format: " + *ext;

    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        return "failed to read file metadata for " + path + ": " + std::strerror(errno);
    }
    auto size = static_cast<uint64_t>(st.st_size);
    if (size > kMaxImageSizeBytes) {
        return "image at " + path + " has size " + std::to_string(size) +
               " bytes, but the max supported size is " + std::to_string(kMaxImageSizeBytes);
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "failed to read image at " + path + ": " + std::strerror(errno);
    }
    ImageBlock block;
    block.format = *format;
    block.bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return "failed to read image at " + path;
    }
    return block;
}

ImageRead ImageRead::from_json(const nlohmann::json& args) {
    require_object(args);
    return ImageRead{require_string_array(args, "paths")};
}

Result<std::vector<std::string>, std::string> ImageRead::processed_paths(
    const SystemProvider& provider, const Platform& platform) const {
    std::vector<std::string> out;
    for (const auto& p : paths) {
        auto resolved = canonicalize_path(p, provider);
        if (!resolved) {
            return "failed to process path " + p + ": " + resolved.error();
        }
        out.push_back(platform.pre_process_image_path(resolved.value().string()));
    }
    return out;
}

std::optional<std::string> ImageRead::validate(const SystemProvider& provider,
                                               const Platform& platform) const {
    auto processed = processed_paths(provider, platform);
    if (!processed) return processed.error();

    std::vector<std::string> errors;
    for (const auto& path : processed.value()) {
        if (!is_supported_image_type(path)) {
            errors.push_back("'" + path + "' is not a supported image type");
            continue;
        }
        struct stat st {};
        if (::lstat(path.c_str(), &st) != 0) {
            errors.push_back("failed to read file metadata for path " + path + ": " +
                             std::strerror(errno));
            continue;
        }
        if (!S_ISREG(st.st_mode)) {
            errors.push_back("'" + path + "' is not a file");
            continue;
        }
        auto size = static_cast<uint64_t>(st.st_size);
        if (size > kMaxImageSizeBytes) {
            errors.push_back("'" + path + "' has size " + std::to_string(size) +
                             " which is greater than the max supported size of " +
                             std::to_string(kMaxImageSizeBytes));
        }
    }
    return join_errors(errors);
}

ToolExecutionResult ImageRead::execute(const SystemProvider& provider,
                                       const Platform& platform) const {
    auto processed = processed_paths(provider, platform);
    if (!processed) return ToolExecutionError::custom(processed.error());

    std::vector<ToolExecutionOutputItem> items;
    std::vector<std::string> errors;
    for (const auto& path : processed.value()) {
        auto image = read_image(path);
        if (image) {
            items.push_back(ToolExecutionOutputItem::make_image(std::move(image.value())));
        } else {
            errors.push_back(image.error());
        }
    }

    // A partial set of images is not useful to the caller.
    if (auto joined = join_errors(errors)) {
        return ToolExecutionError::custom(*joined);
    }
    return ToolExecutionOutput(std::move(items));
}

std::string ImageRead::description() {
    std::string text = R"(A tool for reading images.

WHEN TO USE THIS TOOL:
- Use when you want to read a file that you know is a supported image

HOW TO USE:
- Provide a list of paths to images you want to read

FEATURES:
- Able to read the following image formats: {IMAGE_FORMATS}
- Can read multiple images in one go

LIMITATIONS:
- Maximum supported image size is 10 MB
)";
    return replace_all(text, "{IMAGE_FORMATS}", supported_formats_list());
}

const char* ImageRead::input_schema() {
    return R"json({
    "type": "object",
    "properties": {
        "paths": {
            "type": "array",
            "description": "List of paths to images to read",
            "items": {
                "type": "string",
                "description": "Path to an image"
            }
        }
    },
    "required": ["paths"]
})json";
}

} // namespace toolcore
