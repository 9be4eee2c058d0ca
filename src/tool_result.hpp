#pragma once
#include "result.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace toolcore {

struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

enum class ImageFormat { Png, Jpeg, Gif, Webp };

const std::vector<ImageFormat>& all_image_formats();

std::string to_string(ImageFormat format);

// Accepts lower-case extensions: png, jpg, jpeg, gif, webp.
std::optional<ImageFormat> image_format_from_extension(const std::string& extension);

struct ImageBlock {
    ImageFormat format = ImageFormat::Png;
    std::vector<uint8_t> bytes;
};

struct ToolExecutionOutputItem {
    enum class Kind { Text, Json, Image };

    Kind kind = Kind::Text;
    std::string text;
    nlohmann::json json;
    std::optional<ImageBlock> image;

    static ToolExecutionOutputItem make_text(std::string text);
    static ToolExecutionOutputItem make_json(nlohmann::json value);
    static ToolExecutionOutputItem make_image(ImageBlock image);
};

// Always holds at least one item; the default is a single empty text item.
struct ToolExecutionOutput {
    std::vector<ToolExecutionOutputItem> items;

    ToolExecutionOutput();
    explicit ToolExecutionOutput(std::vector<ToolExecutionOutputItem> items);

    static ToolExecutionOutput text(std::string text);
};

struct ToolExecutionError {
    enum class Kind { Io, Custom };

    Kind kind = Kind::Custom;
    std::string message; // context for Io errors
    std::optional<std::error_code> source;

    static ToolExecutionError io(std::string context, std::error_code source);
    static ToolExecutionError io(std::string context);
    static ToolExecutionError custom(std::string message);

    // "context: cause" when a cause is attached
    std::string to_string() const;
};

using ToolExecutionResult = Result<ToolExecutionOutput, ToolExecutionError>;

} // namespace toolcore
