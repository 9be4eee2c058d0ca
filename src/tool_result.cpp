#include "tool_result.hpp"

namespace toolcore {

const std::vector<ImageFormat>& all_image_formats() {
    static const std::vector<ImageFormat> formats = {
        ImageFormat::Png, ImageFormat::Jpeg, ImageFormat::Gif, ImageFormat::Webp,
    };
    return formats;
}

std::string to_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png:  return "png";
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Gif:  return "gif";
        case ImageFormat::Webp: return "webp";
    }
    return "unknown";
}

std::optional<ImageFormat> image_format_from_extension(const std::string& extension) {
    if (extension == "png") return ImageFormat::Png;
    if (extension == "jpg" || extension == "jpeg") return ImageFormat::Jpeg;
    if (extension == "gif") return ImageFormat::Gif;
    if (extension == "webp") return ImageFormat::Webp;
    return std::nullopt;
}

ToolExecutionOutputItem ToolExecutionOutputItem::make_text(std::string text) {
    ToolExecutionOutputItem item;
    item.kind = Kind::Text;
    item.text = std::move(text);
    return item;
}

ToolExecutionOutputItem ToolExecutionOutputItem::make_json(nlohmann::json value) {
    ToolExecutionOutputItem item;
    item.kind = Kind::Json;
    item.json = std::move(value);
    return item;
}

ToolExecutionOutputItem ToolExecutionOutputItem::make_image(ImageBlock image) {
    ToolExecutionOutputItem item;
    item.kind = Kind::Image;
    item.image = std::move(image);
    return item;
}

ToolExecutionOutput::ToolExecutionOutput()
    : items{ToolExecutionOutputItem::make_text("")} {}

ToolExecutionOutput::ToolExecutionOutput(std::vector<ToolExecutionOutputItem> items)
    : items(std::move(items)) {
    if (this->items.empty()) {
        this->items.push_back(ToolExecutionOutputItem::make_text(""));
    }
}

ToolExecutionOutput ToolExecutionOutput::text(std::string text) {
    return ToolExecutionOutput({ToolExecutionOutputItem::make_text(std::move(text))});
}

ToolExecutionError ToolExecutionError::io(std::string context, std::error_code source) {
    ToolExecutionError err;
    err.kind = Kind::Io;
    err.message = std::move(context);
    err.source = source;
    return err;
}

ToolExecutionError ToolExecutionError::io(std::string context) {
    ToolExecutionError err;
    err.kind = Kind::Io;
    err.message = std::move(context);
    return err;
}

ToolExecutionError ToolExecutionError::custom(std::string message) {
    ToolExecutionError err;
    err.kind = Kind::Custom;
    err.message = std::move(message);
    return err;
}

std::string ToolExecutionError::to_string() const {
    if (kind == Kind::Io && source) {
        return message + ": " + source->message();
    }
    return message;
}

} // namespace toolcore
