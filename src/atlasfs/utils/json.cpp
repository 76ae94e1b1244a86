#include <atlasfs/utils/json.h>

#include <ostream>

namespace atlasfs::utils::json {

namespace {

bool find_field(const JsonDocument &doc, const std::string &key,
                JsonDocument &out) {
    if (!doc.is_object()) return false;
    auto field = doc[key];
    if (field.error()) return false;
    out = field.value();
    return true;
}

}  // namespace

std::size_t for_each_json_line(
    JsonParser &parser, const char *data, std::size_t size,
    const std::function<void(const JsonDocument &)> &callback) {
    std::size_t parsed = 0;
    const char *start = data;
    const char *end = data + size;

    while (start < end) {
        const char *line_end = start;
        while (line_end < end && *line_end != '\n' && *line_end != '\r') {
            ++line_end;
        }

        if (line_end > start) {
            std::size_t line_size = static_cast<std::size_t>(line_end - start);
            auto doc = parser.parse(start, line_size);
            if (!doc.error()) {
                callback(doc.value());
                ++parsed;
            }
        }

        while (line_end < end && (*line_end == '\n' || *line_end == '\r')) {
            ++line_end;
        }
        start = line_end;
    }

    return parsed;
}

bool has_field(const JsonDocument &doc, const std::string &key) {
    JsonDocument value;
    return find_field(doc, key, value);
}

std::string get_string_field(const JsonDocument &doc, const std::string &key) {
    JsonDocument value;
    if (!find_field(doc, key, value)) return "";
    if (value.is_string()) {
        auto str_result = value.get_string();
        if (!str_result.error()) {
            return std::string(str_result.value());
        }
    }
    return "";
}

std::uint64_t get_uint64_field(const JsonDocument &doc,
                               const std::string &key) {
    JsonDocument value;
    if (!find_field(doc, key, value)) return 0;
    if (value.is_uint64()) {
        auto val_result = value.get_uint64();
        if (!val_result.error()) return val_result.value();
    } else if (value.is_int64()) {
        auto val_result = value.get_int64();
        if (!val_result.error() && val_result.value() >= 0) {
            return static_cast<std::uint64_t>(val_result.value());
        }
    } else if (value.is_double()) {
        auto val_result = value.get_double();
        if (!val_result.error() && val_result.value() >= 0) {
            return static_cast<std::uint64_t>(val_result.value());
        }
    }
    return 0;
}

std::string get_raw_field(const JsonDocument &doc, const std::string &key) {
    JsonDocument value;
    if (!find_field(doc, key, value)) return "";
    return simdjson::minify(value);
}

}  // namespace atlasfs::utils::json
