#ifndef ATLASFS_UTILS_JSON_H
#define ATLASFS_UTILS_JSON_H

#include <simdjson.h>

#include <cstdint>
#include <functional>
#include <string>

namespace atlasfs::utils::json {
using JsonParser = simdjson::dom::parser;
using JsonDocument = simdjson::dom::element;

// Elements handed to the callback are only valid inside the callback; the
// parser buffer is reused for the next line. Malformed lines are skipped.
// Returns the number of lines parsed successfully.
std::size_t for_each_json_line(
    JsonParser &parser, const char *data, std::size_t size,
    const std::function<void(const JsonDocument &)> &callback);

bool has_field(const JsonDocument &doc, const std::string &key);
std::string get_string_field(const JsonDocument &doc, const std::string &key);
std::uint64_t get_uint64_field(const JsonDocument &doc,
                               const std::string &key);

// Compact JSON text of a field value, "" when the field is absent.
std::string get_raw_field(const JsonDocument &doc, const std::string &key);
}  // namespace atlasfs::utils::json

#endif  // ATLASFS_UTILS_JSON_H
