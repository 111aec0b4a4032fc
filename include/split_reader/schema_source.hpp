#pragma once
#include "split_reader/error.hpp"
#include <avro/ValidSchema.hh>
#include <optional>
#include <string>
#include <string_view>

namespace sr {

class Properties;
class SchemaCache;

enum class SchemaOrigin { Literal, Url };

// Compile JSON schema text. Config error on failure.
std::optional<avro::ValidSchema> parse_schema(std::string_view text, Error* err);

// Read schema text from "file:" URLs, plain paths, or http(s) URLs.
// Unreachable or unreadable sources are config errors.
bool fetch_schema_text(std::string_view url, std::string* out, Error* err);

// Schema from a property set: the literal wins over the URL, and the value
// "none" counts as absent. Having neither is a config error; callers check
// for the keys first when absence is a legitimate outcome.
std::optional<avro::ValidSchema> determine_schema(const Properties& props,
                                                  SchemaCache* cache,
                                                  Error* err,
                                                  SchemaOrigin* origin = nullptr);

}
