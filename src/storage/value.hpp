#pragma once

#include <string>
#include <optional>
#include <yaml-cpp/yaml.h>

// Results and compute arguments are arbitrary structured values
// (null, scalar, sequence, mapping).
using Value = YAML::Node;

// Emit a value as block YAML text.
std::string dump_value(const Value& value);

// Parse YAML text. Empty text or a parse failure yields nullopt.
std::optional<Value> load_value(const std::string& text);
