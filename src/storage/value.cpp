#include "value.hpp"

std::string dump_value(const Value& value) {
    YAML::Emitter out;
    out << value;
    std::string text = out.c_str();
    text += "\n";
    return text;
}

std::optional<Value> load_value(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    try {
        return YAML::Load(text);
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}
