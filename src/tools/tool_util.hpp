#pragma once
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace termai {

// Parse JSON tool arguments into an object. Throws EngineError{MalformedToolCall}.
inline nlohmann::json parse_tool_json(const std::string& tool_name,
                                      const std::string& args_json) {
    nlohmann::json out;
    try {
        out = nlohmann::json::parse(args_json.empty() ? "{}" : args_json);
    } catch (const std::exception& e) {
        throw EngineError(EngineErrorKind::MalformedToolCall,
            tool_name + ": failed to parse arguments: " + e.what());
    }
    if (!out.is_object()) {
        throw EngineError(EngineErrorKind::MalformedToolCall,
            tool_name + ": arguments must be a JSON object");
    }
    return out;
}

// Fetch a required non-empty string field. Throws EngineError{MalformedToolCall}.
inline std::string require_string(const std::string& tool_name,
                                  const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string() ||
        args[field].get<std::string>().empty()) {
        throw EngineError(EngineErrorKind::MalformedToolCall,
            tool_name + ": missing required parameter '" + field + "'");
    }
    return args[field].get<std::string>();
}

} // namespace termai
