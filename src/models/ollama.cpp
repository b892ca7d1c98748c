#include "ollama.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cctype>

using json = nlohmann::json;

namespace termai {

OllamaServer::OllamaServer(HttpClient& http, const std::string& base_url,
                           long timeout_seconds)
    : http_(http)
    , base_url_(strip_trailing_slashes(base_url))
    , timeout_seconds_(timeout_seconds) {}

// Tool-call arguments travel as raw JSON text internally; Ollama wants an object.
static json arguments_to_json(const std::string& arguments) {
    if (arguments.empty()) return json::object();
    try {
        return json::parse(arguments);
    } catch (const json::parse_error&) {
        return arguments;
    }
}

static json build_messages(const std::vector<ChatMessage>& messages) {
    json msgs = json::array();
    for (const auto& msg : messages) {
        json m;
        m["role"] = role_to_string(msg.role);
        m["content"] = msg.content;

        if (!msg.tool_calls.empty()) {
            json tool_calls = json::array();
            for (const auto& tc : msg.tool_calls) {
                json call;
                if (!tc.id.empty()) call["id"] = tc.id;
                call["function"] = {
                    {"name", tc.name},
                    {"arguments", arguments_to_json(tc.arguments)}
                };
                tool_calls.push_back(call);
            }
            m["tool_calls"] = tool_calls;
        }
        if (msg.role == Role::Tool) {
            if (msg.tool_call_id) m["tool_call_id"] = *msg.tool_call_id;
            if (msg.name) m["tool_name"] = *msg.name;
        }
        msgs.push_back(m);
    }
    return msgs;
}

static json build_tools(const std::vector<ToolSpec>& tools) {
    json tools_arr = json::array();
    for (const auto& tool : tools) {
        json t;
        t["type"] = "function";
        t["function"] = {
            {"name", tool.name},
            {"description", tool.description},
            {"parameters", json::parse(tool.parameters_json)}
        };
        tools_arr.push_back(t);
    }
    return tools_arr;
}

// One-line reason for a failed request: Ollama's {"error": ...} field when
// present, otherwise the body with whitespace runs collapsed.
static std::string error_detail(const std::string& body) {
    std::string detail = body;
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("error") && j["error"].is_string()) {
            detail = j["error"].get<std::string>();
        }
    } catch (const json::parse_error&) {
        // not JSON (proxy error page); use the raw body
    }

    std::string out;
    bool in_space = false;
    for (char c : detail) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += c;
    }
    return out;
}

HttpResponse OllamaServer::send(const std::string& path, const std::string& body) {
    std::string url = base_url_ + path;
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(url, body, headers, timeout_seconds_);

    if (response.timed_out) {
        throw EngineError(EngineErrorKind::Timeout,
            "Ollama request to " + url + " timed out after " +
            std::to_string(timeout_seconds_) + "s");
    }
    if (!response.error.empty()) {
        throw EngineError(EngineErrorKind::Http,
            "cannot reach Ollama at " + url + ": " + response.error);
    }
    if (!response.ok()) {
        if (response.body.find("does not support tools") != std::string::npos) {
            throw EngineError(EngineErrorKind::UnsupportedTools,
                "model does not support tool calling (Ollama returned status " +
                std::to_string(response.status_code) + ")");
        }
        throw EngineError(EngineErrorKind::Http,
            "Ollama returned status " + std::to_string(response.status_code) +
            ": " + error_detail(response.body));
    }
    return response;
}

static json parse_body(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw EngineError(EngineErrorKind::Decode,
            std::string("invalid JSON from Ollama: ") + e.what());
    }
}

static ToolCall parse_tool_call(const json& item) {
    ToolCall tc;
    tc.id = item.contains("id") && item["id"].is_string()
        ? item["id"].get<std::string>() : generate_id();
    if (tc.id.empty()) tc.id = generate_id();

    if (!item.contains("function") || !item["function"].is_object()) {
        throw EngineError(EngineErrorKind::Decode,
            "tool call from Ollama is missing its function object");
    }
    const auto& fn = item["function"];
    tc.name = fn.value("name", "");

    if (!fn.contains("arguments") || fn["arguments"].is_null()) {
        tc.arguments = "{}";
    } else if (fn["arguments"].is_string()) {
        tc.arguments = fn["arguments"].get<std::string>();
    } else {
        tc.arguments = fn["arguments"].dump();
    }
    return tc;
}

ChatResponse OllamaServer::chat(const std::vector<ChatMessage>& messages,
                                const std::vector<ToolSpec>& tools,
                                const std::string& model) {
    json request;
    request["model"] = model;
    request["messages"] = build_messages(messages);
    if (!tools.empty()) {
        request["tools"] = build_tools(tools);
    }
    request["stream"] = false;

    auto resp = parse_body(send("/api/chat", request.dump()).body);

    if (!resp.contains("message") || !resp["message"].is_object()) {
        throw EngineError(EngineErrorKind::Decode,
            "Ollama chat response has no message object");
    }
    const auto& message = resp["message"];

    ChatResponse result;

    if (message.contains("content") && message["content"].is_string()) {
        result.content = message["content"].get<std::string>();
    }
    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& item : message["tool_calls"]) {
            result.tool_calls.push_back(parse_tool_call(item));
        }
    }

    return result;
}

std::string OllamaServer::generate(const std::string& prompt,
                                   const std::string& model) {
    json request;
    request["model"] = model;
    request["prompt"] = prompt;
    request["stream"] = false;

    auto resp = parse_body(send("/api/generate", request.dump()).body);

    if (!resp.contains("response") || !resp["response"].is_string()) {
        throw EngineError(EngineErrorKind::Decode,
            "Ollama generate response has no response field");
    }
    return resp["response"].get<std::string>();
}

} // namespace termai
