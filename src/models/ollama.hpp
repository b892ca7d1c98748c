#pragma once
#include "../model.hpp"
#include "../http.hpp"
#include <string>

namespace termai {

class OllamaServer : public ModelServer {
public:
    OllamaServer(HttpClient& http,
                 const std::string& base_url = "http://localhost:11434",
                 long timeout_seconds = 30);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::vector<ToolSpec>& tools,
                      const std::string& model) override;

    std::string generate(const std::string& prompt,
                         const std::string& model) override;

private:
    HttpResponse send(const std::string& path, const std::string& body);

    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

} // namespace termai
