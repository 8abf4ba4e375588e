#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analysis/SyntaxValidator.h"

struct RepairRequest {
    std::string filePath;
    std::string source;                    // the damaged buffer
    std::vector<ValidationError> errors;
};

/**
 * @brief Capability that turns a syntactically broken buffer into a repaired one.
 *
 * heal() must return within its deadline. Implementations throw
 * CortexError(Timeout) when the deadline passes and CortexError(IoError) for
 * any other failure.
 */
class IRepairOracle {
public:
    virtual ~IRepairOracle() = default;
    virtual std::string heal(const RepairRequest& request) = 0;
};

/**
 * @brief Repair oracle backed by an OpenAI-compatible chat-completions endpoint.
 *
 * The endpoint is the full URL, e.g. http://127.0.0.1:1234/v1/chat/completions.
 */
class LLMRepairClient : public IRepairOracle {
public:
    static constexpr const char* kDefaultEndpoint = "http://127.0.0.1:1234/v1/chat/completions";

    explicit LLMRepairClient(const std::string& endpoint = kDefaultEndpoint,
                             int timeoutSecs = 10,
                             const std::string& apiKey = "",
                             const std::string& model = "");

    std::string heal(const RepairRequest& request) override;

    nlohmann::json buildRequestBody(const RepairRequest& request) const;

    static std::string formatErrorContext(const std::vector<ValidationError>& errors);
    // Drops every markdown fence line, keeps everything else
    static std::string sanitizeCode(const std::string& raw);
    static std::string extractContent(const nlohmann::json& response);

    bool usesSsl() const { return target.isSsl; }
    const std::string& getHost() const { return target.host; }
    int getPort() const { return target.port; }
    const std::string& getPath() const { return target.path; }

    struct Target {
        bool isSsl = false;
        std::string host;
        int port = 80;
        std::string path;
        std::string apiKey;
        int timeoutSecs = 10;
    };

private:
    Target target;
    std::string model;

    void parseEndpoint(const std::string& url);
};
