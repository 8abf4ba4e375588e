#include "core/RepairClient.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include "httplib.h"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <regex>
#include <sstream>
#include <thread>

namespace {

const char* kSystemRole =
    "You are an expert compiler. Fix only the reported syntax errors. "
    "Output ONLY raw code -- no markdown, no backticks, no explanations.";

// Shared between heal() and the request thread; outlives whichever finishes last.
struct PendingRepair {
    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;
    bool ok = false;
    std::string body;
    std::string error;
};

void postRequest(const LLMRepairClient::Target& target, const std::string& bodyStr, PendingRepair& pending) {
    httplib::Headers headers = {{"Content-Type", "application/json"}};
    if (!target.apiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + target.apiKey);
    }

    // heal() owns the deadline; socket timeouts only bound the worker's lifetime
    int socketTimeout = target.timeoutSecs + 1;
    httplib::Result res;
    if (target.isSsl) {
        httplib::SSLClient cli(target.host, target.port);
        cli.set_connection_timeout(socketTimeout);
        cli.set_read_timeout(socketTimeout);
        cli.set_write_timeout(socketTimeout);
        res = cli.Post(target.path, headers, bodyStr, "application/json");
    } else {
        httplib::Client cli(target.host, target.port);
        cli.set_connection_timeout(socketTimeout);
        cli.set_read_timeout(socketTimeout);
        cli.set_write_timeout(socketTimeout);
        res = cli.Post(target.path, headers, bodyStr, "application/json");
    }

    std::lock_guard<std::mutex> lock(pending.mtx);
    if (!res) {
        pending.error = "Failed to connect to repair endpoint: " + httplib::to_string(res.error());
    } else if (res->status != 200) {
        pending.error = "Repair endpoint returned HTTP " + std::to_string(res->status);
    } else {
        pending.ok = true;
        pending.body = res->body;
    }
    pending.done = true;
    pending.cv.notify_all();
}

} // namespace

LLMRepairClient::LLMRepairClient(const std::string& endpoint, int timeoutSecs,
                                 const std::string& apiKey, const std::string& model)
    : model(model) {
    target.apiKey = apiKey;
    target.timeoutSecs = timeoutSecs > 0 ? timeoutSecs : 10;
    parseEndpoint(endpoint.empty() ? std::string(kDefaultEndpoint) : endpoint);
}

void LLMRepairClient::parseEndpoint(const std::string& url) {
    std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        throw CortexError(ErrorKind::IoError, "Invalid repair endpoint URL: " + url);
    }
    target.isSsl = (match[1] == "https");
    target.host = match[2];
    if (match[3].matched) {
        target.port = std::stoi(match[3]);
    } else {
        target.port = target.isSsl ? 443 : 80;
    }
    target.path = match[4];
    if (target.path.empty()) {
        target.path = "/";
    }
}

std::string LLMRepairClient::formatErrorContext(const std::vector<ValidationError>& errors) {
    if (errors.empty()) {
        return "(Tree-sitter detected syntax errors but could not pinpoint them.)";
    }
    std::ostringstream out;
    out << "Tree-sitter reported the following syntax errors:";
    for (size_t i = 0; i < errors.size(); ++i) {
        out << "\n  " << (i + 1) << ". " << errors[i].message;
    }
    return out.str();
}

nlohmann::json LLMRepairClient::buildRequestBody(const RepairRequest& request) const {
    std::string prompt = formatErrorContext(request.errors) +
        "\n\nFix ONLY the syntax errors listed above. Output ONLY raw code, no markdown, no backticks."
        "\n\nBroken code (" + request.filePath + "):\n\n" + request.source;

    nlohmann::json body = {
        {"messages", nlohmann::json::array({
            {{"role", "system"}, {"content", kSystemRole}},
            {{"role", "user"}, {"content", prompt}}
        })},
        {"temperature", 0.1},
        {"max_tokens", 2000}
    };
    if (!model.empty()) {
        body["model"] = model;
    }
    return body;
}

std::string LLMRepairClient::extractContent(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("choices") ||
        !response["choices"].is_array() || response["choices"].empty()) {
        throw CortexError(ErrorKind::IoError, "Missing choices in repair response");
    }
    const auto& choice = response["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        throw CortexError(ErrorKind::IoError, "Malformed choice in repair response");
    }
    const auto& message = choice["message"];
    if (!message.contains("content") || message["content"].is_null()) {
        throw CortexError(ErrorKind::IoError, "Missing content in repair response");
    }
    const auto& content = message["content"];
    if (content.is_string()) {
        return content.get<std::string>();
    }
    // Some servers answer with [{"type":"text","text":"..."}]
    if (content.is_array()) {
        std::string flat;
        for (const auto& part : content) {
            if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                flat += part["text"].get<std::string>();
            }
        }
        if (!flat.empty()) return flat;
    }
    throw CortexError(ErrorKind::IoError, "Unsupported content in repair response");
}

std::string LLMRepairClient::sanitizeCode(const std::string& raw) {
    std::istringstream in(raw);
    std::string line;
    std::vector<std::string> kept;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t first = line.find_first_not_of(" \t");
        if (first != std::string::npos && line.compare(first, 3, "```") == 0) {
            continue;
        }
        kept.push_back(line);
    }

    std::string out;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) out += "\n";
        out += kept[i];
    }
    return out;
}

std::string LLMRepairClient::heal(const RepairRequest& request) {
    std::string bodyStr = buildRequestBody(request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto pending = std::make_shared<PendingRepair>();
    Target requestTarget = target;

    Logger::getInstance().action("Auto-heal: sending " + std::to_string(request.errors.size()) +
                                 " error(s) for " + request.filePath + " to " + target.host + ":" +
                                 std::to_string(target.port) + target.path);

    std::thread([requestTarget, bodyStr, pending]() {
        postRequest(requestTarget, bodyStr, *pending);
    }).detach();

    std::unique_lock<std::mutex> lock(pending->mtx);
    bool finished = pending->cv.wait_for(lock, std::chrono::seconds(target.timeoutSecs),
                                         [&] { return pending->done; });
    if (!finished) {
        throw CortexError(ErrorKind::Timeout,
                          "Repair endpoint did not answer within " + std::to_string(target.timeoutSecs) + "s");
    }
    if (!pending->ok) {
        throw CortexError(ErrorKind::IoError, pending->error);
    }

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(pending->body);
    } catch (const nlohmann::json::parse_error& e) {
        throw CortexError(ErrorKind::IoError, std::string("Failed to parse repair JSON: ") + e.what());
    }
    return sanitizeCode(extractContent(response));
}
