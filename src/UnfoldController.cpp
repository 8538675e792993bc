#include "UnfoldController.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include "FoldedLineReader.hpp"
#include "MemorySegment.hpp"

UnfoldController::UnfoldController() {
}

Json::Value UnfoldController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value UnfoldController::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value UnfoldController::initialize() const {
    Json::Value result;
    result["capabilities"]["unfold"]["text"] = true;
    result["capabilities"]["unfold"]["path"] = true;
    result["serverInfo"]["name"] = "vcard-unfold";
    result["serverInfo"]["version"] = "1.0.0";
    return result;
}

Json::Value UnfoldController::handleRequest(const Json::Value& request) {
    if (!request.isObject()) {
        return createError(Json::Value(), -32600, "Invalid request: expected an object");
    }
    Json::Value id = request.get("id", Json::Value());
    if (!request["method"].isString()) {
        return createError(id, -32600, "Invalid request: method must be a string");
    }
    std::string method = request["method"].asString();
    Json::Value params = request.get("params", Json::Value(Json::objectValue));

    if (method == "notifications/initialized") {
        // No response needed for notifications
        return Json::Value();
    }
    if (method == "initialize") {
        return createResponse(id, initialize());
    }
    if (method == "unfold") {
        if (!params.isObject()) {
            return createError(id, -32602, "Invalid params: expected an object");
        }
        Json::Value result = unfold(params);
        if (result.isMember("__error__")) {
            return createError(id, -32000, result["__error__"].asString());
        }
        return createResponse(id, result);
    }
    return createError(id, -32601, "Method not found: " + method);
}

void UnfoldController::setAllowedPaths(const std::vector<std::string>& paths) {
    allowedPaths_.clear();
    for (const auto& path : paths) {
        try {
            allowedPaths_.push_back(std::filesystem::canonical(path).string());
        } catch (const std::filesystem::filesystem_error&) {
            // Skip invalid paths
        }
    }
}

bool UnfoldController::isPathAllowed(const std::string& path) const {
    if (allowedPaths_.empty()) {
        return true;
    }

    std::filesystem::path canonical;
    try {
        canonical = std::filesystem::canonical(path);
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }

    // Under an allowed path if every component of the allowed path is a leading component of it
    for (const auto& allowedStr : allowedPaths_) {
        std::filesystem::path allowed(allowedStr);
        auto mismatch = std::mismatch(allowed.begin(), allowed.end(), canonical.begin(), canonical.end());
        if (mismatch.first == allowed.end()) {
            return true;
        }
    }
    return false;
}

void UnfoldController::setMaxLines(size_t maxLines) {
    maxLines_ = maxLines;
}

void UnfoldController::configure(const Json::Value& config) {
    if (config.isMember("allowed_paths")) {
        if (!config["allowed_paths"].isArray()) {
            throw std::runtime_error("allowed_paths must be an array");
        }
        std::vector<std::string> paths;
        for (const auto& p : config["allowed_paths"]) {
            paths.push_back(p.asString());
        }
        setAllowedPaths(paths);
    }
    if (config.isMember("max_lines")) {
        setMaxLines(config["max_lines"].asUInt64());
    }
}

Json::Value UnfoldController::unfold(const Json::Value& params) {
    Json::Value result;
    try {
        std::optional<std::string> encoding;
        if (params.isMember("encoding")) {
            encoding = params["encoding"].asString();
        }
        size_t maxLines = maxLines_;
        if (params.isMember("max_lines")) {
            maxLines = params["max_lines"].asUInt64();
        }

        std::unique_ptr<FoldedLineReader> reader;
        if (params.isMember("text")) {
            reader = std::make_unique<FoldedLineReader>(params["text"].asString(), encoding);
        } else if (params.isMember("path")) {
            std::string path = params["path"].asString();
            if (!isPathAllowed(path)) {
                result["__error__"] = "Access denied: path not in allowed list";
                return result;
            }
            auto segment = std::make_shared<const MemorySegment>(std::filesystem::canonical(path).string());
            reader = std::make_unique<FoldedLineReader>(segment, encoding);
        } else {
            result["__error__"] = "Either 'text' or 'path' is required";
            return result;
        }

        Json::Value lines(Json::arrayValue);
        bool truncated = false;
        while (auto line = reader->readLogicalLine()) {
            if (maxLines != 0 && lines.size() >= maxLines) {
                truncated = true;
                break;
            }
            Json::Value item;
            item["line"] = (Json::UInt64)reader->currentLineNumber();
            item["text"] = *line;
            lines.append(item);
        }

        result["lines"] = lines;
        result["encoding"] = reader->encoding() ? Json::Value(*reader->encoding()) : Json::Value();
        result["truncated"] = truncated;
        return result;
    } catch (const std::exception& e) {
        result["__error__"] = std::string("Error: ") + e.what();
        return result;
    }
}
