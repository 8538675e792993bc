#pragma once
#include <json/json.h>
#include <string>
#include <vector>

class UnfoldController {
public:
    explicit UnfoldController();

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;

    // Dispatches one JSON-RPC request (initialize, unfold, notifications/initialized).
    // Returns the response, or a null value when the request is a notification.
    Json::Value handleRequest(const Json::Value& request);

    Json::Value initialize() const;

    // Unfold either params["text"] or the file at params["path"].
    // Returns { lines: [{line, text}], encoding, truncated }, or { __error__ } on failure.
    Json::Value unfold(const Json::Value& params);

    // Configure allowed directories for 'path' requests. Empty list allows everything.
    void setAllowedPaths(const std::vector<std::string>& paths);
    bool isPathAllowed(const std::string& path) const;

    // Default cap on logical lines per request (0 = unlimited).
    void setMaxLines(size_t maxLines);

    // Applies "allowed_paths" and "max_lines" from a configuration object.
    void configure(const Json::Value& config);

private:
    std::vector<std::string> allowedPaths_;
    size_t maxLines_ = 0;
};
