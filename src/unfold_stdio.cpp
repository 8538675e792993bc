#include <iostream>
#include <fstream>
#include <string>
#include <sstream>
#include <filesystem>
#include <json/json.h>
#include "UnfoldController.hpp"

UnfoldController controller;

void writeMessage(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    std::cout << Json::writeString(writer, message) << std::endl;
}

void processRequest(const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        std::cerr << "JSON parse error: " << errs << std::endl;
        return;
    }

    try {
        Json::Value response = controller.handleRequest(request);
        if (!response.isNull()) {
            writeMessage(response);
        }
    } catch (const std::exception& e) {
        std::cerr << "Request failed: " << e.what() << std::endl;
    }
}

// Optional configuration; a missing default file is fine, a broken one is not.
bool loadConfig(const std::string& path, bool required) {
    if (!std::filesystem::exists(path)) {
        if (required) {
            std::cerr << "Config file not found: " << path << std::endl;
            return false;
        }
        return true;
    }

    std::ifstream ifs(path);
    Json::CharReaderBuilder builder;
    Json::Value config;
    std::string errs;
    if (!Json::parseFromStream(builder, ifs, &config, &errs)) {
        std::cerr << "Config parse error in " << path << ": " << errs << std::endl;
        return false;
    }
    try {
        controller.configure(config);
    } catch (const std::exception& e) {
        std::cerr << "Invalid config " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    bool explicitConfig = argc > 1;
    std::string configPath = explicitConfig ? argv[1] : "config.json";
    if (!loadConfig(configPath, explicitConfig)) {
        return 1;
    }

    std::string line;
    std::cerr << "vcard-unfold stdio server started" << std::endl;

    while (std::getline(std::cin, line)) {
        if (!line.empty()) {
            processRequest(line);
        }
    }

    return 0;
}
