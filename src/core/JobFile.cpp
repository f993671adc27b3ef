#include "JobFile.hpp"
#include <json/json.h>
#include <fstream>
#include <sstream>

static bool readStringList(const Json::Value& root, const char* key, std::vector<std::string>& out,
                           std::string& error) {
    out.clear();
    if (!root.isMember(key) || root[key].isNull()) {
        return true;
    }
    const Json::Value& list = root[key];
    if (!list.isArray()) {
        error = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    for (const auto& item : list) {
        if (!item.isString()) {
            error = std::string("'") + key + "' must be an array of strings";
            return false;
        }
        out.push_back(item.asString());
    }
    return true;
}

bool JobFile::parse(const std::string& text, Job& job, std::string& error) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream in(text);
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        error = "Invalid job JSON: " + errors;
        return false;
    }
    if (!root.isObject()) {
        error = "Job description must be a JSON object";
        return false;
    }

    Job parsed;
    parsed.name = root.get("name", "").asString();
    if (parsed.name.empty()) {
        error = "Job name is required";
        return false;
    }
    // 作业名用作目标下的目录名
    if (parsed.name.find('/') != std::string::npos || parsed.name == "." || parsed.name == "..") {
        error = "Job name cannot be used as a directory name: " + parsed.name;
        return false;
    }

    if (!readStringList(root, "sources", parsed.sources, error) ||
        !readStringList(root, "include_patterns", parsed.includePatterns, error) ||
        !readStringList(root, "exclude_patterns", parsed.excludePatterns, error)) {
        return false;
    }
    if (parsed.sources.empty()) {
        error = "At least one source path is required";
        return false;
    }

    parsed.destinationType = root.get("destination_type", "local").asString();
    if (root.isMember("destination")) {
        if (!root["destination"].isObject()) {
            error = "'destination' must be an object";
            return false;
        }
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        parsed.destinationConfig = Json::writeString(writer, root["destination"]);
    }

    std::string policy = root.get("conflict_policy", "rename").asString();
    if (!parseConflictPolicy(policy, parsed.conflictPolicy)) {
        error = "Unknown conflict policy: " + policy;
        return false;
    }
    parsed.schedule = root.get("schedule", "").asString();

    job = parsed;
    return true;
}

bool JobFile::load(const std::string& path, Job& job, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open job file: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), job, error);
}

std::string JobFile::toJson(const Job& job) {
    Json::Value root;
    root["name"] = job.name;
    root["sources"] = Json::Value(Json::arrayValue);
    for (const auto& source : job.sources) {
        root["sources"].append(source);
    }
    root["include_patterns"] = Json::Value(Json::arrayValue);
    for (const auto& pattern : job.includePatterns) {
        root["include_patterns"].append(pattern);
    }
    root["exclude_patterns"] = Json::Value(Json::arrayValue);
    for (const auto& pattern : job.excludePatterns) {
        root["exclude_patterns"].append(pattern);
    }
    root["destination_type"] = job.destinationType;

    Json::Value destination;
    Json::CharReaderBuilder reader;
    std::string errors;
    std::istringstream in(job.destinationConfig);
    if (Json::parseFromStream(reader, in, &destination, &errors) && destination.isObject()) {
        root["destination"] = destination;
    } else {
        root["destination"] = Json::Value(Json::objectValue);
    }
    root["conflict_policy"] = toString(job.conflictPolicy);
    root["schedule"] = job.schedule;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, root);
}
