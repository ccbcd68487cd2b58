#pragma once

#include <map>
#include <string>
#include <vector>

namespace streamstats {
namespace server {

struct Request {
    std::string method;
    std::string path;
    std::multimap<std::string, std::string> params;
    std::string body;
    std::map<std::string, std::string> headers;

    std::string GetParam(const std::string& key) const {
        auto it = params.find(key);
        if (it != params.end()) {
            return it->second;
        }
        return "";
    }
};

struct Response {
    int status = 200;
    std::string body;
    std::string content_type = "text/plain";

    void SetText(int code, std::string text) {
        status = code;
        body = std::move(text);
        content_type = "text/plain";
    }
};

} // namespace server
} // namespace streamstats
