#include "migration/registry/http_host_registry.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <curl/curl.h>

using json = nlohmann::json;

HttpHostRegistry::HttpHostRegistry(const std::string& localHostId, const RegistryConfig& config)
    : HostRegistry(localHostId)
    , config_(config) {
}

size_t HttpHostRegistry::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

void HttpHostRegistry::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = error;
}

std::string HttpHostRegistry::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

bool HttpHostRegistry::fetch(const std::string& url, std::string& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        setLastError("Failed to initialize CURL");
        return false;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!config_.apiToken.empty()) {
        std::string auth = "Authorization: Bearer " + config_.apiToken;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        setLastError("Request to " + url + " failed: " + curl_easy_strerror(res));
        return false;
    }
    if (httpCode != 200) {
        setLastError("Request to " + url + " returned HTTP " + std::to_string(httpCode));
        return false;
    }
    return true;
}

bool HttpHostRegistry::parseHosts(const json& response, std::vector<HostInfo>& hosts, std::string& error) {
    const json* list = &response;
    if (response.is_object() && response.contains("hosts")) {
        list = &response["hosts"];
    }
    if (!list->is_array()) {
        error = "Expected an array of hosts";
        return false;
    }

    std::vector<HostInfo> parsed;
    try {
        for (const auto& entry : *list) {
            if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
                error = "Host entry without a string id";
                return false;
            }

            HostInfo host;
            host.id = entry["id"].get<std::string>();
            host.name = entry.value("name", host.id);
            if (entry.contains("host") && entry["host"].is_string()) {
                host.address = entry["host"].get<std::string>();
            } else {
                host.address = entry.value("address", std::string());
            }

            if (entry.contains("online") && entry["online"].is_boolean()) {
                host.online = entry["online"].get<bool>();
            } else {
                host.online = entry.value("status", std::string()) == "online";
            }
            parsed.push_back(host);
        }
    } catch (const json::exception& e) {
        error = std::string("Malformed host entry: ") + e.what();
        return false;
    }

    hosts.swap(parsed);
    return true;
}

bool HttpHostRegistry::listHosts(std::vector<HostInfo>& hosts) {
    std::string url = utils::joinUrl(config_.url, "api/hosts");
    std::string body;
    if (!fetch(url, body)) {
        Logger::warning("Host registry request failed: " + getLastError());
        return false;
    }

    try {
        std::string error;
        if (!parseHosts(json::parse(body), hosts, error)) {
            setLastError("Unexpected host registry response: " + error);
            return false;
        }
    } catch (const json::exception& e) {
        setLastError(std::string("Invalid host registry JSON: ") + e.what());
        return false;
    }

    Logger::debug("Host registry returned " + std::to_string(hosts.size()) + " hosts");
    return true;
}
