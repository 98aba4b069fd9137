#include "github_client.hpp"
#include "../utils/log.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gitstack::hosting {

// PIMPL implementation to hide curl details
struct GitHubClient::Impl {
    Config config;

    Impl(const Config& cfg) : config(cfg) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        curl_global_cleanup();
    }
};

namespace {

// Callback function for curl to write response data
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t totalSize = size * nmemb;
    response->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

PullRequest fromJson(const json& parsed) {
    PullRequest pr;
    pr.number = parsed.at("number").get<std::uint64_t>();
    pr.head = parsed.at("head").at("ref").get<std::string>();
    pr.base = parsed.at("base").at("ref").get<std::string>();
    pr.state = parsed.value("state", std::string("open"));
    pr.merged = parsed.contains("merged_at") && !parsed["merged_at"].is_null();
    pr.draft = parsed.value("draft", false);
    pr.title = parsed.value("title", std::string());
    pr.url = parsed.value("html_url", std::string());
    return pr;
}

}

GitHubClient::Config GitHubClient::Config::forRepo(const RepoIdentifier& repo,
                                                   const std::string& token) {
    Config config;
    config.token = token;
    config.apiBase = GitHubClient::apiBaseFor(repo.host);
    config.owner = repo.owner;
    config.repo = repo.repo;
    return config;
}

GitHubClient::GitHubClient(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}

GitHubClient::~GitHubClient() = default;

std::string GitHubClient::getProviderName() const {
    return "GitHub";
}

std::string GitHubClient::apiBaseFor(const std::string& host) {
    if (host == "github.com") {
        return "https://api.github.com";
    }
    return "https://" + host + "/api/v3";
}

std::string GitHubClient::repoUrl() const {
    return pImpl_->config.apiBase + "/repos/" + pImpl_->config.owner + "/" + pImpl_->config.repo;
}

GitHubClient::HttpResponse GitHubClient::makeRequest(const std::string& method,
                                                     const std::string& url,
                                                     const std::string& payload) {
    HttpResponse response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    // headers
    struct curl_slist* headers = nullptr;
    std::string authHeader = "Authorization: Bearer " + pImpl_->config.token;
    headers = curl_slist_append(headers, "Accept: application/vnd.github.v3+json");
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, authHeader.c_str());

    // CURL options
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (!payload.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "git-stack");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(pImpl_->config.timeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    log::debug("{} {}", method, url);
    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        response.error = "CURL error: " + std::string(curl_easy_strerror(res));
        return response;
    }
    response.transportOk = true;
    return response;
}

std::string GitHubClient::describeFailure(const HttpResponse& response) {
    if (!response.transportOk) {
        return response.error;
    }
    std::string message = response.body;
    try {
        json parsed = json::parse(response.body);
        if (parsed.contains("message")) {
            message = parsed["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // keep the raw body
    }
    if (response.status == 401) {
        return "GitHub rejected the token (HTTP 401). Set GITHUB_TOKEN to a valid token.";
    }
    return "HTTP error " + std::to_string(response.status) + ": " + message;
}

std::string GitHubClient::createPullRequestPayload(const std::string& head, const std::string& base,
                                                   const std::string& title, bool draft) {
    json payload = {
        {"title", title},
        {"head", head},
        {"base", base},
        {"body", ""},
        {"draft", draft}
    };
    return payload.dump();
}

PullRequest GitHubClient::parsePullRequest(const std::string& jsonText) {
    return fromJson(json::parse(jsonText));
}

HostingClient::PullRequestResult GitHubClient::createPullRequest(const std::string& head,
                                                                 const std::string& base,
                                                                 const std::string& title,
                                                                 bool draft) {
    auto response = makeRequest("POST", repoUrl() + "/pulls",
                                createPullRequestPayload(head, base, title, draft));
    if (!response.transportOk || response.status != 201) {
        return PullRequestResult::Error(describeFailure(response));
    }
    try {
        return PullRequestResult::Success(parsePullRequest(response.body));
    } catch (const json::exception& e) {
        return PullRequestResult::Error("JSON parsing error: " + std::string(e.what()));
    }
}

HostingClient::ListResult GitHubClient::listPullRequests(const std::string& state) {
    const int perPage = 100;
    std::vector<PullRequest> all;

    for (int page = 1;; ++page) {
        const std::string url = repoUrl() + "/pulls?state=" + state +
                                "&per_page=" + std::to_string(perPage) +
                                "&page=" + std::to_string(page);
        auto response = makeRequest("GET", url, "");
        if (!response.transportOk || response.status != 200) {
            return ListResult::Error(describeFailure(response));
        }

        size_t count = 0;
        try {
            json parsed = json::parse(response.body);
            for (const auto& entry : parsed) {
                all.push_back(fromJson(entry));
                ++count;
            }
        } catch (const json::exception& e) {
            return ListResult::Error("JSON parsing error: " + std::string(e.what()));
        }

        if (count < static_cast<size_t>(perPage)) {
            break;
        }
    }
    return ListResult::Success(all);
}

HostingClient::PullRequestResult GitHubClient::updatePullRequestBase(std::uint64_t number,
                                                                     const std::string& base) {
    json payload = {{"base", base}};
    auto response = makeRequest("PATCH", repoUrl() + "/pulls/" + std::to_string(number),
                                payload.dump());
    if (!response.transportOk || response.status != 200) {
        return PullRequestResult::Error(describeFailure(response));
    }
    try {
        return PullRequestResult::Success(parsePullRequest(response.body));
    } catch (const json::exception& e) {
        return PullRequestResult::Error("JSON parsing error: " + std::string(e.what()));
    }
}

}
