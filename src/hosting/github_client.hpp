#pragma once
#include "hosting_client.hpp"
#include <memory>
#include <string>

namespace gitstack::hosting {

/**
 * GitHub REST v3 client
 * Talks to api.github.com, or <host>/api/v3 for GitHub Enterprise
 */
class GitHubClient : public HostingClient {
public:
    /**
     * Configuration for the GitHub client
     */
    struct Config {
        std::string token;
        std::string apiBase = "https://api.github.com";
        std::string owner;
        std::string repo;
        int timeoutSeconds = 30;

        static Config forRepo(const RepoIdentifier& repo, const std::string& token);
    };

    explicit GitHubClient(const Config& config);

    ~GitHubClient() override;

    // HostingClient interface implementation
    PullRequestResult createPullRequest(const std::string& head, const std::string& base,
                                        const std::string& title, bool draft) override;
    ListResult listPullRequests(const std::string& state) override;
    PullRequestResult updatePullRequestBase(std::uint64_t number, const std::string& base) override;
    std::string getProviderName() const override;

    static std::string apiBaseFor(const std::string& host);

    /**
     * Parse one pull request object of the REST API
     * @throws nlohmann::json::exception on malformed input
     */
    static PullRequest parsePullRequest(const std::string& jsonText);

    static std::string createPullRequestPayload(const std::string& head, const std::string& base,
                                                const std::string& title, bool draft);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;

    struct HttpResponse {
        bool transportOk = false;
        long status = 0;
        std::string body;
        std::string error;
    };

    HttpResponse makeRequest(const std::string& method, const std::string& url,
                             const std::string& payload);
    std::string repoUrl() const;
    static std::string describeFailure(const HttpResponse& response);
};

} // namespace gitstack::hosting
