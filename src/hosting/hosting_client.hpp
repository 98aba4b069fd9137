#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gitstack::hosting {

struct PullRequest {
    std::uint64_t number = 0;
    std::string head;        // branch the PR is opened from
    std::string base;        // branch the PR merges into
    std::string state;       // "open" or "closed"
    bool merged = false;
    bool draft = false;
    std::string title;
    std::string url;
};

/**
 * Abstract interface for the code hosting provider. The stack engine only
 * needs to open pull requests, list them, and move their base branch.
 */
class HostingClient {
public:
    /**
     * Result of a call that yields a single pull request
     */
    struct PullRequestResult {
        bool success;
        PullRequest pullRequest;
        std::string error;

        static PullRequestResult Success(const PullRequest& pr) {
            return PullRequestResult{true, pr, ""};
        }

        static PullRequestResult Error(const std::string& error) {
            return PullRequestResult{false, PullRequest{}, error};
        }
    };

    struct ListResult {
        bool success;
        std::vector<PullRequest> pullRequests;
        std::string error;

        static ListResult Success(const std::vector<PullRequest>& prs) {
            return ListResult{true, prs, ""};
        }

        static ListResult Error(const std::string& error) {
            return ListResult{false, {}, error};
        }
    };

    virtual ~HostingClient() = default;

    /**
     * Open a pull request from `head` into `base`
     * @param title Title of the pull request
     * @param draft Open it as a draft
     */
    virtual PullRequestResult createPullRequest(const std::string& head,
                                                const std::string& base,
                                                const std::string& title,
                                                bool draft) = 0;

    /**
     * List pull requests of the repository
     * @param state "open", "closed" or "all"
     */
    virtual ListResult listPullRequests(const std::string& state) = 0;

    /**
     * Point an existing pull request at a different base branch
     */
    virtual PullRequestResult updatePullRequestBase(std::uint64_t number,
                                                    const std::string& base) = 0;

    /**
     * Get the name of this hosting provider (e.g. "GitHub")
     */
    virtual std::string getProviderName() const = 0;
};

// Host, owner and repository name parsed from a remote URL.
struct RepoIdentifier {
    std::string host;
    std::string owner;
    std::string repo;
};

/**
 * Accepts git@host:owner/repo(.git), https://host/owner/repo(.git),
 * ssh://git@host/owner/repo and git://host/owner/repo.
 */
std::optional<RepoIdentifier> parseRemoteUrl(const std::string& url);

class Hosting {
public:
    static std::unique_ptr<HostingClient> createGitHub(const RepoIdentifier& repo,
                                                       const std::string& token);

    /**
     * Build a client for the repository behind `remoteUrl`, authenticated
     * with GITHUB_TOKEN or GH_TOKEN.
     * @return nullptr when the URL cannot be parsed or no token is set
     */
    static std::unique_ptr<HostingClient> fromRemote(const std::string& remoteUrl);

    static std::string findToken();
};

}
