#include "hosting_client.hpp"
#include "github_client.hpp"
#include "../utils/file_utils.hpp"
#include "../utils/log.hpp"

#include <cctype>

namespace gitstack::hosting {

namespace {

bool consumePrefix(std::string& text, const std::string& prefix) {
    if (text.rfind(prefix, 0) != 0) return false;
    text.erase(0, prefix.size());
    return true;
}

// "owner/repo(.git)" -> identifier
std::optional<RepoIdentifier> splitPath(const std::string& host, std::string path) {
    while (!path.empty() && path.back() == '/') path.pop_back();
    if (path.size() > 4 && path.compare(path.size() - 4, 4, ".git") == 0) {
        path.resize(path.size() - 4);
    }
    const size_t slash = path.find('/');
    if (host.empty() || slash == std::string::npos || slash == 0 || slash + 1 >= path.size()) {
        return std::nullopt;
    }
    return RepoIdentifier{host, path.substr(0, slash), path.substr(slash + 1)};
}

}

std::optional<RepoIdentifier> parseRemoteUrl(const std::string& url) {
    std::string rest = url;
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back()))) rest.pop_back();
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front()))) rest.erase(0, 1);

    if (consumePrefix(rest, "git@")) {
        const size_t colon = rest.find(':');
        if (colon == std::string::npos) return std::nullopt;
        return splitPath(rest.substr(0, colon), rest.substr(colon + 1));
    }

    if (consumePrefix(rest, "https://") || consumePrefix(rest, "http://") ||
        consumePrefix(rest, "ssh://") || consumePrefix(rest, "git://")) {
        const size_t at = rest.find('@');
        const size_t slash = rest.find('/');
        if (at != std::string::npos && at < slash) rest.erase(0, at + 1);

        const size_t hostEnd = rest.find('/');
        if (hostEnd == std::string::npos) return std::nullopt;
        std::string host = rest.substr(0, hostEnd);
        if (const size_t port = host.find(':'); port != std::string::npos) host.resize(port);
        return splitPath(host, rest.substr(hostEnd + 1));
    }

    return std::nullopt;
}

std::unique_ptr<HostingClient> Hosting::createGitHub(const RepoIdentifier& repo,
                                                     const std::string& token) {
    if (token.empty()) {
        return nullptr;
    }
    return std::make_unique<GitHubClient>(GitHubClient::Config::forRepo(repo, token));
}

std::string Hosting::findToken() {
    for (const char* name : {"GITHUB_TOKEN", "GH_TOKEN"}) {
        std::string token = utils::FileUtils::getEnvVar(name);
        if (!token.empty()) {
            log::debug("Using GitHub token from {}", name);
            return token;
        }
    }
    return "";
}

std::unique_ptr<HostingClient> Hosting::fromRemote(const std::string& remoteUrl) {
    auto repo = parseRemoteUrl(remoteUrl);
    if (!repo) {
        log::debug("Remote URL '{}' is not a recognised hosting URL", remoteUrl);
        return nullptr;
    }
    return createGitHub(*repo, findToken());
}

}
