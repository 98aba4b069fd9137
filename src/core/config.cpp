#include "config.hpp"
#include "errors.hpp"
#include "../utils/file_utils.hpp"
#include "../utils/log.hpp"
#include "../vcs/vcs_adapter.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gitstack::core {

StackConfig StackConfig::load(const std::string& repoRoot) {
    StackConfig config;
    config.repoRoot = repoRoot;
    config.stateDir = utils::FileUtils::xdgDirectory("XDG_STATE_HOME", ".local/state");

    const std::string configPath =
        utils::FileUtils::xdgDirectory("XDG_CONFIG_HOME", ".config") + "/config.json";
    if (utils::FileUtils::fileExists(configPath)) {
        log::debug("Loading config from {}", configPath);
        config.applyJson(utils::FileUtils::readFile(configPath), configPath);
    }

    config.applyEnvironment();
    return config;
}

void StackConfig::applyJson(const std::string& text, const std::string& source) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            throw StackError(ErrorCode::CorruptState, source + " must contain a JSON object");
        }
        trunk = parsed.value("trunk", trunk);
        remote = parsed.value("remote", remote);
        stateDir = parsed.value("state_dir", stateDir);
        createBackups = parsed.value("create_backups", createBackups);
        draftPullRequests = parsed.value("draft_pull_requests", draftPullRequests);
    } catch (const json::exception& e) {
        throw StackError(ErrorCode::CorruptState,
                         "Invalid config file " + source + ": " + e.what(), "",
                         "Fix or remove " + source + ".");
    }
}

void StackConfig::applyEnvironment() {
    if (auto value = utils::FileUtils::getEnvVar("GIT_STACK_TRUNK"); !value.empty()) trunk = value;
    if (auto value = utils::FileUtils::getEnvVar("GIT_STACK_REMOTE"); !value.empty()) remote = value;
    if (auto value = utils::FileUtils::getEnvVar("GIT_STACK_STATE_DIR"); !value.empty()) stateDir = value;
}

void StackConfig::resolveTrunk(vcs::VcsAdapter& vcs) {
    if (!trunk.empty()) return;
    if (auto detected = vcs.remoteDefaultBranch(remote)) {
        trunk = *detected;
    } else {
        log::debug("No {}/HEAD, assuming trunk 'main'", remote);
        trunk = "main";
    }
}

}
