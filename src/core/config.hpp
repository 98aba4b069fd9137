#pragma once
#include <string>

namespace gitstack::vcs {
class VcsAdapter;
}

namespace gitstack::core {

/**
 * Per-invocation settings. Built once in main and handed to the store,
 * the orchestrator and the sync engine.
 */
struct StackConfig {
    std::string repoRoot;
    std::string trunk;                  // empty until resolved
    std::string remote = "origin";
    std::string stateDir;
    bool createBackups = false;
    bool draftPullRequests = true;

    /**
     * Defaults, then $XDG_CONFIG_HOME/git-stack/config.json, then
     * GIT_STACK_* environment variables
     * @throws StackError(CorruptState) if the config file is not valid JSON
     */
    static StackConfig load(const std::string& repoRoot);

    /**
     * Overlay the keys present in a JSON document onto this config
     */
    void applyJson(const std::string& text, const std::string& source);

    void applyEnvironment();

    /**
     * Fill in `trunk` from the remote's HEAD when not configured, else "main"
     */
    void resolveTrunk(vcs::VcsAdapter& vcs);
};

}
