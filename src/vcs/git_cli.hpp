#pragma once
#include "vcs_adapter.hpp"
#include "../utils/command_stats.hpp"
#include "../utils/process.hpp"
#include <memory>
#include <string>
#include <vector>

namespace gitstack::vcs {

/**
 * VcsAdapter backed by the `git` executable. Every call spawns one git
 * process in the repository root.
 */
class GitCli : public VcsAdapter {
public:
    /**
     * Locate the repository containing `directory`
     * @throws core::StackError(VcsCommandFailed) if it is not inside a git work tree
     */
    static std::unique_ptr<GitCli> open(const std::string& directory = ".");

    explicit GitCli(const std::string& repoRoot);

    std::string repoRoot() const override;
    std::string currentBranch() override;
    bool branchExists(const std::string& name) override;
    std::optional<std::string> tip(const std::string& ref) override;
    bool isClean() override;

    void createBranch(const std::string& name, const std::string& from) override;
    void checkout(const std::string& name) override;
    void deleteBranch(const std::string& name) override;
    void resetBranch(const std::string& name, const std::string& ref) override;

    RebaseOutcome rebase(const std::string& branch, const std::string& onto,
                         const std::optional<std::string>& upstream) override;
    std::optional<std::string> rebaseInProgress() override;
    RebaseOutcome continueRebase() override;
    void abortRebase() override;

    void forcePush(const std::string& remote, const std::string& branch) override;
    void fetch(const std::string& remote) override;

    bool isAncestor(const std::string& ancestor, const std::string& descendant) override;
    bool isMergedInto(const std::string& branch, const std::string& trunk) override;

    std::optional<std::string> remoteDefaultBranch(const std::string& remote) override;
    std::optional<std::string> remoteUrl(const std::string& remote) override;
    std::string subject(const std::string& ref) override;

    bool showDiff(const std::string& from, const std::string& to) override;
    bool showLog(const std::string& from, const std::string& to) override;

    // Time spent in each git subcommand so far.
    const utils::CommandStats& stats() const { return stats_; }

private:
    std::string repoRoot_;
    utils::CommandStats stats_;

    utils::ProcessResult run(const std::vector<std::string>& args);
    // Like run() but throws VcsCommandFailed on a non-zero exit.
    std::string runChecked(const std::vector<std::string>& args);
    bool runPassthrough(const std::vector<std::string>& args);
    utils::ProcessResult timed(const std::vector<std::string>& args, bool passthrough);
};

}
