#pragma once
#include <optional>
#include <string>

namespace gitstack::vcs {

enum class RebaseOutcome {
    Success,
    Conflict
};

/**
 * Branch-level primitives of the underlying version control system.
 * The stack engine only ever talks to the VCS through this interface, so
 * tests can drive it with an in-memory repository.
 *
 * Failures of the underlying tool are reported by throwing
 * core::StackError with ErrorCode::VcsCommandFailed. A rebase that stops on
 * conflicts is not a failure: it returns RebaseOutcome::Conflict.
 */
class VcsAdapter {
public:
    virtual ~VcsAdapter() = default;

    /**
     * Absolute path of the repository working tree
     */
    virtual std::string repoRoot() const = 0;

    /**
     * Name of the checked out branch
     * @return empty string for a detached HEAD
     */
    virtual std::string currentBranch() = 0;

    virtual bool branchExists(const std::string& name) = 0;

    /**
     * Resolve a ref (branch, "<remote>/<branch>", or commit id) to a commit id
     * @return std::nullopt if the ref does not resolve
     */
    virtual std::optional<std::string> tip(const std::string& ref) = 0;

    /**
     * True if there are no staged or unstaged changes to tracked files
     */
    virtual bool isClean() = 0;

    virtual void createBranch(const std::string& name, const std::string& from) = 0;
    virtual void checkout(const std::string& name) = 0;
    virtual void deleteBranch(const std::string& name) = 0;

    /**
     * Fast-forward `name` to `ref`
     */
    virtual void resetBranch(const std::string& name, const std::string& ref) = 0;

    /**
     * Replay the commits of `branch` onto `onto`.
     * @param upstream when set, only commits in upstream..branch are replayed;
     *                 otherwise the VCS picks the merge base
     */
    virtual RebaseOutcome rebase(const std::string& branch, const std::string& onto,
                                 const std::optional<std::string>& upstream) = 0;

    /**
     * @return the branch being rebased if a rebase is stopped in the working tree
     */
    virtual std::optional<std::string> rebaseInProgress() = 0;

    virtual RebaseOutcome continueRebase() = 0;
    virtual void abortRebase() = 0;

    virtual void forcePush(const std::string& remote, const std::string& branch) = 0;
    virtual void fetch(const std::string& remote) = 0;

    virtual bool isAncestor(const std::string& ancestor, const std::string& descendant) = 0;

    /**
     * True if every change on `branch` already exists on `trunk`, either
     * because the branch is an ancestor of trunk or because each of its
     * commits has a patch-equivalent commit there (squash or rebase merges).
     */
    virtual bool isMergedInto(const std::string& branch, const std::string& trunk) = 0;

    /**
     * Default branch of `remote` as advertised by its HEAD, e.g. "main"
     */
    virtual std::optional<std::string> remoteDefaultBranch(const std::string& remote) = 0;

    virtual std::optional<std::string> remoteUrl(const std::string& remote) = 0;

    /**
     * Subject line of the commit at `ref`
     */
    virtual std::string subject(const std::string& ref) = 0;

    // Pass-through views for the reporters; output goes straight to the terminal.
    virtual bool showDiff(const std::string& from, const std::string& to) = 0;
    virtual bool showLog(const std::string& from, const std::string& to) = 0;
};

}
