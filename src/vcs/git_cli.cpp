#include "git_cli.hpp"
#include "../core/errors.hpp"
#include "../utils/log.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace gitstack::vcs {

using core::ErrorCode;
using core::StackError;

namespace {

std::string joinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

std::string stripPrefix(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0 ? text.substr(prefix.size()) : text;
}

}

std::unique_ptr<GitCli> GitCli::open(const std::string& directory) {
    utils::ProcessResult result;
    try {
        result = utils::runProcess({"git", "rev-parse", "--show-toplevel"}, directory);
    } catch (const std::exception& e) {
        throw StackError(ErrorCode::VcsCommandFailed,
                         std::string("Could not run git: ") + e.what(), "",
                         "Make sure git is installed and on your PATH.");
    }
    if (!result.success()) {
        throw StackError(ErrorCode::VcsCommandFailed,
                         "Not inside a git repository: " + utils::trimOutput(result.errorOutput), "",
                         "Run git-stack from within a git work tree.");
    }
    std::error_code ec;
    std::string root = utils::trimOutput(result.output);
    auto canonical = std::filesystem::canonical(root, ec);
    return std::make_unique<GitCli>(ec ? root : canonical.string());
}

GitCli::GitCli(const std::string& repoRoot) : repoRoot_(repoRoot) {}

utils::ProcessResult GitCli::timed(const std::vector<std::string>& args, bool passthrough) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    log::debug("Running `git {}`", joinArgs(args));

    const auto started = std::chrono::steady_clock::now();
    utils::ProcessResult result;
    try {
        result = utils::runProcess(argv, repoRoot_, passthrough);
    } catch (const std::exception& e) {
        throw StackError(ErrorCode::VcsCommandFailed,
                         "git " + joinArgs(args) + " could not be started: " + e.what());
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);

    const std::string command = args.empty() ? "" : args.front();
    stats_.record(command, elapsed);
    log::trace("git {} exited with {} after {:.2f}ms", command, result.exitCode,
               std::chrono::duration<double, std::milli>(elapsed).count());
    return result;
}

utils::ProcessResult GitCli::run(const std::vector<std::string>& args) {
    return timed(args, false);
}

std::string GitCli::runChecked(const std::vector<std::string>& args) {
    auto result = run(args);
    if (!result.success()) {
        std::string detail = utils::trimOutput(result.errorOutput);
        throw StackError(ErrorCode::VcsCommandFailed,
                         "git " + joinArgs(args) + " failed with exit status " +
                             std::to_string(result.exitCode) +
                             (detail.empty() ? "" : ": " + detail));
    }
    return utils::trimOutput(result.output);
}

bool GitCli::runPassthrough(const std::vector<std::string>& args) {
    return timed(args, true).success();
}

std::string GitCli::repoRoot() const {
    return repoRoot_;
}

std::string GitCli::currentBranch() {
    auto result = run({"symbolic-ref", "--quiet", "--short", "HEAD"});
    if (!result.success()) return "";   // detached HEAD
    return utils::trimOutput(result.output);
}

bool GitCli::branchExists(const std::string& name) {
    return run({"show-ref", "--verify", "--quiet", "refs/heads/" + name}).success();
}

std::optional<std::string> GitCli::tip(const std::string& ref) {
    auto result = run({"rev-parse", "--verify", "--quiet", ref + "^{commit}"});
    if (!result.success()) return std::nullopt;
    return utils::trimOutput(result.output);
}

bool GitCli::isClean() {
    return runChecked({"status", "--porcelain", "--untracked-files=no"}).empty();
}

void GitCli::createBranch(const std::string& name, const std::string& from) {
    runChecked({"branch", name, from});
}

void GitCli::checkout(const std::string& name) {
    runChecked({"checkout", "--quiet", name});
}

void GitCli::deleteBranch(const std::string& name) {
    runChecked({"branch", "-D", name});
}

void GitCli::resetBranch(const std::string& name, const std::string& ref) {
    if (currentBranch() == name) {
        runChecked({"merge", "--ff-only", "--quiet", ref});
        return;
    }
    auto target = tip(ref);
    if (!target) {
        throw StackError(ErrorCode::VcsCommandFailed, "Cannot resolve '" + ref + "'", name);
    }
    runChecked({"update-ref", "refs/heads/" + name, *target});
}

RebaseOutcome GitCli::rebase(const std::string& branch, const std::string& onto,
                             const std::optional<std::string>& upstream) {
    std::vector<std::string> args{"rebase", "--quiet"};
    if (upstream) {
        args.insert(args.end(), {"--onto", onto, *upstream, branch});
    } else {
        args.insert(args.end(), {onto, branch});
    }

    auto result = run(args);
    if (result.success()) return RebaseOutcome::Success;
    if (rebaseInProgress()) return RebaseOutcome::Conflict;

    throw StackError(ErrorCode::VcsCommandFailed,
                     "git rebase of '" + branch + "' failed: " + utils::trimOutput(result.errorOutput),
                     branch, "Check `git status` and retry the restack.");
}

std::optional<std::string> GitCli::rebaseInProgress() {
    for (const char* dir : {"rebase-merge", "rebase-apply"}) {
        auto pathResult = run({"rev-parse", "--git-path", dir});
        if (!pathResult.success()) continue;

        std::filesystem::path path = utils::trimOutput(pathResult.output);
        if (path.is_relative()) path = std::filesystem::path(repoRoot_) / path;
        if (!std::filesystem::is_directory(path)) continue;

        std::ifstream headName(path / "head-name");
        std::string ref;
        std::getline(headName, ref);
        return stripPrefix(utils::trimOutput(ref), "refs/heads/");
    }
    return std::nullopt;
}

RebaseOutcome GitCli::continueRebase() {
    auto result = run({"-c", "core.editor=true", "rebase", "--continue"});
    if (result.success()) return RebaseOutcome::Success;
    if (rebaseInProgress()) return RebaseOutcome::Conflict;

    throw StackError(ErrorCode::VcsCommandFailed,
                     "git rebase --continue failed: " + utils::trimOutput(result.errorOutput), "",
                     "Resolve the conflicts, `git add` the files, then re-run `git stack restack`.");
}

void GitCli::abortRebase() {
    runChecked({"rebase", "--abort"});
}

void GitCli::forcePush(const std::string& remote, const std::string& branch) {
    runChecked({"push", "--quiet", "--force-with-lease", "-u", remote, branch + ":" + branch});
}

void GitCli::fetch(const std::string& remote) {
    runChecked({"fetch", "--quiet", "--prune", remote});
}

bool GitCli::isAncestor(const std::string& ancestor, const std::string& descendant) {
    auto result = run({"merge-base", "--is-ancestor", ancestor, descendant});
    if (result.exitCode == 0) return true;
    if (result.exitCode == 1) return false;
    throw StackError(ErrorCode::VcsCommandFailed,
                     "git merge-base --is-ancestor " + ancestor + " " + descendant + " failed: " +
                         utils::trimOutput(result.errorOutput));
}

bool GitCli::isMergedInto(const std::string& branch, const std::string& trunk) {
    if (isAncestor(branch, trunk)) return true;

    // `git cherry` prefixes commits with an equivalent upstream patch with '-'.
    std::istringstream lines(runChecked({"cherry", trunk, branch}));
    std::string line;
    bool sawCommit = false;
    while (std::getline(lines, line)) {
        if (line.empty()) continue;
        if (line[0] != '-') return false;
        sawCommit = true;
    }
    return sawCommit;
}

std::optional<std::string> GitCli::remoteDefaultBranch(const std::string& remote) {
    auto result = run({"symbolic-ref", "--quiet", "refs/remotes/" + remote + "/HEAD"});
    if (!result.success()) return std::nullopt;
    return stripPrefix(utils::trimOutput(result.output), "refs/remotes/" + remote + "/");
}

std::optional<std::string> GitCli::remoteUrl(const std::string& remote) {
    auto result = run({"remote", "get-url", remote});
    if (!result.success()) return std::nullopt;
    return utils::trimOutput(result.output);
}

std::string GitCli::subject(const std::string& ref) {
    return runChecked({"log", "--no-show-signature", "--format=%s", "-1", ref});
}

bool GitCli::showDiff(const std::string& from, const std::string& to) {
    return runPassthrough({"diff", from + ".." + to});
}

bool GitCli::showLog(const std::string& from, const std::string& to) {
    return runPassthrough({"log", "--graph", "--oneline", "--decorate", from + ".." + to});
}

}
