#include "fake_vcs.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace gitstack::test {

using core::ErrorCode;
using core::StackError;

FakeVcs::FakeVcs(const std::string& trunk) : current_(trunk) {
    branches_[trunk] = newCommit("", "root");
}

std::string FakeVcs::newCommit(const std::string& parent, const std::string& patch) {
    std::ostringstream id;
    id << std::hex << std::setw(8) << std::setfill('0') << nextId_++ << std::string(32, '0');
    commits_[id.str()] = Commit{parent, patch};
    return id.str();
}

std::string FakeVcs::resolve(const std::string& ref) const {
    if (auto it = branches_.find(ref); it != branches_.end()) return it->second;
    if (auto it = remoteRefs_.find(ref); it != remoteRefs_.end()) return it->second;
    if (commits_.count(ref)) return ref;
    return "";
}

bool FakeVcs::reachable(const std::string& from, const std::string& target) const {
    std::string current = from;
    while (!current.empty()) {
        if (current == target) return true;
        current = commits_.at(current).parent;
    }
    return false;
}

std::set<std::string> FakeVcs::patchesIn(const std::string& commit) const {
    std::set<std::string> out;
    std::string current = commit;
    while (!current.empty()) {
        out.insert(commits_.at(current).patch);
        current = commits_.at(current).parent;
    }
    return out;
}

std::string FakeVcs::commit(const std::string& branch, const std::string& patch) {
    const std::string id = newCommit(branches_.at(branch), patch);
    branches_[branch] = id;
    return id;
}

void FakeVcs::commits(const std::string& branch, const std::string& prefix, int count) {
    for (int i = 1; i <= count; ++i) {
        commit(branch, prefix + std::to_string(i));
    }
}

void FakeVcs::branchAt(const std::string& name, const std::string& ref) {
    branches_[name] = resolve(ref);
}

void FakeVcs::publish(const std::string& branch, const std::string& remote) {
    remoteRefs_[remote + "/" + branch] = resolve(branch);
}

std::vector<std::string> FakeVcs::patchesSince(const std::string& base, const std::string& branch) const {
    const std::string baseId = resolve(base);
    std::vector<std::string> out;
    std::string current = resolve(branch);
    while (!current.empty() && !reachable(baseId, current)) {
        out.push_back(commits_.at(current).patch);
        current = commits_.at(current).parent;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

size_t FakeVcs::depth(const std::string& ref) const {
    size_t count = 0;
    for (std::string current = resolve(ref); !current.empty(); current = commits_.at(current).parent) {
        ++count;
    }
    return count;
}

bool FakeVcs::branchExists(const std::string& name) {
    return branches_.count(name) > 0;
}

std::optional<std::string> FakeVcs::tip(const std::string& ref) {
    std::string id = resolve(ref);
    if (id.empty()) return std::nullopt;
    return id;
}

void FakeVcs::createBranch(const std::string& name, const std::string& from) {
    const std::string id = resolve(from);
    if (branchExists(name) || id.empty()) {
        throw StackError(ErrorCode::VcsCommandFailed, "cannot create branch " + name);
    }
    branches_[name] = id;
}

void FakeVcs::checkout(const std::string& name) {
    if (!branchExists(name)) {
        throw StackError(ErrorCode::VcsCommandFailed, "no such branch " + name);
    }
    current_ = name;
    checkouts.push_back(name);
}

void FakeVcs::deleteBranch(const std::string& name) {
    if (name == current_ || !branchExists(name)) {
        throw StackError(ErrorCode::VcsCommandFailed, "cannot delete branch " + name);
    }
    branches_.erase(name);
    deleted.push_back(name);
}

void FakeVcs::resetBranch(const std::string& name, const std::string& ref) {
    branches_[name] = resolve(ref);
}

vcs::RebaseOutcome FakeVcs::rebase(const std::string& branch, const std::string& onto,
                                   const std::optional<std::string>& upstream) {
    rebaseCalls.push_back(RebaseCall{branch, onto, upstream});

    const std::string ontoId = resolve(onto);
    const std::string exclude = upstream ? resolve(*upstream) : ontoId;
    const std::set<std::string> present = patchesIn(ontoId);

    std::vector<std::string> patches;
    for (const auto& patch : patchesSince(exclude, branch)) {
        if (!present.count(patch)) patches.push_back(patch);
    }

    current_ = branch;
    pending_ = PendingRebase{branch, ontoId, patches};
    if (conflicts_[branch] > 0) {
        --conflicts_[branch];
        return vcs::RebaseOutcome::Conflict;
    }
    finishRebase();
    return vcs::RebaseOutcome::Success;
}

void FakeVcs::finishRebase() {
    std::string head = pending_->newBase;
    for (const auto& patch : pending_->patches) {
        head = newCommit(head, patch);
    }
    branches_[pending_->branch] = head;
    pending_.reset();
}

std::optional<std::string> FakeVcs::rebaseInProgress() {
    if (!pending_) return std::nullopt;
    return pending_->branch;
}

vcs::RebaseOutcome FakeVcs::continueRebase() {
    if (!pending_) {
        throw StackError(ErrorCode::VcsCommandFailed, "no rebase in progress");
    }
    if (conflicts_[pending_->branch] > 0) {
        --conflicts_[pending_->branch];
        return vcs::RebaseOutcome::Conflict;
    }
    finishRebase();
    return vcs::RebaseOutcome::Success;
}

void FakeVcs::abortRebase() {
    pending_.reset();
}

void FakeVcs::forcePush(const std::string& remote, const std::string& branch) {
    remoteRefs_[remote + "/" + branch] = resolve(branch);
    pushes.push_back(branch);
}

void FakeVcs::fetch(const std::string&) {
    ++fetchCount;
    for (const auto& [ref, source] : pendingRemoteUpdates) {
        remoteRefs_[ref] = resolve(source);
    }
    pendingRemoteUpdates.clear();
}

bool FakeVcs::isAncestor(const std::string& ancestor, const std::string& descendant) {
    const std::string a = resolve(ancestor);
    const std::string d = resolve(descendant);
    if (a.empty() || d.empty()) {
        throw StackError(ErrorCode::VcsCommandFailed,
                         "cannot compare " + ancestor + " and " + descendant);
    }
    return reachable(d, a);
}

bool FakeVcs::isMergedInto(const std::string& branch, const std::string& trunk) {
    if (isAncestor(branch, trunk)) return true;
    const std::set<std::string> present = patchesIn(resolve(trunk));
    for (const auto& patch : patchesSince(trunk, branch)) {
        if (!present.count(patch)) return false;
    }
    return true;
}

std::optional<std::string> FakeVcs::remoteDefaultBranch(const std::string&) {
    return defaultBranch;
}

std::optional<std::string> FakeVcs::remoteUrl(const std::string&) {
    return url;
}

std::string FakeVcs::subject(const std::string& ref) {
    return commits_.at(resolve(ref)).patch;
}

bool FakeVcs::showDiff(const std::string& from, const std::string& to) {
    diffCalls.emplace_back(from, to);
    return true;
}

bool FakeVcs::showLog(const std::string& from, const std::string& to) {
    logCalls.emplace_back(from, to);
    return true;
}

}
