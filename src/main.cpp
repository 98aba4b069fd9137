#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/mutators.hpp"
#include "core/restack.hpp"
#include "core/state_store.hpp"
#include "core/sync_engine.hpp"
#include "hosting/hosting_client.hpp"
#include "report/status_reporter.hpp"
#include "utils/log.hpp"
#include "vcs/git_cli.hpp"

using namespace gitstack;

struct ParsedArgs {
    bool verbose = false;
    std::string command = "status";
    std::vector<std::string> positional;
    std::set<std::string> flags;
    std::map<std::string, std::string> options;

    bool has(const std::string& flag) const { return flags.count(flag) > 0; }

    std::string option(const std::string& name, const std::string& fallback = "") const {
        auto it = options.find(name);
        return it == options.end() ? fallback : it->second;
    }
};

ParsedArgs parseArguments(int argc, char *argv[]) {
    static const std::set<std::string> valueOptions = {"--branch"};
    ParsedArgs args;
    bool haveCommand = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (valueOptions.count(arg)) {
            if (i + 1 >= argc) {
                throw core::StackError(core::ErrorCode::NotFound, "Missing value for " + arg);
            }
            args.options[arg] = argv[++i];
        } else if (arg.substr(0, 2) == "--") {
            args.flags.insert(arg);
        } else if (!haveCommand) {
            args.command = arg;
            haveCommand = true;
        } else {
            args.positional.push_back(arg);
        }
    }

    return args;
}

// Everything one command invocation works with.
struct Session {
    std::unique_ptr<vcs::GitCli> vcs;
    core::StackConfig config;
    std::unique_ptr<core::StateStore> store;
    core::StackState state;
};

Session openSession() {
    Session session;
    session.vcs = vcs::GitCli::open(".");
    session.config = core::StackConfig::load(session.vcs->repoRoot());
    session.config.resolveTrunk(*session.vcs);
    session.store = std::make_unique<core::StateStore>(session.config);
    session.state = session.store->load();
    log::debug("Repository {} with trunk '{}', state in {}", session.config.repoRoot,
               session.state.graph.trunk(), session.store->statePath());
    return session;
}

std::string requireCurrentBranch(Session& session) {
    std::string current = session.vcs->currentBranch();
    if (current.empty()) {
        throw core::StackError(core::ErrorCode::NotFound, "HEAD is detached", "",
                               "Check out a branch first.");
    }
    return current;
}

void printList(const std::string& label, const std::vector<std::string>& names) {
    if (names.empty()) return;
    std::cout << label;
    for (size_t i = 0; i < names.size(); ++i) {
        std::cout << (i ? ", " : " ") << names[i];
    }
    std::cout << '\n';
}

bool printRestackResult(const core::RestackOrchestrator::RestackResult& result) {
    for (const auto& warning : result.warnings) {
        std::cerr << "warning: " << warning << '\n';
    }
    if (result.resumed) {
        std::cout << "Resumed the paused restack.\n";
    }
    printList("Rebased:", result.rebased);
    printList("Already up to date:", result.skipped);
    printList("Pushed:", result.pushed);

    if (result.paused()) {
        std::cout << "\nRebase of '" << result.blockedBranch << "' stopped on conflicts ("
                  << result.remaining << " branch(es) remaining).\n"
                  << "Resolve the conflicts, `git add` the files, then re-run `git stack restack`.\n"
                  << "To give up on this branch, run `git rebase --abort` and re-run the restack.\n";
        return true;
    }
    std::cout << "Restack complete.\n";
    return true;
}

bool handleStatus(Session& session) {
    report::StatusReporter reporter(session.state, *session.vcs, std::cout);
    reporter.printTree(session.vcs->currentBranch());
    return true;
}

bool handleCheckout(Session& session, const ParsedArgs& args) {
    if (args.positional.empty()) {
        std::cerr << "Usage: checkout <branch-name>\n";
        return false;
    }
    const std::string& name = args.positional[0];

    core::GraphMutators mutators(session.state, *session.store, *session.vcs);
    if (mutators.checkout(name)) {
        std::cout << "Created branch '" << name << "' on top of '"
                  << session.state.graph.node(name).parent << "'\n";
    } else {
        std::cout << "Switched to branch '" << name << "'\n";
    }
    return true;
}

bool handleRestack(Session& session, const ParsedArgs& args) {
    core::RestackOptions options;
    options.fetch = args.has("--fetch");
    options.ancestors = args.has("--ancestors");
    options.push = args.has("--push");

    std::string target;
    if (args.has("--all")) {
        target = session.state.graph.trunk();
    } else {
        target = args.option("--branch");
        if (target.empty()) target = requireCurrentBranch(session);
    }

    core::RestackOrchestrator orchestrator(session.state, *session.store, *session.vcs,
                                           session.config);
    return printRestackResult(orchestrator.restack(target, options));
}

bool handleMount(Session& session, const ParsedArgs& args) {
    std::string branch = args.option("--branch");
    if (branch.empty()) branch = requireCurrentBranch(session);
    const std::string parent = args.positional.empty() ? session.state.graph.trunk()
                                                       : args.positional[0];

    core::GraphMutators mutators(session.state, *session.store, *session.vcs);
    mutators.mount(branch, parent);
    std::cout << "Mounted '" << branch << "' on '" << parent << "'.\n"
              << "Run `git stack restack` to move its commits.\n";
    return true;
}

bool handleDelete(Session& session, const ParsedArgs& args) {
    if (args.positional.empty()) {
        std::cerr << "Usage: delete <branch-name> [--keep-branch]\n";
        return false;
    }
    const std::string& name = args.positional[0];

    core::GraphMutators mutators(session.state, *session.store, *session.vcs);
    auto rewired = mutators.remove(name, !args.has("--keep-branch"));
    std::cout << "Deleted '" << name << "' from the stack.\n";
    printList("Re-parented:", rewired);
    return true;
}

bool handleDiff(Session& session, const ParsedArgs& args) {
    const std::string branch = args.positional.empty() ? requireCurrentBranch(session)
                                                       : args.positional[0];
    report::StatusReporter reporter(session.state, *session.vcs, std::cout);
    return reporter.showDiff(branch);
}

bool handleLog(Session& session, const ParsedArgs& args) {
    const std::string branch = args.positional.empty() ? requireCurrentBranch(session)
                                                       : args.positional[0];
    report::StatusReporter reporter(session.state, *session.vcs, std::cout);
    return reporter.showLog(branch);
}

std::unique_ptr<hosting::HostingClient> setupHosting(Session& session) {
    auto url = session.vcs->remoteUrl(session.config.remote);
    if (!url) {
        return nullptr;
    }
    return hosting::Hosting::fromRemote(*url);
}

bool handleSync(Session& session, const ParsedArgs& args) {
    core::SyncOptions options;
    options.restack = args.has("--restack");
    options.push = args.has("--push");
    options.dryRun = args.has("--dry-run");
    options.deleteLocal = args.has("--delete-local");

    auto client = setupHosting(session);
    if (!client) {
        log::debug("No hosting client; pull request state will not be consulted");
    }

    core::SyncEngine engine(session.state, *session.store, *session.vcs, session.config,
                            client.get());
    auto result = engine.sync(options);

    for (const auto& warning : result.warnings) {
        std::cerr << "warning: " << warning << '\n';
    }

    const std::string prefix = options.dryRun ? "[dry-run] " : "";
    if (result.plan.empty()) {
        std::cout << "Everything is in sync.\n";
    }
    for (const auto& prune : result.plan.prunes) {
        std::cout << prefix << "Prune '" << prune.branch << "' (" << prune.reason
                  << "), children move to '" << prune.newParent << "'\n";
    }
    for (const auto& retarget : result.plan.retargets) {
        std::cout << prefix << "Retarget PR #" << retarget.number << " for '" << retarget.branch
                  << "': " << retarget.oldBase << " -> " << retarget.newBase << '\n';
    }
    for (const auto& update : result.plan.prNumbers) {
        std::cout << prefix << "Record PR #" << update.number << " for '" << update.branch << "'\n";
    }

    if (result.restack) {
        return printRestackResult(*result.restack);
    }
    return true;
}

bool handlePullRequest(Session& session) {
    const std::string branch = requireCurrentBranch(session);
    core::BranchNode& node = session.state.graph.node(branch);

    auto client = setupHosting(session);
    if (!client) {
        throw core::StackError(core::ErrorCode::HostingFailed,
                               "No hosting provider available for remote '" + session.config.remote + "'",
                               branch, "Set GITHUB_TOKEN and make sure the remote points at GitHub.");
    }

    if (!session.vcs->tip(session.config.remote + "/" + branch)) {
        std::cout << "Pushing '" << branch << "' to " << session.config.remote << "...\n";
        session.vcs->forcePush(session.config.remote, branch);
    }

    auto result = client->createPullRequest(branch, node.parent, session.vcs->subject(branch),
                                            session.config.draftPullRequests);
    if (!result.success) {
        throw core::StackError(core::ErrorCode::HostingFailed,
                               "Could not create a pull request for '" + branch + "': " + result.error,
                               branch);
    }

    node.prNumber = result.pullRequest.number;
    session.store->save(session.state);
    std::cout << "Created PR #" << result.pullRequest.number << ": " << result.pullRequest.url << '\n';
    return true;
}

void printUsage() {
    std::cerr << "Usage: git-stack [--verbose] <command> [args]\n\n"
              << "  status                              show the stack tree (default)\n"
              << "  checkout <name>                     create or switch to a stacked branch\n"
              << "  restack [--branch <b>] [--fetch] [--ancestors] [--push] [--all]\n"
              << "  mount [<parent>] [--branch <b>]     stack a branch on a new parent\n"
              << "  delete <name> [--keep-branch]       remove a branch from the stack\n"
              << "  diff [<branch>]                     diff a branch against its parent\n"
              << "  log [<branch>]                      log of a branch since its parent\n"
              << "  sync [--restack] [--push] [--dry-run] [--delete-local]\n"
              << "  pr                                  open a pull request for this branch\n";
}

int main(int argc, char *argv[]) {
    bool success = false;
    try {
        ParsedArgs args = parseArguments(argc, argv);
        log::init(args.verbose);

        const std::string& command = args.command;
        if (command == "help" || args.has("--help")) {
            printUsage();
            return EXIT_SUCCESS;
        }

        static const std::set<std::string> known = {
            "status", "checkout", "restack", "mount", "delete", "diff", "log", "sync", "pr"};
        if (!known.count(command)) {
            std::cerr << "Unknown command " << command << '\n';
            printUsage();
            return EXIT_FAILURE;
        }

        Session session = openSession();

        if (command == "status") {
            success = handleStatus(session);
        } else if (command == "checkout") {
            success = handleCheckout(session, args);
        } else if (command == "restack") {
            success = handleRestack(session, args);
        } else if (command == "mount") {
            success = handleMount(session, args);
        } else if (command == "delete") {
            success = handleDelete(session, args);
        } else if (command == "diff") {
            success = handleDiff(session, args);
        } else if (command == "log") {
            success = handleLog(session, args);
        } else if (command == "sync") {
            success = handleSync(session, args);
        } else if (command == "pr") {
            success = handlePullRequest(session);
        }

        for (const auto& line : session.vcs->stats().summary("git")) {
            log::debug("{}", line);
        }
    } catch (const core::StackError& e) {
        log::debug("{} (branch '{}')", core::errorCodeName(e.code()), e.branch());
        if (e.code() == core::ErrorCode::PersistFailed) {
            std::cerr << "FATAL: " << e.what() << '\n'
                      << "The repository may already reflect changes the stack state does not record.\n";
        } else {
            std::cerr << "error: " << e.what() << '\n';
        }
        if (!e.hint().empty()) {
            std::cerr << "hint: " << e.hint() << '\n';
        }
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return success ? EXIT_SUCCESS : EXIT_FAILURE;
}
