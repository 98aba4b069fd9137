#include "state_store.hpp"
#include "errors.hpp"
#include "../utils/file_utils.hpp"
#include "../utils/log.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>
#include <openssl/sha.h>
#include <zlib.h>

using json = nlohmann::json;

namespace gitstack::core {

namespace {

std::string toHex(const unsigned char* bytes, size_t length) {
    std::ostringstream ss;
    for (size_t i = 0; i < length; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(bytes[i]);
    return ss.str();
}

std::string checksumOf(const json& body) {
    const std::string canonical = body.dump();
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(canonical.data()),
                static_cast<uInt>(canonical.size()));
    std::ostringstream ss;
    ss << std::hex << std::setw(8) << std::setfill('0') << crc;
    return ss.str();
}

StackError corrupt(const std::string& source, const std::string& detail) {
    return StackError(ErrorCode::CorruptState,
                      "Stack state " + source + " is corrupt: " + detail, "",
                      "Restore the file from a backup or remove it to start over.");
}

}

StateStore::StateStore(const StackConfig& config)
    : config_(config),
      statePath_(config.stateDir + "/repos/" + repositoryKey(config.repoRoot) + ".json") {}

std::string StateStore::repositoryKey(const std::string& repoRoot) {
    unsigned char sha[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(repoRoot.data()), repoRoot.size(), sha);
    return toHex(sha, SHA_DIGEST_LENGTH);
}

StackState StateStore::load() const {
    if (!utils::FileUtils::fileExists(statePath_)) {
        log::info("No stack state at {}, starting empty", statePath_);
        return StackState{StackGraph(config_.trunk), std::nullopt};
    }

    std::string text;
    try {
        text = utils::FileUtils::readFile(statePath_);
    } catch (const std::exception& e) {
        throw StackError(ErrorCode::CorruptState, e.what(), "",
                         "Check the permissions of " + statePath_ + ".");
    }

    StackState state = parse(text, statePath_);
    if (!config_.trunk.empty() && config_.trunk != state.graph.trunk()) {
        log::warn("Configured trunk '{}' differs from the recorded trunk '{}'; using '{}'",
                  config_.trunk, state.graph.trunk(), state.graph.trunk());
    }
    return state;
}

StackState StateStore::parse(const std::string& text, const std::string& source) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        throw corrupt(source, e.what());
    }
    if (!doc.is_object()) throw corrupt(source, "expected a JSON object");

    if (!doc.contains("version") || !doc["version"].is_number_integer()) {
        throw corrupt(source, "missing schema version");
    }
    const std::int64_t version = doc["version"].get<std::int64_t>();
    if (version > kCurrentVersion || version < 1) {
        throw StackError(ErrorCode::UnsupportedStateVersion,
                         "Stack state " + source + " has schema version " +
                             std::to_string(version) + ", this git-stack understands up to " +
                             std::to_string(kCurrentVersion),
                         "", "Upgrade git-stack to read this state file.");
    }

    if (doc.contains("checksum")) {
        json body = doc;
        body.erase("checksum");
        if (!doc["checksum"].is_string() || doc["checksum"].get<std::string>() != checksumOf(body)) {
            throw corrupt(source, "checksum mismatch");
        }
    }

    try {
        StackState state{StackGraph(doc.at("trunk").get<std::string>()), std::nullopt};

        const json branches = doc.value("branches", json::object());
        for (const auto& [name, entry] : branches.items()) {
            BranchNode node;
            node.name = name;
            node.parent = entry.at("parent").get<std::string>();
            if (entry.contains("anchor") && !entry["anchor"].is_null()) {
                node.anchor = entry["anchor"].get<std::string>();
            }
            node.createdAt = entry.value("created_at", static_cast<std::int64_t>(0));
            if (entry.contains("pr_number") && !entry["pr_number"].is_null()) {
                node.prNumber = entry["pr_number"].get<std::uint64_t>();
            }
            state.graph.insertUnchecked(node);
        }

        for (const auto& name : state.graph.repairDanglingParents()) {
            log::warn("Parent of '{}' is no longer tracked; re-homed it onto '{}'",
                      name, state.graph.trunk());
        }
        state.graph.validate();

        if (doc.contains("restack") && !doc["restack"].is_null()) {
            const json& marker = doc["restack"];
            RestackMarker paused;
            paused.branch = marker.at("branch").get<std::string>();
            paused.remaining = marker.value("remaining", std::vector<std::string>{});
            paused.push = marker.value("push", false);
            paused.returnTo = marker.value("return_to", std::string());
            paused.rewritten = marker.value("rewritten", std::vector<std::string>{});
            paused.originalTip = marker.value("original_tip", std::string());
            state.pausedRestack = paused;
        }
        return state;
    } catch (const json::exception& e) {
        throw corrupt(source, e.what());
    }
}

std::string StateStore::serialize(const StackState& state, const std::string& repository) {
    json branches = json::object();
    for (const auto& [name, node] : state.graph.nodes()) {
        json entry = {
            {"parent", node.parent},
            {"anchor", node.anchor ? json(*node.anchor) : json(nullptr)},
            {"created_at", node.createdAt}
        };
        if (node.prNumber) entry["pr_number"] = *node.prNumber;
        branches[name] = entry;
    }

    json doc = {
        {"version", kCurrentVersion},
        {"repository", repository},
        {"trunk", state.graph.trunk()},
        {"branches", branches}
    };
    if (state.pausedRestack) {
        doc["restack"] = {
            {"branch", state.pausedRestack->branch},
            {"remaining", state.pausedRestack->remaining},
            {"push", state.pausedRestack->push},
            {"return_to", state.pausedRestack->returnTo},
            {"rewritten", state.pausedRestack->rewritten},
            {"original_tip", state.pausedRestack->originalTip}
        };
    }
    doc["checksum"] = checksumOf(doc);
    return doc.dump(2) + "\n";
}

void StateStore::save(const StackState& state) const {
    log::debug("Saving {} branch(es) to {}", state.graph.size(), statePath_);
    try {
        utils::FileUtils::ensureDirectory(config_.stateDir + "/repos");
        utils::FileUtils::writeFileAtomic(statePath_, serialize(state, config_.repoRoot));
    } catch (const std::exception& e) {
        throw StackError(ErrorCode::PersistFailed,
                         std::string("Could not save stack state: ") + e.what(), "",
                         "Check free space and permissions of " + config_.stateDir + ".");
    }
}

}
