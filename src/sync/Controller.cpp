#include "sync/Controller.hpp"
#include "sync/Differ.hpp"
#include "sync/Executor.hpp"
#include "sync/Scanner.hpp"
#include "sync/errors.hpp"
#include "sync/model/Policy.hpp"
#include "checkpoint/Sidecar.hpp"
#include "checkpoint/Xattr.hpp"
#include "checkpoint/errors.hpp"
#include "fs/Filesystem.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <system_error>
#include <utility>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::checkpoint;
using Strategy = ts::config::CheckpointConfig::Strategy;

namespace {

bool nested(const std::filesystem::path& outer, const std::filesystem::path& inner) {
    const auto rel = inner.lexically_relative(outer);
    return !rel.empty() && *rel.begin() != "..";
}

}

Controller::Controller(Options options) : options_(std::move(options)) {}

Controller::Options Controller::optionsFromConfig(const config::Config& cfg, std::string host_identity) {
    Options o;
    o.host_identity = std::move(host_identity);
    o.strategy = cfg.checkpoint.strategy;
    o.sidecar_path = cfg.checkpoint.sidecar_path;
    o.advance_on_item_errors = cfg.checkpoint.advance_on_item_errors;
    o.exclude = cfg.scan.exclude;
    return o;
}

Endpoint Controller::resolveEndpoint(const std::filesystem::path& raw, const bool create) {
    auto p = raw.lexically_normal();
    if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();

    if (!p.is_absolute()) throw EndpointError(p, "Endpoint path is not absolute");

    std::error_code ec;
    const auto status = std::filesystem::status(p, ec);
    if (std::filesystem::is_directory(status)) return {p, true};
    if (std::filesystem::exists(status)) throw EndpointError(p, "Endpoint is not a directory");
    if (!create) throw EndpointError(p, "Endpoint does not exist");

    try {
        fs::Filesystem::mkdir(p);
    } catch (const std::exception& e) {
        throw EndpointError(p, std::string("Failed to create endpoint (") + e.what() + ")");
    }

    log::Registry::treesync()->info("[Controller] Created endpoint {}", p.string());
    return {p, true};
}

std::unique_ptr<Store> Controller::makeStore(const Endpoint& path, const Endpoint& destination) const {
    if (options_.strategy == Strategy::Xattr) {
        if (Xattr::supported(path.absolutePath) && Xattr::supported(destination.absolutePath))
            return std::make_unique<Xattr>();

        log::Registry::checkpoint()->warn(
            "[Controller] Extended attributes unsupported on {} or {}, falling back to sidecar checkpoint",
            path.absolutePath.string(), destination.absolutePath.string());
    }

    const auto sidecar = options_.sidecar_path.empty()
        ? destination.absolutePath / Sidecar::DEFAULT_NAME
        : options_.sidecar_path;

    return std::make_unique<Sidecar>(sidecar);
}

std::vector<std::string> Controller::reservedNames(const Endpoint& path, const Endpoint& destination) const {
    if (options_.sidecar_path.empty()) return {};

    const auto dir = options_.sidecar_path.lexically_normal().parent_path();
    if (dir != path.absolutePath && dir != destination.absolutePath) return {};
    return {options_.sidecar_path.filename().string()};
}

std::optional<Checkpoint> Controller::loadCheckpoint(const Store& store,
                                                     const Endpoint& path,
                                                     const Endpoint& destination,
                                                     const std::string& key) {
    try {
        auto cp = store.load(path, destination, key);
        if (cp) log::Registry::checkpoint()->debug("[Controller] Last sync {} ({})",
                                                   util::timestampToString(cp->last_sync), store.describe());
        else log::Registry::checkpoint()->info("[Controller] No checkpoint for this pair, running a full comparison");
        return cp;
    } catch (const CheckpointError& e) {
        log::Registry::checkpoint()->warn("[Controller] Ignoring checkpoint, running a full comparison: {}", e.what());
        return std::nullopt;
    }
}

Result Controller::synchronize(const std::filesystem::path& path,
                               const std::filesystem::path& destination,
                               const Policy& policy) const {
    // Captured before scanning so changes made during the run are seen next time.
    const auto started = std::chrono::system_clock::now();

    log::Registry::treesync()->info("[Controller] Synchronizing {} => {} ({})",
                                    path.string(), destination.string(), to_string(policy.direction));
    log::Registry::sync()->debug("[Controller] {}", to_string(policy));

    const auto pathEp = resolveEndpoint(path, policy.createPath);
    const auto destEp = resolveEndpoint(destination, policy.createDestination);

    if (nested(pathEp.absolutePath, destEp.absolutePath) || nested(destEp.absolutePath, pathEp.absolutePath)
        || pathEp.absolutePath == destEp.absolutePath)
        throw EndpointError(destEp.absolutePath, "Endpoints overlap with " + pathEp.absolutePath.string());

    const bool reverse = policy.direction == Direction::Reverse;
    const auto& source = reverse ? destEp : pathEp;
    const auto& target = reverse ? pathEp : destEp;

    const auto key = instanceKey(options_.host_identity, pathEp.absolutePath, destEp.absolutePath);
    const auto store = makeStore(pathEp, destEp);
    const auto checkpoint = loadCheckpoint(*store, pathEp, destEp, key);

    const Scanner scanner(options_.exclude, reservedNames(pathEp, destEp));
    const auto sourceTree = scanner.scan(source, policy.recurse);
    const auto targetTree = scanner.scan(target, policy.recurse);

    auto diff = Differ::diff(sourceTree, targetTree, checkpoint, policy);
    auto result = Executor(source, target, policy, scanner).run(diff);
    result.new_checkpoint_time = started - CHECKPOINT_TOLERANCE;

    if (result.ok() || options_.advance_on_item_errors) {
        try {
            store->save(pathEp, destEp, key, result.new_checkpoint_time);
            result.checkpoint_saved = true;
        } catch (const CheckpointError& e) {
            log::Registry::checkpoint()->error("[Controller] Failed to save checkpoint: {}", e.what());
            result.fail(store->describe(), Operation::SaveCheckpoint, e.what());
        }
    } else {
        log::Registry::checkpoint()->warn("[Controller] {} item errors, keeping the previous checkpoint",
                                          result.errors.size());
    }

    const auto& s = result.stats;
    log::Registry::treesync()->info(
        "[Controller] Done: {} dirs created, {} copied, {} overwritten, {} files deleted, {} dirs deleted, {} purged, {} errors",
        s.directories_created, s.files_copied, s.files_overwritten, s.files_deleted, s.directories_deleted,
        s.purged, result.errors.size());

    return result;
}
