#include "diag/Sweeper.hpp"
#include "config/util.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <system_error>
#include <vector>

using namespace ad::diag;
using namespace ad::log;

namespace fs = std::filesystem;

Sweeper::Sweeper(const std::string& name, Options opts)
    : AsyncService(name), opts_(std::move(opts)) {
    if (opts_.path.empty()) throw std::invalid_argument("Sweeper: path is empty.");
    if (opts_.extension.empty()) throw std::invalid_argument("Sweeper: extension is empty.");
    if (opts_.interval.count() <= 0) throw std::invalid_argument("Sweeper: interval must be positive.");
    if (opts_.max_age.count() < 0) throw std::invalid_argument("Sweeper: max_age must not be negative.");
    if (opts_.interval > config::MAX_DURATION || opts_.max_age > config::MAX_DURATION)
        throw std::invalid_argument("Sweeper: interval and max_age must not exceed " +
                                    config::durationToString(config::MAX_DURATION) + ".");

    if (!opts_.remove) opts_.remove = [](const fs::path& p, std::error_code& ec) { return fs::remove(p, ec); };

    if (opts_.extension != "*")
        suffix_ = opts_.extension.front() == '.' ? opts_.extension : "." + opts_.extension;
}

Sweeper::~Sweeper() { stop(); }

bool Sweeper::matches(const fs::path& p) const {
    return suffix_.empty() || p.filename().string().ends_with(suffix_);
}

void Sweeper::runLoop() {
    while (!shouldStop()) {
        lazySleep(opts_.interval);
        if (shouldStop()) break;
        sweep();
    }
}

SweepResult Sweeper::sweep() {
    if (runOwner_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
        Registry::sweeper()->warn("[{}] sweep() called from an observer during a run, ignoring", serviceName_);
        return {};
    }

    std::lock_guard lk(runMutex_);

    struct InProgressGuard {
        Sweeper& s;
        explicit InProgressGuard(Sweeper& sw) : s(sw) {
            s.runOwner_.store(std::this_thread::get_id(), std::memory_order_release);
            s.inProgress_.store(true, std::memory_order_release);
        }
        ~InProgressGuard() {
            s.inProgress_.store(false, std::memory_order_release);
            s.runOwner_.store(std::thread::id{}, std::memory_order_release);
        }
    } guard(*this);

    SweepResult result;
    notifyInfo("Cleaning files: " + opts_.path.string());

    std::error_code ec;
    if (!fs::is_directory(opts_.path, ec)) {
        notifyInfo("deleted file count: 0");
        notifyComplete(result);
        return result;
    }

    for (const auto& candidate : collectCandidates()) {
        if (cancelRequested()) {
            result.cancelled = true;
            break;
        }

        const auto st = fs::status(candidate, ec);
        if (ec || !fs::exists(st)) {
            ++result.skipped;
            Registry::sweeper()->debug("[{}] stat failed for {}: {}", serviceName_, candidate.string(),
                                       ec ? ec.message() : "not found");
            continue;
        }
        if (fs::is_directory(st)) continue;

        ++result.scanned;

        const auto mtime = fs::last_write_time(candidate, ec);
        if (ec) {
            ++result.skipped;
            continue;
        }

        const auto age = fs::file_time_type::clock::now() - mtime;
        if (age <= opts_.max_age) continue;

        if (!opts_.remove(candidate, ec) || ec) {
            ++result.skipped;
            Registry::sweeper()->warn("[{}] Failed to delete {}: {}", serviceName_, candidate.string(),
                                      ec ? ec.message() : "file vanished");
            continue;
        }

        ++result.deleted;
        notifyDeleted(candidate);
    }

    notifyInfo("deleted file count: " + std::to_string(result.deleted));
    notifyComplete(result);
    return result;
}

// Depth-first listing of matching non-directory entries. A directory that cannot be read
// (removed mid-scan, permissions) is skipped on its own; its siblings are still listed.
std::vector<fs::path> Sweeper::collectCandidates() const {
    std::vector<fs::path> candidates;
    std::vector<fs::path> pending{opts_.path};

    while (!pending.empty()) {
        const auto dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            if (it->is_directory(typeEc) && !it->is_symlink(typeEc)) pending.push_back(it->path());
            else if (matches(it->path())) candidates.push_back(it->path());
        }
        if (ec) Registry::sweeper()->debug("[{}] Skipping {}: {}", serviceName_, dir.string(), ec.message());
    }

    return candidates;
}

void Sweeper::notifyInfo(const std::string_view msg) const {
    if (!opts_.observer.on_info) {
        Registry::sweeper()->info("[{}] {}", serviceName_, msg);
        return;
    }
    try {
        opts_.observer.on_info(msg);
    } catch (const std::exception& e) {
        Registry::sweeper()->warn("[{}] on_info observer threw: {}", serviceName_, e.what());
    }
}

void Sweeper::notifyDeleted(const fs::path& p) const {
    if (!opts_.observer.on_deleted) {
        Registry::sweeper()->info("[{}] Deleted {}", serviceName_, p.string());
        return;
    }
    try {
        opts_.observer.on_deleted(p);
    } catch (const std::exception& e) {
        Registry::sweeper()->warn("[{}] on_deleted observer threw: {}", serviceName_, e.what());
    }
}

void Sweeper::notifyComplete(const SweepResult& r) const {
    if (!opts_.observer.on_complete) {
        Registry::sweeper()->debug("[{}] Sweep finished: scanned={} deleted={} skipped={}{}", serviceName_,
                                   r.scanned, r.deleted, r.skipped, r.cancelled ? " (cancelled)" : "");
        return;
    }
    try {
        opts_.observer.on_complete(r);
    } catch (const std::exception& e) {
        Registry::sweeper()->warn("[{}] on_complete observer threw: {}", serviceName_, e.what());
    }
}
