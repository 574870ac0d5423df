#include "services/ServiceManager.hpp"
#include "diag/Sweeper.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ad::services;
using namespace ad::log;
using namespace ad::diag;

ServiceManager::ServiceManager(const std::vector<config::SweeperConfig>& sweepers) {
    for (const auto& sc : sweepers) {
        auto svc = std::make_shared<Sweeper>("Sweeper:" + sc.name, Sweeper::Options{
            .path = sc.path,
            .extension = sc.extension,
            .max_age = sc.max_age,
            .interval = sc.interval
        });
        if (!sweepers_.emplace(sc.name, std::move(svc)).second)
            throw std::invalid_argument("[ServiceManager] Duplicate sweeper name: " + sc.name);
    }
}

ServiceManager::~ServiceManager() { stopAll(); }

void ServiceManager::startAll() {
    Registry::agent()->debug("[ServiceManager] Starting all services...");
    std::lock_guard lock(mutex_);
    for (const auto& [name, svc] : sweepers_) tryStart(name, svc);
    Registry::agent()->debug("[ServiceManager] All services started.");
}

void ServiceManager::stopAll() {
    Registry::agent()->debug("[ServiceManager] Stopping all services...");
    std::lock_guard lock(mutex_);
    for (const auto& [name, svc] : sweepers_) stopService(name, svc);
    Registry::agent()->debug("[ServiceManager] All services stopped.");
}

void ServiceManager::restartService(const std::string& name) {
    std::lock_guard lock(mutex_);

    const auto it = sweepers_.find(name);
    if (it == sweepers_.end()) throw std::out_of_range("[ServiceManager] Unknown service: " + name);

    Registry::agent()->warn("[ServiceManager] Restarting service: {}", name);
    stopService(name, it->second);
    tryStart(name, it->second);
}

bool ServiceManager::allRunning() const {
    std::lock_guard lock(mutex_);
    for (const auto& [_, svc] : sweepers_)
        if (!svc->isRunning()) return false;
    return true;
}

std::vector<std::string> ServiceManager::serviceNames() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    names.reserve(sweepers_.size());
    for (const auto& [name, _] : sweepers_) names.push_back(name);
    return names;
}

std::shared_ptr<Sweeper> ServiceManager::sweeper(const std::string& name) const {
    std::lock_guard lock(mutex_);
    const auto it = sweepers_.find(name);
    return it == sweepers_.end() ? nullptr : it->second;
}

void ServiceManager::tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;
    Registry::agent()->debug("[ServiceManager] Starting service: {}", name);
    svc->start();
}

void ServiceManager::stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc || !svc->isRunning()) return;
    Registry::agent()->debug("[ServiceManager] Stopping service: {}", name);
    svc->stop();
}
