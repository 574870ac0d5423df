#pragma once

#include "config/Config.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ad::concurrency { class AsyncService; }
namespace ad::diag { class Sweeper; }

namespace ad::services {

class ServiceManager {
public:
    explicit ServiceManager(const std::vector<config::SweeperConfig>& sweepers);
    ~ServiceManager();

    // prevent accidental copies
    ServiceManager(const ServiceManager&) = delete;
    ServiceManager& operator=(const ServiceManager&) = delete;

    void startAll();
    void stopAll();
    void restartService(const std::string& name);

    [[nodiscard]] bool allRunning() const;
    [[nodiscard]] std::vector<std::string> serviceNames() const;

    [[nodiscard]] std::shared_ptr<diag::Sweeper> sweeper(const std::string& name) const;

private:
    static void tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    static void stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<diag::Sweeper>> sweepers_;
};

}
