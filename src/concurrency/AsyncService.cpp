#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace ad::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

void AsyncService::start() {
    if (isRunning()) return;

    // a previous run may have ended on its own (runLoop threw)
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::agent()->error("[{}] Service error: {}", serviceName_, e.what());
        } catch (...) {
            log::Registry::agent()->error("[{}] Service error: unknown exception.", serviceName_);
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::agent()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!isRunning()) return;

    log::Registry::agent()->info("[{}] Stopping service...", serviceName_);
    {
        std::lock_guard lk(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
    }

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::agent()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::agent()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}
