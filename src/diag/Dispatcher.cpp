#include "diag/Dispatcher.hpp"

#include <stdexcept>

using namespace ad::diag;

void Dispatcher::addWriter(std::shared_ptr<Writer> writer) {
    if (!writer) throw std::invalid_argument("Dispatcher: null writer");
    std::lock_guard lock(mutex_);
    writers_.push_back(std::move(writer));
}

void Dispatcher::dispatch(const Level level, const std::string_view message) {
    std::lock_guard lock(mutex_);
    for (const auto& w : writers_) {
        if (!accepts(w->level(), level)) continue;
        if (level == Level::Error) w->writeError(message);
        else w->write(message);
    }
}

void Dispatcher::end() {
    std::lock_guard lock(mutex_);
    for (const auto& w : writers_) w->end();
}

std::size_t Dispatcher::size() const {
    std::lock_guard lock(mutex_);
    return writers_.size();
}
