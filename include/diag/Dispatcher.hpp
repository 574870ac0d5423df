#pragma once

#include "diag/Writer.hpp"

#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace ad::diag {

// Fans a message out to every writer whose level admits it.
class Dispatcher {
public:
    void addWriter(std::shared_ptr<Writer> writer);

    void dispatch(Level level, std::string_view message);

    void error(const std::string_view message) { dispatch(Level::Error, message); }
    void warning(const std::string_view message) { dispatch(Level::Warning, message); }
    void status(const std::string_view message) { dispatch(Level::Status, message); }
    void info(const std::string_view message) { dispatch(Level::Info, message); }
    void verbose(const std::string_view message) { dispatch(Level::Verbose, message); }

    void end();

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Writer>> writers_;
};

}
