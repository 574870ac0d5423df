#pragma once

#include "diag/Level.hpp"

#include <string_view>

namespace ad::diag {

// Sink for the agent's diagnostic text. Messages are written verbatim; callers own separators.
class Writer {
public:
    explicit Writer(const Level level) : level_(level) {}
    virtual ~Writer() = default;

    [[nodiscard]] Level level() const { return level_; }

    virtual void write(std::string_view message) = 0;
    virtual void writeError(std::string_view message) = 0;
    virtual void end() = 0;

protected:
    Level level_;
};

}
