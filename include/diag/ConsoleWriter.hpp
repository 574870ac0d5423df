#pragma once

#include "diag/Writer.hpp"

#include <ostream>

namespace ad::diag {

class ConsoleWriter final : public Writer {
public:
    explicit ConsoleWriter(Level level);
    ConsoleWriter(Level level, std::ostream& out, std::ostream& err);

    void write(std::string_view message) override;
    void writeError(std::string_view message) override;
    void end() override;

private:
    std::ostream& out_;
    std::ostream& err_;
};

}
