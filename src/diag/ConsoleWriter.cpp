#include "diag/ConsoleWriter.hpp"

#include <iostream>

using namespace ad::diag;

ConsoleWriter::ConsoleWriter(const Level level) : ConsoleWriter(level, std::cout, std::cerr) {}

ConsoleWriter::ConsoleWriter(const Level level, std::ostream& out, std::ostream& err)
    : Writer(level), out_(out), err_(err) {}

void ConsoleWriter::write(const std::string_view message) { out_ << message; }

void ConsoleWriter::writeError(const std::string_view message) { err_ << message; }

void ConsoleWriter::end() {
    out_.flush();
    err_.flush();
}
