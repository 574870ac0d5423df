#pragma once

#include "diag/Writer.hpp"

#include <filesystem>
#include <string>

namespace ad::diag {

// Appends to a single fixed file. Not rotated.
class FileWriter final : public Writer {
public:
    FileWriter(Level level, const std::filesystem::path& folder, const std::string& fileName);
    ~FileWriter() override;

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    void write(std::string_view message) override;
    void writeError(std::string_view message) override;
    void end() override;

    void divider();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_{-1};
};

}
