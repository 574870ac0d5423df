#pragma once

#include "diag/Writer.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ad::diag {

/**
 * Append-only diagnostic file that rolls over after a fixed number of write() calls
 * and keeps at most `files_to_keep` files for its (folder, prefix) pair.
 *
 * Files are named "{prefix}_{pid}_{YYYY-MM-DDTHH_MM_SSZ}_.log". Two rotations in the
 * same process and the same wall-clock second produce the same name; the second one
 * reopens the first file in append mode and keeps writing to it.
 *
 * Only one writer per (folder, prefix) is supported. Not thread-safe.
 *
 * Failures to open a file or to delete a file evicted by retention are thrown
 * (std::system_error / std::filesystem::filesystem_error) from the constructor or write().
 */
class RollingFileWriter final : public Writer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using ProcessId = std::function<long()>;

    struct Options {
        std::filesystem::path folder;
        std::string prefix;
        std::size_t max_lines_per_file = 10000;   // write() calls per file, not embedded newlines
        std::size_t files_to_keep = 10;
        Level level = Level::Info;

        // Defaults: std::chrono::system_clock::now and ::getpid
        Clock clock = nullptr;
        ProcessId process_id = nullptr;
    };

    explicit RollingFileWriter(Options opts);
    ~RollingFileWriter() override;

    RollingFileWriter(const RollingFileWriter&) = delete;
    RollingFileWriter& operator=(const RollingFileWriter&) = delete;

    void write(std::string_view message) override;
    void writeError(std::string_view message) override;

    // Closes the active file. Idempotent; write() afterwards is a logic error.
    void end() override;

    [[nodiscard]] std::filesystem::path generateFilename() const;

    [[nodiscard]] const std::optional<std::filesystem::path>& activePath() const { return active_; }
    [[nodiscard]] std::size_t lineCount() const { return lineCount_; }
    [[nodiscard]] const std::deque<std::filesystem::path>& fileQueue() const { return queue_; }

    // Lines in a file: newline-terminated lines plus a trailing partial line, if any.
    // An empty file is 0 lines and "a\nb\n" is 2, one less than a split-on-newline count,
    // so a file written with "\n"-terminated messages resumes at exactly its write count.
    static std::size_t countLines(const std::filesystem::path& path);

private:
    Options opts_;
    std::deque<std::filesystem::path> queue_;   // oldest first
    std::optional<std::filesystem::path> active_;
    std::size_t lineCount_{0};
    int fd_{-1};
    bool ended_{false};

    void initializeFileQueue();
    int fileDescriptor();
    void openNewFile();
    void enforceRetention();
};

}
