#include "diag/RollingFileWriter.hpp"
#include "diag/fileio.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <unistd.h>

using namespace ad::diag;
using namespace ad::log;

namespace fs = std::filesystem;

RollingFileWriter::RollingFileWriter(Options opts)
    : Writer(opts.level), opts_(std::move(opts)) {
    if (opts_.prefix.empty()) throw std::invalid_argument("RollingFileWriter: prefix is empty.");
    if (opts_.folder.empty()) throw std::invalid_argument("RollingFileWriter: folder is empty.");
    if (opts_.max_lines_per_file == 0) throw std::invalid_argument("RollingFileWriter: max_lines_per_file must be > 0.");
    if (opts_.files_to_keep == 0) throw std::invalid_argument("RollingFileWriter: files_to_keep must be > 0.");

    if (!opts_.clock) opts_.clock = [] { return std::chrono::system_clock::now(); };
    if (!opts_.process_id) opts_.process_id = [] { return static_cast<long>(::getpid()); };

    fileio::ensureFolder(opts_.folder);
    initializeFileQueue();
}

RollingFileWriter::~RollingFileWriter() { fileio::closeQuietly(fd_); }

void RollingFileWriter::write(const std::string_view message) {
    if (ended_) throw std::logic_error("RollingFileWriter: write after end()");
    const int fd = fileDescriptor();
    fileio::writeAll(fd, message, *active_);
    ++lineCount_;
}

void RollingFileWriter::writeError(const std::string_view message) { write(message); }

void RollingFileWriter::end() {
    fileio::closeQuietly(fd_);
    ended_ = true;
}

fs::path RollingFileWriter::generateFilename() const {
    const auto t = std::chrono::system_clock::to_time_t(opts_.clock());
    std::tm tm{};
    gmtime_r(&t, &tm);

    char datePart[32];
    std::strftime(datePart, sizeof(datePart), "%Y-%m-%dT%H:%M:%SZ", &tm);

    std::string stamp(datePart);
    std::ranges::replace(stamp, ':', '_');

    return opts_.folder / (opts_.prefix + "_" + std::to_string(opts_.process_id()) + "_" + stamp + "_.log");
}

std::size_t RollingFileWriter::countLines(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("RollingFileWriter: cannot read " + path.string());

    std::size_t lines = 0;
    char last = '\n';
    std::for_each(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>(), [&](const char c) {
        if (c == '\n') ++lines;
        last = c;
    });
    if (in.bad()) throw std::runtime_error("RollingFileWriter: read failed for " + path.string());

    return last == '\n' ? lines : lines + 1;
}

void RollingFileWriter::initializeFileQueue() {
    struct Entry {
        fs::path path;
        fs::file_time_type mtime;
    };
    std::vector<Entry> entries;

    for (const auto& de : fs::directory_iterator(opts_.folder)) {
        std::error_code ec;
        if (!de.is_regular_file(ec)) continue;
        if (!de.path().filename().string().starts_with(opts_.prefix)) continue;

        const auto mtime = fs::last_write_time(de.path(), ec);
        if (ec) continue; // vanished between listing and stat
        entries.push_back({de.path(), mtime});
    }

    std::ranges::sort(entries, [](const Entry& a, const Entry& b) {
        if (a.mtime != b.mtime) return a.mtime < b.mtime;
        return a.path.filename() < b.path.filename();
    });

    for (auto& e : entries) queue_.push_back(std::move(e.path));
    enforceRetention();

    if (queue_.empty()) return;

    // Resume a partially-filled file instead of starting a new one.
    const auto& mostRecent = queue_.back();
    const auto lines = countLines(mostRecent);
    if (lines < opts_.max_lines_per_file) {
        fd_ = fileio::openAppend(mostRecent, "RollingFileWriter: cannot resume");
        active_ = mostRecent;
        lineCount_ = lines;
        Registry::diag()->debug("[RollingFileWriter] Resuming {} at {} lines", mostRecent.string(), lines);
    }
}

int RollingFileWriter::fileDescriptor() {
    if (fd_ >= 0 && lineCount_ >= opts_.max_lines_per_file) {
        Registry::diag()->debug("[RollingFileWriter] {} reached {} lines, rotating", active_->string(), lineCount_);
        fileio::closeQuietly(fd_);
        active_.reset();
    }

    if (fd_ < 0) openNewFile();
    return fd_;
}

void RollingFileWriter::openNewFile() {
    auto filename = generateFilename();
    lineCount_ = 0;
    fd_ = fileio::openAppend(filename, "RollingFileWriter: cannot create log file");
    active_ = filename;

    // A name collision (same second, or the clock stepped back) reopens a queued file. Move it
    // to the tail instead of queueing it twice, or retention would delete the active file.
    if (const auto it = std::ranges::find(queue_, filename); it != queue_.end()) queue_.erase(it);
    queue_.push_back(std::move(filename));
    enforceRetention();
}

void RollingFileWriter::enforceRetention() {
    while (queue_.size() > opts_.files_to_keep) {
        const auto victim = std::move(queue_.front());
        queue_.pop_front();

        std::error_code ec;
        fs::remove(victim, ec);
        if (ec) throw std::system_error(ec, "RollingFileWriter: cannot delete " + victim.string());

        Registry::diag()->debug("[RollingFileWriter] Retention removed {}", victim.string());
    }
}
