#include "diag/FileWriter.hpp"
#include "diag/fileio.hpp"

#include <stdexcept>

using namespace ad::diag;

static constexpr std::string_view DIVIDER = "----------------------------------------";

FileWriter::FileWriter(const Level level, const std::filesystem::path& folder, const std::string& fileName)
    : Writer(level), path_(folder / fileName) {
    fileio::ensureFolder(folder);
    fd_ = fileio::openAppend(path_, "FileWriter");
}

FileWriter::~FileWriter() { fileio::closeQuietly(fd_); }

void FileWriter::write(const std::string_view message) {
    if (fd_ < 0) throw std::logic_error("FileWriter: write after end(): " + path_.string());
    fileio::writeAll(fd_, message, path_);
}

void FileWriter::writeError(const std::string_view message) { write(message); }

void FileWriter::divider() { write(DIVIDER); }

void FileWriter::end() { fileio::closeQuietly(fd_); }
