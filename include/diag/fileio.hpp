#pragma once

#include <filesystem>
#include <string_view>

namespace ad::diag::fileio {

// mkdir -p; a freshly created leaf gets mode 0775. Throws std::filesystem::filesystem_error.
void ensureFolder(const std::filesystem::path& folder);

// open(O_WRONLY | O_APPEND | O_CREAT, 0644). Throws std::system_error naming `what`.
int openAppend(const std::filesystem::path& path, const char* what);

// Writes every byte of `data`, retrying on EINTR and short writes. Throws std::system_error.
void writeAll(int fd, std::string_view data, const std::filesystem::path& path);

void closeQuietly(int& fd);

}
