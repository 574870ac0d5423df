#include "diag/fileio.hpp"

#include <cerrno>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ad::diag::fileio {

void ensureFolder(const fs::path& folder) {
    if (!fs::create_directories(folder)) return;
    fs::permissions(folder,
                    fs::perms::owner_all | fs::perms::group_all |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);
}

int openAppend(const fs::path& path, const char* what) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) throw std::system_error(errno, std::generic_category(),
                                        std::string(what) + ": cannot open " + path.string());
    return fd;
}

void writeAll(const int fd, std::string_view data, const fs::path& path) {
    while (!data.empty()) {
        const ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "write failed: " + path.string());
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
}

void closeQuietly(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}
