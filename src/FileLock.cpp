#include "FileLock.hpp"
#include <cerrno>
#include <system_error>
#ifndef _WIN32
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace scsv {

FileLock::~FileLock() { release(); }

bool FileLock::acquire(const std::filesystem::path& path, bool create, std::string& err) {
    release();
#ifdef _WIN32
    (void)path; (void)create; (void)err;
    return true;
#else
    int flags = O_RDWR | O_CLOEXEC;
    if (create) flags |= O_CREAT;
    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) { err = std::error_code(errno, std::generic_category()).message(); return false; }
    int rc;
    do { rc = ::flock(fd, LOCK_EX); } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        err = std::error_code(errno, std::generic_category()).message();
        ::close(fd);
        return false;
    }
    m_fd = fd;
    return true;
#endif
}

void FileLock::release() {
#ifndef _WIN32
    if (m_fd >= 0) {
        ::flock(m_fd, LOCK_UN);
        ::close(m_fd);
        m_fd = -1;
    }
#endif
}

} // namespace scsv
