#pragma once
#include <filesystem>
#include <string>

namespace scsv {

// Advisory exclusive lock (flock) held for the lifetime of the object.
// Only cooperating writers are excluded. No-op on Windows.
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Blocks until the lock is granted. Creates the file if missing when create is set.
    bool acquire(const std::filesystem::path& path, bool create, std::string& err);
    void release();
    bool held() const { return m_fd >= 0; }

private:
    int m_fd{-1};
};

} // namespace scsv
