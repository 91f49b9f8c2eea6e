#pragma once

#include <string>

enum class FileMode
{
    Read,      // O_RDONLY, file must exist
    Write,     // create, truncated after the lock is held
    ReadWrite  // create, contents kept
};

enum class LockKind
{
    Shared,
    Exclusive
};

/**
 * @brief Scoped advisory lock on an open file.
 *
 * The file is opened first and then locked with flock(), so the lock belongs to
 * the open descriptor and not to the path. Shared locks coexist, an exclusive
 * lock excludes every other lock. Acquisition blocks until granted. The lock is
 * released and the descriptor closed when the handle goes out of scope.
 *
 * Open failures throw std::system_error and no lock is attempted.
 */
class LockedFile
{
public:
    LockedFile(const std::string &path, FileMode mode, LockKind lock);
    ~LockedFile();

    LockedFile(const LockedFile &) = delete;
    LockedFile &operator=(const LockedFile &) = delete;

    // Read from the start of the file to EOF
    std::string readAll();

    // Append content at the current offset, handling short writes
    void write(const std::string &content);

    void truncate();

    const std::string &path() const { return path_; }

private:
    void acquire();

    std::string path_;
    LockKind lock_;
    int fd_{-1};
};

// Whole-document helpers, each one a single locked operation
std::string readLockedFile(const std::string &path);
void writeLockedFile(const std::string &path, const std::string &content);
