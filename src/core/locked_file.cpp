#include "core/locked_file.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <system_error>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace
{
    int openFlags(FileMode mode)
    {
        switch (mode)
        {
        case FileMode::Read:
            return O_RDONLY | O_CLOEXEC;
        case FileMode::Write:
            // No O_TRUNC: truncating before the lock is held would let a
            // shared-lock reader see an emptied document.
            return O_WRONLY | O_CREAT | O_CLOEXEC;
        case FileMode::ReadWrite:
            return O_RDWR | O_CREAT | O_CLOEXEC;
        }
        return O_RDONLY | O_CLOEXEC;
    }
}

LockedFile::LockedFile(const std::string &path, FileMode mode, LockKind lock)
    : path_(path), lock_(lock)
{
    fd_ = ::open(path_.c_str(), openFlags(mode), 0644);
    if (fd_ < 0)
    {
        throw std::system_error(errno, std::generic_category(), "Cannot open " + path_);
    }

    try
    {
        acquire();
        if (mode == FileMode::Write)
        {
            truncate();
        }
    }
    catch (...)
    {
        ::close(fd_);
        fd_ = -1;
        throw;
    }
}

LockedFile::~LockedFile()
{
    if (fd_ >= 0)
    {
        if (::flock(fd_, LOCK_UN) != 0)
        {
            Logger::warn("LockedFile: failed to unlock " + path_);
        }
        ::close(fd_);
    }
}

void LockedFile::acquire()
{
    const int operation = (lock_ == LockKind::Exclusive) ? LOCK_EX : LOCK_SH;
    while (::flock(fd_, operation) != 0)
    {
        if (errno != EINTR)
        {
            throw std::system_error(errno, std::generic_category(), "Cannot lock " + path_);
        }
    }
}

std::string LockedFile::readAll()
{
    if (::lseek(fd_, 0, SEEK_SET) < 0)
    {
        throw std::system_error(errno, std::generic_category(), "Cannot seek " + path_);
    }

    std::string content;
    char buffer[4096];
    for (;;)
    {
        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "Cannot read " + path_);
        }
        if (n == 0)
            break;
        content.append(buffer, static_cast<size_t>(n));
    }
    return content;
}

void LockedFile::write(const std::string &content)
{
    const char *data = content.data();
    size_t remaining = content.size();
    while (remaining > 0)
    {
        ssize_t n = ::write(fd_, data, remaining);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "Cannot write " + path_);
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
}

void LockedFile::truncate()
{
    if (::ftruncate(fd_, 0) != 0 || ::lseek(fd_, 0, SEEK_SET) < 0)
    {
        throw std::system_error(errno, std::generic_category(), "Cannot truncate " + path_);
    }
}

std::string readLockedFile(const std::string &path)
{
    LockedFile file(path, FileMode::Read, LockKind::Shared);
    return file.readAll();
}

void writeLockedFile(const std::string &path, const std::string &content)
{
    LockedFile file(path, FileMode::Write, LockKind::Exclusive);
    file.write(content);
}
