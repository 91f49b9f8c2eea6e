#include "test_base.hpp"
#include "core/locked_file.hpp"
#include <atomic>
#include <sys/file.h>
#include <fcntl.h>
#include <system_error>
#include <thread>
#include <vector>

class LockedFileTest : public TempDirTest
{
};

TEST_F(LockedFileTest, WriteThenReadBack)
{
    writeLockedFile(path("doc.txt"), "hello world\n");
    EXPECT_EQ(readLockedFile(path("doc.txt")), "hello world\n");
}

TEST_F(LockedFileTest, WriteModeReplacesPreviousContent)
{
    writeFile("doc.txt", "a much longer previous document");
    writeLockedFile(path("doc.txt"), "short");
    EXPECT_EQ(readFile("doc.txt"), "short");
}

TEST_F(LockedFileTest, ReadWriteModeKeepsContent)
{
    writeFile("doc.txt", "keep me");
    LockedFile file(path("doc.txt"), FileMode::ReadWrite, LockKind::Exclusive);
    EXPECT_EQ(file.readAll(), "keep me");
    file.truncate();
    EXPECT_EQ(file.readAll(), "");
}

TEST_F(LockedFileTest, MissingFileThrowsWithErrno)
{
    try
    {
        LockedFile file(path("missing.txt"), FileMode::Read, LockKind::Shared);
        FAIL() << "expected std::system_error";
    }
    catch (const std::system_error &e)
    {
        EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
    }
}

TEST_F(LockedFileTest, SharedLocksCoexist)
{
    writeFile("doc.txt", "shared");
    LockedFile first(path("doc.txt"), FileMode::Read, LockKind::Shared);

    // A second shared lock must be grantable without blocking
    int fd = open(path("doc.txt").c_str(), O_RDONLY);
    ASSERT_GE(fd, 0);
    EXPECT_EQ(flock(fd, LOCK_SH | LOCK_NB), 0);
    close(fd);

    LockedFile second(path("doc.txt"), FileMode::Read, LockKind::Shared);
    EXPECT_EQ(second.readAll(), "shared");
}

TEST_F(LockedFileTest, ExclusiveLockExcludesOthersUntilScopeEnds)
{
    writeFile("doc.txt", "x");
    int fd = open(path("doc.txt").c_str(), O_RDONLY);
    ASSERT_GE(fd, 0);
    {
        LockedFile writer(path("doc.txt"), FileMode::ReadWrite, LockKind::Exclusive);
        EXPECT_NE(flock(fd, LOCK_SH | LOCK_NB), 0);
    }
    EXPECT_EQ(flock(fd, LOCK_SH | LOCK_NB), 0);
    close(fd);
}

TEST_F(LockedFileTest, ReadersNeverObserveInterleavedWrites)
{
    const std::string doc_a(64 * 1024, 'a');
    const std::string doc_b(64 * 1024, 'b');
    writeLockedFile(path("doc.txt"), doc_a);

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread writer([&]()
                       {
        for (int i = 0; i < 200; ++i)
        {
            writeLockedFile(path("doc.txt"), i % 2 ? doc_a : doc_b);
        }
        done.store(true); });

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r)
    {
        readers.emplace_back([&]()
                             {
            while (!done.load())
            {
                const std::string content = readLockedFile(path("doc.txt"));
                if (content != doc_a && content != doc_b)
                {
                    torn.fetch_add(1);
                }
            } });
    }

    writer.join();
    for (auto &reader : readers)
    {
        reader.join();
    }
    EXPECT_EQ(torn.load(), 0);
}
