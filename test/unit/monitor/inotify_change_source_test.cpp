#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <functional>
#include <memory>
#include <vector>

#include "test_util/temp_dir.h"
#include "vecsync/monitor/inotify_change_source.h"

using namespace vecsync;
using namespace vecsync::monitor;
using namespace std::chrono_literals;

class InotifyChangeSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("vecsync_inotify");
        root_ = std::filesystem::canonical(dir_->path()).string();
        config_ = core::MonitorConfig::Default();
        config_.poll_interval = 20ms;
        source_ = std::make_unique<InotifyChangeSource>(config_, common::Logger::null());
    }

    void TearDown() override {
        source_->stop();
    }

    // Pops events until one matches or the timeout expires.
    bool WaitFor(const std::function<bool(const core::ChangeEvent&)>& match,
                 std::chrono::milliseconds timeout = 3000ms) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto event = channel_.pop(50ms);
            if (!event) {
                continue;
            }
            channel_.ack();
            seen_.push_back(*event);
            if (match(*event)) {
                return true;
            }
        }
        return false;
    }

    static std::function<bool(const core::ChangeEvent&)> Is(const std::string& path, core::ChangeKind kind) {
        return [path, kind](const core::ChangeEvent& e) { return e.path == path && e.kind == kind; };
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    std::string root_;
    core::MonitorConfig config_;
    EventChannel channel_;
    std::unique_ptr<InotifyChangeSource> source_;
    std::vector<core::ChangeEvent> seen_;
};

TEST_F(InotifyChangeSourceTest, WatchesWholeTree) {
    std::filesystem::create_directories(dir_->path() / "a" / "b");
    std::filesystem::create_directories(dir_->path() / "c");

    ASSERT_TRUE(source_->start({root_}, channel_).ok());
    EXPECT_EQ(source_->watchCount(), 4u);
}

TEST_F(InotifyChangeSourceTest, MissingRootFails) {
    auto result = source_->start({root_ + "/missing"}, channel_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::NOT_FOUND);
    EXPECT_EQ(source_->watchCount(), 0u);
}

TEST_F(InotifyChangeSourceTest, CreateWriteAndDelete) {
    ASSERT_TRUE(source_->start({root_}, channel_).ok());

    const std::string path = root_ + "/note.txt";
    testutil::WriteFile(path, "hello");
    EXPECT_TRUE(WaitFor(Is(path, core::ChangeKind::CREATED)));

    testutil::WriteFile(path, "hello again");
    EXPECT_TRUE(WaitFor(Is(path, core::ChangeKind::MODIFIED)));

    std::filesystem::remove(path);
    EXPECT_TRUE(WaitFor(Is(path, core::ChangeKind::DELETED)));
}

TEST_F(InotifyChangeSourceTest, RenameWithinTreeIsMove) {
    const std::string from = root_ + "/old.txt";
    const std::string to = root_ + "/new.txt";
    testutil::WriteFile(from, "content");
    ASSERT_TRUE(source_->start({root_}, channel_).ok());

    std::filesystem::rename(from, to);
    EXPECT_TRUE(WaitFor([&](const core::ChangeEvent& e) {
        return e.kind == core::ChangeKind::MOVED && e.path == from && e.dest_path == to;
    }));
}

TEST_F(InotifyChangeSourceTest, NewDirectoryIsWatchedAndItsFilesReported) {
    ASSERT_TRUE(source_->start({root_}, channel_).ok());
    const size_t before = source_->watchCount();

    const std::string sub = root_ + "/fresh";
    std::filesystem::create_directories(sub);
    // Either the watch sees the create or the initial listing reports it.
    testutil::WriteFile(sub + "/inside.txt", "x");
    EXPECT_TRUE(WaitFor(Is(sub + "/inside.txt", core::ChangeKind::CREATED)));
    EXPECT_EQ(source_->watchCount(), before + 1);

    const std::string later = sub + "/later.txt";
    testutil::WriteFile(later, "y");
    EXPECT_TRUE(WaitFor(Is(later, core::ChangeKind::CREATED)));
}

TEST_F(InotifyChangeSourceTest, NewFileIsReportedWhenTheWriterCloses) {
    ASSERT_TRUE(source_->start({root_}, channel_).ok());

    const std::string path = root_ + "/slow.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "first half ";
        out.flush();
        EXPECT_FALSE(WaitFor([&](const core::ChangeEvent& e) { return e.path == path; }, 300ms));
        out << "second half";
    }
    EXPECT_TRUE(WaitFor(Is(path, core::ChangeKind::CREATED)));
    EXPECT_EQ(std::count_if(seen_.begin(), seen_.end(),
                            [&](const core::ChangeEvent& e) { return e.path == path; }), 1);
}

TEST_F(InotifyChangeSourceTest, MovedOutIsDeleted) {
    std::filesystem::create_directories(dir_->path() / "watched");
    const std::string watched = root_ + "/watched";
    const std::string file = watched + "/leaving.txt";
    testutil::WriteFile(file, "bye");
    ASSERT_TRUE(source_->start({watched}, channel_).ok());

    std::filesystem::rename(file, root_ + "/outside.txt");
    EXPECT_TRUE(WaitFor(Is(file, core::ChangeKind::DELETED)));
}

TEST_F(InotifyChangeSourceTest, RemoveRootDropsWatches) {
    std::filesystem::create_directories(dir_->path() / "one" / "deep");
    std::filesystem::create_directories(dir_->path() / "two");
    ASSERT_TRUE(source_->start({root_ + "/one", root_ + "/two"}, channel_).ok());
    EXPECT_EQ(source_->watchCount(), 3u);

    ASSERT_TRUE(source_->removeRoot(root_ + "/one").ok());
    EXPECT_EQ(source_->watchCount(), 1u);
}

TEST_F(InotifyChangeSourceTest, StopIsPromptAndRepeatable) {
    ASSERT_TRUE(source_->start({root_}, channel_).ok());
    auto start = std::chrono::steady_clock::now();
    source_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(source_->watchCount(), 0u);
    source_->stop();

    auto added = source_->addRoot(root_);
    ASSERT_FALSE(added.ok());
    EXPECT_EQ(added.code(), core::Error::Code::INVALID_ARGUMENT);
}
