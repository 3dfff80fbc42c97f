// ==============================================================================
// test_watch_gtest.cpp - Тесты канала событий и наблюдателя inotify (GoogleTest)
// ==============================================================================

#include "turbosort/watch.hpp"

#include "test_support.hpp"

#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <thread>

namespace turbosort::watch::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// ==============================================================================
// Channel
// ==============================================================================

TEST(ChannelTest, PushPop_Fifo) {
    Channel<int> ch;
    EXPECT_TRUE(ch.push(1));
    EXPECT_TRUE(ch.push(2));

    EXPECT_EQ(ch.size(), 2u);
    EXPECT_EQ(ch.try_pop(), 1);
    EXPECT_EQ(ch.pop_for(10ms), 2);
    EXPECT_FALSE(ch.try_pop().has_value());
}

TEST(ChannelTest, PopFor_TimesOutWhenEmpty) {
    Channel<int> ch;
    auto start = std::chrono::steady_clock::now();

    auto value = ch.pop_for(50ms);

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST(ChannelTest, Close_RejectsPushAndWakesWaiter) {
    Channel<int> ch;
    std::thread closer([&ch] {
        std::this_thread::sleep_for(20ms);
        ch.close();
    });

    auto value = ch.pop_for(5s);
    closer.join();

    EXPECT_FALSE(value.has_value());
    EXPECT_TRUE(ch.closed());
    EXPECT_FALSE(ch.push(3));
}

TEST(ChannelTest, CrossThreadDelivery) {
    Channel<int> ch;
    std::thread producer([&ch] {
        for (int i = 0; i < 100; ++i) {
            ch.push(i);
        }
    });

    int sum = 0;
    int received = 0;
    while (received < 100) {
        if (auto v = ch.pop_for(1s)) {
            sum += *v;
            ++received;
        } else {
            break;
        }
    }
    producer.join();

    EXPECT_EQ(received, 100);
    EXPECT_EQ(sum, 4950);
}

TEST(WatchEventTest, KindNames) {
    EXPECT_STREQ(event_kind_to_string(EventKind::Created), "created");
    EXPECT_STREQ(event_kind_to_string(EventKind::Overflow), "overflow");
}

// ==============================================================================
// InotifyWatcher
// ==============================================================================

class WatcherTest : public turbosort::test::TempDirTest {
protected:
    Channel<WatchEvent> events_;

    // Ждать событие, удовлетворяющее условию (до 5 секунд)
    bool wait_for(const std::function<bool(const WatchEvent&)>& match) {
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (std::chrono::steady_clock::now() < deadline) {
            if (auto ev = events_.pop_for(100ms)) {
                if (match(*ev)) {
                    return true;
                }
            }
        }
        return false;
    }
};

TEST_F(WatcherTest, Start_WatchesExistingTree) {
    fs::create_directories(test_dir_ / "a" / "b");
    fs::create_directories(test_dir_ / "c");
    InotifyWatcher watcher(test_dir_, events_);

    std::string error;
    ASSERT_TRUE(watcher.start(error)) << error;

    EXPECT_TRUE(watcher.running());
    EXPECT_EQ(watcher.watch_count(), 4u);
    watcher.stop();
    EXPECT_FALSE(watcher.running());
}

TEST_F(WatcherTest, Start_MissingRoot_Fails) {
    InotifyWatcher watcher(test_dir_ / "absent", events_);

    std::string error;
    EXPECT_FALSE(watcher.start(error));
    EXPECT_FALSE(error.empty());
}

TEST_F(WatcherTest, FileWrite_ProducesModifiedEvent) {
    // Arrange
    InotifyWatcher watcher(test_dir_, events_);
    std::string error;
    ASSERT_TRUE(watcher.start(error)) << error;
    fs::path file = test_dir_ / "new.txt";

    // Act
    write_file(file, "data");

    // Assert
    EXPECT_TRUE(wait_for([&](const WatchEvent& ev) {
        return ev.kind == EventKind::Modified && ev.path == file && !ev.is_directory;
    }));
}

TEST_F(WatcherTest, NewDirectory_IsAnnouncedAndWatched) {
    // Arrange
    InotifyWatcher watcher(test_dir_, events_);
    std::string error;
    ASSERT_TRUE(watcher.start(error)) << error;
    fs::path dir = test_dir_ / "incoming";

    // Act
    fs::create_directories(dir);
    ASSERT_TRUE(wait_for([&](const WatchEvent& ev) {
        return ev.kind == EventKind::Created && ev.path == dir && ev.is_directory;
    }));
    write_file(dir / "late.txt", "x");

    // Assert: файл в новой директории тоже отслеживается
    EXPECT_TRUE(wait_for([&](const WatchEvent& ev) {
        return ev.kind == EventKind::Modified && ev.path == dir / "late.txt";
    }));
}

TEST_F(WatcherTest, Delete_ProducesDeletedEvent) {
    fs::path file = test_dir_ / "doomed.txt";
    write_file(file, "x");
    InotifyWatcher watcher(test_dir_, events_);
    std::string error;
    ASSERT_TRUE(watcher.start(error)) << error;

    fs::remove(file);

    EXPECT_TRUE(wait_for([&](const WatchEvent& ev) {
        return ev.kind == EventKind::Deleted && ev.path == file;
    }));
}

TEST_F(WatcherTest, ClosedChannel_StopsLoop) {
    InotifyWatcher watcher(test_dir_, events_);
    std::string error;
    ASSERT_TRUE(watcher.start(error)) << error;

    events_.close();
    write_file(test_dir_ / "f.txt", "x");

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (watcher.running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_FALSE(watcher.running());
}

}  // namespace turbosort::watch::test
