#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "Debug/headers/LogBuffer.h"
#include "Debug/headers/LogBufferManager.h"
#include "Debug/headers/LogMacros.h"

using debug::LogBuffer;
using debug::LogBufferManager;
using debug::LogContext;

TEST(LogBufferTest, KeepsNewestEntriesWhenFull) {
    LogBuffer buffer(3);
    for (int i = 1; i <= 5; ++i) {
        buffer.append("entry " + std::to_string(i));
    }

    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.totalAppended(), 5u);

    const auto all = buffer.readAll();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].message, "entry 3");
    EXPECT_EQ(all[2].message, "entry 5");
}

TEST(LogBufferTest, ReadRecentIsNewestFirstAndFiltered) {
    LogBuffer buffer(10, LogContext::Debug);
    buffer.append("a");
    buffer.append("b", LogContext::Warning);
    buffer.append("c");
    buffer.append("d", LogContext::Warning);

    const auto recent = buffer.readRecent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "d");
    EXPECT_EQ(recent[1].message, "c");

    const auto warnings = buffer.readRecent(10, LogContext::Warning);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].message, "d");
    EXPECT_EQ(warnings[1].message, "b");
    EXPECT_EQ(buffer.readAll()[0].context, LogContext::Debug);
}

TEST(LogBufferTest, ClearKeepsCapacity) {
    LogBuffer buffer(2);
    buffer.append("x");
    buffer.clear();
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_EQ(buffer.capacity(), 2u);
    buffer.append("y");
    ASSERT_EQ(buffer.readAll().size(), 1u);
    EXPECT_EQ(buffer.readAll()[0].message, "y");
}

TEST(LogBufferManagerTest, UnknownBufferThrows) {
    auto &manager = LogBufferManager::getInstance();
    manager.restart();
    EXPECT_FALSE(manager.exists("LogBufferTest.missing"));
    EXPECT_THROW(manager.readFrom("LogBufferTest.missing"), std::out_of_range);
    EXPECT_THROW(manager.readRecentFrom("LogBufferTest.missing", 1), std::out_of_range);
    EXPECT_FALSE(manager.clear("LogBufferTest.missing"));
    EXPECT_FALSE(manager.remove("LogBufferTest.missing"));
}

TEST(LogBufferManagerTest, MacrosAppendToNamedBuffers) {
    auto &manager = LogBufferManager::getInstance();
    manager.restart();
    manager.remove("LogBufferTest.macros");

    LOG_WARN("LogBufferTest.macros", "pixel count mismatch");
    LOG_MEM("LogBufferTest.macros", "released 4 KB");

    const auto entries = manager.readFrom("LogBufferTest.macros");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].context, LogContext::Warning);
    EXPECT_EQ(entries[1].context, LogContext::Memory);
    EXPECT_EQ(entries[1].message, "released 4 KB");
    EXPECT_TRUE(manager.remove("LogBufferTest.macros"));
}

TEST(LogBufferManagerTest, ListenerSeesEveryAppend) {
    auto &manager = LogBufferManager::getInstance();
    manager.restart();

    std::vector<std::string> seen;
    manager.setListener([&seen](const std::string &name, const debug::LogEntry &entry) {
        seen.push_back(name + ":" + entry.message);
    });
    manager.appendTo("LogBufferTest.listener", "one", LogContext::Info);
    manager.appendTo("LogBufferTest.listener", "two");
    manager.setListener({});
    manager.appendTo("LogBufferTest.listener", "three");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "LogBufferTest.listener:one");
    EXPECT_EQ(seen[1], "LogBufferTest.listener:two");
    manager.remove("LogBufferTest.listener");
}

TEST(LogBufferManagerTest, ShutdownDropsAppendsUntilRestart) {
    auto &manager = LogBufferManager::getInstance();
    manager.restart();
    manager.appendTo("LogBufferTest.shutdown", "before");

    manager.shutdown();
    EXPECT_FALSE(manager.exists("LogBufferTest.shutdown"));
    manager.appendTo("LogBufferTest.shutdown", "ignored");
    EXPECT_FALSE(manager.exists("LogBufferTest.shutdown"));

    manager.restart();
    manager.appendTo("LogBufferTest.shutdown", "after");
    ASSERT_EQ(manager.readFrom("LogBufferTest.shutdown").size(), 1u);
    manager.remove("LogBufferTest.shutdown");
}
