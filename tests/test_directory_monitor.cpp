#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/common/Paths.hpp"
#include "core/monitor/DirectoryMonitor.hpp"
#include "TestSupport.hpp"

using namespace sdi;

TEST(DirectoryMonitor, ReportsCreatedAndDeleted) {
  fixtures::TempDir dir;
  fixtures::writeBytes(dir.file("existing.kmall"), "a");
  fixtures::writeBytes(dir.file("sub/nested.kmall"), "b");

  DirectoryMonitor flat(dir.path().string(), false);
  std::vector<std::string> created;
  std::vector<std::string> deleted;
  flat.bindTo([&](const std::string& path, MonitorEvent event) {
    (event == MonitorEvent::Created ? created : deleted).push_back(paths::fileName(path));
  });
  EXPECT_EQ(flat.poll(), 0u);  // not started

  flat.start();
  EXPECT_EQ(flat.poll(), 1u);
  EXPECT_EQ(created, std::vector<std::string>{"existing.kmall"});
  EXPECT_EQ(flat.poll(), 0u);

  std::filesystem::remove(dir.file("existing.kmall"));
  EXPECT_EQ(flat.poll(), 1u);
  EXPECT_EQ(deleted, std::vector<std::string>{"existing.kmall"});

  DirectoryMonitor deep(dir.path().string(), true);
  deep.start();
  EXPECT_EQ(deep.poll(), 1u);
}

TEST(DirectoryMonitor, ThrowingCallbackDoesNotDropBatch) {
  fixtures::TempDir dir;
  fixtures::writeBytes(dir.file("0001_line.kmall"), "a");
  fixtures::writeBytes(dir.file("0002_line.kmall"), "b");

  DirectoryMonitor monitor(dir.path().string(), false);
  std::vector<std::string> seen;
  int calls = 0;
  monitor.bindTo([&](const std::string& path, MonitorEvent) {
    if (calls++ == 0) throw std::runtime_error("handler failed");
    seen.push_back(paths::fileName(path));
  });
  std::vector<std::string> second;
  monitor.bindTo([&](const std::string& path, MonitorEvent) { second.push_back(paths::fileName(path)); });

  monitor.start();
  EXPECT_EQ(monitor.poll(), 2u);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(seen.size(), 1u);
  // the other callback still sees both files
  EXPECT_EQ(second, (std::vector<std::string>{"0001_line.kmall", "0002_line.kmall"}));
  EXPECT_EQ(monitor.poll(), 0u);
}
