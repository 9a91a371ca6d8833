// CPU detection helpers, tool lookup and time formatting.

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "stillcap/system.hpp"

namespace stillcap {
namespace {

TEST(SystemTest, CpusetParsing) {
  EXPECT_EQ(parse_cpuset_string("0-3"), (std::vector<int>{0, 1, 2, 3}));
  EXPECT_EQ(parse_cpuset_string("0,2,4\n"), (std::vector<int>{0, 2, 4}));
  EXPECT_EQ(parse_cpuset_string("1,4-5"), (std::vector<int>{1, 4, 5}));
  EXPECT_TRUE(parse_cpuset_string("").empty());
  EXPECT_TRUE(parse_cpuset_string("3-1").empty());
  EXPECT_TRUE(parse_cpuset_string("a-b").empty());
}

TEST(SystemTest, CpuLimitIsSane) {
  int limit = detect_cpu_limit();
  EXPECT_GE(limit, 1);
  EXPECT_LE(limit, 64);
}

TEST(SystemTest, ThreadCountPrefersConfiguredValue) {
  EXPECT_EQ(resolve_thread_count(3), 3);
  EXPECT_EQ(resolve_thread_count(0), detect_cpu_limit());
}

TEST(SystemTest, FindsExecutables) {
  auto sh = find_executable("sh");
  ASSERT_TRUE(sh.has_value());
  EXPECT_EQ(sh->back(), 'h');
  EXPECT_EQ(find_executable("/bin/sh").value_or(""), "/bin/sh");
  EXPECT_FALSE(find_executable("stillcap-no-such-tool-xyz").has_value());
  EXPECT_FALSE(find_executable("/nonexistent/ffmpeg").has_value());
  EXPECT_FALSE(find_executable("").has_value());
}

TEST(SystemTest, FormatTime) {
  EXPECT_EQ(format_time(0.0), "00:00:00.000");
  EXPECT_EQ(format_time(10.3), "00:00:10.300");
  EXPECT_EQ(format_time(3725.25), "01:02:05.250");
  EXPECT_EQ(format_time(-1.0), "00:00:00.000");
}

} // namespace
} // namespace stillcap
