#include <gtest/gtest.h>
#include "misc/errors.hpp"
#include "source/directory_walk.hpp"
#include "tests/fixture_util.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace Bi5;
using fixture::make_ts;

TEST(DirectoryWalk, VisitsQualifyingFilesChronologically) {
  fixture::TempDir dir;
  const auto root = dir.path() / "EURUSD";
  // month directories 9 and 10 would sort "10" < "9" as plain strings
  fixture::write_file(root / "2020" / "10" / "1" / "00h_ticks.bi5", {});
  fixture::write_file(root / "2020" / "9" / "30" / "23h_ticks.bi5", {});
  fixture::write_file(root / "2020" / "9" / "2" / "05h_ticks.bi5", {});
  fixture::write_file(root / "2020" / "9" / "2" / "17h_ticks.bi5", {});
  fixture::write_file(root / "2020" / "9" / "10" / "01h_ticks.bi5", {});
  fixture::write_file(root / "2019" / "11" / "31" / "22h_ticks.bi5", {});

  DirectoryWalk walk(root);
  std::vector<Timestamp> seen;
  while (auto entry = walk.next_qualifying()) {
    seen.push_back(entry->timestamp);
  }

  const std::vector<Timestamp> expected = {
      make_ts(2019, 12, 31, 22), make_ts(2020, 10, 2, 5), make_ts(2020, 10, 2, 17),
      make_ts(2020, 10, 10, 1), make_ts(2020, 10, 30, 23), make_ts(2020, 11, 1, 0),
  };
  EXPECT_EQ(seen, expected);
  EXPECT_EQ(walk.depth(), 0u);
}

TEST(DirectoryWalk, SkipsUnresolvableFilesAndDirectories) {
  fixture::TempDir dir;
  const auto day = dir.path() / "2020" / "0" / "15";
  fixture::write_file(day / "07h_ticks.bi5", {});
  fixture::write_file(day / "README", {});
  fixture::write_file(day / "x", {});
  fixture::write_file(dir.path() / "notes.txt", {});
  std::filesystem::create_directories(day / "12h_dir");

  DirectoryWalk walk(dir.path());
  auto first = walk.next_qualifying();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->path.filename().string(), "07h_ticks.bi5");
  EXPECT_EQ(first->timestamp, make_ts(2020, 1, 15, 7));
  EXPECT_FALSE(walk.next_qualifying().has_value());
  EXPECT_FALSE(walk.next_qualifying().has_value());
}

TEST(DirectoryWalk, EmptyDirectoryIsExhausted) {
  fixture::TempDir dir;
  DirectoryWalk walk(dir.path());
  EXPECT_FALSE(walk.next_qualifying().has_value());
}

TEST(DirectoryWalk, MissingRootIsIoError) {
  fixture::TempDir dir;
  EXPECT_THROW(DirectoryWalk(dir.path() / "missing"), IoError);
}

TEST(DirectoryWalk, StrayNameAmongMonthsKeepsOrder) {
  fixture::TempDir dir;
  const auto year = dir.path() / "2020";
  for (int month0 = 0; month0 < 12; ++month0) {
    fixture::write_file(year / std::to_string(month0) / "1" / "00h_ticks.bi5", {});
  }
  fixture::write_file(year / "1_notes", {});
  std::filesystem::create_directories(year / "archive");

  DirectoryWalk walk(dir.path());
  std::vector<Timestamp> seen;
  while (auto entry = walk.next_qualifying()) {
    seen.push_back(entry->timestamp);
  }

  ASSERT_EQ(seen.size(), 12u);
  for (unsigned month = 1; month <= 12; ++month) {
    EXPECT_EQ(seen[month - 1], make_ts(2020, month, 1, 0)) << "month " << month;
  }
}

TEST(DirectoryWalk, UnreadableSubdirectoryThrowsThenContinues) {
  namespace fs = std::filesystem;
  fixture::TempDir dir;
  const auto year = dir.path() / "2020";
  fixture::write_file(year / "0" / "1" / "00h_ticks.bi5", {});
  fixture::write_file(year / "1" / "1" / "00h_ticks.bi5", {});
  fixture::write_file(year / "2" / "1" / "00h_ticks.bi5", {});

  const auto locked = year / "1";
  fs::permissions(locked, fs::perms::none);
  std::error_code ec;
  fs::directory_iterator check(locked, ec);
  if (!ec) {
    fs::permissions(locked, fs::perms::owner_all);
    GTEST_SKIP() << "permissions not enforced for this user";
  }

  DirectoryWalk walk(dir.path());
  auto first = walk.next_qualifying();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->timestamp, make_ts(2020, 1, 1, 0));

  EXPECT_THROW(walk.next_qualifying(), IoError);

  auto after = walk.next_qualifying();
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->timestamp, make_ts(2020, 3, 1, 0));
  EXPECT_FALSE(walk.next_qualifying().has_value());

  fs::permissions(locked, fs::perms::owner_all);
}
