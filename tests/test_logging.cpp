/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 */

#include <gtest/gtest.h>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <atomic>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "logging.h"

namespace {

class LoggingTest : public ::testing::Test {
 protected:
   void SetUp() override {
      char path[] = "/tmp/vaani_log_XXXXXX";
      int fd = mkstemp(path);
      ASSERT_GE(fd, 0);
      close(fd);
      path_ = path;
      ASSERT_EQ(init_logging(path_.c_str()), 0);
   }

   void TearDown() override {
      close_logging();
      logging_set_min_level(LOG_LEVEL_INFO);
      unlink(path_.c_str());
   }

   std::string contents() const {
      std::ifstream in(path_);
      std::stringstream ss;
      ss << in.rdbuf();
      return ss.str();
   }

   std::string path_;
};

}  // namespace

TEST_F(LoggingTest, MinLevelFiltersFileOutput) {
   logging_set_min_level(LOG_LEVEL_WARNING);
   LOG_INFO("quiet line %d", 1);
   LOG_WARNING("loud line %d", 2);
   LOG_ERROR("loud line %d", 3);
   close_logging();

   std::string out = contents();
   EXPECT_EQ(out.find("quiet line"), std::string::npos);
   EXPECT_NE(out.find("[WARN] test_logging.cpp"), std::string::npos);
   EXPECT_NE(out.find("loud line 2"), std::string::npos);
   EXPECT_NE(out.find("[ERROR]"), std::string::npos);
}

TEST_F(LoggingTest, MinLevelChangesWhileOtherThreadsLog) {
   std::atomic<bool> stop(false);
   std::vector<std::thread> writers;
   for (int t = 0; t < 4; t++) {
      writers.emplace_back([&stop, t] {
         int n = 0;
         while (!stop.load()) {
            LOG_INFO("writer %d line %d", t, n++);
         }
      });
   }

   for (int i = 0; i < 200; i++) {
      logging_set_min_level(i % 2 ? LOG_LEVEL_ERROR : LOG_LEVEL_INFO);
   }
   logging_set_min_level(LOG_LEVEL_ERROR);
   stop.store(true);
   for (std::thread &w : writers)
      w.join();

   EXPECT_EQ(logging_get_min_level(), LOG_LEVEL_ERROR);
   close_logging();

   /* Lines are written whole under the log mutex */
   std::ifstream in(path_);
   std::string line;
   while (std::getline(in, line)) {
      EXPECT_EQ(line.compare(0, 1, "["), 0) << line;
      EXPECT_NE(line.find(" writer "), std::string::npos) << line;
   }
}

TEST(LoggingLevelTest, NamesParse) {
   log_level_t level = LOG_LEVEL_ERROR;
   EXPECT_EQ(logging_level_from_name("info", &level), 0);
   EXPECT_EQ(level, LOG_LEVEL_INFO);
   EXPECT_EQ(logging_level_from_name("warn", &level), 0);
   EXPECT_EQ(level, LOG_LEVEL_WARNING);
   EXPECT_EQ(logging_level_from_name("warning", &level), 0);
   EXPECT_EQ(logging_level_from_name("error", &level), 0);
   EXPECT_EQ(level, LOG_LEVEL_ERROR);
   EXPECT_EQ(logging_level_from_name("debug", &level), 1);
   EXPECT_EQ(level, LOG_LEVEL_ERROR);
   EXPECT_EQ(logging_level_from_name(NULL, &level), 1);
}
