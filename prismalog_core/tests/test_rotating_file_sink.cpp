#include <dirent.h>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "../include/prismalog/errors.hpp"
#include "../include/prismalog/formatters/pattern_formatter.hpp"
#include "../include/prismalog/log_level.hpp"
#include "../include/prismalog/log_record.hpp"
#include "../include/prismalog/sinks/rotating_file_sink.hpp"

static prismalog::LogRecord make_record(
    prismalog::LogLevel level = prismalog::LogLevel::Info,
    const char* msg = "test message")
{
  prismalog::LogRecord record{};
  record.wall_clock_ns = 1739692200123456000ULL;
  record.timestamp_ns = 123456789ULL;
  record.level = level;
  record.file_path = "/src/main.cpp";
  record.file_name = "main.cpp";
  record.function_name = "process";
  record.line = 42;
  record.thread_id = 1234;
  record.process_id = 5678;
  std::strncpy(record.thread_name, "worker", sizeof(record.thread_name));
  record.sequence_id = 1001;
  std::strncpy(record.logger_name, "app", sizeof(record.logger_name));
  record.name_len = 3;
  record.msg_len = static_cast<uint32_t>(std::strlen(msg));
  std::strncpy(record.msg, msg, PRISMALOG_MAX_MSG_LEN);
  return record;
}

// Line = message only, so sizes are easy to reason about.
class MockFileFmt : public prismalog::IFormatter
{
 public:
  size_t Format(const prismalog::LogRecord& record, char* buf, size_t buf_size) override
  {
    std::string_view text = record.Message();
    size_t len = text.size();
    if (len >= buf_size) len = buf_size - 1;
    std::memcpy(buf, text.data(), len);
    buf[len] = '\0';
    return len;
  }
};

class RotatingFileSinkTest : public ::testing::Test
{
 protected:
  std::string tmp_dir_;
  std::string base_path_;

  void SetUp() override
  {
    char tmpl[] = "/tmp/prismalog_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    tmp_dir_ = dir;
    base_path_ = tmp_dir_ + "/app.log";
  }

  void TearDown() override { remove_dir_recursive(tmp_dir_); }

  std::unique_ptr<prismalog::RotatingFileSink> make_sink(uint64_t threshold, uint32_t backups,
                                                         prismalog::RotationOptions options = {})
  {
    auto sink =
        std::make_unique<prismalog::RotatingFileSink>(base_path_, threshold, backups, options);
    sink->SetFormatter(std::make_unique<MockFileFmt>());
    return sink;
  }

  static std::string read_file(const std::string& path)
  {
    std::ifstream ifs(path);
    if (!ifs) return "";
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
  }

  static bool file_exists(const std::string& path)
  {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
  }

  static size_t file_size(const std::string& path)
  {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    return static_cast<size_t>(st.st_size);
  }

  static void remove_dir_recursive(const std::string& path)
  {
    DIR* d = ::opendir(path.c_str());
    if (!d) return;
    struct dirent* ent;
    while ((ent = ::readdir(d)) != nullptr)
    {
      std::string name = ent->d_name;
      if (name == "." || name == "..") continue;
      std::string full = path + "/" + name;
      struct stat st{};
      if (::stat(full.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
      {
        remove_dir_recursive(full);
      }
      else
      {
        std::remove(full.c_str());
      }
    }
    ::closedir(d);
    ::rmdir(path.c_str());
  }
};

TEST_F(RotatingFileSinkTest, FileCreatedOnConstruction)
{
  prismalog::RotatingFileSink sink(base_path_, 1024, 3);
  EXPECT_TRUE(file_exists(base_path_));
}

TEST_F(RotatingFileSinkTest, CreatesMissingDirectories)
{
  std::string nested = tmp_dir_ + "/a/b/c/app.log";
  prismalog::RotatingFileSink sink(nested, 1024, 3);
  EXPECT_TRUE(file_exists(nested));
}

TEST_F(RotatingFileSinkTest, EachRecordIsOneNewlineTerminatedLine)
{
  auto sink = make_sink(4096, 3);
  sink->Write(make_record(prismalog::LogLevel::Info, "line1"));
  sink->Write(make_record(prismalog::LogLevel::Info, "line2"));
  sink->Write(make_record(prismalog::LogLevel::Info, "line3"));
  sink->Flush();

  EXPECT_EQ(read_file(base_path_), "line1\nline2\nline3\n");
  EXPECT_EQ(sink->CurrentSize(), 18u);
}

TEST_F(RotatingFileSinkTest, BackupNaming)
{
  EXPECT_EQ(prismalog::RotatingFileSink::BackupName("/x/app.log", 1), "/x/app.log.1");
  EXPECT_EQ(prismalog::RotatingFileSink::BackupName("/x/app.log", 12), "/x/app.log.12");
}

TEST_F(RotatingFileSinkTest, RotationShiftsBackupChain)
{
  // Each line is 10 bytes; a threshold of 25 fits two lines per file.
  auto sink = make_sink(25, 3);
  sink->Write(make_record(prismalog::LogLevel::Info, "message_1"));
  sink->Write(make_record(prismalog::LogLevel::Info, "message_2"));
  sink->Write(make_record(prismalog::LogLevel::Info, "message_3"));
  sink->Write(make_record(prismalog::LogLevel::Info, "message_4"));
  sink->Write(make_record(prismalog::LogLevel::Info, "message_5"));
  sink->Flush();

  EXPECT_EQ(read_file(base_path_), "message_5\n");
  EXPECT_EQ(read_file(base_path_ + ".1"), "message_3\nmessage_4\n");
  EXPECT_EQ(read_file(base_path_ + ".2"), "message_1\nmessage_2\n");
  EXPECT_FALSE(file_exists(base_path_ + ".3"));
  EXPECT_EQ(sink->RotationCount(), 2u);
}

TEST_F(RotatingFileSinkTest, OldestBackupDeletedBeyondCount)
{
  auto sink = make_sink(15, 2);
  for (int i = 0; i < 10; ++i)
  {
    std::string msg = "message_" + std::to_string(i);
    sink->Write(make_record(prismalog::LogLevel::Info, msg.c_str()));
  }
  sink->Flush();

  EXPECT_EQ(read_file(base_path_), "message_9\n");
  EXPECT_EQ(read_file(base_path_ + ".1"), "message_8\n");
  EXPECT_EQ(read_file(base_path_ + ".2"), "message_7\n");
  EXPECT_FALSE(file_exists(base_path_ + ".3"));
}

TEST_F(RotatingFileSinkTest, ZeroBackupsNeverRotates)
{
  auto sink = make_sink(15, 0);
  EXPECT_FALSE(sink->RotationEnabled());
  sink->Write(make_record(prismalog::LogLevel::Info, "message_1"));
  sink->Write(make_record(prismalog::LogLevel::Info, "message_2"));
  sink->Write(make_record(prismalog::LogLevel::Info, "message_3"));
  sink->Flush();

  EXPECT_EQ(read_file(base_path_), "message_1\nmessage_2\nmessage_3\n");
  EXPECT_FALSE(file_exists(base_path_ + ".1"));
  EXPECT_EQ(sink->RotationCount(), 0u);
}

TEST_F(RotatingFileSinkTest, RotationNoticeStartsEachNewFile)
{
  prismalog::RotationOptions options;
  options.rotation_notice = true;
  auto sink = make_sink(25, 3, options);
  sink->Write(make_record(prismalog::LogLevel::Info, "message_1"));
  sink->Write(make_record(prismalog::LogLevel::Info, "message_2"));
  sink->Write(make_record(prismalog::LogLevel::Info, "message_3"));
  sink->Flush();

  EXPECT_EQ(read_file(base_path_ + ".1"), "message_1\nmessage_2\n");
  EXPECT_EQ(read_file(base_path_), "Log file rotated\nmessage_3\n");
  EXPECT_EQ(sink->CurrentSize(), 27u);
}

TEST_F(RotatingFileSinkTest, RotationNoticeUsesFileLayout)
{
  prismalog::RotationOptions options;
  options.rotation_notice = true;
  prismalog::RotatingFileSink sink(base_path_, 100, 2, options);
  std::string filler(120, 'f');
  sink.Write(make_record(prismalog::LogLevel::Info, filler.c_str()));
  sink.Write(make_record(prismalog::LogLevel::Info, "after"));
  sink.Flush();

  std::string content = read_file(base_path_);
  EXPECT_NE(content.find(" - prismalog.rotation - [INFO] - Log file rotated\n"), std::string::npos);
  EXPECT_LT(content.find("Log file rotated"), content.find("after"));
}

TEST_F(RotatingFileSinkTest, OversizedRecordWrittenWholeThenRotated)
{
  auto sink = make_sink(20, 3);
  std::string big(100, 'x');
  sink->Write(make_record(prismalog::LogLevel::Info, big.c_str()));
  EXPECT_EQ(read_file(base_path_), big + "\n");
  EXPECT_EQ(sink->RotationCount(), 0u);

  sink->Write(make_record(prismalog::LogLevel::Info, "next"));
  sink->Flush();
  EXPECT_EQ(read_file(base_path_), "next\n");
  EXPECT_EQ(read_file(base_path_ + ".1"), big + "\n");
}

TEST_F(RotatingFileSinkTest, LineLongerThanInitialBufferWrittenWhole)
{
  auto sink = make_sink(1 << 20, 3);
  std::string big(3 * PRISMALOG_FORMAT_BUF_SIZE, 'z');
  prismalog::LogRecord record = make_record();
  prismalog::SetRecordMessage(record, big);
  sink->Write(record);
  sink->Write(make_record(prismalog::LogLevel::Info, "short"));
  sink->Flush();
  prismalog::ReleaseRecordMessage(record);

  EXPECT_EQ(read_file(base_path_), big + "\nshort\n");
}

TEST_F(RotatingFileSinkTest, RotationDisabledKeepsAppending)
{
  prismalog::RotationOptions options;
  options.rotation_enabled = false;
  auto sink = make_sink(15, 3, options);
  for (int i = 0; i < 5; ++i)
  {
    sink->Write(make_record(prismalog::LogLevel::Info, "message_x"));
  }
  sink->Flush();

  EXPECT_EQ(file_size(base_path_), 50u);
  EXPECT_FALSE(file_exists(base_path_ + ".1"));
}

TEST_F(RotatingFileSinkTest, ExistingFileSizeCountsTowardThreshold)
{
  {
    auto sink = make_sink(25, 3);
    sink->Write(make_record(prismalog::LogLevel::Info, "session_1"));
    sink->Write(make_record(prismalog::LogLevel::Info, "session_1"));
  }

  auto sink = make_sink(25, 3);
  EXPECT_EQ(sink->CurrentSize(), 20u);
  sink->Write(make_record(prismalog::LogLevel::Info, "session_2"));
  sink->Flush();

  EXPECT_EQ(read_file(base_path_), "session_2\n");
  EXPECT_EQ(read_file(base_path_ + ".1"), "session_1\nsession_1\n");
}

TEST_F(RotatingFileSinkTest, ReopensWhenAnotherWriterRotated)
{
  auto first = make_sink(1000, 3);
  auto second = make_sink(1000, 3);

  first->Write(make_record(prismalog::LogLevel::Info, "before"));
  // Simulate a rotation by another process.
  ASSERT_EQ(std::rename(base_path_.c_str(), (base_path_ + ".1").c_str()), 0);

  second->Write(make_record(prismalog::LogLevel::Info, "from_second"));
  first->Write(make_record(prismalog::LogLevel::Info, "from_first"));
  first->Flush();
  second->Flush();

  EXPECT_EQ(read_file(base_path_ + ".1"), "before\n");
  EXPECT_EQ(read_file(base_path_), "from_second\nfrom_first\n");
}

TEST_F(RotatingFileSinkTest, SecondWriterSeesSizeOfSharedFile)
{
  auto first = make_sink(25, 3);
  auto second = make_sink(25, 3);

  first->Write(make_record(prismalog::LogLevel::Info, "message_1"));
  first->Write(make_record(prismalog::LogLevel::Info, "message_2"));
  // The second sink never wrote, but must still see a 20 byte file.
  second->Write(make_record(prismalog::LogLevel::Info, "message_3"));
  first->Write(make_record(prismalog::LogLevel::Info, "message_4"));
  second->Flush();
  first->Flush();

  EXPECT_EQ(read_file(base_path_ + ".1"), "message_1\nmessage_2\n");
  EXPECT_EQ(read_file(base_path_), "message_3\nmessage_4\n");
  EXPECT_EQ(first->RotationCount() + second->RotationCount(), 1u);
}

TEST_F(RotatingFileSinkTest, WritesWithoutRotationWhenLockUnavailable)
{
  prismalog::RotationOptions options;
  options.lock_timeout = std::chrono::milliseconds(20);
  auto sink = make_sink(15, 3, options);

  prismalog::RotationLock holder(base_path_ + ".lock");
  ASSERT_TRUE(holder.TryLockFor(std::chrono::milliseconds(0)));

  sink->Write(make_record(prismalog::LogLevel::Info, "message_1"));
  sink->Write(make_record(prismalog::LogLevel::Info, "message_2"));
  sink->Flush();

  EXPECT_EQ(read_file(base_path_), "message_1\nmessage_2\n");
  EXPECT_EQ(sink->LockTimeoutCount(), 1u);
  EXPECT_EQ(sink->RotationCount(), 0u);

  holder.Unlock();
  sink->Write(make_record(prismalog::LogLevel::Info, "message_3"));
  EXPECT_EQ(sink->RotationCount(), 1u);
  EXPECT_EQ(read_file(base_path_), "message_3\n");
}

TEST_F(RotatingFileSinkTest, UnopenableFileThrowsSinkWriteError)
{
  std::string blocked = tmp_dir_ + "/blocked";
  ASSERT_EQ(::mkdir(blocked.c_str(), 0755), 0);
  // The log path is a directory, so open(2) fails.
  prismalog::RotatingFileSink sink(blocked, 1024, 3);
  sink.SetFormatter(std::make_unique<MockFileFmt>());

  EXPECT_THROW(sink.Write(make_record()), prismalog::SinkWriteError);
}

TEST_F(RotatingFileSinkTest, SinkWriteErrorCarriesErrno)
{
  std::string blocked = tmp_dir_ + "/blocked";
  ASSERT_EQ(::mkdir(blocked.c_str(), 0755), 0);
  prismalog::RotatingFileSink sink(blocked, 1024, 3);

  try
  {
    sink.Write(make_record());
    FAIL() << "expected SinkWriteError";
  }
  catch (const prismalog::SinkWriteError& e)
  {
    EXPECT_EQ(e.code().value(), EISDIR);
    EXPECT_NE(std::string(e.what()).find("blocked"), std::string::npos);
  }
}

TEST_F(RotatingFileSinkTest, SetLevelFiltering)
{
  auto sink = make_sink(4096, 3);
  sink->SetLevel(prismalog::LogLevel::Warning);

  sink->Write(make_record(prismalog::LogLevel::Info, "should_not_appear"));
  sink->Write(make_record(prismalog::LogLevel::Debug, "also_not"));
  sink->Write(make_record(prismalog::LogLevel::Warning, "warning_msg"));
  sink->Write(make_record(prismalog::LogLevel::Error, "error_msg"));
  sink->Flush();

  EXPECT_EQ(read_file(base_path_), "warning_msg\nerror_msg\n");
}

TEST_F(RotatingFileSinkTest, DefaultFormatterUsesFileLayout)
{
  prismalog::RotatingFileSink sink(base_path_, 4096, 3);
  sink.Write(make_record());
  sink.Flush();

  std::string content = read_file(base_path_);
  EXPECT_NE(content.find(" - main.cpp - 5678 - 1234 - app - [INFO] - test message\n"),
            std::string::npos);
  EXPECT_EQ(content.find('\033'), std::string::npos);
}

TEST_F(RotatingFileSinkTest, SyncEveryDoesNotChangeContent)
{
  prismalog::RotationOptions options;
  options.sync_every = 2;
  auto sink = make_sink(4096, 3, options);
  for (int i = 0; i < 5; ++i)
  {
    sink->Write(make_record(prismalog::LogLevel::Info, "synced"));
  }
  EXPECT_EQ(file_size(base_path_), 35u);
}

TEST_F(RotatingFileSinkTest, DestructorClosesCleanly)
{
  {
    auto sink = make_sink(4096, 3);
    sink->Write(make_record(prismalog::LogLevel::Info, "before_destruct"));
  }

  EXPECT_EQ(read_file(base_path_), "before_destruct\n");
}
