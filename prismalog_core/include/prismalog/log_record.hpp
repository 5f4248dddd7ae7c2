#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "log_level.hpp"
#include "platform.hpp"

namespace prismalog
{

struct SourceLocation;

struct LogRecord
{
  uint64_t timestamp_ns;
  uint64_t wall_clock_ns;

  LogLevel level;

  const char* file_path;
  const char* file_name;
  const char* function_name;
  uint32_t line;

  uint32_t thread_id;
  uint32_t process_id;
  char thread_name[32];

  uint64_t sequence_id;

  uint16_t name_len;
  char logger_name[PRISMALOG_MAX_NAME_LEN];

  // Messages that do not fit msg live in overflow_msg (heap, NUL terminated).
  uint32_t msg_len;
  char* overflow_msg;
  char msg[PRISMALOG_MAX_MSG_LEN];

  std::string_view LoggerName() const { return {logger_name, name_len}; }
  std::string_view Message() const
  {
    return {overflow_msg != nullptr ? overflow_msg : msg, msg_len};
  }
};

static_assert(std::is_trivially_copyable_v<LogRecord>,
              "LogRecord must be trivially copyable for lock-free ring buffer");

// Fills timestamps, process/thread identity, source location and logger name.
// The message is left empty.
void FillRecordHeader(LogRecord& record, LogLevel level, std::string_view logger_name,
                      const SourceLocation& loc);

// Copies text into the record. Text longer than PRISMALOG_MAX_MSG_LEN - 1
// goes to a heap block owned by the record; whoever consumes or drops the
// record calls ReleaseRecordMessage. Copies share that block, so a copy read
// after the release sees freed memory.
void SetRecordMessage(LogRecord& record, std::string_view text);

// Frees the overflow block, if any. The DeliveryQueue does this for records it
// drops or discards, the Listener after every sink and the critical handler
// have seen the record.
void ReleaseRecordMessage(const LogRecord& record);

// Records produced by the library itself (drop notices, config warnings).
LogRecord MakeInternalRecord(LogLevel level, std::string_view logger_name,
                             std::string_view message);

}  // namespace prismalog
