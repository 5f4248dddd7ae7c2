#include "prismalog/log_record.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>

#include "prismalog/log_context.hpp"
#include "prismalog/source_location.hpp"
#include "prismalog/timestamp.hpp"

namespace prismalog
{

namespace
{

std::atomic<uint64_t> g_sequence{0};

}  // namespace

void FillRecordHeader(LogRecord& record, LogLevel level, std::string_view logger_name,
                      const SourceLocation& loc)
{
  record.timestamp_ns = monotonic_now_ns();
  record.wall_clock_ns = wall_clock_now_ns();
  record.level = level;

  record.file_path = loc.file_path;
  record.file_name = loc.file_name;
  record.function_name = loc.function_name;
  record.line = loc.line;

  record.sequence_id = g_sequence.fetch_add(1, std::memory_order_relaxed);
  LogContext::FillThreadInfo(record);

  size_t n = std::min(logger_name.size(), sizeof(record.logger_name) - 1);
  std::memcpy(record.logger_name, logger_name.data(), n);
  record.logger_name[n] = '\0';
  record.name_len = static_cast<uint16_t>(n);

  record.msg_len = 0;
  record.overflow_msg = nullptr;
  record.msg[0] = '\0';
}

void SetRecordMessage(LogRecord& record, std::string_view text)
{
  ReleaseRecordMessage(record);
  record.overflow_msg = nullptr;

  char* dest = record.msg;
  if (text.size() >= sizeof(record.msg))
  {
    record.overflow_msg = new char[text.size() + 1];
    dest = record.overflow_msg;
    record.msg[0] = '\0';
  }
  std::memcpy(dest, text.data(), text.size());
  dest[text.size()] = '\0';
  record.msg_len = static_cast<uint32_t>(text.size());
}

void ReleaseRecordMessage(const LogRecord& record) { delete[] record.overflow_msg; }

LogRecord MakeInternalRecord(LogLevel level, std::string_view logger_name,
                             std::string_view message)
{
  LogRecord record{};
  FillRecordHeader(record, level, logger_name, SourceLocation::none());
  SetRecordMessage(record, message);
  return record;
}

}  // namespace prismalog
