#pragma once
#include <memory>
#include <vector>

#include "../formatters/formatter_interface.hpp"
#include "../log_level.hpp"
#include "../log_record.hpp"
#include "../platform.hpp"

namespace prismalog
{

class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  // Called from the Listener thread only. May throw SinkWriteError.
  virtual void Write(const LogRecord& record) = 0;

  virtual void Flush() = 0;

  void SetFormatter(std::unique_ptr<IFormatter> formatter)
  {
    formatter_ = std::move(formatter);
  }

  // Sink-local threshold, applied on top of the logger's effective level.
  void SetLevel(LogLevel level) { min_level_ = level; }

  LogLevel Level() const { return min_level_; }

  bool ShouldLog(LogLevel record_level) const { return record_level >= min_level_; }

 protected:
  std::unique_ptr<IFormatter> formatter_;
  LogLevel min_level_ = LogLevel::Debug;
  std::vector<char> format_buf_ = std::vector<char>(PRISMALOG_FORMAT_BUF_SIZE);

  // Formats into format_buf_ and appends '\n', so one line is one buffer.
  // The buffer grows until the whole line fits. Returns the length including
  // the newline, or 0 without a formatter.
  size_t DoFormatLine(const LogRecord& record)
  {
    if (!formatter_)
    {
      return 0;
    }
    size_t wanted = record.Message().size() + PRISMALOG_FORMAT_BUF_SIZE;
    if (format_buf_.size() < wanted)
    {
      format_buf_.resize(wanted);
    }

    size_t len = formatter_->Format(record, format_buf_.data(), format_buf_.size() - 1);
    // Output stopping at the limit may be cut short (e.g. %m used twice).
    while (len + 2 >= format_buf_.size())
    {
      format_buf_.resize(format_buf_.size() * 2);
      len = formatter_->Format(record, format_buf_.data(), format_buf_.size() - 1);
    }
    format_buf_[len] = '\n';
    format_buf_[len + 1] = '\0';
    return len + 1;
  }

  const char* FormattedLine() const { return format_buf_.data(); }
};

}  // namespace prismalog
