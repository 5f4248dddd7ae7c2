#include "prismalog/sinks/console_sink.hpp"

#include <unistd.h>

#include <cerrno>

#include "prismalog/errors.hpp"
#include "prismalog/formatters/pattern_formatter.hpp"

namespace prismalog
{

ConsoleSink::ConsoleSink(std::optional<bool> force_color, FILE* out, FILE* err)
    : out_(out), err_(err)
{
  if (force_color.has_value())
  {
    use_color_ = force_color.value();
  }
  else
  {
    bool out_is_tty = ::isatty(::fileno(out_)) != 0;
    bool err_is_tty = ::isatty(::fileno(err_)) != 0;
    use_color_ = out_is_tty && err_is_tty;
  }
}

void ConsoleSink::Write(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }

  if (!formatter_)
  {
    formatter_ = std::make_unique<PatternFormatter>(kDefaultConsolePattern, use_color_);
  }

  size_t len = DoFormatLine(record);
  if (len == 0)
  {
    return;
  }

  FILE* target = (record.level >= LogLevel::Warning) ? err_ : out_;
  if (std::fwrite(FormattedLine(), 1, len, target) != len)
  {
    int err = errno;
    std::clearerr(target);
    throw SinkWriteError(err, "console write failed");
  }
}

void ConsoleSink::Flush()
{
  std::fflush(out_);
  std::fflush(err_);
}

}  // namespace prismalog
