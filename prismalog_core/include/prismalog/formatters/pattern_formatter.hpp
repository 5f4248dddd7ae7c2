#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "formatter_interface.hpp"

namespace prismalog
{

// Default layouts. The *_NUMERIC variants use the epoch timestamp, which is
// cheaper to render than a calendar date.
inline constexpr std::string_view kDefaultFilePattern =
    "%D %T.%e - %f - %P - %t - %n - [%L] - %m";
inline constexpr std::string_view kDefaultFilePatternNumeric =
    "%E - %f - %P - %t - %n - [%L] - %m";
inline constexpr std::string_view kDefaultConsolePattern = "%D %T.%e - %n - [%C%L%R] - %m";
inline constexpr std::string_view kDefaultConsolePatternNumeric = "%E - %n - [%C%L%R] - %m";

// ANSI escape emitted by %C for a level, empty for Off.
const char* color_for_level(LogLevel level);

class PatternFormatter : public IFormatter
{
 public:
  explicit PatternFormatter(std::string_view pattern = kDefaultConsolePattern,
                            bool enable_color = true);

  size_t Format(const LogRecord& record, char* buf, size_t buf_size) override;

  bool ColorEnabled() const { return enable_color_; }

 private:
  std::string pattern_;
  bool enable_color_;

  enum class OpType : uint8_t
  {
    Literal,
    Date,
    Time,
    Microseconds,
    Epoch,
    LevelFull,
    LevelShort,
    LoggerName,
    FileName,
    FilePath,
    FuncName,
    Line,
    ThreadId,
    ProcessId,
    ThreadName,
    SequenceId,
    Message,
    ColorStart,
    ColorReset
  };

  struct FormatOp
  {
    OpType type;
    std::string literal;
  };

  std::vector<FormatOp> ops_;
  // Set when %D or %T is present; localtime_r then runs once per record.
  bool needs_calendar_ = false;

  static std::optional<OpType> OpForToken(char token);
  void CompilePattern();
};

}  // namespace prismalog
