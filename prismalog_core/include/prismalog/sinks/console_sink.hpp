#pragma once
#include <cstdio>
#include <optional>

#include "sink_interface.hpp"

namespace prismalog
{

// WARNING and above go to the error stream, everything else to the output
// stream. One fwrite per line.
class ConsoleSink : public ILogSink
{
 public:
  // force_color: nullopt colors only when the stream is a terminal.
  explicit ConsoleSink(std::optional<bool> force_color = std::nullopt, FILE* out = stdout,
                       FILE* err = stderr);

  void Write(const LogRecord& record) override;
  void Flush() override;

  bool UsesColor() const { return use_color_; }

 private:
  FILE* out_;
  FILE* err_;
  bool use_color_;
};

}  // namespace prismalog
