#pragma once
#include <functional>
#include <string_view>

#include "sink_interface.hpp"

namespace prismalog
{

// Hands each accepted record, and its formatted line when a formatter is set,
// to a user callback. Runs on the Listener thread. record.Message() is only
// valid during the call; copy the text to keep it.
class CallbackSink : public ILogSink
{
 public:
  using Callback = std::function<void(const LogRecord&, std::string_view line)>;

  explicit CallbackSink(Callback cb);

  void Write(const LogRecord& record) override;
  void Flush() override;

 private:
  Callback callback_;
};

}  // namespace prismalog
