#include "prismalog/sinks/callback_sink.hpp"

namespace prismalog {

CallbackSink::CallbackSink(Callback cb)
    : callback_(std::move(cb)) {}

void CallbackSink::Write(const LogRecord& record) {
    if (!ShouldLog(record.level) || !callback_) {
        return;
    }
    size_t len = DoFormatLine(record);
    // Line handed over without its trailing newline.
    std::string_view line(FormattedLine(), len > 0 ? len - 1 : 0);
    callback_(record, line);
}

void CallbackSink::Flush() {
}

} // namespace prismalog
