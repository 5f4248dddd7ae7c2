#include "prismalog/formatters/pattern_formatter.hpp"
#include "prismalog/log_level.hpp"
#include "prismalog/timestamp.hpp"
#include <algorithm>
#include <cstring>
#include <fmt/format.h>
#include <utility>

namespace prismalog {

namespace {

constexpr std::string_view kColorReset = "\033[0m";

// Bounded appender over the caller's buffer; always leaves room for the NUL.
class LineWriter {
public:
    LineWriter(char* buf, size_t buf_size) : buf_(buf), limit_(buf_size - 1) {}

    void Append(std::string_view text) {
        if (pos_ >= limit_) return;
        size_t n = std::min(text.size(), limit_ - pos_);
        std::memcpy(buf_ + pos_, text.data(), n);
        pos_ += n;
    }

    void AppendCString(const char* text) {
        if (text) Append(text);
    }

    template <typename... Args>
    void AppendFormatted(fmt::format_string<Args...> format, Args&&... args) {
        if (pos_ >= limit_) return;
        auto result = fmt::format_to_n(buf_ + pos_, limit_ - pos_, format,
                                       std::forward<Args>(args)...);
        pos_ += std::min(result.size, limit_ - pos_);
    }

    size_t Finish() {
        buf_[pos_] = '\0';
        return pos_;
    }

private:
    char* buf_;
    size_t limit_;
    size_t pos_ = 0;
};

} // namespace

const char* color_for_level(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "\033[94m";
        case LogLevel::Info:     return "\033[92m";
        case LogLevel::Warning:  return "\033[93m";
        case LogLevel::Error:    return "\033[91m";
        case LogLevel::Critical: return "\033[91m\033[1m";
        default:                 return "";
    }
}

PatternFormatter::PatternFormatter(std::string_view pattern, bool enable_color)
    : pattern_(pattern), enable_color_(enable_color) {
    CompilePattern();
}

std::optional<PatternFormatter::OpType> PatternFormatter::OpForToken(char token) {
    switch (token) {
        case 'D': return OpType::Date;
        case 'T': return OpType::Time;
        case 'e': return OpType::Microseconds;
        case 'E': return OpType::Epoch;
        case 'L': return OpType::LevelFull;
        case 'l': return OpType::LevelShort;
        case 'n': return OpType::LoggerName;
        case 'f': return OpType::FileName;
        case 'F': return OpType::FilePath;
        case 'N': return OpType::FuncName;
        case '#': return OpType::Line;
        case 't': return OpType::ThreadId;
        case 'P': return OpType::ProcessId;
        case 'k': return OpType::ThreadName;
        case 'q': return OpType::SequenceId;
        case 'm': return OpType::Message;
        case 'C': return OpType::ColorStart;
        case 'R': return OpType::ColorReset;
        default:  return std::nullopt;
    }
}

// "%%" is a literal '%'; an unknown "%x" is kept verbatim.
void PatternFormatter::CompilePattern() {
    ops_.clear();
    needs_calendar_ = false;
    std::string literal;

    for (size_t i = 0; i < pattern_.size(); ++i) {
        char c = pattern_[i];
        if (c != '%' || i + 1 == pattern_.size()) {
            literal += c;
            continue;
        }
        char token = pattern_[++i];
        std::optional<OpType> op = OpForToken(token);
        if (!op) {
            if (token != '%') literal += '%';
            literal += token;
            continue;
        }
        if (!literal.empty()) {
            ops_.push_back({OpType::Literal, std::move(literal)});
            literal.clear();
        }
        if (*op == OpType::Date || *op == OpType::Time) {
            needs_calendar_ = true;
        }
        ops_.push_back({*op, {}});
    }
    if (!literal.empty()) {
        ops_.push_back({OpType::Literal, std::move(literal)});
    }
}

size_t PatternFormatter::Format(const LogRecord& record, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;

    LineWriter out(buf, buf_size);
    WallClockParts wall;
    if (needs_calendar_) {
        wall = split_wall_clock(record.wall_clock_ns);
    }

    for (const auto& op : ops_) {
        switch (op.type) {
            case OpType::Literal:
                out.Append(op.literal);
                break;
            case OpType::Date:
                out.AppendFormatted("{:04}-{:02}-{:02}", wall.local.tm_year + 1900,
                                    wall.local.tm_mon + 1, wall.local.tm_mday);
                break;
            case OpType::Time:
                out.AppendFormatted("{:02}:{:02}:{:02}", wall.local.tm_hour,
                                    wall.local.tm_min, wall.local.tm_sec);
                break;
            case OpType::Microseconds:
                out.AppendFormatted("{:06}", (record.wall_clock_ns / 1000ULL) % 1'000'000ULL);
                break;
            case OpType::Epoch: {
                char tmp[32];
                out.Append({tmp, format_epoch(record.wall_clock_ns, tmp, sizeof(tmp))});
                break;
            }
            case OpType::LevelFull:
                out.Append(to_string(record.level));
                break;
            case OpType::LevelShort: {
                char c = to_short_char(record.level);
                out.Append({&c, 1});
                break;
            }
            case OpType::LoggerName:
                out.Append(record.LoggerName());
                break;
            case OpType::FileName:
                out.AppendCString(record.file_name);
                break;
            case OpType::FilePath:
                out.AppendCString(record.file_path);
                break;
            case OpType::FuncName:
                out.AppendCString(record.function_name);
                break;
            case OpType::Line:
                out.AppendFormatted("{}", record.line);
                break;
            case OpType::ThreadId:
                out.AppendFormatted("{}", record.thread_id);
                break;
            case OpType::ProcessId:
                out.AppendFormatted("{}", record.process_id);
                break;
            case OpType::ThreadName:
                out.Append({record.thread_name, strnlen(record.thread_name, sizeof(record.thread_name))});
                break;
            case OpType::SequenceId:
                out.AppendFormatted("{}", record.sequence_id);
                break;
            case OpType::Message:
                out.Append(record.Message());
                break;
            case OpType::ColorStart:
                if (enable_color_) out.AppendCString(color_for_level(record.level));
                break;
            case OpType::ColorReset:
                if (enable_color_) out.Append(kColorReset);
                break;
        }
    }
    return out.Finish();
}

} // namespace prismalog
