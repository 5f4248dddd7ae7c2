#include "prismalog/sinks/rotating_file_sink.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fmt/format.h>

#include "prismalog/errors.hpp"
#include "prismalog/formatters/pattern_formatter.hpp"

namespace prismalog {

namespace {

void mkdir_recursive(const std::string& path) {
    std::string tmp;
    for (size_t i = 0; i < path.size(); ++i) {
        tmp += path[i];
        if (path[i] == '/' || i == path.size() - 1) {
            ::mkdir(tmp.c_str(), 0755);
        }
    }
}

// A missing source is normal for a short chain; anything else is reported.
void rename_if_exists(const std::string& from, const std::string& to) {
    if (::rename(from.c_str(), to.c_str()) != 0 && errno != ENOENT) {
        fmt::print(stderr, "prismalog: rename '{}' -> '{}' failed: {}\n", from, to,
                   std::strerror(errno));
    }
}

void unlink_if_exists(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        fmt::print(stderr, "prismalog: unlink '{}' failed: {}\n", path, std::strerror(errno));
    }
}

std::string parent_dir(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos || pos == 0) {
        return {};
    }
    return path.substr(0, pos);
}

} // namespace

std::string RotatingFileSink::BackupName(const std::string& base_path, uint32_t index) {
    return fmt::format("{}.{}", base_path, index);
}

RotatingFileSink::RotatingFileSink(std::string base_path, uint64_t threshold_bytes,
                                   uint32_t backup_count, RotationOptions options)
    : base_path_(std::move(base_path))
    , threshold_bytes_(threshold_bytes)
    , backup_count_(backup_count)
    , options_(options)
    , lock_(base_path_ + ".lock")
    , fd_(-1)
    , dev_(0)
    , ino_(0)
    , current_size_(0)
    , writes_since_sync_(0)
    , rotations_(0)
    , lock_timeouts_(0)
{
    if (backup_count_ == 0) {
        options_.rotation_enabled = false;
    }

    std::string dir = parent_dir(base_path_);
    if (!dir.empty()) {
        mkdir_recursive(dir);
    }
    OpenFile();
    if (fd_ < 0) {
        fmt::print(stderr, "prismalog: failed to open '{}': {}\n", base_path_,
                   std::strerror(errno));
    }
}

RotatingFileSink::~RotatingFileSink() {
    if (fd_ >= 0) {
        ::fdatasync(fd_);
    }
    CloseFile();
}

void RotatingFileSink::OpenFile() {
    fd_ = ::open(base_path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return;
    }

    struct stat st{};
    if (::fstat(fd_, &st) == 0) {
        dev_ = st.st_dev;
        ino_ = st.st_ino;
        current_size_ = static_cast<uint64_t>(st.st_size);
    } else {
        dev_ = 0;
        ino_ = 0;
        current_size_ = 0;
    }
}

void RotatingFileSink::CloseFile() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// Another process may have rotated (inode changed) or removed the file.
void RotatingFileSink::RefreshFileState() {
    struct stat st{};
    bool exists = ::stat(base_path_.c_str(), &st) == 0;
    if (fd_ >= 0 && exists && st.st_dev == dev_ && st.st_ino == ino_) {
        current_size_ = static_cast<uint64_t>(st.st_size);
        return;
    }

    CloseFile();
    OpenFile();
    if (fd_ < 0) {
        int err = errno;
        throw SinkWriteError(err, fmt::format("cannot open '{}'", base_path_));
    }
}

void RotatingFileSink::ShiftBackups() {
    CloseFile();

    unlink_if_exists(BackupName(base_path_, backup_count_));
    for (uint32_t i = backup_count_ - 1; i >= 1; --i) {
        rename_if_exists(BackupName(base_path_, i), BackupName(base_path_, i + 1));
    }
    rename_if_exists(base_path_, BackupName(base_path_, 1));

    OpenFile();
    if (fd_ < 0) {
        int err = errno;
        throw SinkWriteError(err, fmt::format("cannot reopen '{}' after rotation", base_path_));
    }
    rotations_.fetch_add(1, std::memory_order_relaxed);
}

void RotatingFileSink::MaybeRotate(size_t incoming) {
    ScopedRotationLock guard(lock_, options_.lock_timeout);
    if (!guard.OwnsLock()) {
        lock_timeouts_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    // Someone may have rotated while we waited for the lock.
    RefreshFileState();
    if (current_size_ > 0 && current_size_ + incoming > threshold_bytes_) {
        ShiftBackups();
        if (options_.rotation_notice) {
            WriteRotationNotice();
        }
    }
}

// Only the process that performed the rotation writes this, under the lock.
// Formatted into its own buffer: format_buf_ still holds the pending line.
void RotatingFileSink::WriteRotationNotice() {
    LogRecord notice = MakeInternalRecord(LogLevel::Info, kRotationLoggerName, "Log file rotated");
    char line[PRISMALOG_FORMAT_BUF_SIZE];
    size_t len = formatter_->Format(notice, line, sizeof(line) - 1);
    line[len++] = '\n';
    AppendLine(line, len);
    current_size_ += len;
}

void RotatingFileSink::AppendLine(const char* data, size_t len) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::write(fd_, data + done, len - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            throw SinkWriteError(err, fmt::format("write to '{}' failed", base_path_));
        }
        done += static_cast<size_t>(n);
    }
}

void RotatingFileSink::Write(const LogRecord& record) {
    if (!ShouldLog(record.level)) {
        return;
    }

    if (!formatter_) {
        formatter_ = std::make_unique<PatternFormatter>(kDefaultFilePattern, false);
    }

    size_t len = DoFormatLine(record);
    if (len == 0) {
        return;
    }

    RefreshFileState();

    if (options_.rotation_enabled && current_size_ > 0 &&
        current_size_ + len > threshold_bytes_) {
        MaybeRotate(len);
    }

    AppendLine(FormattedLine(), len);
    current_size_ += len;

    if (options_.sync_every > 0 && ++writes_since_sync_ >= options_.sync_every) {
        ::fdatasync(fd_);
        writes_since_sync_ = 0;
    }
}

void RotatingFileSink::Flush() {
    if (fd_ >= 0) {
        ::fdatasync(fd_);
    }
    writes_since_sync_ = 0;
}

} // namespace prismalog
