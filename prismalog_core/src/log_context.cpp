#include "prismalog/log_context.hpp"
#include "prismalog/platform.hpp"
#include <pthread.h>
#include <unistd.h>
#include <cstring>

#if defined(PRISMALOG_PLATFORM_LINUX)
#include <sys/syscall.h>
#endif

namespace prismalog {

thread_local char LogContext::tls_thread_name_[32] = {};
thread_local uint32_t LogContext::tls_thread_id_ = 0;
thread_local bool LogContext::tls_thread_id_cached_ = false;

namespace {

void install_fork_handler_once(void (*child_handler)()) {
    static const int registered = ::pthread_atfork(nullptr, nullptr, child_handler);
    (void)registered;
}

} // namespace

void LogContext::SetThreadName(const char* name) {
    if (!name) return;
    std::strncpy(tls_thread_name_, name, sizeof(tls_thread_name_) - 1);
    tls_thread_name_[sizeof(tls_thread_name_) - 1] = '\0';
}

const char* LogContext::GetThreadName() {
    return tls_thread_name_;
}

uint32_t LogContext::GetThreadId() {
    if (!tls_thread_id_cached_) {
        install_fork_handler_once(&LogContext::ResetAfterFork);
#if defined(PRISMALOG_PLATFORM_LINUX)
        tls_thread_id_ = static_cast<uint32_t>(::syscall(SYS_gettid));
#elif defined(PRISMALOG_PLATFORM_MACOS)
        uint64_t tid = 0;
        ::pthread_threadid_np(nullptr, &tid);
        tls_thread_id_ = static_cast<uint32_t>(tid);
#endif
        tls_thread_id_cached_ = true;
    }
    return tls_thread_id_;
}

uint32_t LogContext::GetProcessId() {
    return static_cast<uint32_t>(::getpid());
}

void LogContext::ResetAfterFork() {
    // Runs in the child, on the thread that called fork().
    tls_thread_id_cached_ = false;
    tls_thread_id_ = 0;
}

void LogContext::FillThreadInfo(LogRecord& record) {
    record.process_id = GetProcessId();
    record.thread_id = GetThreadId();
    std::memcpy(record.thread_name, tls_thread_name_, sizeof(record.thread_name));
}

} // namespace prismalog
