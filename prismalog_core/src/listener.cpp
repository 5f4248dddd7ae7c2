#include "prismalog/listener.hpp"

#include <cstdio>
#include <exception>

#include <fmt/format.h>

#include "prismalog/errors.hpp"
#include "prismalog/timestamp.hpp"

namespace prismalog {

namespace {

constexpr size_t kBatchSize = 64;

// The record text goes with the report so a failing file sink loses nothing
// even when no console sink is configured.
void report_sink_fault(const LogRecord& record, const char* what) {
    fmt::print(stderr, "prismalog: sink failed writing record {} from '{}': {}\n"
                       "prismalog: [{}] {} - {}\n",
               record.sequence_id, record.LoggerName(), what, to_string(record.level),
               record.LoggerName(), record.Message());
}

} // namespace

Listener::Listener(size_t queue_capacity)
    : queue_(queue_capacity) {}

Listener::~Listener() {
    Stop(std::chrono::milliseconds(0));
}

void Listener::AddSink(std::unique_ptr<ILogSink> sink) {
    if (State() != ListenerState::Stopped || !sink) {
        return;
    }
    sinks_.push_back(std::move(sink));
}

void Listener::Start() {
    if (State() != ListenerState::Stopped) {
        return;
    }
    queue_.Reopen();
    state_.store(ListenerState::Running, std::memory_order_release);
    worker_ = std::thread(&Listener::WorkerLoop, this);
}

size_t Listener::Stop(std::chrono::milliseconds grace, bool write_drop_notice) {
    bool threaded = worker_.joinable();
    if (State() == ListenerState::Stopped && !threaded && queue_.Empty() &&
        queue_.PendingDrops() == 0) {
        return 0;
    }

    uint64_t grace_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(grace).count());
    drain_deadline_ns_.store(monotonic_now_ns() + grace_ns, std::memory_order_relaxed);

    queue_.Close();
    state_.store(ListenerState::Draining, std::memory_order_release);

    if (threaded) {
        worker_.join();
    } else {
        DrainUntilDeadline();
    }

    size_t discarded = queue_.DiscardRemaining();
    if (write_drop_notice) {
        uint64_t undelivered = queue_.TakePendingDrops();
        if (undelivered > 0) {
            Dispatch(MakeDropNotice(undelivered));
        }
    }

    FlushSinks();
    state_.store(ListenerState::Stopped, std::memory_order_release);
    return discarded;
}

size_t Listener::Drain(size_t max_records) {
    size_t count = 0;
    LogRecord record{};
    while (count < max_records && !GraceExpired() && queue_.TryDequeue(record)) {
        Dispatch(record);
        ReleaseRecordMessage(record);
        ++count;
    }
    return count;
}

bool Listener::GraceExpired() const {
    return State() == ListenerState::Draining &&
           monotonic_now_ns() >= drain_deadline_ns_.load(std::memory_order_relaxed);
}

void Listener::DrainUntilDeadline() {
    while (Drain(kBatchSize) > 0) {
    }
}

void Listener::Dispatch(const LogRecord& record) {
    for (auto& sink : sinks_) {
        try {
            sink->Write(record);
        } catch (const SinkWriteError& e) {
            faults_.fetch_add(1, std::memory_order_relaxed);
            report_sink_fault(record, e.what());
        } catch (const std::exception& e) {
            faults_.fetch_add(1, std::memory_order_relaxed);
            report_sink_fault(record, e.what());
        }
    }
    processed_.fetch_add(1, std::memory_order_relaxed);

    critical_.Observe(record, [this]() { FlushSinks(); });
}

void Listener::FlushSinks() {
    for (auto& sink : sinks_) {
        try {
            sink->Flush();
        } catch (const std::exception& e) {
            faults_.fetch_add(1, std::memory_order_relaxed);
            fmt::print(stderr, "prismalog: sink flush failed: {}\n", e.what());
        }
    }
}

void Listener::WorkerLoop() {
    uint32_t idle_count = 0;
    bool dirty = false;
    while (State() == ListenerState::Running) {
        size_t drained = Drain(kBatchSize);
        if (drained > 0) {
            idle_count = 0;
            dirty = true;
        } else {
            if (dirty) {
                FlushSinks();
                dirty = false;
            }
            ++idle_count;
            if (idle_count < 100) {
                // busy spin
            } else if (idle_count < 1000) {
                std::this_thread::yield();
            } else {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
            }
        }
    }
    DrainUntilDeadline();
}

} // namespace prismalog
