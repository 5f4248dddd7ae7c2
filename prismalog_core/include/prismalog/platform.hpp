#pragma once

// ===== Platform detection =====
#if defined(__linux__)
    #define PRISMALOG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define PRISMALOG_PLATFORM_MACOS 1
#endif

#if !defined(PRISMALOG_PLATFORM_LINUX) && !defined(PRISMALOG_PLATFORM_MACOS)
    #error "prismalog requires a POSIX platform (flock, O_APPEND, fork-safe pids)"
#endif

// ===== Delivery queue default capacity (rounded up to a power of 2) =====
#ifndef PRISMALOG_DEFAULT_QUEUE_CAPACITY
    #define PRISMALOG_DEFAULT_QUEUE_CAPACITY 4096
#endif

// ===== Inline message capacity; longer messages are carried on the heap =====
#ifndef PRISMALOG_MAX_MSG_LEN
    #define PRISMALOG_MAX_MSG_LEN 1024
#endif

// ===== Maximum dotted logger name length =====
#ifndef PRISMALOG_MAX_NAME_LEN
    #define PRISMALOG_MAX_NAME_LEN 96
#endif

// ===== Initial per-sink line buffer; grows for longer lines =====
#ifndef PRISMALOG_FORMAT_BUF_SIZE
    #define PRISMALOG_FORMAT_BUF_SIZE (PRISMALOG_MAX_MSG_LEN + 1024)
#endif

// ===== cacheline size =====
#ifndef PRISMALOG_CACHELINE_SIZE
    #define PRISMALOG_CACHELINE_SIZE 64
#endif
