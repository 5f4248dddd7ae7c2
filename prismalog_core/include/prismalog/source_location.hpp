#pragma once
#include <cstdint>

namespace prismalog {

struct SourceLocation {
    const char* file_path;
    const char* file_name;
    const char* function_name;
    uint32_t    line;

    static constexpr const char* extract_filename(const char* path) {
        const char* name = path;
        for (const char* p = path; *p != '\0'; ++p) {
            if (*p == '/' || *p == '\\') name = p + 1;
        }
        return name;
    }

    static constexpr SourceLocation none() {
        return SourceLocation{"", "", "", 0u};
    }
};

// Expanded at the call site, so wrapper frames never show up in a record.
#define PRISMALOG_CURRENT_LOCATION() \
    ::prismalog::SourceLocation { \
        __FILE__, \
        ::prismalog::SourceLocation::extract_filename(__FILE__), \
        __func__, \
        static_cast<uint32_t>(__LINE__) \
    }

} // namespace prismalog
