#pragma once
#include <cstddef>

#include "../log_record.hpp"

namespace prismalog
{

class IFormatter
{
 public:
  virtual ~IFormatter() = default;

  // Renders one record into buf without a trailing newline and returns the
  // length. Output is NUL terminated and never exceeds buf_size - 1.
  virtual size_t Format(const LogRecord& record, char* buf, size_t buf_size) = 0;
};

}  // namespace prismalog
