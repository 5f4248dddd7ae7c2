#pragma once
#include <stdexcept>
#include <string>
#include <system_error>

namespace prismalog
{

// A configuration source (file, environment value, command line value) could
// not be parsed. The resolver falls back to the remaining sources.
class ConfigurationError : public std::runtime_error
{
 public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// A file sink could not open or append to its file. Raised by the sink and
// absorbed by the Listener.
class SinkWriteError : public std::system_error
{
 public:
  SinkWriteError(int err, const std::string& what)
      : std::system_error(err, std::generic_category(), what)
  {
  }
};

}  // namespace prismalog
