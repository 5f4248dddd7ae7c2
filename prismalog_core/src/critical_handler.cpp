#include "prismalog/critical_handler.hpp"

#include <cstdlib>

namespace prismalog
{

namespace
{

void terminate_process(const LogRecord&) { std::_Exit(kCriticalExitStatus); }

}  // namespace

CriticalHandler::CriticalHandler(bool exit_on_critical)
    : exit_on_critical_(exit_on_critical), action_(terminate_process)
{
}

void CriticalHandler::SetAction(Action action)
{
  action_ = action ? std::move(action) : Action(terminate_process);
}

bool CriticalHandler::Observe(const LogRecord& record, const std::function<void()>& flush_all)
{
  if (record.level != LogLevel::Critical || !ExitOnCritical())
  {
    return false;
  }
  if (flush_all)
  {
    flush_all();
  }
  action_(record);
  return true;
}

}  // namespace prismalog
