#include <prismalog/logger.hpp>
#include <sys/wait.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

// Forks N workers that all append to one rotating file. Logging is set up
// after fork in each child; rotation is coordinated through "<file>.lock".
//
//   prismalog_multiprocess_example [workers] --log-dir /tmp/mp --log-level DEBUG

namespace
{

int run_worker(int index, int argc, char** argv)
{
  prismalog::InitializeFromCommandLine(argc, argv);
  auto& log = prismalog::GetLogger("mp.worker" + std::to_string(index));

  std::vector<std::thread> threads;
  for (int t = 0; t < 2; ++t)
  {
    threads.emplace_back(
        [&log, t]()
        {
          for (int i = 0; i < 2000; ++i)
          {
            LOG_INFO(log, "thread {} record {}", t, i);
          }
        });
  }
  for (auto& th : threads)
  {
    th.join();
  }

  size_t discarded = prismalog::Shutdown();
  return discarded == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv)
{
  int workers = 4;
  if (argc > 1 && argv[1][0] != '-')
  {
    workers = std::atoi(argv[1]);
  }

  std::vector<pid_t> children;
  for (int i = 0; i < workers; ++i)
  {
    pid_t pid = fork();
    if (pid < 0)
    {
      std::perror("fork");
      break;
    }
    if (pid == 0)
    {
      std::_Exit(run_worker(i, argc, argv));
    }
    children.push_back(pid);
  }

  int failures = 0;
  for (pid_t pid : children)
  {
    int status = 0;
    if (waitpid(pid, &status, 0) != pid || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
      ++failures;
    }
  }

  prismalog::InitializeFromCommandLine(argc, argv);
  auto& log = prismalog::GetLogger("mp.parent");
  LOG_INFO(log, "{} workers finished, {} failed", children.size(), failures);
  prismalog::Shutdown();
  return failures == 0 ? 0 : 1;
}
