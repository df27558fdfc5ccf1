#include "threads.hpp"

#include "../log/log.hpp"

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <unsupported/Eigen/CXX11/Tensor>
#include <unsupported/Eigen/CXX11/ThreadPool>

#include <algorithm>
#include <memory>
#include <thread>

namespace tvd::Threads {

namespace {
/* The device keeps a pointer to the pool, so the two live and die together */
struct Pool
{
  Eigen::ThreadPool       pool;
  Eigen::ThreadPoolDevice device;

  explicit Pool(Index const n)
    : pool(static_cast<int>(n))
    , device(&pool, static_cast<int>(n))
  {
  }
};

std::unique_ptr<Pool> global;

auto Available() -> Index { return std::max<Index>(1, std::thread::hardware_concurrency()); }

auto Global() -> Pool &
{
  if (!global) {
    Log::Debug("Thread", "Starting default pool with {} threads", Available());
    global = std::make_unique<Pool>(Available());
  }
  return *global;
}
} // namespace

auto TensorDevice() -> Eigen::ThreadPoolDevice & { return Global().device; }

auto GlobalThreadCount() -> Index { return Global().pool.NumThreads(); }

void SetGlobalThreadCount(Index const n)
{
  Index const nt = n < 1 ? Available() : n;
  if (global && global->pool.NumThreads() == nt) { return; }
  Log::Debug("Thread", "Starting pool with {} threads", nt);
  global.reset();
  global = std::make_unique<Pool>(nt);
}

} // namespace tvd::Threads
