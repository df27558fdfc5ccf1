#pragma once

#include "../types.hpp"

namespace tvd::Threads {

/* Shared device for every threaded tensor expression, created on first use */
auto TensorDevice() -> Eigen::ThreadPoolDevice &;

auto GlobalThreadCount() -> Index;
/* n < 1 means one thread per hardware core. Replacing the pool invalidates any device reference held elsewhere. */
void SetGlobalThreadCount(Index const n);

} // namespace tvd::Threads
