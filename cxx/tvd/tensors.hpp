#pragma once

#include "sys/threads.hpp"
#include "types.hpp"

namespace tvd {

template <typename T> typename T::Scalar Sum(T const &a)
{
  Eigen::TensorFixedSize<typename T::Scalar, Eigen::Sizes<>> s;
  s.device(tvd::Threads::TensorDevice()) = a.sum();
  return s();
}

/* Real inner product. The threaded version reduces in blocks, so is only reproducible for a fixed thread count. */
template <bool threads, typename T, typename U> inline decltype(auto) Dot(T const &a, U const &b)
{
  using Scalar = typename std::remove_reference<T>::type::Scalar;
  Eigen::TensorFixedSize<Scalar, Eigen::Sizes<>> d0;
  if constexpr (threads) {
    d0.device(tvd::Threads::TensorDevice()) = (a * b).sum();
  } else {
    d0 = (a * b).sum();
  }
  Scalar const d = d0();
  return d;
}

template <bool threads, typename T> inline decltype(auto) Norm2(T const &a) { return Dot<threads>(a, a); }

} // namespace tvd
