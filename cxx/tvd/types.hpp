#pragma once

// This doesn't help with the integer tensors but catches uninitialised reals
#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <unsupported/Eigen/CXX11/Tensor>

#include <array>
#include <cstdint>
#include <functional>

using Index = Eigen::Index;

namespace tvd {

using Real = double;

template <int N> using ReN = Eigen::Tensor<Real, N>;
using Re1 = ReN<1>;
using Re2 = ReN<2>; // Images, (width, height)
using Re3 = ReN<3>;

using Re0 = Eigen::TensorFixedSize<Real, Eigen::Sizes<>>; // Annoying return type for reductions

using U8N3 = Eigen::Tensor<uint8_t, 3>; // Packed pixels, (channel, width, height)

template <int Rank> using Sz = typename Eigen::DSizes<Index, Rank>;
using Sz1 = Sz<1>;
using Sz2 = Sz<2>;
using Sz3 = Sz<3>;

} // namespace tvd
