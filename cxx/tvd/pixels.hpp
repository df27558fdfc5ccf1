#pragma once

#include "channels.hpp"
#include "types.hpp"

#include <vector>

/*
 * Conversion between packed 8-bit pixel buffers, as produced by image decoders, and the real-valued tensors the solvers
 * work on. Buffers are row-major and interleaved (R, G, B, R, G, B...). In the tensors x runs along axis 0 and y along
 * axis 1, so a width × height image becomes a (width, height) matrix.
 */
namespace tvd::Pixels {

enum struct Channel : Index
{
  Red = 0,
  Green = 1,
  Blue = 2
};

/* Clamp to [0, 255] then truncate towards zero. NaN maps to 0. */
auto Narrow(Real const v) -> uint8_t;

auto ToMatrix(std::vector<uint8_t> const &grey, Index const width, Index const height) -> Re2;
auto FromMatrix(Re2 const &m) -> std::vector<uint8_t>;

auto ToChannels(std::vector<uint8_t> const &rgb, Index const width, Index const height) -> Channels;
auto FromChannels(Channels const &c) -> std::vector<uint8_t>;

auto ExtractChannel(std::vector<uint8_t> const &rgb, Index const width, Index const height, Channel const c) -> Re2;
void UpdateChannel(std::vector<uint8_t> &rgb, Index const width, Index const height, Channel const c, Re2 const &m);

} // namespace tvd::Pixels
