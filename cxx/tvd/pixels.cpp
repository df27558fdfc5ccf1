#include "pixels.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>

namespace tvd::Pixels {

namespace {
using U8Map = Eigen::TensorMap<U8N3>;
using U8CMap = Eigen::TensorMap<U8N3 const>;
using U8N2 = Eigen::Tensor<uint8_t, 2>;

auto ChannelIndex(Channel const c) -> Index
{
  auto const ic = static_cast<Index>(c);
  if (ic < 0 || ic >= Channels::NC) { throw Log::Failure("Pixels", "Channel index {} out of range", ic); }
  return ic;
}

/*
 * Chipping the interleaved channel axis and changing the scalar type in one expression trips Eigen's block evaluator
 * (only the first row is filled). The chip is always evaluated in its own type before casting.
 */
auto Unpack(U8CMap const &buf, Index const ic) -> Re2
{
  U8N2 const u = buf.chip<0>(ic);
  Re2        m(u.dimensions());
  m = u.cast<Real>();
  return m;
}

void Pack(Re2 const &m, U8Map &buf, Index const ic)
{
  U8N2 u(m.dimensions());
  u = m.unaryExpr([](Real const v) { return Narrow(v); });
  buf.chip<0>(ic) = u;
}

void CheckBuffer(std::vector<uint8_t> const &buf, Index const nc, Index const width, Index const height)
{
  if (width < 1 || height < 1) { throw Log::Failure("Pixels", "Invalid image size {}x{}", width, height); }
  if ((Index)buf.size() != nc * width * height) {
    throw ShapeMismatch("Pixels", "Buffer has {} bytes, expected {} for {}x{}x{}", buf.size(), nc * width * height, width, height,
                        nc);
  }
}
} // namespace

auto Narrow(Real const v) -> uint8_t
{
  if (std::isnan(v)) { return 0; }
  return static_cast<uint8_t>(std::clamp(v, 0., 255.));
}

auto ToMatrix(std::vector<uint8_t> const &grey, Index const w, Index const h) -> Re2
{
  CheckBuffer(grey, 1, w, h);
  U8CMap const buf(grey.data(), 1, w, h);
  return Unpack(buf, 0);
}

auto FromMatrix(Re2 const &m) -> std::vector<uint8_t>
{
  std::vector<uint8_t> grey(m.size());
  U8Map                buf(grey.data(), 1, m.dimension(0), m.dimension(1));
  Pack(m, buf, 0);
  return grey;
}

auto ExtractChannel(std::vector<uint8_t> const &rgb, Index const w, Index const h, Channel const c) -> Re2
{
  auto const ic = ChannelIndex(c);
  CheckBuffer(rgb, Channels::NC, w, h);
  U8CMap const buf(rgb.data(), Channels::NC, w, h);
  return Unpack(buf, ic);
}

void UpdateChannel(std::vector<uint8_t> &rgb, Index const w, Index const h, Channel const c, Re2 const &m)
{
  auto const ic = ChannelIndex(c);
  CheckBuffer(rgb, Channels::NC, w, h);
  CheckShapes<2>("Pixels", m.dimensions(), Sz2{w, h});
  U8Map buf(rgb.data(), Channels::NC, w, h);
  Pack(m, buf, ic);
}

auto ToChannels(std::vector<uint8_t> const &rgb, Index const w, Index const h) -> Channels
{
  return Channels(ExtractChannel(rgb, w, h, Channel::Red), ExtractChannel(rgb, w, h, Channel::Green),
                  ExtractChannel(rgb, w, h, Channel::Blue));
}

auto FromChannels(Channels const &c) -> std::vector<uint8_t>
{
  auto const           sh = c.shape();
  std::vector<uint8_t> rgb(Channels::NC * sh[0] * sh[1]);
  UpdateChannel(rgb, sh[0], sh[1], Channel::Red, c[0]);
  UpdateChannel(rgb, sh[0], sh[1], Channel::Green, c[1]);
  UpdateChannel(rgb, sh[0], sh[1], Channel::Blue, c[2]);
  return rgb;
}

} // namespace tvd::Pixels
