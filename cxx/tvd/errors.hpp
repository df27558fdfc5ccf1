#pragma once

#include "log/log.hpp"

namespace tvd {

/* Operands of a binary operation, or the channels of a bundle, had different shapes */
struct ShapeMismatch final : Log::Failure
{
  using Log::Failure::Failure;
};

/* A difference was requested along an axis the tensor does not have */
struct AxisOutOfBounds final : Log::Failure
{
  using Log::Failure::Failure;
};

/* A difference was requested along an axis of length 1 (or 0), where a shift is undefined */
struct AxisTooShort final : Log::Failure
{
  using Log::Failure::Failure;
};

} // namespace tvd
