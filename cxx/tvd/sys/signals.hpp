#pragma once

namespace tvd {

void PushInterrupt();
void PopInterrupt();
auto InterruptReceived() -> bool;
void ClearInterrupt();

} // namespace tvd
