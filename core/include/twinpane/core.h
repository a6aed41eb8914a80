// core.h — версия ядра TwinPane

#pragma once

namespace TwinPane {

constexpr const char* VERSION = "0.1.0";

} // namespace TwinPane
