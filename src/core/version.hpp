#pragma once

namespace elrelay {

constexpr const char* SERVER_NAME = "element-context-capture";
constexpr const char* SERVER_VERSION = "1.0.0";

} // namespace elrelay
