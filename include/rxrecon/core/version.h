#pragma once

namespace rxrecon::core {

// kBuildVersion is reported by the CLI and recorded in RunStarted audit payloads.
constexpr const char* kBuildVersion = "0.1";

}  // namespace rxrecon::core
