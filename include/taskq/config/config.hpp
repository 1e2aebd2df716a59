#pragma once

#include "taskq/config/system_config.hpp"
#include "taskq/core/error.hpp"

#include <string_view>

namespace taskq {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Rejects timeouts that would make the liveness state machine meaningless
  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;

  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

}  // namespace taskq
