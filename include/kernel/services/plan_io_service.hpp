#pragma once

#include <filesystem>
#include <yaml-cpp/yaml.h>

#include "kernel/startup_plan.hpp"

namespace ks {

// Reads and writes startup plans as YAML manifests.
class KEYSTRAP_API PlanIOService {
 public:
  StartupPlan load(const std::filesystem::path& yaml_path) const;
  void save(const StartupPlan& plan, const std::filesystem::path& yaml_path) const;

  static StartupPlan from_yaml(const YAML::Node& root);
  static YAML::Node to_yaml(const StartupPlan& plan);
};

}  // namespace ks
