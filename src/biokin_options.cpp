// yaml
#include <yaml-cpp/yaml.h>

// biokin
#include "biokin_options.hpp"

namespace biokin {

BiokinOptions BiokinOptions::from_yaml(std::string const& filename) {
  return from_yaml(YAML::LoadFile(filename));
}

BiokinOptions BiokinOptions::from_yaml(const YAML::Node& root) {
  BiokinOptions options;

  options.model(HybridModelOptions::from_yaml(root));

  if (root["sequence"]) {
    options.sequence(SequenceOptions::from_yaml(root["sequence"]));
  }

  if (root["loss"]) {
    options.loss(PhysicsLossOptions::from_yaml(root["loss"]));
  }

  if (root["training"]) {
    options.trainer(TrainerOptions::from_yaml(root["training"]));
  }

  if (root["seed"]) {
    options.seed(root["seed"].as<uint64_t>());
  }

  return options;
}

}  // namespace biokin
