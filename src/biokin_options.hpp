#pragma once

// C/C++
#include <string>

// biokin
#include <biokin/hybrid/hybrid_model.hpp>
#include <biokin/loss/physics_loss.hpp>
#include <biokin/sequence/sequence_builder.hpp>
#include <biokin/train/trainer.hpp>

// arg
#include <biokin/add_arg.h>

namespace YAML {
class Node;
}

namespace biokin {

//! All options of a training run
struct BiokinOptions {
  //! \brief Create a `BiokinOptions` object from a YAML file
  /*!
   * Recognized sections: "kinetics", "integrator", "learner", "sequence",
   * "loss", "training"; top-level "mode" (or "use_learning") selects the
   * hybrid mode and a top-level "seed" seeds both the split and training.
   * Missing entries keep their defaults.
   */
  static BiokinOptions from_yaml(std::string const& filename);
  static BiokinOptions from_yaml(const YAML::Node& root);

  BiokinOptions() = default;

  //! set the seed of the split permutation and of training
  BiokinOptions& seed(uint64_t value) {
    sequence_.seed(value);
    trainer_.seed(value);
    return *this;
  }

  ADD_ARG(HybridModelOptions, model);
  ADD_ARG(SequenceOptions, sequence);
  ADD_ARG(PhysicsLossOptions, loss);
  ADD_ARG(TrainerOptions, trainer);
};

}  // namespace biokin

#undef ADD_ARG
