#pragma once

// C/C++
#include <map>
#include <string>
#include <vector>

// torch
#include <torch/torch.h>

namespace biokin {

//! channel layout of the state vector; auxiliary channels follow PRODUCT
enum Channel : int64_t { BIOMASS = 0, SUBSTRATE = 1, PRODUCT = 2 };

//! number of channels carried by the mechanistic model
constexpr int64_t kNumKineticChannels = 3;

//! default channel names, extended with "aux<i>" for auxiliary channels
std::vector<std::string> channel_names(int64_t nchannel);

//! One batch run as handed over by the data-loading collaborator
struct Experiment {
  Experiment() = default;
  Experiment(std::string id_, torch::Tensor time_, torch::Tensor state_)
      : id(std::move(id_)), time(std::move(time_)), state(std::move(state_)) {}

  //! number of observations
  int64_t size() const { return time.defined() ? time.size(0) : 0; }

  //! number of channels
  int64_t nchannel() const { return state.defined() ? state.size(-1) : 0; }

  //! experiment identifier
  std::string id;

  //! observation times, shape (n,)
  torch::Tensor time;

  //! observed states, shape (n, nchannel)
  torch::Tensor state;
};

//! experiments keyed by id
using Dataset = std::map<std::string, Experiment>;

//! \brief Check that an experiment is well formed
/*!
 * Raises DataShapeError if time/state shapes disagree or the channel count
 * differs from `nchannel`, ConfigurationError if the time axis is not
 * strictly increasing, NumericalError on non-finite values.
 */
void validate_experiment(Experiment const& exp, int64_t nchannel);

//! \brief Common channel count of all experiments in a dataset
/*!
 * Raises DataShapeError if the dataset is empty or the experiments disagree.
 */
int64_t dataset_channels(Dataset const& data);

//! \brief Substitute for a missing substrate channel
/*!
 * S = S0 - (X - X0) / Yxs, clipped at zero, with X0 the first biomass
 * observation.
 *
 * \param biomass biomass observations, shape (n,)
 * \return estimated substrate, shape (n,)
 */
torch::Tensor estimate_substrate(torch::Tensor biomass, double S0 = 10.0,
                                 double Yxs = 0.5);

}  // namespace biokin
