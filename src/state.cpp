// C/C++
#include <algorithm>

// biokin
#include "errors.hpp"
#include "state.hpp"

namespace biokin {

std::vector<std::string> channel_names(int64_t nchannel) {
  std::vector<std::string> names = {"biomass", "substrate", "product"};
  names.resize(std::min<int64_t>(nchannel, kNumKineticChannels));
  for (int64_t i = kNumKineticChannels; i < nchannel; ++i) {
    names.push_back("aux" + std::to_string(i - kNumKineticChannels));
  }
  return names;
}

void validate_experiment(Experiment const& exp, int64_t nchannel) {
  BIOKIN_CHECK(exp.time.defined() && exp.state.defined(), DataShapeError,
               "experiment '", exp.id, "' has no data");

  BIOKIN_CHECK(exp.time.dim() == 1, DataShapeError, "experiment '", exp.id,
               "': time must be 1-D, got ", exp.time.sizes());

  BIOKIN_CHECK(exp.state.dim() == 2, DataShapeError, "experiment '", exp.id,
               "': state must be (n, nchannel), got ", exp.state.sizes());

  BIOKIN_CHECK(exp.state.size(0) == exp.time.size(0), DataShapeError,
               "experiment '", exp.id, "': ", exp.time.size(0),
               " time points but ", exp.state.size(0), " states");

  BIOKIN_CHECK(exp.state.size(1) == nchannel, DataShapeError, "experiment '",
               exp.id, "': nchannel = ", exp.state.size(1),
               ". Expected = ", nchannel);

  BIOKIN_CHECK(torch::isfinite(exp.time).all().item<bool>() &&
                   torch::isfinite(exp.state).all().item<bool>(),
               NumericalError, "experiment '", exp.id,
               "' contains non-finite values");

  if (exp.size() > 1) {
    auto dt = exp.time.diff();
    BIOKIN_CHECK((dt > 0.).all().item<bool>(), ConfigurationError,
                 "experiment '", exp.id,
                 "': time axis is not strictly increasing");
  }
}

int64_t dataset_channels(Dataset const& data) {
  BIOKIN_CHECK(!data.empty(), DataShapeError, "dataset is empty");

  int64_t nchannel = data.begin()->second.nchannel();
  for (auto const& [id, exp] : data) {
    BIOKIN_CHECK(exp.nchannel() == nchannel, DataShapeError, "experiment '",
                 id, "' has ", exp.nchannel(), " channels. Expected = ",
                 nchannel);
  }
  return nchannel;
}

torch::Tensor estimate_substrate(torch::Tensor biomass, double S0,
                                 double Yxs) {
  BIOKIN_CHECK(Yxs > 0., ConfigurationError, "Yxs = ", Yxs, " must be > 0");
  auto X0 = biomass.select(0, 0);
  return (S0 - (biomass - X0) / Yxs).clamp_min(0.);
}

}  // namespace biokin
