#pragma once

// C/C++
#include <algorithm>
#include <string>

// external
#include <gtest/gtest.h>

// torch
#include <torch/torch.h>

struct Parameters {
  torch::DeviceType device_type;
  torch::Dtype dtype;
};

//! Fixture running a test once per (device, dtype) pair; unavailable devices
//! are skipped
class DeviceTest : public testing::TestWithParam<Parameters> {
 protected:
  torch::Device device = torch::kCPU;
  torch::Dtype dtype = torch::kFloat64;

  void SetUp() override {
    auto param = GetParam();
    if (param.device_type == torch::kCUDA && !torch::cuda::is_available()) {
      GTEST_SKIP() << "CUDA is not available";
    }
    device = torch::Device(param.device_type);
    dtype = param.dtype;
  }

  torch::TensorOptions options() const {
    return torch::device(device).dtype(dtype);
  }
};

#define BIOKIN_INSTANTIATE_DEVICE_TESTS(fixture)                             \
  INSTANTIATE_TEST_SUITE_P(                                                  \
      DeviceTests, fixture,                                                  \
      testing::Values(Parameters{torch::kCPU, torch::kFloat64},              \
                      Parameters{torch::kCUDA, torch::kFloat64}),            \
      [](const testing::TestParamInfo<fixture::ParamType>& info) {           \
        std::string name = torch::Device(info.param.device_type).str();      \
        name += "_";                                                         \
        name += torch::toString(info.param.dtype);                           \
        std::replace(name.begin(), name.end(), '.', '_');                    \
        return name;                                                         \
      })
