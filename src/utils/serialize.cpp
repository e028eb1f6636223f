// torch
#include <torch/serialize.h>

// biokin
#include "serialize.hpp"

namespace biokin {

void save_tensors(const std::map<std::string, torch::Tensor>& tensor_map,
                  const std::string& filename) {
  torch::serialize::OutputArchive archive;
  for (const auto& pair : tensor_map) {
    TORCH_CHECK(pair.first.find('.') == std::string::npos,
                "tensor key '", pair.first, "' must not contain '.'");
    archive.write(pair.first, pair.second);
  }
  archive.save_to(filename);
}

std::map<std::string, torch::Tensor> load_tensors(const std::string& filename) {
  std::map<std::string, torch::Tensor> data;

  torch::serialize::InputArchive archive;
  archive.load_from(filename);

  for (const auto& key : archive.keys()) {
    torch::Tensor tensor;
    if (archive.try_read(key, tensor)) {
      data[key] = tensor;
    }
  }

  return data;
}

}  // namespace biokin
