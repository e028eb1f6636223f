#pragma once

// C/C++
#include <map>
#include <string>

// torch
#include <torch/torch.h>

namespace biokin {

//! \brief Write named tensors to a torch archive
/*!
 * Keys must not contain '.'.
 */
void save_tensors(const std::map<std::string, torch::Tensor>& tensor_map,
                  const std::string& filename);

//! \brief Read every tensor of an archive written by `save_tensors`
std::map<std::string, torch::Tensor> load_tensors(const std::string& filename);

}  // namespace biokin
