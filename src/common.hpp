//
// Created by ppwang on 2022/5/8.
//

#ifndef NGP_FIELDS__COMMON_HPP_
#define NGP_FIELDS__COMMON_HPP_

#include <tiny-cuda-nn/cpp_api.h>
#include <torch/torch.h>

using Slc = torch::indexing::Slice;
const auto CUDAFloat = torch::TensorOptions().dtype(torch::kFloat32).device(torch::kCUDA);
const auto CPUFloat = torch::TensorOptions().dtype(torch::kFloat32).device(torch::kCPU);

inline torch::ScalarType to_torch_dtype(tcnn::cpp::Precision precision)
{
  switch (precision) {
    case tcnn::cpp::Precision::Fp32:
      return torch::kFloat32;
    case tcnn::cpp::Precision::Fp16:
      return torch::kFloat16;
  }
  throw std::runtime_error("Unknown tiny-cuda-nn precision");
}

#endif  // NGP_FIELDS__COMMON_HPP_
