#ifndef REVGRAD_INITIALIZATION_APPLY_HPP
#define REVGRAD_INITIALIZATION_APPLY_HPP
#include <cmath>

#include <torch/torch.h>

#include "initialization.hpp"

namespace Revgrad::Initialization::Details {
    namespace detail {
        // Biases and other rank-1 tensors have no fan-in/fan-out pair; the fan based schemes fall back to these.
        inline void uniform_by_size(torch::Tensor& tensor)
        {
            const auto fan = tensor.numel() > 0 ? static_cast<double>(tensor.size(0)) : 1.0;
            const auto bound = 1.0 / std::sqrt(fan);
            torch::nn::init::uniform_(tensor, -bound, bound);
        }
    }

    // Fills `tensor` in place. Expects to be called on a freshly allocated tensor that does not require grad yet.
    inline void apply_tensor_initialization(torch::Tensor& tensor, const Descriptor& descriptor)
    {
        torch::NoGradGuard no_grad;
        const bool has_fans = tensor.dim() >= 2;

        switch (descriptor.type) {
            case Type::XavierNormal:
                if (has_fans) {
                    torch::nn::init::xavier_normal_(tensor);
                } else {
                    detail::uniform_by_size(tensor);
                }
                break;
            case Type::XavierUniform:
                if (has_fans) {
                    torch::nn::init::xavier_uniform_(tensor);
                } else {
                    detail::uniform_by_size(tensor);
                }
                break;
            case Type::HeNormal:
                if (has_fans) {
                    torch::nn::init::kaiming_normal_(tensor, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                } else {
                    detail::uniform_by_size(tensor);
                }
                break;
            case Type::HeUniform:
                if (has_fans) {
                    torch::nn::init::kaiming_uniform_(tensor, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                } else {
                    detail::uniform_by_size(tensor);
                }
                break;
            case Type::Zeros:
                torch::nn::init::zeros_(tensor);
                break;
            case Type::Constant:
                torch::nn::init::constant_(tensor, descriptor.value);
                break;
            case Type::Orthogonal:
                if (has_fans) {
                    torch::nn::init::orthogonal_(tensor);
                } else {
                    detail::uniform_by_size(tensor);
                }
                break;
            case Type::Default:
            default:
                // Same scheme torch::nn::Linear / Conv use for their weights.
                if (has_fans) {
                    torch::nn::init::kaiming_uniform_(tensor, /*a=*/std::sqrt(5.0));
                } else {
                    detail::uniform_by_size(tensor);
                }
                break;
        }
    }
}
#endif // REVGRAD_INITIALIZATION_APPLY_HPP
