#ifndef REVGRAD_ACTIVATION_APPLY_HPP
#define REVGRAD_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"
#include "details/saturating.hpp"

namespace Revgrad::Activation::Details {
    // Saturation costs of HardSigmoid / HardTanh are dropped here; call the functors directly to keep them.
    inline torch::Tensor apply(const ::Revgrad::Activation::Descriptor& descriptor, torch::Tensor input) {
        switch (descriptor.type) {
            case ::Revgrad::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Revgrad::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Revgrad::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Revgrad::Activation::Type::GeLU:
                return torch::gelu(std::move(input));
            case ::Revgrad::Activation::Type::SiLU:
                return torch::silu(std::move(input));
            case ::Revgrad::Activation::Type::SaturatingSigmoid:
                return SaturatingSigmoid{}(std::move(input));
            case ::Revgrad::Activation::Type::HardSigmoid:
                return HardSigmoid{descriptor.saturation_limit}(input).value;
            case ::Revgrad::Activation::Type::HardTanh:
                return HardTanh{descriptor.saturation_limit}(input).value;
            case ::Revgrad::Activation::Type::Identity:
                return input;
            default:
                return input;
        }
    }
}
#endif // REVGRAD_ACTIVATION_APPLY_HPP
