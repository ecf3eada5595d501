#ifndef REVGRAD_SATURATING_HPP
#define REVGRAD_SATURATING_HPP
// Gated units from "Neural GPUs Learn Algorithms" https://arxiv.org/abs/1511.08228
#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Revgrad::Activation::Details {
    // Activation value together with a penalty on pre-activations beyond the saturation limit.
    struct Saturated {
        torch::Tensor value{};
        torch::Tensor cost{};
    };

    [[nodiscard]] inline torch::Tensor saturation_cost(const torch::Tensor& input, double limit) {
        return torch::relu(input.abs() - limit).mean();
    }

    // 1.2 * sigmoid(x) - 0.1 cut to [0, 1].
    struct SaturatingSigmoid {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::clamp(1.2 * torch::sigmoid(std::move(input)) - 0.1, 0.0, 1.0);
        }
    };

    struct HardSigmoid {
        double saturation_limit{0.9};

        [[nodiscard]] Saturated operator()(const torch::Tensor& input) const {
            auto shifted = 0.5 * input + 0.5;
            return {torch::clamp_max(torch::relu(shifted), 1.0), saturation_cost(input, saturation_limit)};
        }
    };

    struct HardTanh {
        double saturation_limit{0.9};

        [[nodiscard]] Saturated operator()(const torch::Tensor& input) const {
            return {torch::clamp(input, -1.0, 1.0), saturation_cost(input, saturation_limit)};
        }
    };
}

#endif //REVGRAD_SATURATING_HPP
