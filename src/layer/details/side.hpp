#ifndef REVGRAD_LAYER_SIDE_HPP
#define REVGRAD_LAYER_SIDE_HPP

#include <cstdint>
#include <vector>

#include <torch/torch.h>

namespace Revgrad::Layer::Details {
    // Side inputs join the primary input along `dim` (features for FC, channels for 2-D layers).
    [[nodiscard]] inline torch::Tensor with_side(const torch::Tensor& input, const std::vector<torch::Tensor>& side, std::int64_t dim)
    {
        if (side.empty()) {
            return input;
        }
        std::vector<torch::Tensor> parts{};
        parts.reserve(1 + side.size());
        parts.push_back(input);
        parts.insert(parts.end(), side.begin(), side.end());
        return torch::cat(parts, dim);
    }
}

#endif // REVGRAD_LAYER_SIDE_HPP
