#ifndef REVGRAD_GRADIENT_ENGINE_HPP
#define REVGRAD_GRADIENT_ENGINE_HPP
/*
 * Thin layer over libtorch autograd used by every custom gradient in the library.
 *  - stop_gradient : detach, optionally re-rooting the value as a fresh leaf that tracks gradients.
 *  - differentiate : torch::autograd::grad that tolerates outputs without history, targets that do
 *                    not require grad and targets that are unreachable (all yield undefined tensors).
 *  - accumulate    : elementwise sum where an undefined tensor counts as zero.
 */

#include <cstddef>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"

namespace Revgrad::Gradient {
    [[nodiscard]] inline torch::Tensor stop_gradient(const torch::Tensor& value, bool track = false)
    {
        if (!value.defined()) {
            return value;
        }
        auto detached = value.detach();
        if (track && (detached.is_floating_point() || detached.is_complex())) {
            detached.requires_grad_(true);
        }
        return detached;
    }

    [[nodiscard]] inline std::vector<torch::Tensor> stop_gradient(const std::vector<torch::Tensor>& values, bool track = false)
    {
        std::vector<torch::Tensor> detached{};
        detached.reserve(values.size());
        for (const auto& value : values) {
            detached.push_back(stop_gradient(value, track));
        }
        return detached;
    }

    [[nodiscard]] inline std::vector<torch::Tensor> differentiate(const std::vector<torch::Tensor>& outputs,
                                                                  const std::vector<torch::Tensor>& targets,
                                                                  const std::vector<torch::Tensor>& seeds,
                                                                  bool retain_graph = false)
    {
        ::Revgrad::Details::require_length("differentiate: one seed per output", outputs.size(), seeds.size());

        std::vector<torch::Tensor> gradients(targets.size());

        std::vector<torch::Tensor> live_outputs{};
        std::vector<torch::Tensor> live_seeds{};
        for (std::size_t i = 0; i < outputs.size(); ++i) {
            if (outputs[i].defined() && outputs[i].requires_grad() && seeds[i].defined()) {
                live_outputs.push_back(outputs[i]);
                live_seeds.push_back(seeds[i]);
            }
        }

        std::vector<std::size_t> positions{};
        std::vector<torch::Tensor> live_targets{};
        for (std::size_t i = 0; i < targets.size(); ++i) {
            if (targets[i].defined() && targets[i].requires_grad()) {
                positions.push_back(i);
                live_targets.push_back(targets[i]);
            }
        }

        if (live_outputs.empty() || live_targets.empty()) {
            return gradients;
        }

        auto computed = torch::autograd::grad(live_outputs,
                                              live_targets,
                                              live_seeds,
                                              /*retain_graph=*/retain_graph,
                                              /*create_graph=*/false,
                                              /*allow_unused=*/true);
        for (std::size_t k = 0; k < positions.size(); ++k) {
            gradients[positions[k]] = std::move(computed[k]);
        }
        return gradients;
    }

    [[nodiscard]] inline std::vector<torch::Tensor> differentiate(const torch::Tensor& output,
                                                                  const std::vector<torch::Tensor>& targets,
                                                                  const torch::Tensor& seed,
                                                                  bool retain_graph = false)
    {
        return differentiate(std::vector<torch::Tensor>{output}, targets, std::vector<torch::Tensor>{seed}, retain_graph);
    }

    [[nodiscard]] inline torch::Tensor accumulate(const torch::Tensor& lhs, const torch::Tensor& rhs)
    {
        if (!lhs.defined()) {
            return rhs;
        }
        if (!rhs.defined()) {
            return lhs;
        }
        return lhs + rhs;
    }
}

#endif // REVGRAD_GRADIENT_ENGINE_HPP
