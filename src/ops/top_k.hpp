#ifndef REVGRAD_OPS_TOP_K_HPP
#define REVGRAD_OPS_TOP_K_HPP

#include <cstddef>
#include <cstdint>
#include <tuple>
#include <vector>

#include <torch/torch.h>

namespace Revgrad::Ops {
    inline constexpr std::int64_t kSmallTopK = 10;

    // Top-k along dim 1 of a [batch, depth] tensor. For k <= kSmallTopK the result is built from k
    // argmax passes, masking each winner with -1e9 before the next pass; larger k use torch::topk.
    // Returns (values [batch, k], indices [batch, k] as int32).
    [[nodiscard]] inline std::tuple<torch::Tensor, torch::Tensor> top_k_small(const torch::Tensor& input, std::int64_t k) {
        TORCH_CHECK(input.dim() == 2, "top_k_small expects a [batch, depth] tensor, got rank ", input.dim(), ".");
        TORCH_CHECK(k > 0 && k <= input.size(1), "top_k_small needs 0 < k <= depth, got k=", k, " and depth=", input.size(1), ".");

        if (k > kSmallTopK) {
            auto [values, indices] = torch::topk(input, k, /*dim=*/1);
            return {values, indices.to(torch::kInt32)};
        }

        std::vector<torch::Tensor> values{};
        std::vector<torch::Tensor> indices{};
        values.reserve(static_cast<std::size_t>(k));
        indices.reserve(static_cast<std::size_t>(k));

        auto remaining = input;
        const auto depth = input.size(1);
        for (std::int64_t i = 0; i < k; ++i) {
            values.push_back(std::get<0>(remaining.max(1)));
            auto argmax = remaining.argmax(1);
            indices.push_back(argmax);
            if (i + 1 < k) {
                remaining = remaining + torch::one_hot(argmax, depth).to(remaining.scalar_type()) * -1e9;
            }
        }
        return {torch::stack(values, 1), torch::stack(indices, 1).to(torch::kInt32)};
    }
}

#endif // REVGRAD_OPS_TOP_K_HPP
