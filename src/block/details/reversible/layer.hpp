#ifndef REVGRAD_BLOCK_DETAILS_REVERSIBLE_LAYER_HPP
#define REVGRAD_BLOCK_DETAILS_REVERSIBLE_LAYER_HPP
/*
 * Additive coupling layer.
 *
 *     y1 = x1 + f(x2, f_side)            x2 = y2 - g(y1, g_side)
 *     y2 = x2 + g(y1, g_side)            x1 = y1 - f(x2, f_side)
 *
 * backward() rebuilds (x1, x2) from (y1, y2) and produces every gradient of the layer from two
 * local recomputations, one of g and one of f. Nothing from the forward pass is retained.
 */

#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../../common/error.hpp"
#include "../../../common/scope.hpp"
#include "../../../gradient/engine.hpp"

namespace Revgrad::Block::Details::Reversible {
    // Everything layer i hands over to layer i-1. Returned by value and fully materialised, so the
    // recomputed sub-graphs of one layer are gone before the next layer starts rebuilding its own.
    struct LayerGradients {
        torch::Tensor x1{};
        torch::Tensor x2{};
        torch::Tensor grad_x1{};
        torch::Tensor grad_x2{};
        std::vector<torch::Tensor> f_parameters{};
        std::vector<torch::Tensor> g_parameters{};
        std::vector<torch::Tensor> f_side{};
        std::vector<torch::Tensor> g_side{};
    };

    class ReversibleLayer {
    public:
        ReversibleLayer(std::size_t index, ::Revgrad::Scope f_scope, ::Revgrad::Scope g_scope,
                        ::Revgrad::SubFunction f, ::Revgrad::SubFunction g)
            : index_(index)
            , f_scope_(std::move(f_scope))
            , g_scope_(std::move(g_scope))
            , f_(std::move(f))
            , g_(std::move(g))
        {
            if (!f_ || !g_) {
                throw ::Revgrad::ConfigurationError("Reversible layer " + std::to_string(index_)
                                                    + " requires both an f and a g sub-function.");
            }
        }

        [[nodiscard]] std::size_t index() const noexcept { return index_; }
        [[nodiscard]] const ::Revgrad::Scope& f_scope() const noexcept { return f_scope_; }
        [[nodiscard]] const ::Revgrad::Scope& g_scope() const noexcept { return g_scope_; }

        std::pair<torch::Tensor, torch::Tensor> forward(const torch::Tensor& x1,
                                                        const torch::Tensor& x2,
                                                        const std::vector<torch::Tensor>& f_side,
                                                        const std::vector<torch::Tensor>& g_side) const
        {
            auto f_scope = f_scope_.with_reuse(::Revgrad::Reuse::Auto);
            auto g_scope = g_scope_.with_reuse(::Revgrad::Reuse::Auto);

            auto y1 = x1 + coupled(f_, f_scope, x2, f_side, x1, "f");
            auto y2 = x2 + coupled(g_, g_scope, y1, g_side, x2, "g");
            return {std::move(y1), std::move(y2)};
        }

        // f_parameters / g_parameters are the tensors of this layer's parameters, in the order the
        // caller wants their gradients back.
        LayerGradients backward(const torch::Tensor& y1,
                                const torch::Tensor& y2,
                                const torch::Tensor& grad_y1,
                                const torch::Tensor& grad_y2,
                                const std::vector<torch::Tensor>& f_side,
                                const std::vector<torch::Tensor>& g_side,
                                const std::vector<torch::Tensor>& f_parameters,
                                const std::vector<torch::Tensor>& g_parameters) const
        {
            torch::AutoGradMode enable_grad(true);
            auto f_scope = f_scope_.with_reuse(::Revgrad::Reuse::Strict);
            auto g_scope = g_scope_.with_reuse(::Revgrad::Reuse::Strict);

            auto y1_stopped = ::Revgrad::Gradient::stop_gradient(y1, /*track=*/true);
            auto g_side_stopped = ::Revgrad::Gradient::stop_gradient(g_side, /*track=*/true);
            auto g_value = coupled(g_, g_scope, y1_stopped, g_side_stopped, y2, "g");
            auto x2 = y2.detach() - g_value.detach();

            auto x2_stopped = ::Revgrad::Gradient::stop_gradient(x2, /*track=*/true);
            auto f_side_stopped = ::Revgrad::Gradient::stop_gradient(f_side, /*track=*/true);
            auto f_value = coupled(f_, f_scope, x2_stopped, f_side_stopped, y1, "f");
            auto x1 = y1.detach() - f_value.detach();

            LayerGradients gradients{};
            gradients.x1 = std::move(x1);
            gradients.x2 = std::move(x2);

            // g: indirect term for y1, g parameters, g side inputs; all seeded with grad_y2.
            auto g_targets = concatenate(y1_stopped, g_parameters, g_side_stopped);
            auto g_gradients = ::Revgrad::Gradient::differentiate(g_value, g_targets, grad_y2);
            gradients.grad_x1 = ::Revgrad::Gradient::accumulate(grad_y1, g_gradients[0]);
            split(g_gradients, g_parameters.size(), gradients.g_parameters, gradients.g_side);

            // f: seeding with grad_x1 = grad_y1 + indirect is the sum of the two separately seeded
            // passes, differentiation being linear in the seed.
            auto f_targets = concatenate(x2_stopped, f_parameters, f_side_stopped);
            auto f_gradients = ::Revgrad::Gradient::differentiate(f_value, f_targets, gradients.grad_x1);
            gradients.grad_x2 = ::Revgrad::Gradient::accumulate(grad_y2, f_gradients[0]);
            split(f_gradients, f_parameters.size(), gradients.f_parameters, gradients.f_side);

            return gradients;
        }

    private:
        torch::Tensor coupled(const ::Revgrad::SubFunction& function,
                              ::Revgrad::Scope& scope,
                              const torch::Tensor& input,
                              const std::vector<torch::Tensor>& side,
                              const torch::Tensor& partner,
                              const char* role) const
        {
            auto value = function(scope, input, side);
            TORCH_CHECK(value.defined(),
                        "Reversible layer ", index_, ": sub-function ", role, " returned an undefined tensor.");
            // Exact match, broadcastable shapes included: x + f(...) must stay invertible.
            TORCH_CHECK(value.sizes() == partner.sizes(),
                        "Reversible layer ", index_, ": sub-function ", role, " produced shape ", value.sizes(),
                        " but the coupled half has shape ", partner.sizes(), "; f and g must preserve shape.");
            return value;
        }

        static std::vector<torch::Tensor> concatenate(const torch::Tensor& head,
                                                      const std::vector<torch::Tensor>& parameters,
                                                      const std::vector<torch::Tensor>& side)
        {
            std::vector<torch::Tensor> targets{};
            targets.reserve(1 + parameters.size() + side.size());
            targets.push_back(head);
            targets.insert(targets.end(), parameters.begin(), parameters.end());
            targets.insert(targets.end(), side.begin(), side.end());
            return targets;
        }

        static void split(std::vector<torch::Tensor>& gradients,
                          std::size_t parameter_count,
                          std::vector<torch::Tensor>& parameters,
                          std::vector<torch::Tensor>& side)
        {
            const auto first = gradients.begin() + 1;
            const auto middle = first + static_cast<std::ptrdiff_t>(parameter_count);
            parameters.assign(std::make_move_iterator(first), std::make_move_iterator(middle));
            side.assign(std::make_move_iterator(middle), std::make_move_iterator(gradients.end()));
        }

        std::size_t index_;
        ::Revgrad::Scope f_scope_;
        ::Revgrad::Scope g_scope_;
        ::Revgrad::SubFunction f_;
        ::Revgrad::SubFunction g_;
    };
}

#endif // REVGRAD_BLOCK_DETAILS_REVERSIBLE_LAYER_HPP
