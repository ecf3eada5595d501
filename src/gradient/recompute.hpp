#ifndef REVGRAD_GRADIENT_RECOMPUTE_HPP
#define REVGRAD_GRADIENT_RECOMPUTE_HPP
/*
 * Recomputation wrapper (activation checkpointing).
 * The forward runs without keeping intermediates; on backward `fn` is evaluated again on detached
 * copies of its inputs and the fresh sub-graph is differentiated structurally.
 *
 * `fn` must be a pure function of its inputs and of the parameters it acquires. Anything it
 * reads from elsewhere that changes between forward and backward silently yields wrong gradients.
 */

#include <utility>
#include <vector>

#include <torch/torch.h>

#include "custom.hpp"
#include "engine.hpp"

namespace Revgrad::Gradient {
    struct RecomputeOptions {
        bool use_global_parameters{false};
        bool monitor{false};
        std::ostream* stream{&std::clog};
    };

    class Recompute {
    public:
        Recompute(::Revgrad::Scope scope, ForwardFunction fn, RecomputeOptions options = {})
            : scope_(std::move(scope))
            , fn_(std::move(fn))
            , options_(options)
        {
            if (!fn_) {
                throw ::Revgrad::ConfigurationError("Recompute requires a function to wrap.");
            }
        }

        std::vector<torch::Tensor> operator()(const std::vector<torch::Tensor>& inputs) const
        {
            CustomGradientOptions custom{};
            custom.use_global_parameters = options_.use_global_parameters;
            custom.monitor = options_.monitor;
            custom.stream = options_.stream;
            return CustomGradient(scope_, fn_, gradient(), custom)(inputs);
        }

    private:
        [[nodiscard]] GradientFunction gradient() const
        {
            return [scope = scope_, fn = fn_](const std::vector<torch::Tensor>& inputs,
                                              const std::vector<::Revgrad::Parameter>& parameters,
                                              const std::vector<torch::Tensor>& /*outputs*/,
                                              const std::vector<torch::Tensor>& output_gradients) -> GradientResult {
                auto fresh_inputs = stop_gradient(inputs, /*track=*/true);
                auto replay = scope.with_reuse(::Revgrad::Reuse::Strict);
                auto outputs = fn(replay, fresh_inputs);
                ::Revgrad::Details::require_length("Recomputed outputs", output_gradients.size(), outputs.size());

                std::vector<torch::Tensor> targets = fresh_inputs;
                targets.reserve(fresh_inputs.size() + parameters.size());
                for (const auto& parameter : parameters) {
                    targets.push_back(parameter.value);
                }

                auto gradients = differentiate(outputs, targets, output_gradients);

                GradientResult result{};
                result.inputs.assign(gradients.begin(), gradients.begin() + static_cast<std::ptrdiff_t>(inputs.size()));
                result.parameters.assign(gradients.begin() + static_cast<std::ptrdiff_t>(inputs.size()), gradients.end());
                return result;
            };
        }

        ::Revgrad::Scope scope_;
        ForwardFunction fn_;
        RecomputeOptions options_;
    };

    inline std::vector<torch::Tensor> recompute(const ::Revgrad::Scope& scope,
                                                ForwardFunction fn,
                                                const std::vector<torch::Tensor>& inputs,
                                                RecomputeOptions options = {})
    {
        return Recompute(scope, std::move(fn), options)(inputs);
    }
}

#endif // REVGRAD_GRADIENT_RECOMPUTE_HPP
