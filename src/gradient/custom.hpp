#ifndef REVGRAD_GRADIENT_CUSTOM_HPP
#define REVGRAD_GRADIENT_CUSTOM_HPP
/*
 * Subgraph with a user supplied gradient.
 * ---------------------------------------------------------------------------
 * The forward function runs without recording history; its outputs are then re-exposed through an
 * identity node whose backward calls the gradient function instead of differentiating the forward
 * structurally. The node's edges point at the inputs and at the parameters the forward acquired
 * (created or reused) during this call, so libtorch's ordinary `backward()` / `torch::autograd::grad`
 * deliver the returned gradients exactly where structural differentiation would have.
 *
 * Gradient function contract:
 *     (inputs, parameters, outputs, output_gradients) -> {input_gradients, parameter_gradients}
 * with one entry per input and one per parameter, in the order given. An undefined entry means
 * "no gradient". Output gradients that the engine did not produce are handed over as zeros.
 */

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>
#include <torch/csrc/autograd/function.h>
#include <torch/csrc/autograd/functions/utils.h>

#include "../common/error.hpp"
#include "../common/scope.hpp"
#include "../utils/terminal.hpp"

namespace Revgrad::Gradient {
    struct GradientResult {
        std::vector<torch::Tensor> inputs{};
        std::vector<torch::Tensor> parameters{};
    };

    using ForwardFunction = std::function<std::vector<torch::Tensor>(::Revgrad::Scope&, const std::vector<torch::Tensor>&)>;

    using GradientFunction = std::function<GradientResult(const std::vector<torch::Tensor>& inputs,
                                                          const std::vector<::Revgrad::Parameter>& parameters,
                                                          const std::vector<torch::Tensor>& outputs,
                                                          const std::vector<torch::Tensor>& output_gradients)>;

    struct CustomGradientOptions {
        bool use_global_parameters{false}; // true: non-trainable parameters reach the gradient function too
        bool monitor{false};
        std::ostream* stream{&std::clog};
    };

    namespace Details {
        inline void check_forward_outputs(const std::string& scope, const std::vector<torch::Tensor>& outputs)
        {
            if (outputs.empty()) {
                throw ::Revgrad::ConfigurationError("Forward function of scope '" + scope + "' returned no outputs.");
            }
            for (std::size_t i = 0; i < outputs.size(); ++i) {
                if (!outputs[i].defined()) {
                    std::ostringstream message;
                    message << "Forward function of scope '" << scope << "' returned an undefined tensor at output " << i
                            << "; output shapes must be known when the subgraph is built.";
                    throw ::Revgrad::ConfigurationError(message.str());
                }
            }
        }

        [[nodiscard]] inline bool is_differentiable(const torch::Tensor& tensor)
        {
            return tensor.is_floating_point() || tensor.is_complex();
        }

        class IdentityGradientNode : public torch::autograd::Node {
        public:
            IdentityGradientNode(std::string name,
                                 GradientFunction gradient,
                                 std::vector<torch::Tensor> inputs,
                                 std::vector<::Revgrad::Parameter> parameters,
                                 std::vector<torch::Tensor> outputs,
                                 std::vector<std::size_t> attached,
                                 CustomGradientOptions options)
                : name_(std::move(name))
                , gradient_(std::move(gradient))
                , inputs_(std::move(inputs))
                , parameters_(std::move(parameters))
                , outputs_(std::move(outputs))
                , attached_(std::move(attached))
                , options_(options) {}

            torch::autograd::variable_list apply(torch::autograd::variable_list&& grads) override
            {
                TORCH_CHECK(!released_,
                            "Trying to backward through '", name_, "' a second time; pass retain_graph=true to the first backward.");
                ::Revgrad::Details::require_length("Gradients received by '" + name_ + "'", attached_.size(), grads.size());

                std::vector<torch::Tensor> output_gradients(outputs_.size());
                for (std::size_t k = 0; k < attached_.size(); ++k) {
                    const auto position = attached_[k];
                    if (grads[k].defined()) {
                        output_gradients[position] = std::move(grads[k]);
                        continue;
                    }
                    ::Revgrad::Utils::Terminal::Warn(options_, name_,
                        "output " + std::to_string(position) + " received no gradient, using zeros");
                    output_gradients[position] = torch::zeros_like(outputs_[position]);
                }

                ::Revgrad::Utils::Terminal::Report(options_, name_, "backward through custom gradient");

                GradientResult result{};
                {
                    torch::AutoGradMode enable_grad(true);
                    result = gradient_(inputs_, parameters_, outputs_, output_gradients);
                }

                ::Revgrad::Details::require_length("Input gradients returned to '" + name_ + "'",
                                                   inputs_.size(), result.inputs.size());
                ::Revgrad::Details::require_length("Parameter gradients returned to '" + name_ + "'",
                                                   parameters_.size(), result.parameters.size());

                torch::autograd::variable_list routed{};
                routed.reserve(result.inputs.size() + result.parameters.size());
                for (auto& gradient : result.inputs) {
                    routed.push_back(gradient.defined() ? gradient.detach() : torch::Tensor{});
                }
                for (auto& gradient : result.parameters) {
                    routed.push_back(gradient.defined() ? gradient.detach() : torch::Tensor{});
                }
                return routed;
            }

            [[nodiscard]] std::string name() const override { return name_; }

            void release_variables() override
            {
                inputs_.clear();
                parameters_.clear();
                outputs_.clear();
                released_ = true;
            }

        private:
            std::string name_;
            GradientFunction gradient_;
            std::vector<torch::Tensor> inputs_;
            std::vector<::Revgrad::Parameter> parameters_;
            std::vector<torch::Tensor> outputs_;
            std::vector<std::size_t> attached_;
            CustomGradientOptions options_;
            bool released_{false};
        };

        // Re-exposes `outputs` through a fresh, uniquely named identity node. Returns the outputs
        // unchanged when nothing upstream asks for a gradient.
        [[nodiscard]] inline std::vector<torch::Tensor> attach(const ::Revgrad::Scope& scope,
                                                               const GradientFunction& gradient,
                                                               const std::vector<torch::Tensor>& inputs,
                                                               std::vector<::Revgrad::Parameter> parameters,
                                                               const std::vector<torch::Tensor>& outputs,
                                                               const CustomGradientOptions& options)
        {
            std::vector<torch::Tensor> parameter_tensors{};
            parameter_tensors.reserve(parameters.size());
            for (const auto& parameter : parameters) {
                parameter_tensors.push_back(parameter.value);
            }

            const bool requires_grad = torch::autograd::compute_requires_grad(inputs, parameter_tensors);
            if (!requires_grad) {
                return outputs;
            }

            std::vector<std::size_t> attached{};
            for (std::size_t i = 0; i < outputs.size(); ++i) {
                if (is_differentiable(outputs[i])) {
                    attached.push_back(i);
                }
            }

            auto name = scope.workspace().names().unique(scope.qualify("identity_custom_grad"));
            ::Revgrad::Utils::Terminal::Report(options, name,
                "attached over " + std::to_string(inputs.size()) + " inputs and "
                + std::to_string(parameters.size()) + " parameters");

            auto node = std::make_shared<IdentityGradientNode>(
                name, gradient, inputs, std::move(parameters), outputs, attached, options);
            node->set_next_edges(torch::autograd::collect_next_edges(inputs, parameter_tensors));

            std::vector<torch::Tensor> results{};
            results.reserve(outputs.size());
            std::size_t next_attached = 0;
            for (std::size_t i = 0; i < outputs.size(); ++i) {
                if (next_attached < attached.size() && attached[next_attached] == i) {
                    auto result = outputs[i].detach();
                    torch::autograd::set_history(result, node);
                    results.push_back(std::move(result));
                    ++next_attached;
                } else {
                    results.push_back(outputs[i]);
                }
            }
            return results;
        }
    }

    class CustomGradient {
    public:
        CustomGradient(::Revgrad::Scope scope,
                       ForwardFunction forward,
                       GradientFunction gradient = {},
                       CustomGradientOptions options = {})
            : scope_(std::move(scope))
            , forward_(std::move(forward))
            , gradient_(std::move(gradient))
            , options_(options)
        {
            if (!forward_) {
                throw ::Revgrad::ConfigurationError("CustomGradient requires a forward function.");
            }
        }

        std::vector<torch::Tensor> operator()(const std::vector<torch::Tensor>& inputs) const
        {
            auto scope = scope_.with_reuse(::Revgrad::Reuse::Auto);
            if (!gradient_) {
                auto outputs = forward_(scope, inputs);
                Details::check_forward_outputs(scope_.path(), outputs);
                return outputs;
            }

            // Only what this forward acquires reaches the gradient function, never the rest of the workspace.
            std::vector<torch::Tensor> outputs{};
            std::vector<::Revgrad::Parameter> parameters{};
            {
                torch::NoGradGuard no_grad;
                ::Revgrad::ParameterRecorder recorder(scope_.workspace().parameters());
                outputs = forward_(scope, inputs);
                parameters = recorder.parameters(/*trainable_only=*/!options_.use_global_parameters);
            }
            Details::check_forward_outputs(scope_.path(), outputs);

            return Details::attach(scope_, gradient_, inputs, std::move(parameters), outputs, options_);
        }

    private:
        ::Revgrad::Scope scope_;
        ForwardFunction forward_;
        GradientFunction gradient_;
        CustomGradientOptions options_;
    };

    inline std::vector<torch::Tensor> apply(const ::Revgrad::Scope& scope,
                                            ForwardFunction forward,
                                            const std::vector<torch::Tensor>& inputs,
                                            GradientFunction gradient = {},
                                            CustomGradientOptions options = {})
    {
        return CustomGradient(scope, std::move(forward), std::move(gradient), options)(inputs);
    }
}

#endif // REVGRAD_GRADIENT_CUSTOM_HPP
