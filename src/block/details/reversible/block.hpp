#ifndef REVGRAD_BLOCK_DETAILS_REVERSIBLE_BLOCK_HPP
#define REVGRAD_BLOCK_DETAILS_REVERSIBLE_BLOCK_HPP

#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <tuple>
#include <unordered_set>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "layer.hpp"
#include "../../../common/error.hpp"
#include "../../../common/scope.hpp"
#include "../../../gradient/custom.hpp"
#include "../../../gradient/engine.hpp"
#include "../../../utils/terminal.hpp"

namespace Revgrad::Block::Details::Reversible {
    struct ReversibleOptions {
        std::size_t num_layers{1};
        bool monitor{false};
        std::ostream* stream{&std::clog};
        std::string name{"revblock"};
    };

    struct ReversibleDescriptor {
        std::vector<::Revgrad::SubFunction> f{};
        std::vector<::Revgrad::SubFunction> g{};
        ReversibleOptions options{};
    };

    namespace Details {
        // Flat inputs of a block are laid out as [x1, x2, f_side..., g_side...].
        struct SideInputLayout {
            std::size_t f_count{0};
            std::size_t g_count{0};

            [[nodiscard]] std::size_t size() const noexcept { return 2 + f_count + g_count; }
            [[nodiscard]] std::size_t f_position(std::size_t k) const noexcept { return 2 + k; }
            [[nodiscard]] std::size_t g_position(std::size_t k) const noexcept { return 2 + f_count + k; }

            [[nodiscard]] std::vector<torch::Tensor> flatten(const torch::Tensor& x1,
                                                             const torch::Tensor& x2,
                                                             const std::vector<torch::Tensor>& f_side,
                                                             const std::vector<torch::Tensor>& g_side) const
            {
                std::vector<torch::Tensor> flat{};
                flat.reserve(size());
                flat.push_back(x1);
                flat.push_back(x2);
                flat.insert(flat.end(), f_side.begin(), f_side.end());
                flat.insert(flat.end(), g_side.begin(), g_side.end());
                return flat;
            }

            [[nodiscard]] std::vector<torch::Tensor> f_side(const std::vector<torch::Tensor>& flat) const
            {
                return {flat.begin() + static_cast<std::ptrdiff_t>(f_position(0)),
                        flat.begin() + static_cast<std::ptrdiff_t>(f_position(f_count))};
            }

            [[nodiscard]] std::vector<torch::Tensor> g_side(const std::vector<torch::Tensor>& flat) const
            {
                return {flat.begin() + static_cast<std::ptrdiff_t>(g_position(0)),
                        flat.begin() + static_cast<std::ptrdiff_t>(g_position(g_count))};
            }
        };

        struct RoleGroup {
            std::vector<torch::Tensor> tensors{};
            std::vector<std::size_t> positions{}; // index into the flat parameter list
        };

        struct LayerParameters {
            RoleGroup f{};
            RoleGroup g{};
        };

        // Groups parameters by the tag stamped on them at creation time.
        [[nodiscard]] inline std::vector<LayerParameters> partition_parameters(const std::vector<::Revgrad::Parameter>& parameters,
                                                                              std::size_t num_layers)
        {
            std::vector<LayerParameters> groups(num_layers);
            for (std::size_t position = 0; position < parameters.size(); ++position) {
                const auto& parameter = parameters[position];
                if (!parameter.tag.has_value()) {
                    throw ::Revgrad::ConfigurationError("Parameter '" + parameter.name
                                                        + "' carries no revlayer_<n>/<f|g> tag; its gradient cannot be attributed to a layer.");
                }
                const auto& tag = *parameter.tag;
                if (tag.layer >= num_layers) {
                    std::ostringstream message;
                    message << "Parameter '" << parameter.name << "' is tagged for layer " << tag.layer
                            << " but the block only has " << num_layers << " layers.";
                    throw ::Revgrad::ConfigurationError(message.str());
                }
                auto& group = tag.role == ::Revgrad::Role::F ? groups[tag.layer].f : groups[tag.layer].g;
                group.tensors.push_back(parameter.value);
                group.positions.push_back(position);
            }
            return groups;
        }
    }

    class ReversibleBlockImpl : public torch::nn::Module {
    public:
        explicit ReversibleBlockImpl(ReversibleDescriptor descriptor, ::Revgrad::Scope parent = {})
            : options_(descriptor.options)
        {
            if (options_.num_layers == 0) {
                throw ::Revgrad::ConfigurationError("Reversible blocks require at least one layer.");
            }
            ::Revgrad::Details::require_length("Reversible block f sub-functions", options_.num_layers, descriptor.f.size());
            ::Revgrad::Details::require_length("Reversible block g sub-functions", options_.num_layers, descriptor.g.size());

            scope_ = parent.unique_child(options_.name);
            layers_ = std::make_shared<std::vector<ReversibleLayer>>();
            layers_->reserve(options_.num_layers);
            for (std::size_t index = 0; index < options_.num_layers; ++index) {
                auto layer_scope = scope_.child("revlayer_" + std::to_string(index));
                layers_->emplace_back(index,
                                      layer_scope.child(::Revgrad::to_string(::Revgrad::Role::F)).tagged({index, ::Revgrad::Role::F}),
                                      layer_scope.child(::Revgrad::to_string(::Revgrad::Role::G)).tagged({index, ::Revgrad::Role::G}),
                                      std::move(descriptor.f[index]),
                                      std::move(descriptor.g[index]));
            }
            ::Revgrad::Utils::Terminal::Report(options_, scope_.path(),
                "built with " + std::to_string(options_.num_layers) + " layers");
        }

        std::pair<torch::Tensor, torch::Tensor> forward(const torch::Tensor& x1,
                                                        const torch::Tensor& x2,
                                                        const std::vector<torch::Tensor>& f_side = {},
                                                        const std::vector<torch::Tensor>& g_side = {})
        {
            const Details::SideInputLayout layout{f_side.size(), g_side.size()};
            auto layers = layers_;

            ::Revgrad::Gradient::ForwardFunction chain = [layers, layout](::Revgrad::Scope&, const std::vector<torch::Tensor>& flat) {
                auto f_inputs = layout.f_side(flat);
                auto g_inputs = layout.g_side(flat);
                auto y1 = flat[0];
                auto y2 = flat[1];
                for (const auto& layer : *layers) {
                    std::tie(y1, y2) = layer.forward(y1, y2, f_inputs, g_inputs);
                }
                return std::vector<torch::Tensor>{y1, y2};
            };

            std::vector<torch::Tensor> outputs{};
            if (is_training()) {
                ::Revgrad::Gradient::CustomGradientOptions custom{};
                custom.monitor = options_.monitor;
                custom.stream = options_.stream;
                ::Revgrad::Gradient::GradientFunction gradient =
                    [layers, layout, options = options_](const std::vector<torch::Tensor>& inputs,
                                                         const std::vector<::Revgrad::Parameter>& parameters,
                                                         const std::vector<torch::Tensor>& ys,
                                                         const std::vector<torch::Tensor>& grad_ys) {
                        return run_backward(*layers, layout, options, inputs, parameters, ys, grad_ys);
                    };
                outputs = ::Revgrad::Gradient::CustomGradient(scope_, chain, gradient, custom)(layout.flatten(x1, x2, f_side, g_side));
            } else {
                auto scope = scope_;
                outputs = chain(scope, layout.flatten(x1, x2, f_side, g_side));
            }

            register_new_parameters();
            return {outputs[0], outputs[1]};
        }

        // The gradient function installed in training mode, exposed for direct use.
        ::Revgrad::Gradient::GradientResult backward(const std::vector<torch::Tensor>& inputs,
                                                     const std::vector<::Revgrad::Parameter>& parameters,
                                                     const std::vector<torch::Tensor>& outputs,
                                                     const std::vector<torch::Tensor>& output_gradients,
                                                     std::size_t f_side_count,
                                                     std::size_t g_side_count) const
        {
            const Details::SideInputLayout layout{f_side_count, g_side_count};
            return run_backward(*layers_, layout, options_, inputs, parameters, outputs, output_gradients);
        }

        [[nodiscard]] const ::Revgrad::Scope& scope() const noexcept { return scope_; }
        [[nodiscard]] std::size_t num_layers() const noexcept { return layers_->size(); }
        [[nodiscard]] const ReversibleLayer& layer(std::size_t index) const { return layers_->at(index); }

        // Parameters of the block in creation order, each with its layer tag.
        [[nodiscard]] std::vector<::Revgrad::Parameter> block_parameters(bool trainable_only = true) const
        {
            return scope_.parameters(trainable_only);
        }

    private:
        static ::Revgrad::Gradient::GradientResult run_backward(const std::vector<ReversibleLayer>& layers,
                                                                const Details::SideInputLayout& layout,
                                                                const ReversibleOptions& options,
                                                                const std::vector<torch::Tensor>& inputs,
                                                                const std::vector<::Revgrad::Parameter>& parameters,
                                                                const std::vector<torch::Tensor>& outputs,
                                                                const std::vector<torch::Tensor>& output_gradients)
        {
            ::Revgrad::Details::require_length("Reversible block flat inputs", layout.size(), inputs.size());
            ::Revgrad::Details::require_length("Reversible block outputs", 2, outputs.size());
            ::Revgrad::Details::require_length("Reversible block output gradients", 2, output_gradients.size());

            const auto groups = Details::partition_parameters(parameters, layers.size());
            const auto f_side = layout.f_side(inputs);
            const auto g_side = layout.g_side(inputs);

            std::vector<torch::Tensor> parameter_gradients(parameters.size());
            std::vector<torch::Tensor> f_side_gradients(layout.f_count);
            std::vector<torch::Tensor> g_side_gradients(layout.g_count);

            auto y1 = outputs[0];
            auto y2 = outputs[1];
            auto grad_y1 = output_gradients[0];
            auto grad_y2 = output_gradients[1];

            for (auto index = layers.size(); index-- > 0;) {
                const auto& group = groups[index];
                auto step = layers[index].backward(y1, y2, grad_y1, grad_y2, f_side, g_side,
                                                   group.f.tensors, group.g.tensors);

                for (std::size_t k = 0; k < group.f.positions.size(); ++k) {
                    parameter_gradients[group.f.positions[k]] = std::move(step.f_parameters[k]);
                }
                for (std::size_t k = 0; k < group.g.positions.size(); ++k) {
                    parameter_gradients[group.g.positions[k]] = std::move(step.g_parameters[k]);
                }
                for (std::size_t k = 0; k < layout.f_count; ++k) {
                    f_side_gradients[k] = ::Revgrad::Gradient::accumulate(f_side_gradients[k], step.f_side[k]);
                }
                for (std::size_t k = 0; k < layout.g_count; ++k) {
                    g_side_gradients[k] = ::Revgrad::Gradient::accumulate(g_side_gradients[k], step.g_side[k]);
                }

                y1 = std::move(step.x1);
                y2 = std::move(step.x2);
                grad_y1 = std::move(step.grad_x1);
                grad_y2 = std::move(step.grad_x2);

                ::Revgrad::Utils::Terminal::Report(options, options.name,
                    std::string(::Revgrad::Utils::Terminal::Symbols::kArrowDown) + " layer "
                    + std::to_string(index + 1) + "/" + std::to_string(layers.size()) + " reconstructed");
            }

            ::Revgrad::Gradient::GradientResult result{};
            result.inputs.resize(layout.size());
            result.inputs[0] = std::move(grad_y1);
            result.inputs[1] = std::move(grad_y2);
            for (std::size_t k = 0; k < layout.f_count; ++k) {
                result.inputs[layout.f_position(k)] = std::move(f_side_gradients[k]);
            }
            for (std::size_t k = 0; k < layout.g_count; ++k) {
                result.inputs[layout.g_position(k)] = std::move(g_side_gradients[k]);
            }
            result.parameters = std::move(parameter_gradients);
            return result;
        }

        void register_new_parameters()
        {
            const auto prefix = scope_.path() + "/";
            for (const auto& parameter : scope_.parameters(/*trainable_only=*/false)) {
                if (!registered_.insert(parameter.name).second) {
                    continue;
                }
                auto local = parameter.name.substr(prefix.size());
                register_parameter(local, parameter.value, parameter.trainable);
            }
        }

        ReversibleOptions options_{};
        ::Revgrad::Scope scope_{};
        std::shared_ptr<std::vector<ReversibleLayer>> layers_{};
        std::unordered_set<std::string> registered_{};
    };

    TORCH_MODULE(ReversibleBlock);
}

#endif // REVGRAD_BLOCK_DETAILS_REVERSIBLE_BLOCK_HPP
