#ifndef REVGRAD_LAYER_REGISTRY_HPP
#define REVGRAD_LAYER_REGISTRY_HPP

#include <concepts>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "../common/scope.hpp"
#include "details/conv.hpp"
#include "details/fc.hpp"
#include "details/gru.hpp"
#include "details/lstm.hpp"
#include "details/multiscale.hpp"
#include "details/pooling.hpp"

namespace Revgrad::Layer::Details {
    using Descriptor = std::variant<FCDescriptor,
                                    Conv2dDescriptor,
                                    Pool2dDescriptor,
                                    MultiscaleConv2dSumDescriptor,
                                    ConvGRUDescriptor,
                                    DiagonalGRUDescriptor,
                                    ConvLSTMDescriptor>;

    template <class T>
    concept SubFunctionDescriptor = requires(const T& descriptor) {
        { build_sub_function(descriptor) } -> std::convertible_to<::Revgrad::SubFunction>;
    };

    [[nodiscard]] inline ::Revgrad::SubFunction build_sub_function(const Descriptor& descriptor)
    {
        return std::visit([](const auto& concrete) -> ::Revgrad::SubFunction {
            static_assert(SubFunctionDescriptor<std::decay_t<decltype(concrete)>>,
                          "Every layer descriptor must provide build_sub_function().");
            return build_sub_function(concrete);
        }, descriptor);
    }

    // Layers applied one after the other, each in its own child scope (layer_0, layer_1, ...).
    // Side inputs are handed to every layer.
    [[nodiscard]] inline ::Revgrad::SubFunction build_sub_function(const std::vector<Descriptor>& descriptors)
    {
        std::vector<::Revgrad::SubFunction> functions{};
        functions.reserve(descriptors.size());
        for (const auto& descriptor : descriptors) {
            functions.push_back(build_sub_function(descriptor));
        }
        return [functions](::Revgrad::Scope& scope, const torch::Tensor& input, const std::vector<torch::Tensor>& side) {
            auto output = input;
            for (std::size_t index = 0; index < functions.size(); ++index) {
                auto child = scope.child("layer_" + std::to_string(index));
                output = functions[index](child, output, side);
            }
            return output;
        };
    }
}

#endif //REVGRAD_LAYER_REGISTRY_HPP
