#ifndef REVGRAD_FC_HPP
#define REVGRAD_FC_HPP

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../../common/scope.hpp"
#include "../../initialization/initialization.hpp"
#include "side.hpp"

namespace Revgrad::Layer::Details {
    struct FCOptions {
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Revgrad::Activation::Descriptor activation{::Revgrad::Activation::Identity};
        ::Revgrad::Initialization::Descriptor initialization{::Revgrad::Initialization::Default};
    };

    // in_features is read from the first input (plus side inputs) when the weight is created.
    [[nodiscard]] inline ::Revgrad::SubFunction build_sub_function(const FCDescriptor& descriptor)
    {
        if (descriptor.options.out_features <= 0) {
            throw std::invalid_argument("Fully connected layers require positive out features.");
        }

        return [descriptor](::Revgrad::Scope& scope, const torch::Tensor& input, const std::vector<torch::Tensor>& side) {
            auto features = with_side(input, side, -1);
            const auto in_features = features.size(-1);
            auto weight = scope.parameter("weight", {descriptor.options.out_features, in_features}, descriptor.initialization);
            torch::Tensor bias{};
            if (descriptor.options.bias) {
                bias = scope.parameter("bias", {descriptor.options.out_features}, ::Revgrad::Initialization::Zeros);
            }
            auto output = torch::linear(features, weight, bias);
            return ::Revgrad::Activation::Details::apply(descriptor.activation, std::move(output));
        };
    }
}

#endif //REVGRAD_FC_HPP
