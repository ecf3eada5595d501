#ifndef REVGRAD_MULTISCALE_HPP
#define REVGRAD_MULTISCALE_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../../common/scope.hpp"
#include "../../initialization/initialization.hpp"
#include "conv.hpp"
#include "pooling.hpp"

namespace Revgrad::Layer::Details {
    struct Scale {
        Size2d dilation{1, 1};
        Size2d kernel_size{3, 3};
    };

    struct MultiscaleConv2dSumOptions {
        std::int64_t out_channels{};
        std::vector<Scale> scales{};
        PoolingType pooling{PoolingType::Avg};
        Padding padding{Padding::Same};
    };

    struct MultiscaleConv2dSumDescriptor {
        MultiscaleConv2dSumOptions options{};
        ::Revgrad::Activation::Descriptor activation{::Revgrad::Activation::Identity};
        ::Revgrad::Initialization::Descriptor initialization{::Revgrad::Initialization::Default};
    };

    // One convolution per scale under conv_layer<i>; scales dilated along the height first pool the
    // input with the scale's kernel. The sum is scaled by 1/sqrt(#scales).
    [[nodiscard]] inline ::Revgrad::SubFunction build_sub_function(const MultiscaleConv2dSumDescriptor& descriptor)
    {
        if (descriptor.options.scales.empty()) {
            throw std::invalid_argument("MultiscaleConv2dSum requires at least one (dilation, kernel_size) pair.");
        }

        std::vector<Conv2dDescriptor> convolutions{};
        std::vector<Pool2dOptions> pools{};
        for (const auto& scale : descriptor.options.scales) {
            Conv2dDescriptor convolution{};
            convolution.options.out_channels = descriptor.options.out_channels;
            convolution.options.kernel_size = scale.kernel_size;
            convolution.options.dilation = scale.dilation;
            convolution.options.padding = descriptor.options.padding;
            convolution.initialization = descriptor.initialization;
            validate(convolution.options);
            convolutions.push_back(convolution);

            Pool2dOptions pool{};
            pool.type = descriptor.options.pooling;
            pool.kernel_size = scale.kernel_size;
            pool.padding = descriptor.options.padding;
            pools.push_back(pool);
        }

        const auto activation = descriptor.activation;
        return [convolutions, pools, activation](::Revgrad::Scope& scope, const torch::Tensor& input, const std::vector<torch::Tensor>& side) {
            torch::Tensor total{};
            for (std::size_t i = 0; i < convolutions.size(); ++i) {
                const auto& options = convolutions[i].options;
                auto pooled = options.dilation[0] > 1 ? pool2d(input, pools[i]) : input;
                auto child = scope.child("conv_layer" + std::to_string(i));
                auto result = convolve(child, convolutions[i], pooled, side);
                total = total.defined() ? total + result : result;
            }
            total = total * (1.0 / std::sqrt(static_cast<double>(convolutions.size())));
            return ::Revgrad::Activation::Details::apply(activation, std::move(total));
        };
    }
}

#endif //REVGRAD_MULTISCALE_HPP
