#ifndef REVGRAD_CONV_HPP
#define REVGRAD_CONV_HPP

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
#include "padding.hpp"
#include "side.hpp"

namespace Revgrad::Layer::Details {
    struct Conv2dOptions {
        std::int64_t out_channels{};
        Size2d kernel_size{3, 3};
        Size2d stride{1, 1};
        Size2d dilation{1, 1};
        Padding padding{Padding::Same};
        bool bias{true};
        double bias_start{0.0};
    };

    struct Conv2dDescriptor {
        Conv2dOptions options{};
        ::Revgrad::Activation::Descriptor activation{::Revgrad::Activation::Identity};
        ::Revgrad::Initialization::Descriptor initialization{::Revgrad::Initialization::Default};
    };

    inline void validate(const Conv2dOptions& options)
    {
        if (options.out_channels <= 0) {
            throw std::invalid_argument("Conv2d layers require a positive output channel count.");
        }
        check_size(options.kernel_size, "Conv2d kernel_size");
        check_size(options.stride, "Conv2d stride");
        check_size(options.dilation, "Conv2d dilation");
        if (options.padding == Padding::Left && (options.kernel_size[0] % 2 == 0 || options.kernel_size[1] % 2 == 0)) {
            throw std::invalid_argument("Conv2d with left padding requires odd kernel sizes.");
        }
    }

    // NCHW convolution whose weight / bias live under `scope`. Side inputs are concatenated on channels.
    inline torch::Tensor convolve(::Revgrad::Scope& scope, const Conv2dDescriptor& descriptor,
                                  const torch::Tensor& input, const std::vector<torch::Tensor>& side)
    {
        const auto& options = descriptor.options;
        auto features = with_side(input, side, 1);
        TORCH_CHECK(features.dim() == 4, "Conv2d expects a rank 4 NCHW input, got rank ", features.dim(), ".");

        const auto in_channels = features.size(1);
        auto weight = scope.parameter("weight",
                                      {options.out_channels, in_channels, options.kernel_size[0], options.kernel_size[1]},
                                      descriptor.initialization);
        torch::Tensor bias{};
        if (options.bias) {
            bias = scope.parameter("bias", {options.out_channels}, ::Revgrad::Initialization::Constant(options.bias_start));
        }

        auto padded = pad(features, resolve_padding(options.padding, features, options.kernel_size, options.stride, options.dilation));
        auto output = torch::conv2d(padded, weight, bias,
                                    {options.stride[0], options.stride[1]},
                                    /*padding=*/{0, 0},
                                    {options.dilation[0], options.dilation[1]});
        return ::Revgrad::Activation::Details::apply(descriptor.activation, std::move(output));
    }

    [[nodiscard]] inline ::Revgrad::SubFunction build_sub_function(const Conv2dDescriptor& descriptor)
    {
        validate(descriptor.options);
        return [descriptor](::Revgrad::Scope& scope, const torch::Tensor& input, const std::vector<torch::Tensor>& side) {
            return convolve(scope, descriptor, input, side);
        };
    }
}

#endif //REVGRAD_CONV_HPP
