#ifndef REVGRAD_GRU_HPP
#define REVGRAD_GRU_HPP
// Convolutional GRU from "Neural GPUs Learn Algorithms" https://arxiv.org/abs/1511.08228
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/details/saturating.hpp"
#include "../../common/scope.hpp"
#include "../../initialization/initialization.hpp"
#include "conv.hpp"

namespace Revgrad::Layer::Details {
    struct ConvGRUOptions {
        std::int64_t out_channels{};
        Size2d kernel_size{3, 3};
        Size2d dilation{1, 1};
        Padding padding{Padding::Same};
    };

    struct ConvGRUDescriptor {
        ConvGRUOptions options{};
        ::Revgrad::Initialization::Descriptor initialization{::Revgrad::Initialization::Default};
    };

    //   reset     = saturating_sigmoid(conv_reset(x))
    //   gate      = saturating_sigmoid(conv_gate(x))
    //   candidate = tanh(conv_candidate(reset * x))
    //   output    = gate * x + (1 - gate) * candidate
    // out_channels must equal the channel count of x. Side inputs reach every convolution as extra channels.
    [[nodiscard]] inline ::Revgrad::SubFunction build_sub_function(const ConvGRUDescriptor& descriptor)
    {
        auto make = [&descriptor](double bias_start) {
            Conv2dDescriptor convolution{};
            convolution.options.out_channels = descriptor.options.out_channels;
            convolution.options.kernel_size = descriptor.options.kernel_size;
            convolution.options.dilation = descriptor.options.dilation;
            convolution.options.padding = descriptor.options.padding;
            convolution.options.bias_start = bias_start;
            convolution.initialization = descriptor.initialization;
            validate(convolution.options);
            return convolution;
        };
        const auto gates = make(1.0);
        const auto candidate = make(0.0);

        return [gates, candidate](::Revgrad::Scope& scope, const torch::Tensor& input, const std::vector<torch::Tensor>& side) {
            TORCH_CHECK(input.dim() == 4 && input.size(1) == gates.options.out_channels,
                        "ConvGRU needs out_channels equal to the input channel count (", gates.options.out_channels,
                        " vs. ", input.dim() == 4 ? input.size(1) : -1, ").");
            const ::Revgrad::Activation::Details::SaturatingSigmoid saturating{};

            auto reset_scope = scope.child("reset");
            auto gate_scope = scope.child("gate");
            auto candidate_scope = scope.child("candidate");

            auto reset = saturating(convolve(reset_scope, gates, input, side));
            auto gate = saturating(convolve(gate_scope, gates, input, side));
            auto proposal = torch::tanh(convolve(candidate_scope, candidate, reset * input, side));
            return gate * input + (1 - gate) * proposal;
        };
    }

    // Depthwise 1x3 shift along the width: the first C - 2*(C/3) channels stay, the next C/3 move one
    // step right and the last C/3 one step left. Vacated cells are zero.
    [[nodiscard]] inline torch::Tensor diagonal_shift(const torch::Tensor& input)
    {
        TORCH_CHECK(input.dim() == 4, "diagonal_shift expects a rank 4 NCHW input, got rank ", input.dim(), ".");
        const auto channels = input.size(1);
        const auto shifted = channels / 3;
        const auto kept = channels - 2 * shifted;

        auto weight = torch::zeros({channels, 1, 1, 3}, input.options().requires_grad(false));
        weight.narrow(0, 0, kept).select(3, 1).fill_(1.0);
        weight.narrow(0, kept, shifted).select(3, 0).fill_(1.0);
        weight.narrow(0, kept + shifted, shifted).select(3, 2).fill_(1.0);
        return torch::conv2d(input, weight, /*bias=*/{}, /*stride=*/{1, 1}, /*padding=*/{0, 1}, /*dilation=*/{1, 1}, channels);
    }

    struct DiagonalGRUOptions {
        std::int64_t out_channels{};
        Size2d kernel_size{3, 3};
        Size2d dilation{1, 1};
        Padding padding{Padding::Same};
        double saturation_limit{0.9};
    };

    struct DiagonalGRUDescriptor {
        DiagonalGRUOptions options{};
        ::Revgrad::Initialization::Descriptor initialization{::Revgrad::Initialization::Default};
    };

    //   reset     = hard_sigmoid(conv_reset(x))
    //   gate      = hard_sigmoid(conv_gate(x))
    //   candidate = tanh(conv_candidate(reset * x))
    //   output    = gate * diagonal_shift(x) + (1 - gate) * candidate
    // Saturation costs of the gates are not part of the output. No dropout: a recomputed
    // sub-function has to give the same value twice.
    [[nodiscard]] inline ::Revgrad::SubFunction build_sub_function(const DiagonalGRUDescriptor& descriptor)
    {
        auto make = [&descriptor](double bias_start) {
            Conv2dDescriptor convolution{};
            convolution.options.out_channels = descriptor.options.out_channels;
            convolution.options.kernel_size = descriptor.options.kernel_size;
            convolution.options.dilation = descriptor.options.dilation;
            convolution.options.padding = descriptor.options.padding;
            convolution.options.bias_start = bias_start;
            convolution.initialization = descriptor.initialization;
            validate(convolution.options);
            return convolution;
        };
        const auto reset_convolution = make(0.5);
        const auto gate_convolution = make(0.7);
        const auto candidate_convolution = make(0.0);
        const ::Revgrad::Activation::Details::HardSigmoid hard{descriptor.options.saturation_limit};

        return [reset_convolution, gate_convolution, candidate_convolution, hard](
                   ::Revgrad::Scope& scope, const torch::Tensor& input, const std::vector<torch::Tensor>& side) {
            TORCH_CHECK(input.dim() == 4 && input.size(1) == reset_convolution.options.out_channels,
                        "DiagonalGRU needs out_channels equal to the input channel count (", reset_convolution.options.out_channels,
                        " vs. ", input.dim() == 4 ? input.size(1) : -1, ").");
            auto reset_scope = scope.child("reset");
            auto gate_scope = scope.child("gate");
            auto candidate_scope = scope.child("candidate");

            auto reset = hard(convolve(reset_scope, reset_convolution, input, side)).value;
            auto gate = hard(convolve(gate_scope, gate_convolution, input, side)).value;
            auto proposal = torch::tanh(convolve(candidate_scope, candidate_convolution, reset * input, side));
            return gate * diagonal_shift(input) + (1 - gate) * proposal;
        };
    }
}

#endif //REVGRAD_GRU_HPP
