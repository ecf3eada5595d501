#ifndef REVGRAD_LSTM_HPP
#define REVGRAD_LSTM_HPP

#include <cstdint>
#include <vector>

#include <torch/torch.h>

#include "../../common/scope.hpp"
#include "../../initialization/initialization.hpp"
#include "conv.hpp"

namespace Revgrad::Layer::Details {
    struct ConvLSTMOptions {
        std::int64_t out_channels{};
        Size2d kernel_size{3, 3};
        Size2d dilation{1, 1};
        Padding padding{Padding::Same};
    };

    struct ConvLSTMDescriptor {
        ConvLSTMOptions options{};
        ::Revgrad::Initialization::Descriptor initialization{::Revgrad::Initialization::Default};
    };

    // One convolution yields the four gates, layer-normalised over channels:
    //   cell   = sigmoid(g0) * x + sigmoid(g1) * tanh(g3)
    //   output = sigmoid(g2) * tanh(cell)
    // x plays the previous cell state, so out_channels must equal its channel count.
    [[nodiscard]] inline ::Revgrad::SubFunction build_sub_function(const ConvLSTMDescriptor& descriptor)
    {
        Conv2dDescriptor gates{};
        gates.options.out_channels = 4 * descriptor.options.out_channels;
        gates.options.kernel_size = descriptor.options.kernel_size;
        gates.options.dilation = descriptor.options.dilation;
        gates.options.padding = descriptor.options.padding;
        gates.initialization = descriptor.initialization;
        validate(gates.options);

        return [gates](::Revgrad::Scope& scope, const torch::Tensor& input, const std::vector<torch::Tensor>& side) {
            const auto width = gates.options.out_channels;
            TORCH_CHECK(input.dim() == 4 && 4 * input.size(1) == width,
                        "ConvLSTM needs out_channels equal to the input channel count (", width / 4,
                        " vs. ", input.dim() == 4 ? input.size(1) : -1, ").");

            auto gates_scope = scope.child("gates");
            auto norm_scope = scope.child("layer_norm");
            auto raw = convolve(gates_scope, gates, input, side);

            auto scale = norm_scope.parameter("scale", {width}, ::Revgrad::Initialization::Constant(1.0));
            auto shift = norm_scope.parameter("shift", {width}, ::Revgrad::Initialization::Zeros);
            const std::vector<std::int64_t> normalized_shape{width};
            auto normalised = torch::layer_norm(raw.permute({0, 2, 3, 1}), normalized_shape, scale, shift, 1e-6)
                                  .permute({0, 3, 1, 2});

            auto g = normalised.chunk(4, 1);
            auto cell = torch::sigmoid(g[0]) * input + torch::sigmoid(g[1]) * torch::tanh(g[3]);
            return torch::sigmoid(g[2]) * torch::tanh(cell);
        };
    }
}

#endif //REVGRAD_LSTM_HPP
