#ifndef REVGRAD_LAYER_PADDING_HPP
#define REVGRAD_LAYER_PADDING_HPP

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Revgrad::Layer::Details {
    enum class Padding {
        Same,  // output spatial size = ceil(input / stride)
        Valid, // no padding
        Left,  // causal: pad only top and left, then valid
    };

    using Size2d = std::array<std::int64_t, 2>;

    struct Pad2d {
        std::int64_t top{0};
        std::int64_t bottom{0};
        std::int64_t left{0};
        std::int64_t right{0};

        [[nodiscard]] bool any() const noexcept { return top != 0 || bottom != 0 || left != 0 || right != 0; }
    };

    [[nodiscard]] inline std::int64_t same_total(std::int64_t extent, std::int64_t kernel, std::int64_t stride, std::int64_t dilation)
    {
        const auto effective = (kernel - 1) * dilation + 1;
        const auto out = (extent + stride - 1) / stride;
        return std::max<std::int64_t>((out - 1) * stride + effective - extent, 0);
    }

    // Inputs are NCHW.
    [[nodiscard]] inline Pad2d resolve_padding(Padding padding, const torch::Tensor& input,
                                               const Size2d& kernel, const Size2d& stride, const Size2d& dilation)
    {
        TORCH_CHECK(input.dim() == 4, "2-D layers expect a rank 4 NCHW input, got rank ", input.dim(), ".");
        Pad2d pad{};
        switch (padding) {
            case Padding::Same: {
                const auto height = same_total(input.size(2), kernel[0], stride[0], dilation[0]);
                const auto width = same_total(input.size(3), kernel[1], stride[1], dilation[1]);
                pad.top = height / 2;
                pad.bottom = height - pad.top;
                pad.left = width / 2;
                pad.right = width - pad.left;
                break;
            }
            case Padding::Left: {
                if (kernel[0] % 2 == 0 || kernel[1] % 2 == 0) {
                    throw std::invalid_argument("Left padding requires odd kernel sizes.");
                }
                pad.top = 2 * (kernel[0] / 2) * dilation[0];
                pad.left = input.size(3) == 1 ? 0 : 2 * (kernel[1] / 2) * dilation[1];
                break;
            }
            case Padding::Valid:
            default:
                break;
        }
        return pad;
    }

    [[nodiscard]] inline torch::Tensor pad(const torch::Tensor& input, const Pad2d& pad, double value = 0.0)
    {
        if (!pad.any()) {
            return input;
        }
        return torch::constant_pad_nd(input, {pad.left, pad.right, pad.top, pad.bottom}, value);
    }

    inline void check_size(const Size2d& size, const char* what)
    {
        if (size[0] <= 0 || size[1] <= 0) {
            throw std::invalid_argument(std::string(what) + " entries must be positive.");
        }
    }
}

#endif // REVGRAD_LAYER_PADDING_HPP
