#ifndef REVGRAD_POOLING_HPP
#define REVGRAD_POOLING_HPP

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../../common/scope.hpp"
#include "padding.hpp"

namespace Revgrad::Layer::Details {
    enum class PoolingType {
        Avg,
        Max,
    };

    struct Pool2dOptions {
        PoolingType type{PoolingType::Avg};
        Size2d kernel_size{3, 3};
        Size2d stride{1, 1};
        Padding padding{Padding::Same};
    };

    struct Pool2dDescriptor {
        Pool2dOptions options{};
        ::Revgrad::Activation::Descriptor activation{::Revgrad::Activation::Identity};
    };

    inline void validate(const Pool2dOptions& options)
    {
        check_size(options.kernel_size, "Pool2d kernel_size");
        check_size(options.stride, "Pool2d stride");
        if (options.padding == Padding::Left && (options.kernel_size[0] % 2 == 0 || options.kernel_size[1] % 2 == 0)) {
            throw std::invalid_argument("Pool2d with left padding requires odd kernel sizes.");
        }
    }

    // Same padding never lets padded cells into the result: max pools over -inf, average pools divide
    // by the number of real cells under the window. Left padding pads zeros that do count.
    inline torch::Tensor pool2d(const torch::Tensor& input, const Pool2dOptions& options)
    {
        const Size2d unit{1, 1};
        const auto padding = resolve_padding(options.padding, input, options.kernel_size, options.stride, unit);
        const std::vector<std::int64_t> kernel{options.kernel_size[0], options.kernel_size[1]};
        const std::vector<std::int64_t> stride{options.stride[0], options.stride[1]};

        if (options.type == PoolingType::Max) {
            const auto fill = options.padding == Padding::Same ? -std::numeric_limits<double>::infinity() : 0.0;
            return torch::max_pool2d(pad(input, padding, fill), kernel, stride);
        }

        auto summed = torch::avg_pool2d(pad(input, padding), kernel, stride);
        if (options.padding != Padding::Same || !padding.any()) {
            return summed;
        }
        auto coverage = torch::avg_pool2d(pad(torch::ones_like(input.narrow(1, 0, 1)), padding), kernel, stride);
        return summed / coverage;
    }

    [[nodiscard]] inline ::Revgrad::SubFunction build_sub_function(const Pool2dDescriptor& descriptor)
    {
        validate(descriptor.options);
        return [descriptor](::Revgrad::Scope&, const torch::Tensor& input, const std::vector<torch::Tensor>& side) {
            TORCH_CHECK(side.empty(), "Pool2d takes no side inputs, got ", side.size(), ".");
            return ::Revgrad::Activation::Details::apply(descriptor.activation, pool2d(input, descriptor.options));
        };
    }
}

#endif //REVGRAD_POOLING_HPP
