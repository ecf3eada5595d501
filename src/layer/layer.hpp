#ifndef REVGRAD_LAYER_HPP
#define REVGRAD_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <initializer_list>
#include <utility>
#include <vector>

#include "details/conv.hpp"
#include "details/fc.hpp"
#include "details/gru.hpp"
#include "details/lstm.hpp"
#include "details/multiscale.hpp"
#include "details/padding.hpp"
#include "details/pooling.hpp"

#include "registry.hpp"

namespace Revgrad::Layer {
    using Padding = Details::Padding;
    using Size2d = Details::Size2d;
    using PoolingType = Details::PoolingType;
    using Scale = Details::Scale;

    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using Conv2dOptions = Details::Conv2dOptions;
    using Conv2dDescriptor = Details::Conv2dDescriptor;

    using Pool2dOptions = Details::Pool2dOptions;
    using Pool2dDescriptor = Details::Pool2dDescriptor;

    using MultiscaleConv2dSumOptions = Details::MultiscaleConv2dSumOptions;
    using MultiscaleConv2dSumDescriptor = Details::MultiscaleConv2dSumDescriptor;

    using ConvGRUOptions = Details::ConvGRUOptions;
    using ConvGRUDescriptor = Details::ConvGRUDescriptor;
    using DiagonalGRUOptions = Details::DiagonalGRUOptions;
    using DiagonalGRUDescriptor = Details::DiagonalGRUDescriptor;
    using ConvLSTMOptions = Details::ConvLSTMOptions;
    using ConvLSTMDescriptor = Details::ConvLSTMDescriptor;

    using Descriptor = Details::Descriptor;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Revgrad::Activation::Descriptor activation = ::Revgrad::Activation::Identity,
                                 ::Revgrad::Initialization::Descriptor initialization = ::Revgrad::Initialization::Default) -> FCDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Conv2d(const Conv2dOptions& options, ::Revgrad::Activation::Descriptor activation = ::Revgrad::Activation::Identity,
                                     ::Revgrad::Initialization::Descriptor initialization = ::Revgrad::Initialization::Default) -> Conv2dDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Pool2d(const Pool2dOptions& options = {},
                                     ::Revgrad::Activation::Descriptor activation = ::Revgrad::Activation::Identity) -> Pool2dDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto MultiscaleConv2dSum(const MultiscaleConv2dSumOptions& options,
                                                  ::Revgrad::Activation::Descriptor activation = ::Revgrad::Activation::Identity,
                                                  ::Revgrad::Initialization::Descriptor initialization = ::Revgrad::Initialization::Default) -> MultiscaleConv2dSumDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto ConvGRU(const ConvGRUOptions& options,
                                      ::Revgrad::Initialization::Descriptor initialization = ::Revgrad::Initialization::Default) -> ConvGRUDescriptor {
        return {options, initialization};
    }

    [[nodiscard]] inline auto DiagonalGRU(const DiagonalGRUOptions& options,
                                          ::Revgrad::Initialization::Descriptor initialization = ::Revgrad::Initialization::Default) -> DiagonalGRUDescriptor {
        return {options, initialization};
    }

    [[nodiscard]] inline auto ConvLSTM(const ConvLSTMOptions& options,
                                       ::Revgrad::Initialization::Descriptor initialization = ::Revgrad::Initialization::Default) -> ConvLSTMDescriptor {
        return {options, initialization};
    }

    // Turns descriptors into the sub-functions reversible blocks and custom gradients consume.
    [[nodiscard]] inline auto Build(const Descriptor& descriptor) -> ::Revgrad::SubFunction {
        return Details::build_sub_function(descriptor);
    }

    [[nodiscard]] inline auto Build(std::initializer_list<Descriptor> descriptors) -> ::Revgrad::SubFunction {
        return Details::build_sub_function(std::vector<Descriptor>(descriptors));
    }

    [[nodiscard]] inline auto Build(const std::vector<Descriptor>& descriptors) -> ::Revgrad::SubFunction {
        return Details::build_sub_function(descriptors);
    }
}

#endif //REVGRAD_LAYER_HPP
