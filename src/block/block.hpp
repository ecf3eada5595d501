#ifndef REVGRAD_BLOCK_HPP
#define REVGRAD_BLOCK_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

#include "../common/scope.hpp"
#include "details/reversible/block.hpp"
#include "details/reversible/layer.hpp"

namespace Revgrad::Block {
    using ReversibleOptions = Details::Reversible::ReversibleOptions;
    using ReversibleDescriptor = Details::Reversible::ReversibleDescriptor;
    using ReversibleBlock = Details::Reversible::ReversibleBlock;
    using ReversibleBlockImpl = Details::Reversible::ReversibleBlockImpl;
    using ReversibleLayer = Details::Reversible::ReversibleLayer;
    using LayerGradients = Details::Reversible::LayerGradients;

    // One f and one g shared by every layer; each layer still gets its own parameters.
    [[nodiscard]] inline auto Reversible(::Revgrad::SubFunction f, ::Revgrad::SubFunction g, ReversibleOptions options = {}) -> ReversibleDescriptor {
        ReversibleDescriptor descriptor{};
        descriptor.f.assign(options.num_layers, f);
        descriptor.g.assign(options.num_layers, g);
        descriptor.options = std::move(options);
        return descriptor;
    }

    [[nodiscard]] inline auto Reversible(std::vector<::Revgrad::SubFunction> f, std::vector<::Revgrad::SubFunction> g, ReversibleOptions options = {}) -> ReversibleDescriptor {
        ReversibleDescriptor descriptor{};
        descriptor.f = std::move(f);
        descriptor.g = std::move(g);
        descriptor.options = std::move(options);
        return descriptor;
    }

    [[nodiscard]] inline auto Reversible(std::initializer_list<::Revgrad::SubFunction> f, std::initializer_list<::Revgrad::SubFunction> g, ReversibleOptions options = {}) -> ReversibleDescriptor {
        return Reversible(std::vector<::Revgrad::SubFunction>(f), std::vector<::Revgrad::SubFunction>(g), std::move(options));
    }
}

#endif // REVGRAD_BLOCK_HPP
