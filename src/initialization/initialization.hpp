#ifndef REVGRAD_INITIALIZATION_HPP
#define REVGRAD_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Revgrad::Initialization {
    enum class Type {
        Default,
        XavierNormal,
        XavierUniform,
        HeNormal,
        HeUniform,
        Zeros,
        Constant,
        Orthogonal,
    };

    struct Descriptor {
        Type type{Type::Default};
        double value{0.0}; // Constant only
    };

    inline constexpr Descriptor Default{Type::Default};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal};
    inline constexpr Descriptor XavierUniform{Type::XavierUniform};
    inline constexpr Descriptor HeNormal{Type::HeNormal};
    inline constexpr Descriptor HeUniform{Type::HeUniform};
    inline constexpr Descriptor Zeros{Type::Zeros};
    inline constexpr Descriptor Orthogonal{Type::Orthogonal};

    [[nodiscard]] constexpr auto Constant(double value) -> Descriptor { return {Type::Constant, value}; }
}

#endif // REVGRAD_INITIALIZATION_HPP
