#ifndef REVGRAD_ACTIVATION_HPP
#define REVGRAD_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Revgrad::Activation {
    enum class Type {
        Identity,
        ReLU,
        Sigmoid,
        Tanh,
        GeLU,
        SiLU,
        SaturatingSigmoid,
        HardSigmoid,
        HardTanh,
    };

    struct Descriptor {
        Type type{Type::Identity};
        double saturation_limit{0.9}; // HardSigmoid / HardTanh
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor GeLU{Type::GeLU};
    inline constexpr Descriptor SiLU{Type::SiLU};
    inline constexpr Descriptor SaturatingSigmoid{Type::SaturatingSigmoid};
    inline constexpr Descriptor HardSigmoid{Type::HardSigmoid};
    inline constexpr Descriptor HardTanh{Type::HardTanh};
}

#endif //REVGRAD_ACTIVATION_HPP
