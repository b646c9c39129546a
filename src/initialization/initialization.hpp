#ifndef TASNET_INITIALIZATION_HPP
#define TASNET_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Tasnet::Initialization {
    enum class Type {
        Default, // libtorch reset_parameters(), kaiming uniform with a = sqrt(5)
        XavierNormal,
    };

    struct Descriptor {
        Type type{Type::Default};
    };

    inline constexpr Descriptor Default{Type::Default};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal};
}

#endif //TASNET_INITIALIZATION_HPP
