#ifndef TASNET_LAYER_REGISTRY_HPP
#define TASNET_LAYER_REGISTRY_HPP

#include <stdexcept>
#include <string>

#include <torch/torch.h>

// Every layer descriptor provides an overload of
//     build_registered_layer(Owner&, const Descriptor&, const std::string& name)
// which registers the module on the owner under `name` and returns its holder.
// Parameter names therefore follow the module tree ("separator.layer_norm.gamma").
namespace Tasnet::Layer::Details {
    template <class Owner, class Descriptor>
    void build_registered_layer(Owner&, const Descriptor&, const std::string&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported layer descriptor provided to build_registered_layer.");
    }

    inline void require_name(const std::string& name)
    {
        if (name.empty()) {
            throw std::invalid_argument("Layers must be registered under a non-empty name.");
        }
    }
}
#endif // TASNET_LAYER_REGISTRY_HPP
