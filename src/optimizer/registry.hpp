#ifndef TASNET_OPTIMIZER_REGISTRY_HPP
#define TASNET_OPTIMIZER_REGISTRY_HPP


#include <memory>
#include <variant>

#include <torch/torch.h>

#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Tasnet::Optimizer::Details {
    template <class Owner, class Descriptor>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const SGDDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::SGD>(owner.parameters(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::Adam>(owner.parameters(), options);
    }

    template <class Owner, class... DescriptorTypes>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const std::variant<DescriptorTypes...>& descriptor) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_optimizer(owner, concrete_descriptor);
            },
            descriptor);
    }
}

#endif // TASNET_OPTIMIZER_REGISTRY_HPP
