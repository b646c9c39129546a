#ifndef TASNET_OPTIMIZER_HPP
#define TASNET_OPTIMIZER_HPP
#include <memory>
#include <variant>

#include "registry.hpp"


#include "details/adam.hpp"
#include "details/sgd.hpp"


namespace Tasnet::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;


    using Descriptor = std::variant<SGDDescriptor,
                                    AdamDescriptor>;



    [[nodiscard]] inline constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

    // Optimizer over every parameter of `owner`, a torch::nn::Module (pass `*model` for a holder).
    template <class Owner>
    [[nodiscard]] std::unique_ptr<torch::optim::Optimizer> build(Owner& owner, const Descriptor& descriptor) {
        return Details::build_optimizer(owner, descriptor);
    }

}

#endif //TASNET_OPTIMIZER_HPP
