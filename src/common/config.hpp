#ifndef TASNET_COMMON_CONFIG_HPP
#define TASNET_COMMON_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>

#include "../layer/details/normalization.hpp"
#include "json.hpp"
#include "options.hpp"

namespace Tasnet::Config {
    using PropertyTree = Common::Json::PropertyTree;

    inline PropertyTree to_property_tree(const Options& options)
    {
        PropertyTree tree;
        tree.put("N", options.N);
        tree.put("L", options.L);
        tree.put("B", options.B);
        tree.put("H", options.H);
        tree.put("P", options.P);
        tree.put("X", options.X);
        tree.put("R", options.R);
        tree.put("C", options.C);
        tree.put("norm_type", Layer::Details::to_string(options.norm_type));
        return tree;
    }

    // With `require_all`, every hyperparameter key must be present (checkpoints); otherwise
    // missing keys keep their defaults (hand-written configuration files). A key that is present
    // but not an integer is rejected in both modes.
    // A missing norm_type always reads as gLN: older checkpoints never stored it.
    inline Options from_property_tree(const PropertyTree& tree,
                                      const std::string& context,
                                      bool require_all,
                                      std::ostream* stream = &std::cout)
    {
        Options options{};
        auto read = [&](const std::string& key, std::int64_t& target) {
            if (require_all) {
                target = Common::Json::get_numeric<std::int64_t>(tree, key, context);
            } else if (const auto value = Common::Json::find_numeric<std::int64_t>(tree, key, context)) {
                target = *value;
            }
        };
        read("N", options.N);
        read("L", options.L);
        read("B", options.B);
        read("H", options.H);
        read("P", options.P);
        read("X", options.X);
        read("R", options.R);
        read("C", options.C);
        if (const auto norm_type = tree.get_optional<std::string>("norm_type")) {
            options.norm_type = Layer::Details::parse_norm_type(*norm_type, stream);
        } else {
            options.norm_type = Layer::Details::NormType::Global;
        }
        validate(options);
        return options;
    }

    inline Options read_options(const std::filesystem::path& path, std::ostream* stream = &std::cout)
    {
        return from_property_tree(Common::Json::read_json_file(path), "configuration '" + path.string() + "'",
                                  /*require_all=*/false, stream);
    }

    inline void write_options(const std::filesystem::path& path, const Options& options)
    {
        Common::Json::write_json_file(path, to_property_tree(options));
    }
}

#endif // TASNET_COMMON_CONFIG_HPP
