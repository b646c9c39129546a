#ifndef TASNET_COMMON_SAVE_LOAD_HPP
#define TASNET_COMMON_SAVE_LOAD_HPP
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../utils/log.hpp"
#include "../utils/shape.hpp"
#include "config.hpp"
#include "json.hpp"
#include "options.hpp"

/*
 * Checkpoint package.
 * ---------------------------------------------------------------------------
 * In memory a Package holds the hyperparameters, a snapshot of every parameter
 * and buffer, and optionally the optimizer state, the epoch counter and the
 * train / validation loss history.
 *
 * On disk a package is a directory:
 *   architecture.json   hyperparameters, epoch, losses, ordered state_dict keys
 *   parameters.binary   the state_dict tensors, in key order
 *   optimizer.binary    the optimizer archive (only when one was captured)
 */
namespace Tasnet::Common::SaveLoad {
    using PropertyTree = Json::PropertyTree;
    using StateDict = torch::OrderedDict<std::string, torch::Tensor>;

    inline constexpr const char* kArchitectureFile = "architecture.json";
    inline constexpr const char* kParametersFile = "parameters.binary";
    inline constexpr const char* kOptimizerFile = "optimizer.binary";

    struct Package {
        Options options{};
        StateDict state_dict{"state_dict"};
        std::optional<std::string> optim_dict{}; // serialized torch::optim archive
        std::optional<std::int64_t> epoch{};
        std::optional<std::vector<double>> tr_loss{};
        std::optional<std::vector<double>> cv_loss{};

        [[nodiscard]] bool resumable() const noexcept { return optim_dict.has_value() && epoch.has_value(); }
    };

    // Detached copies of every parameter and buffer of `module`, keyed by their dotted names.
    inline StateDict capture_state(const torch::nn::Module& module)
    {
        torch::NoGradGuard guard;
        StateDict state{"state_dict"};
        for (const auto& item : module.named_parameters(/*recurse=*/true)) {
            state.insert(item.key(), item.value().detach().clone());
        }
        for (const auto& item : module.named_buffers(/*recurse=*/true)) {
            if (!item.value().defined()) {
                continue;
            }
            state.insert(item.key(), item.value().detach().clone());
        }
        return state;
    }

    // Copies `state` into `module`. The load is strict: every parameter and buffer must be present
    // with a matching shape and `state` may hold nothing else. Every entry is checked before the
    // first copy, so a failing load leaves the module untouched.
    inline void apply_state(torch::nn::Module& module, const StateDict& state)
    {
        auto parameters = module.named_parameters(/*recurse=*/true);
        auto buffers = module.named_buffers(/*recurse=*/true);

        auto check = [&state](const std::string& key, const torch::Tensor& target, const char* kind) {
            const auto* stored = state.find(key);
            if (stored == nullptr) {
                throw std::runtime_error(std::string("Checkpoint is missing ") + kind + " '" + key + "'.");
            }
            if (!stored->defined()) {
                throw std::runtime_error(std::string("Checkpoint ") + kind + " '" + key + "' is undefined.");
            }
            if (stored->sizes() != target.sizes()) {
                throw std::runtime_error(std::string(kind) + " '" + key + "' shape mismatch: expected "
                                         + Utils::format_shape(target) + " but found "
                                         + Utils::format_shape(*stored) + ".");
            }
        };

        for (const auto& item : parameters) {
            check(item.key(), item.value(), "parameter");
        }
        for (const auto& item : buffers) {
            if (item.value().defined()) {
                check(item.key(), item.value(), "buffer");
            }
        }

        for (const auto& item : state) {
            const auto* buffer = buffers.find(item.key());
            if (!parameters.contains(item.key()) && (buffer == nullptr || !buffer->defined())) {
                throw std::runtime_error("Checkpoint entry '" + item.key() + "' has no counterpart in the model.");
            }
        }

        torch::NoGradGuard guard;
        for (auto& item : parameters) {
            item.value().copy_(state[item.key()]);
        }
        for (auto& item : buffers) {
            if (item.value().defined()) {
                item.value().copy_(state[item.key()]);
            }
        }
    }

    inline std::string capture_optimizer(const torch::optim::Optimizer& optimizer)
    {
        torch::serialize::OutputArchive archive;
        optimizer.save(archive);
        std::ostringstream bytes;
        archive.save_to(bytes);
        return bytes.str();
    }

    inline void apply_optimizer(const std::string& optim_dict, torch::optim::Optimizer& optimizer)
    {
        torch::serialize::InputArchive archive;
        std::istringstream bytes(optim_dict);
        try {
            archive.load_from(bytes);
            optimizer.load(archive);
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to restore optimizer state: ") + error.what());
        }
    }

    inline PropertyTree serialize_package(const Package& package)
    {
        PropertyTree tree = Config::to_property_tree(package.options);
        if (package.epoch) {
            tree.put("epoch", *package.epoch);
        }
        if (package.tr_loss) {
            tree.add_child("tr_loss", Json::write_array(*package.tr_loss));
        }
        if (package.cv_loss) {
            tree.add_child("cv_loss", Json::write_array(*package.cv_loss));
        }
        std::vector<std::string> keys;
        keys.reserve(package.state_dict.size());
        for (const auto& item : package.state_dict) {
            keys.push_back(item.key());
        }
        tree.add_child("state_dict", Json::write_array(keys));
        return tree;
    }

    // Everything but the tensors; the returned keys give the order of parameters.binary.
    inline std::pair<Package, std::vector<std::string>> deserialize_package(const PropertyTree& tree,
                                                                            const std::string& context,
                                                                            std::ostream* stream = &std::cout)
    {
        Package package{};
        package.options = Config::from_property_tree(tree, context, /*require_all=*/true, stream);
        if (const auto epoch = Json::find_numeric<std::int64_t>(tree, "epoch", context)) {
            package.epoch = *epoch;
        }
        if (const auto node = tree.get_child_optional("tr_loss")) {
            package.tr_loss = Json::read_array<double>(*node, context + " tr_loss");
        }
        if (const auto node = tree.get_child_optional("cv_loss")) {
            package.cv_loss = Json::read_array<double>(*node, context + " cv_loss");
        }
        const auto keys_node = tree.get_child_optional("state_dict");
        if (!keys_node) {
            throw std::runtime_error("Missing 'state_dict' entry in " + context);
        }
        return {std::move(package), Json::read_array<std::string>(*keys_node, context + " state_dict")};
    }

    inline void save_package(const std::filesystem::path& directory, const Package& package, std::ostream* stream = &std::cout)
    {
        namespace fs = std::filesystem;
        if (directory.empty()) {
            throw std::invalid_argument("save_package requires a non-empty directory path.");
        }
        fs::create_directories(directory);

        const auto architecture_path = directory / kArchitectureFile;
        const auto parameters_path = directory / kParametersFile;
        const auto optimizer_path = directory / kOptimizerFile;

        try {
            Json::write_json_file(architecture_path, serialize_package(package));
        } catch (const std::exception& error) {
            throw std::runtime_error(std::string("Failed to write architecture description to '")
                                     + architecture_path.string() + "': " + error.what());
        }

        std::vector<torch::Tensor> tensors;
        tensors.reserve(package.state_dict.size());
        for (const auto& item : package.state_dict) {
            tensors.push_back(item.value().to(torch::kCPU));
        }
        try {
            torch::save(tensors, parameters_path.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to write parameters to '")
                                     + parameters_path.string() + "': " + error.what());
        }

        if (package.optim_dict) {
            std::ofstream file(optimizer_path, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Failed to open '" + optimizer_path.string() + "' for writing.");
            }
            file.write(package.optim_dict->data(), static_cast<std::streamsize>(package.optim_dict->size()));
        } else if (fs::exists(optimizer_path)) {
            fs::remove(optimizer_path);
        }

        Utils::Log::Info(stream, "Checkpoint saved to: " + directory.string());
    }

    inline Package load_package(const std::filesystem::path& directory, std::ostream* stream = &std::cout)
    {
        namespace fs = std::filesystem;
        if (directory.empty()) {
            throw std::invalid_argument("load_package requires a non-empty directory path.");
        }

        const auto architecture_path = directory / kArchitectureFile;
        const auto parameters_path = directory / kParametersFile;
        const auto optimizer_path = directory / kOptimizerFile;

        if (!fs::exists(architecture_path)) {
            throw std::runtime_error(std::string("Architecture file not found at '") + architecture_path.string() + "'.");
        }
        if (!fs::exists(parameters_path)) {
            throw std::runtime_error(std::string("Parameter archive not found at '") + parameters_path.string() + "'.");
        }

        auto [package, keys] = deserialize_package(Json::read_json_file(architecture_path),
                                                   "checkpoint '" + architecture_path.string() + "'", stream);

        std::vector<torch::Tensor> tensors;
        try {
            torch::load(tensors, parameters_path.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to load parameters from '")
                                     + parameters_path.string() + "': " + error.what());
        }
        if (tensors.size() != keys.size()) {
            throw std::runtime_error("Parameter archive '" + parameters_path.string() + "' holds "
                                     + std::to_string(tensors.size()) + " tensors but the architecture lists "
                                     + std::to_string(keys.size()) + ".");
        }
        for (std::size_t index = 0; index < keys.size(); ++index) {
            package.state_dict.insert(keys[index], std::move(tensors[index]));
        }

        if (fs::exists(optimizer_path)) {
            std::ifstream file(optimizer_path, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Failed to open '" + optimizer_path.string() + "' for reading.");
            }
            package.optim_dict = std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        }

        Utils::Log::Info(stream, "Checkpoint loaded from: " + directory.string());
        return package;
    }
}
#endif // TASNET_COMMON_SAVE_LOAD_HPP
