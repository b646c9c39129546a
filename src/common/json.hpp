#ifndef TASNET_COMMON_JSON_HPP
#define TASNET_COMMON_JSON_HPP

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace Tasnet::Common::Json {
    using PropertyTree = boost::property_tree::ptree;

    // Empty when `key` is absent; a present value that does not convert is an error, never a default.
    template <class Numeric>
    std::optional<Numeric> find_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
    {
        static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
        const auto child = tree.get_child_optional(key);
        if (!child) {
            return std::nullopt;
        }
        const auto value = child->get_value_optional<Numeric>();
        if (!value) {
            std::ostringstream message;
            message << "Invalid numeric field '" << key << "' = '" << child->data() << "' in " << context;
            throw std::runtime_error(message.str());
        }
        return *value;
    }

    template <class Numeric>
    Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
    {
        const auto value = find_numeric<Numeric>(tree, key, context);
        if (!value) {
            std::ostringstream message;
            message << "Missing numeric field '" << key << "' in " << context;
            throw std::runtime_error(message.str());
        }
        return *value;
    }

    inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
    {
        const auto value = tree.get_optional<std::string>(key);
        if (!value) {
            std::ostringstream message;
            message << "Missing string field '" << key << "' in " << context;
            throw std::runtime_error(message.str());
        }
        return *value;
    }

    namespace Details {
        // Stream extraction does not parse "nan" / "inf", so non-finite floats use fixed spellings.
        inline constexpr const char* kNaN = "nan";
        inline constexpr const char* kInfinity = "inf";
        inline constexpr const char* kNegativeInfinity = "-inf";

        template <class T>
        std::optional<T> parse_non_finite(const std::string& text)
        {
            if (text == kNaN) {
                return std::numeric_limits<T>::quiet_NaN();
            }
            if (text == kInfinity) {
                return std::numeric_limits<T>::infinity();
            }
            if (text == kNegativeInfinity) {
                return -std::numeric_limits<T>::infinity();
            }
            return std::nullopt;
        }
    }

    template <class T>
    std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
    {
        std::vector<T> values;
        values.reserve(tree.size());
        for (const auto& child : tree) {
            if constexpr (std::is_floating_point_v<T>) {
                if (const auto special = Details::parse_non_finite<T>(child.second.data())) {
                    values.push_back(*special);
                    continue;
                }
            }
            const auto value = child.second.get_value_optional<T>();
            if (!value) {
                std::ostringstream message;
                message << "Invalid array element '" << child.second.data() << "' in " << context;
                throw std::runtime_error(message.str());
            }
            values.push_back(*value);
        }
        return values;
    }

    template <class T>
    PropertyTree write_array(const std::vector<T>& values)
    {
        PropertyTree array;
        for (const auto& value : values) {
            PropertyTree element;
            if constexpr (std::is_floating_point_v<T>) {
                if (std::isnan(value)) {
                    element.put("", std::string(Details::kNaN));
                } else if (std::isinf(value)) {
                    element.put("", std::string(value > 0 ? Details::kInfinity : Details::kNegativeInfinity));
                } else {
                    element.put("", value);
                }
            } else {
                element.put("", value);
            }
            array.push_back({"", element});
        }
        return array;
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error(std::string("Failed to read JSON from '") + path.string() + "': " + error.what());
        }
        return tree;
    }
}

#endif // TASNET_COMMON_JSON_HPP
