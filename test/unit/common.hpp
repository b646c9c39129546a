#ifndef TASNET_TEST_COMMON_HPP
#define TASNET_TEST_COMMON_HPP

#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../src/utils/terminal.hpp"

namespace TasnetTest {
    inline int& failures()
    {
        static int count = 0;
        return count;
    }

    inline void test_passed(const std::string& name)
    {
        using namespace Tasnet::Utils::Terminal;
        std::cout << ApplyColor("[PASS] ", Colors::kBrightGreen) << Symbols::kCheck << ' ' << name << std::endl;
    }

    inline void test_failed(const std::string& name, const std::string& reason)
    {
        using namespace Tasnet::Utils::Terminal;
        std::cerr << ApplyColor("[FAIL] ", Colors::kBrightRed) << Symbols::kCross << ' ' << name << ": " << reason << std::endl;
        ++failures();
    }

    struct Failure : std::exception {
        explicit Failure(std::string reason) : reason_(std::move(reason)) {}
        const char* what() const noexcept override { return reason_.c_str(); }
        std::string reason_;
    };

    inline void expect(bool condition, const std::string& reason)
    {
        if (!condition) {
            throw Failure(reason);
        }
    }

    inline bool approx_equal(const torch::Tensor& a, const torch::Tensor& b, double tol = 1e-5)
    {
        return a.sizes() == b.sizes() && torch::allclose(a, b, /*rtol=*/tol, /*atol=*/tol);
    }

    template <class Body>
    void run(const std::string& name, Body&& body)
    {
        try {
            body();
            test_passed(name);
        } catch (const std::exception& error) {
            test_failed(name, error.what());
        }
    }

    // Runs `body` and reports whether it threw an exception of type E.
    template <class E, class Body>
    bool throws(Body&& body)
    {
        try {
            body();
        } catch (const E&) {
            return true;
        }
        return false;
    }

    inline int finish(const char* suite)
    {
        std::cout << "=== " << suite << ": " << (failures() == 0 ? "all passed" : std::to_string(failures()) + " failed")
                  << " ===" << std::endl;
        return failures() == 0 ? 0 : 1;
    }
}

#endif // TASNET_TEST_COMMON_HPP
