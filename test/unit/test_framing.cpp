#include <iostream>

#include <torch/torch.h>

#include "../../include/Tasnet.h"
#include "common.hpp"

using namespace TasnetTest;
namespace Data = Tasnet::Data;

namespace {
    void test_frame_layout()
    {
        const auto waveform = torch::arange(8, torch::kFloat32).view({1, 8});
        const auto frames = Data::Frame(waveform, {.frame_length = 4});
        expect(frames.sizes() == torch::IntArrayRef({1, 2, 4}), "8 samples make two frames of 4");
        expect(approx_equal(frames.select(1, 1), torch::arange(4, 8, torch::kFloat32).view({1, 4})), "second frame content");
    }

    void test_frame_pads_tail()
    {
        const auto frames = Data::Frame(torch::ones({2, 10}), {.frame_length = 4});
        expect(frames.sizes() == torch::IntArrayRef({2, 3, 4}), "10 samples pad to three frames of 4");
        expect(frames.select(1, 2).sum().item<double>() == 4.0, "two real samples per mixture in the last frame, then zeros");
    }

    void test_frame_with_hop()
    {
        const auto frames = Data::Frame(torch::arange(10, torch::kFloat32), {.frame_length = 4, .hop = 2});
        expect(frames.sizes() == torch::IntArrayRef({1, 4, 4}), "hop 2 over 10 samples gives four frames");
        expect(frames[0][1][0].item<double>() == 2.0, "second frame starts one hop later");
    }

    void test_round_trip_without_overlap()
    {
        torch::manual_seed(19);
        const auto waveform = torch::randn({3, 12});
        const auto restored = Data::OverlapAdd(Data::Frame(waveform, {.frame_length = 4}), 4);
        expect(approx_equal(restored, waveform), "frame then overlap-add must reconstruct the waveform");
    }

    void test_round_trip_with_overlap()
    {
        torch::manual_seed(20);
        const auto waveform = torch::randn({2, 9});
        const auto frames = Data::Frame(waveform, {.frame_length = 4, .hop = 2});
        const auto summed = Data::OverlapAdd(frames, 2);
        const auto restored = summed / Data::OverlapCount(frames.size(1), 4, 2);
        const auto padded = torch::constant_pad_nd(waveform, {0, restored.size(-1) - 9}, 0);
        expect(approx_equal(restored, padded), "normalised overlap-add must reconstruct the padded waveform");
    }

    void test_overlap_add_keeps_leading_axes()
    {
        const auto signal = Data::OverlapAdd(torch::ones({2, 3, 5, 4}), 2);
        expect(signal.sizes() == torch::IntArrayRef({2, 3, 12}), "[M, C, K, L] -> [M, C, (K - 1) * hop + L]");
        expect(signal[0][0][3].item<double>() == 2.0, "overlapping samples are summed");
    }

    void test_invalid_arguments()
    {
        expect(throws<c10::Error>([] { Data::Frame(torch::ones({4}), {.frame_length = 0}); }), "frame length 0");
        expect(throws<c10::Error>([] { Data::OverlapAdd(torch::ones({2, 4}), 0); }), "hop 0");
    }

    void test_hop_longer_than_frame()
    {
        expect(throws<c10::Error>([] { Data::Frame(torch::arange(12, torch::kFloat32), {.frame_length = 4, .hop = 6}); }),
               "a hop beyond the frame length would skip samples");
        expect(throws<c10::Error>([] { Data::OverlapAdd(torch::ones({2, 4}), 6); }),
               "overlap-add cannot leave gaps between frames");
        const auto frames = Data::Frame(torch::arange(12, torch::kFloat32), {.frame_length = 4, .hop = 4});
        expect(frames.sizes() == torch::IntArrayRef({1, 3, 4}), "hop equal to the frame length is allowed");
    }
}

int main()
{
    std::cout << "=== Framing tests ===" << std::endl;
    run("frame layout", test_frame_layout);
    run("frame pads the tail", test_frame_pads_tail);
    run("frame with hop", test_frame_with_hop);
    run("round trip without overlap", test_round_trip_without_overlap);
    run("round trip with overlap", test_round_trip_with_overlap);
    run("overlap-add keeps leading axes", test_overlap_add_keeps_leading_axes);
    run("invalid arguments", test_invalid_arguments);
    run("hop longer than the frame", test_hop_longer_than_frame);
    return finish("Framing");
}
