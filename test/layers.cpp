#include "../include/Revgrad.h"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    int failures = 0;

    void check(bool condition, const std::string& message)
    {
        if (!condition) {
            std::cerr << "[layers] " << message << '\n';
            ++failures;
        }
    }

    bool same_shape(const torch::Tensor& tensor, std::vector<std::int64_t> sizes)
    {
        return tensor.sizes() == c10::IntArrayRef(sizes);
    }
}

int main()
{
    torch::manual_seed(5);

    // FC: width from the input, side inputs as extra features, parameters reused.
    {
        Revgrad::Scope scope{};
        auto fc = Revgrad::Layer::Build(Revgrad::Layer::FC({7}, Revgrad::Activation::ReLU));
        auto x = torch::randn({3, 4});
        auto side = torch::randn({3, 2});
        auto y = fc(scope, x, {side});
        check(same_shape(y, {3, 7}), "FC output shape");
        check((y >= 0).all().item<bool>(), "ReLU activation applied");
        auto weight = scope.workspace().parameters().find("weight");
        check(weight.has_value() && same_shape(weight->value, {7, 6}), "FC weight spans input and side features");
        (void)fc(scope, x, {side});
        check(scope.workspace().parameters().size() == 2, "second call reuses weight and bias");
    }

    // Conv2d padding modes
    {
        Revgrad::Scope scope{};
        auto x = torch::randn({2, 3, 8, 6});

        auto same = scope.child("same");
        auto y = Revgrad::Layer::Build(Revgrad::Layer::Conv2d({.out_channels = 5, .kernel_size = {3, 5}}))(same, x, {});
        check(same_shape(y, {2, 5, 8, 6}), "same padding keeps spatial size");

        auto strided = scope.child("strided");
        y = Revgrad::Layer::Build(Revgrad::Layer::Conv2d({.out_channels = 4, .stride = {2, 2}}))(strided, x, {});
        check(same_shape(y, {2, 4, 4, 3}), "same padding with stride 2 halves spatial size");

        auto valid = scope.child("valid");
        y = Revgrad::Layer::Build(Revgrad::Layer::Conv2d({.out_channels = 4, .padding = Revgrad::Layer::Padding::Valid}))(valid, x, {});
        check(same_shape(y, {2, 4, 6, 4}), "valid padding shrinks by kernel - 1");

        auto left = scope.child("left");
        y = Revgrad::Layer::Build(Revgrad::Layer::Conv2d({.out_channels = 3, .dilation = {2, 1}, .padding = Revgrad::Layer::Padding::Left}))(left, x, {});
        check(same_shape(y, {2, 3, 8, 6}), "left padding keeps spatial size with dilation");

        // Causality: changing the last row must not affect earlier rows.
        auto causal = scope.child("causal");
        auto conv = Revgrad::Layer::Build(Revgrad::Layer::Conv2d({.out_channels = 2, .padding = Revgrad::Layer::Padding::Left}));
        auto altered = x.clone();
        altered.select(2, 7).add_(1.0);
        auto before = conv(causal, x, {});
        auto after = conv(causal, altered, {});
        check(torch::allclose(before.narrow(2, 0, 7), after.narrow(2, 0, 7)), "left padding only looks at earlier rows");

        auto bias_scope = scope.child("biased");
        (void)Revgrad::Layer::Build(Revgrad::Layer::Conv2d({.out_channels = 2, .bias_start = 1.0}))(bias_scope, x, {});
        auto bias = bias_scope.workspace().parameters().find("biased/bias");
        check(bias.has_value() && torch::equal(bias->value, torch::ones({2})), "bias starts at bias_start");

        bool raised = false;
        try {
            (void)Revgrad::Layer::Build(Revgrad::Layer::Conv2d({.out_channels = 2, .kernel_size = {2, 2}, .padding = Revgrad::Layer::Padding::Left}));
        } catch (const std::invalid_argument&) {
            raised = true;
        }
        check(raised, "left padding with an even kernel is rejected");

        raised = false;
        try {
            (void)Revgrad::Layer::Build(Revgrad::Layer::Conv2d({.out_channels = 0}));
        } catch (const std::invalid_argument&) {
            raised = true;
        }
        check(raised, "non-positive channel counts are rejected");
    }

    // Pool2d
    {
        Revgrad::Scope scope{};
        auto ones = torch::ones({1, 2, 5, 5});
        auto average = Revgrad::Layer::Build(Revgrad::Layer::Pool2d({.type = Revgrad::Layer::PoolingType::Avg}));
        auto y = average(scope, ones, {});
        check(same_shape(y, {1, 2, 5, 5}) && torch::allclose(y, ones), "same average pooling ignores padded cells");

        auto negative = -torch::ones({1, 1, 4, 4});
        auto maximum = Revgrad::Layer::Build(Revgrad::Layer::Pool2d({.type = Revgrad::Layer::PoolingType::Max}));
        check(torch::allclose(maximum(scope, negative, {}), negative), "same max pooling never picks padding");

        auto left = Revgrad::Layer::Build(Revgrad::Layer::Pool2d({.type = Revgrad::Layer::PoolingType::Avg, .padding = Revgrad::Layer::Padding::Left}));
        y = left(scope, ones, {});
        check(same_shape(y, {1, 2, 5, 5}), "left pooling keeps spatial size");
        check(std::abs(y.index({0, 0, 0, 0}).item<double>() - 1.0 / 9.0) < 1e-6, "left padding pads zeros that count");
        check(scope.workspace().parameters().size() == 0, "pooling creates no parameters");
    }

    // MultiscaleConv2dSum
    {
        Revgrad::Scope scope{};
        Revgrad::Layer::MultiscaleConv2dSumOptions options{};
        options.out_channels = 4;
        options.scales = {
            Revgrad::Layer::Scale{{1, 1}, {3, 3}},
            Revgrad::Layer::Scale{{2, 2}, {3, 3}},
            Revgrad::Layer::Scale{{4, 1}, {1, 3}},
        };
        auto multiscale = Revgrad::Layer::Build(Revgrad::Layer::MultiscaleConv2dSum(options));
        auto x = torch::randn({2, 3, 7, 7});
        auto y = multiscale(scope, x, {});
        check(same_shape(y, {2, 4, 7, 7}), "multiscale sum keeps spatial size");
        check(scope.workspace().parameters().find("conv_layer2/weight").has_value(), "one convolution per scale");
        check(scope.workspace().parameters().size() == 6, "weight and bias per scale");

        // With a single scale the sum is that convolution alone.
        Revgrad::Scope single{};
        Revgrad::Layer::MultiscaleConv2dSumOptions one{};
        one.out_channels = 2;
        one.scales.push_back(Revgrad::Layer::Scale{{1, 1}, {3, 3}});
        auto z = Revgrad::Layer::Build(Revgrad::Layer::MultiscaleConv2dSum(one))(single, x, {});
        auto scale_scope = single.child("conv_layer0");
        auto reference = Revgrad::Layer::Build(Revgrad::Layer::Conv2d({.out_channels = 2}))(scale_scope, x, {});
        check(torch::allclose(z, reference), "a single scale reduces to its convolution");
    }

    // ConvGRU
    {
        Revgrad::Scope scope{};
        auto gru = Revgrad::Layer::Build(Revgrad::Layer::ConvGRU({.out_channels = 4}));
        auto x = torch::randn({2, 4, 6, 6});
        auto context = torch::randn({2, 1, 6, 6});
        auto y = gru(scope, x, {context});
        check(same_shape(y, {2, 4, 6, 6}), "ConvGRU keeps shape");
        auto gate_bias = scope.workspace().parameters().find("gate/bias");
        auto candidate_weight = scope.workspace().parameters().find("candidate/weight");
        check(gate_bias.has_value() && torch::equal(gate_bias->value, torch::ones({4})), "gate bias starts at 1");
        check(candidate_weight.has_value() && same_shape(candidate_weight->value, {4, 5, 3, 3}),
              "candidate convolution sees the side input channels");

        bool raised = false;
        try {
            (void)Revgrad::Layer::Build(Revgrad::Layer::ConvGRU({.out_channels = 3}))(scope, x, {});
        } catch (const c10::Error&) {
            raised = true;
        }
        check(raised, "ConvGRU with a channel count different from the input fails");
    }

    // DiagonalGRU
    {
        auto x = torch::arange(1.0, 13.0).view({1, 3, 1, 4});
        auto shifted = Revgrad::Layer::Details::diagonal_shift(x);
        check(torch::equal(shifted.select(1, 0), x.select(1, 0)), "first channel group stays in place");
        check(torch::equal(shifted.select(1, 1).flatten(), torch::tensor({0.0, 5.0, 6.0, 7.0})), "middle group moves one step right");
        check(torch::equal(shifted.select(1, 2).flatten(), torch::tensor({10.0, 11.0, 12.0, 0.0})), "last group moves one step left");

        Revgrad::Scope scope{};
        auto gru = Revgrad::Layer::Build(Revgrad::Layer::DiagonalGRU({.out_channels = 3}));
        auto input = torch::randn({2, 3, 5, 5});
        auto y = gru(scope, input, {torch::randn({2, 2, 5, 5})});
        check(same_shape(y, {2, 3, 5, 5}), "DiagonalGRU keeps shape");
        auto reset_bias = scope.workspace().parameters().find("reset/bias");
        auto gate_bias = scope.workspace().parameters().find("gate/bias");
        auto candidate_weight = scope.workspace().parameters().find("candidate/weight");
        check(reset_bias.has_value() && torch::allclose(reset_bias->value, torch::full({3}, 0.5)), "reset bias starts at 0.5");
        check(gate_bias.has_value() && torch::allclose(gate_bias->value, torch::full({3}, 0.7)), "gate bias starts at 0.7");
        check(candidate_weight.has_value() && same_shape(candidate_weight->value, {3, 5, 3, 3}),
              "DiagonalGRU candidate sees the side input channels");
        check(torch::equal(gru(scope, input, {torch::zeros({2, 2, 5, 5})}), gru(scope, input, {torch::zeros({2, 2, 5, 5})})),
              "DiagonalGRU is deterministic for a replay");
    }

    // ConvLSTM
    {
        Revgrad::Scope scope{};
        auto lstm = Revgrad::Layer::Build(Revgrad::Layer::ConvLSTM({.out_channels = 4}));
        auto x = torch::randn({2, 4, 6, 6});
        auto y = lstm(scope, x, {});
        check(same_shape(y, {2, 4, 6, 6}), "ConvLSTM keeps shape");
        check((y.abs() < 1.0).all().item<bool>(), "ConvLSTM output is a gated tanh");
        auto gates = scope.workspace().parameters().find("gates/weight");
        auto norm_scale = scope.workspace().parameters().find("layer_norm/scale");
        check(gates.has_value() && same_shape(gates->value, {16, 4, 3, 3}), "one convolution yields all four gates");
        check(norm_scale.has_value() && torch::equal(norm_scale->value, torch::ones({16})), "layer norm scale starts at 1");
        check(scope.workspace().parameters().size() == 4, "gate weight, bias and layer norm scale and shift");

        bool raised = false;
        try {
            (void)Revgrad::Layer::Build(Revgrad::Layer::ConvLSTM({.out_channels = 2}))(scope, x, {});
        } catch (const c10::Error&) {
            raised = true;
        }
        check(raised, "ConvLSTM with a channel count different from the input fails");
    }

    // Sequential build
    {
        Revgrad::Scope scope{};
        auto stack = Revgrad::Layer::Build({
            Revgrad::Layer::Conv2d({.out_channels = 4}, Revgrad::Activation::SaturatingSigmoid),
            Revgrad::Layer::Pool2d(),
            Revgrad::Layer::Conv2d({.out_channels = 2}, Revgrad::Activation::HardTanh),
        });
        auto y = stack(scope, torch::randn({1, 3, 4, 4}), {});
        check(same_shape(y, {1, 2, 4, 4}), "stacked layers chain shapes");
        check(scope.workspace().parameters().find("layer_2/weight").has_value(), "each stacked layer gets its own scope");
        check((y.abs() <= 1.0).all().item<bool>(), "hard tanh bounds the output");
    }

    // Saturating activations
    {
        auto x = torch::tensor({-2.0, 0.0, 2.0});
        auto saturating = Revgrad::Activation::Details::SaturatingSigmoid{}(x);
        check((saturating >= 0).all().item<bool>() && (saturating <= 1).all().item<bool>(), "saturating sigmoid stays in [0, 1]");
        check(std::abs(saturating[1].item<double>() - 0.5) < 1e-6, "saturating sigmoid(0) = 0.5");

        auto hard = Revgrad::Activation::Details::HardSigmoid{}(x);
        check(torch::allclose(hard.value, torch::tensor({0.0, 0.5, 1.0})), "hard sigmoid values");
        check(std::abs(hard.cost.item<double>() - 2.2 / 3.0) < 1e-6, "saturation cost is the mean overshoot past the limit");

        auto tanh = Revgrad::Activation::Details::HardTanh{0.5}(x);
        check(torch::allclose(tanh.value, torch::tensor({-1.0, 0.0, 1.0})), "hard tanh values");
        check(std::abs(tanh.cost.item<double>() - 1.0) < 1e-6, "saturation cost follows the configured limit");
    }

    if (failures != 0) {
        std::cerr << failures << " layer check(s) failed\n";
        return 1;
    }
    std::cout << "layers: all checks passed" << std::endl;
    return 0;
}
