#ifndef REVGRAD_OPS_DENSE_HPP
#define REVGRAD_OPS_DENSE_HPP
/*
 * Identity whose incoming gradient is converted to a dense (strided) tensor.
 * Embedding lookups with sparse=true hand back sparse gradients; ops upstream of them such as
 * cat / stack are much cheaper to differentiate with a dense gradient, so wrap their output:
 *     dense_gradient(torch::cat(parts, 0))
 */

#include <torch/torch.h>

namespace Revgrad::Ops {
    namespace Details {
        struct DenseGradient : public torch::autograd::Function<DenseGradient> {
            static torch::Tensor forward(torch::autograd::AutogradContext*, const torch::Tensor& input) {
                return input.view_as(input);
            }

            static torch::autograd::tensor_list backward(torch::autograd::AutogradContext*, torch::autograd::tensor_list grad_outputs) {
                auto gradient = grad_outputs[0];
                if (gradient.defined() && gradient.layout() != torch::kStrided) {
                    gradient = gradient.to_dense();
                }
                return {gradient};
            }
        };
    }

    [[nodiscard]] inline torch::Tensor dense_gradient(const torch::Tensor& input) {
        return Details::DenseGradient::apply(input);
    }
}

#endif // REVGRAD_OPS_DENSE_HPP
