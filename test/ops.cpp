#include "../include/Revgrad.h"

#include <iostream>
#include <string>
#include <tuple>

namespace {
    int failures = 0;

    void check(bool condition, const std::string& message)
    {
        if (!condition) {
            std::cerr << "[ops] " << message << '\n';
            ++failures;
        }
    }

    torch::Tensor sparse_lookup(const torch::Tensor& table, const torch::Tensor& indices)
    {
        return torch::embedding(table, indices, /*padding_idx=*/-1, /*scale_grad_by_freq=*/false, /*sparse=*/true);
    }
}

int main()
{
    torch::manual_seed(3);

    // dense_gradient
    {
        auto table = torch::randn({3, 4}, torch::requires_grad());
        auto wrapped = Revgrad::Ops::dense_gradient(table);
        check(torch::equal(wrapped, table.detach()), "forward is the identity");

        auto indices = torch::tensor({0, 2, 0}, torch::kLong);
        sparse_lookup(table, indices).sum().backward();
        check(table.grad().layout() != torch::kStrided, "a sparse lookup hands back a sparse gradient");

        table.mutable_grad() = torch::Tensor{};
        sparse_lookup(Revgrad::Ops::dense_gradient(table), indices).sum().backward();
        check(table.grad().layout() == torch::kStrided, "dense_gradient converts the gradient to a strided tensor");
        auto expected = torch::tensor({2.0, 0.0, 1.0}).unsqueeze(1).expand({3, 4});
        check(torch::allclose(table.grad(), expected), "dense gradient counts every lookup of a row");
    }

    // top_k_small
    {
        auto input = torch::tensor({1.0, 5.0, 3.0, 4.0, 9.0, 2.0, 8.0, 0.0}).view({2, 4});
        auto [values, indices] = Revgrad::Ops::top_k_small(input, 2);
        check(torch::equal(values, torch::tensor({5.0, 4.0, 9.0, 8.0}).view({2, 2})), "top 2 values per row");
        check(indices.scalar_type() == torch::kInt32, "indices are int32");
        check(torch::equal(indices, torch::tensor({1, 3, 0, 2}, torch::kInt32).view({2, 2})), "top 2 indices per row");

        auto [first, first_index] = Revgrad::Ops::top_k_small(input, 1);
        check(torch::equal(first, torch::tensor({5.0, 9.0}).view({2, 1})), "k = 1 is the row maximum");
        check(torch::equal(first_index, torch::tensor({1, 0}, torch::kInt32).view({2, 1})), "k = 1 index is the argmax");

        auto wide = torch::randn({3, 32});
        auto [small_values, small_indices] = Revgrad::Ops::top_k_small(wide, Revgrad::Ops::kSmallTopK);
        auto reference = torch::topk(wide, Revgrad::Ops::kSmallTopK, 1);
        check(torch::allclose(small_values, std::get<0>(reference)), "repeated argmax agrees with torch::topk");
        check(torch::equal(small_indices, std::get<1>(reference).to(torch::kInt32)), "repeated argmax indices agree with torch::topk");

        auto [large_values, large_indices] = Revgrad::Ops::top_k_small(wide, 20);
        check(large_values.sizes() == c10::IntArrayRef({3, 20}) && large_indices.scalar_type() == torch::kInt32,
              "large k falls back to torch::topk");

        bool raised = false;
        try {
            (void)Revgrad::Ops::top_k_small(input, 5);
        } catch (const c10::Error&) {
            raised = true;
        }
        check(raised, "k larger than the depth is rejected");
    }

    if (failures != 0) {
        std::cerr << failures << " ops check(s) failed\n";
        return 1;
    }
    std::cout << "ops: all checks passed" << std::endl;
    return 0;
}
