#include "../include/Revgrad.h"

#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace {
    int failures = 0;

    void check(bool condition, const std::string& message)
    {
        if (!condition) {
            std::cerr << "[scope] " << message << '\n';
            ++failures;
        }
    }

    template <class Exception, class Function>
    bool throws(Function&& function)
    {
        try {
            function();
        } catch (const Exception&) {
            return true;
        }
        return false;
    }
}

int main()
{
    // Name allocator
    {
        Revgrad::NameAllocator names{};
        check(names.unique("revblock") == "revblock", "first name must be the bare base");
        check(names.unique("revblock") == "revblock_1", "second name must carry suffix _1");
        check(names.unique("revblock") == "revblock_2", "third name must carry suffix _2");
        check(names.unique("identity_custom_grad") == "identity_custom_grad", "bases are counted independently");
        check(names.issued("revblock") == 3, "issued() must count every name handed out");
        check(names.issued("unknown") == 0, "issued() of an unseen base is zero");
    }

    // Concurrent allocation never hands out a name twice.
    {
        Revgrad::NameAllocator names{};
        std::vector<std::vector<std::string>> per_thread(4);
        std::vector<std::thread> threads{};
        for (std::size_t t = 0; t < per_thread.size(); ++t) {
            threads.emplace_back([&names, &per_thread, t] {
                for (int i = 0; i < 250; ++i) {
                    per_thread[t].push_back(names.unique("node"));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        std::unordered_set<std::string> seen{};
        for (const auto& names_of_thread : per_thread) {
            for (const auto& name : names_of_thread) {
                check(seen.insert(name).second, "duplicate name handed out: " + name);
            }
        }
        check(seen.size() == 1000, "expected 1000 distinct names");
    }

    // Parameters are created once and reused by name.
    {
        Revgrad::Scope root{};
        auto layer = root.child("block").child("revlayer_0").child("f").tagged({0, Revgrad::Role::F});
        auto weight = layer.parameter("weight", {4, 3}, Revgrad::Initialization::XavierUniform);
        auto again = layer.parameter("weight", {4, 3}, Revgrad::Initialization::XavierUniform);
        check(weight.is_same(again), "second request must return the very same tensor");
        check(weight.requires_grad(), "trainable parameters require grad");
        check(root.workspace().parameters().size() == 1, "reuse must not create a second parameter");

        auto stored = root.workspace().parameters().find("block/revlayer_0/f/weight");
        check(stored.has_value(), "parameter name must embed the scope path");
        check(stored.has_value() && stored->tag.has_value() && stored->tag->layer == 0 && stored->tag->role == Revgrad::Role::F,
              "parameter must carry the tag of the scope it was created in");

        check(throws<Revgrad::ConfigurationError>([&] { (void)layer.parameter("weight", {3, 3}); }),
              "requesting an existing parameter with another shape must fail");

        auto strict = layer.with_reuse(Revgrad::Reuse::Strict);
        check(throws<Revgrad::ConfigurationError>([&] { (void)strict.parameter("bias", {4}); }),
              "strict reuse must refuse to create parameters");
        check(strict.parameter("weight", {4, 3}).is_same(weight), "strict reuse must return existing parameters");

        auto frozen = layer.parameter("running", {4}, Revgrad::Initialization::Zeros, /*trainable=*/false);
        check(!frozen.requires_grad(), "non-trainable parameters must not require grad");
        check(torch::equal(frozen, torch::zeros({4})), "Zeros initialisation");

        check(layer.parameters().size() == 1, "trainable_only listing skips frozen parameters");
        check(layer.parameters(/*trainable_only=*/false).size() == 2, "full listing includes frozen parameters");
        check(root.child("block").parameters().size() == 1, "listing covers nested scopes");
        check(root.child("blo").parameters().empty(), "a path prefix that is not a scope boundary must not match");
    }

    // Unique children
    {
        Revgrad::Scope root{};
        auto first = root.unique_child("revblock");
        auto second = root.unique_child("revblock");
        check(first.path() == "revblock", "first unique child keeps the base name");
        check(second.path() == "revblock_1", "second unique child is suffixed");
        check(throws<std::invalid_argument>([&] { (void)root.child("a/b"); }), "scope names must not contain '/'");
        check(throws<std::invalid_argument>([&] { (void)root.child(""); }), "scope names must not be empty");
    }

    // Workspace dtype reaches created parameters.
    {
        Revgrad::Scope root(std::make_shared<Revgrad::Workspace>(torch::TensorOptions().dtype(torch::kFloat64)));
        auto weight = root.parameter("w", {2, 2}, Revgrad::Initialization::Constant(0.5));
        check(weight.scalar_type() == torch::kFloat64, "parameters follow the workspace dtype");
        check(torch::equal(weight, torch::full({2, 2}, 0.5, torch::kFloat64)), "Constant initialisation");
    }

    // Recorders see what is acquired while they are alive, in order, each name once.
    {
        Revgrad::Scope root{};
        (void)root.parameter("before", {1});
        Revgrad::Scope other{};

        std::vector<Revgrad::Parameter> outer_seen{};
        std::vector<Revgrad::Parameter> inner_seen{};
        {
            Revgrad::ParameterRecorder outer(root.workspace().parameters());
            (void)root.parameter("b", {2});
            {
                Revgrad::ParameterRecorder inner(root.workspace().parameters());
                (void)root.parameter("a", {2});
                (void)root.parameter("before", {1});
                (void)root.parameter("stats", {2}, Revgrad::Initialization::Zeros, /*trainable=*/false);
                (void)other.parameter("elsewhere", {2});
                inner_seen = inner.parameters(/*trainable_only=*/false);
            }
            (void)root.parameter("b", {2});
            outer_seen = outer.parameters(/*trainable_only=*/true);
        }
        (void)root.parameter("after", {1});

        auto names = [](const std::vector<Revgrad::Parameter>& parameters) {
            std::vector<std::string> result{};
            for (const auto& parameter : parameters) {
                result.push_back(parameter.name);
            }
            return result;
        };
        check(names(inner_seen) == std::vector<std::string>{"a", "before", "stats"},
              "inner recorder lists created and reused parameters of its own store");
        check(names(outer_seen) == std::vector<std::string>{"b", "a", "before"},
              "outer recorder sees nested acquisitions once, filtered to trainable ones");
    }

    if (failures != 0) {
        std::cerr << failures << " scope check(s) failed\n";
        return 1;
    }
    std::cout << "scope: all checks passed" << std::endl;
    return 0;
}
