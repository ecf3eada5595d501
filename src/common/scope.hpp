#ifndef REVGRAD_COMMON_SCOPE_HPP
#define REVGRAD_COMMON_SCOPE_HPP
/*
 * Parameter ownership for graph construction.
 * ---------------------------------------------------------------------------
 *  - `Workspace` owns every parameter of a model together with the name allocator used to
 *    give blocks and identity nodes unique names.
 *  - `Scope` is a cheap handle (workspace + path + optional layer tag) handed to sub-functions.
 *    `scope.parameter("weight", {...})` creates the parameter on first request and returns the
 *    very same tensor afterwards, so re-running a sub-function never duplicates state.
 *  - A `LayerTag` is stamped on each parameter at creation time; reversible blocks route
 *    parameter gradients through that tag instead of inspecting names.
 *  - A `ParameterRecorder` lists the parameters a piece of code acquires (created or reused) from
 *    one store on the current thread, whatever scope they were requested through.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "error.hpp"
#include "naming.hpp"
#include "../initialization/apply.hpp"
#include "../initialization/initialization.hpp"

namespace Revgrad {
    enum class Role {
        F,
        G,
    };

    [[nodiscard]] constexpr std::string_view to_string(Role role) noexcept
    {
        return role == Role::F ? "f" : "g";
    }

    struct LayerTag {
        std::size_t layer{0};
        Role role{Role::F};

        friend bool operator==(const LayerTag&, const LayerTag&) = default;
    };

    struct Parameter {
        std::string name{};
        torch::Tensor value{};
        bool trainable{true};
        std::optional<LayerTag> tag{};
    };

    enum class Reuse {
        Auto,   // create on first request, return the existing tensor afterwards
        Strict, // the parameter must already exist
    };

    class ParameterStore;

    // Active while alive; recorders nest, each one seeing the acquisitions of everything inside it.
    class ParameterRecorder {
    public:
        explicit ParameterRecorder(const ParameterStore& store)
            : store_(&store)
            , previous_(active())
        {
            active() = this;
        }

        ~ParameterRecorder() { active() = previous_; }

        ParameterRecorder(const ParameterRecorder&) = delete;
        ParameterRecorder& operator=(const ParameterRecorder&) = delete;

        // Acquisition order, each parameter once.
        [[nodiscard]] std::vector<Parameter> parameters(bool trainable_only) const
        {
            std::vector<Parameter> selected{};
            for (const auto& parameter : parameters_) {
                if (!trainable_only || parameter.trainable) {
                    selected.push_back(parameter);
                }
            }
            return selected;
        }

        static void notify(const ParameterStore& store, const Parameter& parameter)
        {
            for (auto* recorder = active(); recorder != nullptr; recorder = recorder->previous_) {
                if (recorder->store_ == &store && recorder->seen_.insert(parameter.name).second) {
                    recorder->parameters_.push_back(parameter);
                }
            }
        }

    private:
        static ParameterRecorder*& active() noexcept
        {
            thread_local ParameterRecorder* current = nullptr;
            return current;
        }

        const ParameterStore* store_;
        ParameterRecorder* previous_;
        std::vector<Parameter> parameters_{};
        std::unordered_set<std::string> seen_{};
    };

    class ParameterStore {
    public:
        struct Request {
            std::string name{};
            std::vector<std::int64_t> sizes{};
            ::Revgrad::Initialization::Descriptor initialization{::Revgrad::Initialization::Default};
            bool trainable{true};
            std::optional<LayerTag> tag{};
            Reuse reuse{Reuse::Auto};
            torch::TensorOptions options{};
        };

        ParameterStore() = default;
        ParameterStore(const ParameterStore&) = delete;
        ParameterStore& operator=(const ParameterStore&) = delete;

        [[nodiscard]] Parameter acquire(const Request& request)
        {
            auto parameter = acquire_locked(request);
            ParameterRecorder::notify(*this, parameter);
            return parameter;
        }

        // Parameters whose name lies under `prefix`, in creation order.
        [[nodiscard]] std::vector<Parameter> under(std::string_view prefix, bool trainable_only) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<Parameter> selected{};
            const auto qualified = prefix.empty() ? std::string{} : std::string(prefix) + "/";
            for (const auto& parameter : parameters_) {
                if (trainable_only && !parameter.trainable) {
                    continue;
                }
                if (!qualified.empty() && parameter.name.rfind(qualified, 0) != 0) {
                    continue;
                }
                selected.push_back(parameter);
            }
            return selected;
        }

        [[nodiscard]] std::optional<Parameter> find(const std::string& name) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = index_.find(name);
            if (it == index_.end()) {
                return std::nullopt;
            }
            return parameters_[it->second];
        }

        [[nodiscard]] std::size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return parameters_.size();
        }

    private:
        Parameter acquire_locked(const Request& request)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (const auto it = index_.find(request.name); it != index_.end()) {
                const auto& existing = parameters_[it->second];
                if (existing.value.sizes() != c10::IntArrayRef(request.sizes)) {
                    std::ostringstream message;
                    message << "Parameter '" << request.name << "' already exists with shape " << existing.value.sizes()
                            << " but was requested with shape " << c10::IntArrayRef(request.sizes) << '.';
                    throw ConfigurationError(message.str());
                }
                return existing;
            }

            if (request.reuse == Reuse::Strict) {
                throw ConfigurationError("Parameter '" + request.name
                                         + "' does not exist and the scope only allows reuse; "
                                           "a recomputed sub-function must not create new parameters.");
            }

            auto tensor = torch::empty(request.sizes, request.options);
            ::Revgrad::Initialization::Details::apply_tensor_initialization(tensor, request.initialization);
            tensor.set_requires_grad(request.trainable);

            Parameter parameter{request.name, tensor, request.trainable, request.tag};
            index_.emplace(request.name, parameters_.size());
            parameters_.push_back(parameter);
            return parameter;
        }

        mutable std::mutex mutex_{};
        std::vector<Parameter> parameters_{};
        std::unordered_map<std::string, std::size_t> index_{};
    };

    class Workspace {
    public:
        explicit Workspace(torch::TensorOptions options = torch::TensorOptions().dtype(torch::kFloat32))
            : options_(options) {}

        Workspace(const Workspace&) = delete;
        Workspace& operator=(const Workspace&) = delete;

        [[nodiscard]] ParameterStore& parameters() noexcept { return parameters_; }
        [[nodiscard]] const ParameterStore& parameters() const noexcept { return parameters_; }
        [[nodiscard]] NameAllocator& names() noexcept { return names_; }
        [[nodiscard]] const torch::TensorOptions& options() const noexcept { return options_; }

    private:
        torch::TensorOptions options_{};
        ParameterStore parameters_{};
        NameAllocator names_{};
    };

    class Scope {
    public:
        Scope() : Scope(std::make_shared<Workspace>()) {}

        explicit Scope(std::shared_ptr<Workspace> workspace)
            : workspace_(std::move(workspace))
        {
            if (!workspace_) {
                throw std::invalid_argument("Scope requires a workspace.");
            }
        }

        [[nodiscard]] const std::string& path() const noexcept { return path_; }
        [[nodiscard]] Workspace& workspace() const noexcept { return *workspace_; }

        [[nodiscard]] std::string qualify(std::string_view name) const
        {
            if (path_.empty()) {
                return std::string(name);
            }
            return path_ + "/" + std::string(name);
        }

        [[nodiscard]] Scope child(std::string_view name) const
        {
            if (name.empty() || name.find('/') != std::string_view::npos) {
                throw std::invalid_argument("Scope names must be non-empty and must not contain '/'.");
            }
            auto scope = *this;
            scope.path_ = qualify(name);
            return scope;
        }

        // Child whose name is unique among the children requested with the same base under this path.
        [[nodiscard]] Scope unique_child(std::string_view base) const
        {
            if (base.empty() || base.find('/') != std::string_view::npos) {
                throw std::invalid_argument("Scope names must be non-empty and must not contain '/'.");
            }
            auto scope = *this;
            scope.path_ = workspace_->names().unique(qualify(base));
            return scope;
        }

        [[nodiscard]] Scope tagged(LayerTag tag) const
        {
            auto scope = *this;
            scope.tag_ = tag;
            return scope;
        }

        [[nodiscard]] Scope with_reuse(Reuse reuse) const
        {
            auto scope = *this;
            scope.reuse_ = reuse;
            return scope;
        }

        torch::Tensor parameter(std::string_view name,
                                std::vector<std::int64_t> sizes,
                                ::Revgrad::Initialization::Descriptor initialization = ::Revgrad::Initialization::Default,
                                bool trainable = true) const
        {
            ParameterStore::Request request{};
            request.name = qualify(name);
            request.sizes = std::move(sizes);
            request.initialization = initialization;
            request.trainable = trainable;
            request.tag = tag_;
            request.reuse = reuse_;
            request.options = workspace_->options();
            return workspace_->parameters().acquire(request).value;
        }

        [[nodiscard]] std::vector<Parameter> parameters(bool trainable_only = true) const
        {
            return workspace_->parameters().under(path_, trainable_only);
        }

    private:
        std::shared_ptr<Workspace> workspace_{};
        std::string path_{};
        std::optional<LayerTag> tag_{};
        Reuse reuse_{Reuse::Auto};
    };

    // f / g of a reversible layer: (scope, x, side inputs) -> value shaped like x.
    // Side inputs arrive only through the argument list, never through captured tensors.
    using SubFunction = std::function<torch::Tensor(Scope&, const torch::Tensor&, const std::vector<torch::Tensor>&)>;
}

#endif // REVGRAD_COMMON_SCOPE_HPP
