#ifndef REVGRAD_COMMON_NAMING_HPP
#define REVGRAD_COMMON_NAMING_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Revgrad {
    /*
     * Hands out unique names per base: "revblock", "revblock_1", "revblock_2", ...
     * One allocator lives in each Workspace and is passed down through Scope, so two
     * workspaces never share counters and construction stays reentrant.
     */
    class NameAllocator {
    public:
        NameAllocator() = default;
        NameAllocator(const NameAllocator&) = delete;
        NameAllocator& operator=(const NameAllocator&) = delete;

        [[nodiscard]] std::string unique(std::string_view base)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto key = std::string(base);
            auto& count = counts_[key];
            auto name = count == 0 ? key : key + "_" + std::to_string(count);
            ++count;
            return name;
        }

        [[nodiscard]] std::size_t issued(std::string_view base) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = counts_.find(std::string(base));
            return it == counts_.end() ? 0 : it->second;
        }

    private:
        mutable std::mutex mutex_{};
        std::unordered_map<std::string, std::size_t> counts_{};
    };
}

#endif // REVGRAD_COMMON_NAMING_HPP
