#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace ferry::server
{

    struct PlannerSettings
    {
        std::uint64_t chunk_size{1024 * 1024};
        std::uint32_t max_parallel_chunks{5};
    };

    struct TransferPlan
    {
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        bool should_compress{};
        double estimated_ratio{1.0};
        std::uint32_t recommended_parallelism{1};
    };

    class TransferPlanner
    {
    public:
        explicit TransferPlanner(PlannerSettings settings);

        const PlannerSettings &settings() const noexcept { return settings_; }

        // sample is a prefix of the file used only for the ratio estimate.
        TransferPlan plan(std::uint64_t file_size, std::string_view filename,
                          std::span<const std::byte> sample) const;

    private:
        PlannerSettings settings_;
    };

} // namespace ferry::server
