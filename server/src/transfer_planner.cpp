#include "ferry/server/transfer_planner.hpp"

#include <algorithm>

#include "ferry/chunker.hpp"
#include "ferry/compression.hpp"
#include "ferry/error_codes.hpp"

namespace ferry::server
{

    TransferPlanner::TransferPlanner(PlannerSettings settings) : settings_(settings)
    {
        if (settings_.chunk_size == 0 || settings_.max_parallel_chunks == 0)
        {
            throw TransferError(ErrorCode::InvalidArgument, "Chunk size and parallelism must be positive");
        }
    }

    TransferPlan TransferPlanner::plan(std::uint64_t file_size, std::string_view filename,
                                       std::span<const std::byte> sample) const
    {
        TransferPlan plan{
            .chunk_size = settings_.chunk_size,
            .total_chunks = chunker::chunk_count(file_size, settings_.chunk_size),
        };

        if (compression::should_compress(filename))
        {
            plan.estimated_ratio = compression::estimate_ratio(sample);
            plan.should_compress = plan.estimated_ratio < compression::kWorthwhileRatio;
        }

        const auto useful = std::max<std::uint64_t>(plan.total_chunks, 1);
        plan.recommended_parallelism =
            static_cast<std::uint32_t>(std::min<std::uint64_t>(settings_.max_parallel_chunks, useful));
        return plan;
    }

} // namespace ferry::server
