#include <marshal-cpp/batch.hpp>
#include <marshal-cpp/logger.hpp>

#include "executor.hpp"

#include <taskflow/algorithm/for_each.hpp>

#include <algorithm>

namespace marshal_cpp {

auto decode_batch(std::span<const std::vector<std::byte>> inputs,
                  const DecodeOptions& options) -> std::vector<BatchResult> {
    auto results = std::vector<BatchResult>(inputs.size());
    if (inputs.empty()) return results;

    auto decode_one = [&](std::size_t i) {
        try {
            results[i].outcome = decode(inputs[i], options);
        } catch (const Exception& e) {
            results[i].outcome = e.error();
        }
    };

    if (inputs.size() == 1) {
        decode_one(0);
    } else {
        auto taskflow = tf::Taskflow{};
        taskflow.for_each_index(std::size_t{0}, inputs.size(), std::size_t{1}, decode_one);
        detail::global_executor().run(taskflow).wait();
    }

    auto failed = std::ranges::count_if(results, [](const BatchResult& r) { return !r.ok(); });
    MARSHAL_CPP_LOG_DEBUG("batch", "decoded {} buffers, {} failed", inputs.size(), failed);
    return results;
}

}  // namespace marshal_cpp
