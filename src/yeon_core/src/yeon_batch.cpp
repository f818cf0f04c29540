#include "yeon_batch.h"
#include <algorithm>
#include <functional>
#include <future>
#include <thread>

namespace Yeon {

static void evaluateRange(const std::vector<ConditionBatch>& batches, std::vector<uint8_t>& results,
                          size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        const auto& batch = batches[i];
        results[i] = (batch.context && evaluateConditions(*batch.context, batch.conditions, batch.logic))
                         ? 1 : 0;
    }
}

std::vector<uint8_t> evaluateConditionBatch(const std::vector<ConditionBatch>& batches, size_t chunkSize) {
    std::vector<uint8_t> results(batches.size(), 0);
    if (batches.empty()) return results;
    if (chunkSize == 0) chunkSize = 1;

    // 동시 작업 수는 하드웨어 스레드 수로 제한
    size_t maxJobs = std::thread::hardware_concurrency();
    if (maxJobs == 0) maxJobs = 4;
    chunkSize = std::max(chunkSize, (batches.size() + maxJobs - 1) / maxJobs);

    if (batches.size() <= chunkSize) {
        evaluateRange(batches, results, 0, batches.size());
        return results;
    }

    // 청크마다 서로 다른 results 구간에만 쓴다
    std::vector<std::future<void>> jobs;
    for (size_t begin = 0; begin < batches.size(); begin += chunkSize) {
        size_t end = std::min(begin + chunkSize, batches.size());
        jobs.push_back(std::async(std::launch::async, evaluateRange,
                                  std::cref(batches), std::ref(results), begin, end));
    }
    for (auto& job : jobs) {
        job.get();
    }
    return results;
}

} // namespace Yeon
