#pragma once
#include "yeon_nodes.h"
#include "yeon_context.h"
#include <vector>
#include <cstdint>

namespace Yeon {

// 실행 하나의 조건 묶음. 평가 중 context는 읽기만 한다.
struct ConditionBatch {
    const ExecutionContext* context = nullptr;
    std::vector<Condition> conditions;
    ConditionLogic logic = ConditionLogic::And;
};

// 여러 실행의 조건을 병렬로 평가. 결과[i]는 batches[i]의 결과 (1/0).
// 평가 중에는 어떤 context도 수정하면 안 된다.
// chunkSize 이하이면 호출 스레드에서 바로 평가.
// 작업 수가 하드웨어 스레드 수를 넘으면 청크를 키운다.
std::vector<uint8_t> evaluateConditionBatch(const std::vector<ConditionBatch>& batches,
                                            size_t chunkSize = 64);

} // namespace Yeon
