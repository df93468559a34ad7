#ifndef AGENTFLOW_TYPES_RESULT_H
#define AGENTFLOW_TYPES_RESULT_H

#include "context.h"
#include "errors.h"
#include <optional>
#include <string>

namespace agentflow {

// RunResult structure
struct RunResult {
    bool success = false;
    std::string message;          // 错误信息或成功信息
    Value output = nullptr;       // exit node value(s)
    Value final_context = Value::object(); // ctx at the end of the run
    std::optional<ErrorInfo> error;

    static RunResult ok(Value output, Value final_context) {
        RunResult r;
        r.success = true;
        r.message = "completed";
        r.output = std::move(output);
        r.final_context = std::move(final_context);
        return r;
    }

    static RunResult failed(ErrorInfo info, Value final_context) {
        RunResult r;
        r.success = false;
        r.message = info.node.empty() ? info.message : "[" + info.node + "] " + info.message;
        r.final_context = std::move(final_context);
        r.error = std::move(info);
        return r;
    }
};

} // namespace agentflow

#endif // AGENTFLOW_TYPES_RESULT_H
