// modules/tools/builtin_registry.h
#ifndef AGENTFLOW_MODULES_TOOLS_BUILTIN_REGISTRY_H
#define AGENTFLOW_MODULES_TOOLS_BUILTIN_REGISTRY_H

#include "tools/tool_context.h"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

struct ToolOutcome {
    Value value = nullptr;
    bool persist = true; // false: the node's output is not written to ctx/last-output
    bool stream = true;  // false: the output is kept off the event stream
};

// An in-process tool
class BuiltinTool {
public:
    virtual ~BuiltinTool() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const { return ""; }
    // missing or null required arguments fail with MissingArgument before call()
    virtual std::vector<std::string> required_params() const { return {}; }

    virtual ToolOutcome call(const Value& args, ToolCallContext& tc) = 0;
};

class BuiltinRegistry {
public:
    using Function = std::function<Value(const Value&, ToolCallContext&)>;

    void register_tool(std::unique_ptr<BuiltinTool> tool);

    // Plain function builtin
    template <typename Func>
    void register_tool(std::string name, Func&& func, std::vector<std::string> required = {},
                       std::string description = "") {
        register_tool(std::make_unique<FunctionTool>(std::move(name), Function(std::forward<Func>(func)),
                                                     std::move(required), std::move(description)));
    }

    bool has_tool(const std::string& name) const;
    std::vector<std::string> list_tools() const;

    // throws ToolResolutionError for an unknown name, MissingArgument for a missing required argument
    ToolOutcome call_tool(const std::string& name, const Value& args, ToolCallContext& tc) const;

private:
    class FunctionTool : public BuiltinTool {
    public:
        FunctionTool(std::string name, Function fn, std::vector<std::string> required, std::string description)
            : name_(std::move(name)), fn_(std::move(fn)), required_(std::move(required)),
              description_(std::move(description)) {}

        std::string name() const override { return name_; }
        std::string description() const override { return description_; }
        std::vector<std::string> required_params() const override { return required_; }
        ToolOutcome call(const Value& args, ToolCallContext& tc) override { return ToolOutcome{fn_(args, tc), true}; }

    private:
        std::string name_;
        Function fn_;
        std::vector<std::string> required_;
        std::string description_;
    };

    std::unordered_map<std::string, std::unique_ptr<BuiltinTool>> tools_;
};

// set_context, notify, timer, fail, workflow
void register_system_builtins(BuiltinRegistry& registry);
// read_file, write_file, edit_file, glob, grep, shell
void register_devtools(BuiltinRegistry& registry);
// fetch, fetch_url (libcurl)
void register_network_builtins(BuiltinRegistry& registry);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TOOLS_BUILTIN_REGISTRY_H
