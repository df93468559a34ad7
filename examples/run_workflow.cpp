// run_workflow.cpp
#include "agentflow/core/engine.h"
#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>

namespace {

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot open " + path);
    return nlohmann::json::parse(in);
}

// Client tool results arrive on stdin, one {"id": ..., "result": ...} or {"id": ..., "error": ...} per line
void answer_client_tools(agentflow::ClientBridge* bridge) {
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        auto msg = nlohmann::json::parse(line, nullptr, false);
        if (msg.is_discarded() || !msg.contains("id") || !msg["id"].is_string()) {
            std::cerr << "ignoring stdin line: " << line << "\n";
            continue;
        }
        const std::string id = msg["id"].get<std::string>();
        bool known = false;
        if (msg.contains("error")) {
            const auto& err = msg["error"];
            known = bridge->reject(id, err.is_string() ? err.get<std::string>() : err.dump());
        } else {
            known = bridge->resolve(id, msg.value("result", nlohmann::json()));
        }
        if (!known) std::cerr << "no pending tool call " << id << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " <workflow.yaml> [input.json] [agentflow.json]\n";
        return 1;
    }

    try {
        auto engine = agentflow::WorkflowEngine::from_file(argv[1], argc > 3 ? argv[3] : "agentflow.json");
        nlohmann::json input = argc > 2 ? read_json_file(argv[2]) : nlohmann::json::object();

        // 事件流写到 stdout, 日志写到 stderr
        engine->set_event_sink(std::make_shared<agentflow::JsonLinesEventSink>(std::cout));

        engine->register_tool(
            "word_count",
            [](const nlohmann::json& args, agentflow::ToolCallContext&) {
                const std::string text = args["text"].get<std::string>();
                size_t words = 0;
                bool in_word = false;
                for (char c : text) {
                    bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
                    if (!space && !in_word) ++words;
                    in_word = !space;
                }
                return nlohmann::json{{"words", words}};
            },
            {"text"});

        if (auto* bridge = engine->client_bridge()) {
            std::thread(answer_client_tools, bridge).detach();
        }

        auto result = engine->run(input);

        nlohmann::json summary = {{"success", result.success}, {"output", result.output}};
        if (result.error) summary["error"] = result.error->to_value();
        std::cout << summary.dump() << std::endl;

        std::ofstream trace_file("execution_trace.json");
        nlohmann::json traces = nlohmann::json::array();
        for (const auto& record : engine->get_last_traces()) {
            traces.push_back(agentflow::TraceExporter::to_value(record));
        }
        trace_file << traces.dump(2) << std::endl;
        std::cerr << "Trace exported to execution_trace.json (" << traces.size() << " records)\n";

        return result.success ? 0 : 2;
    } catch (const agentflow::FlowError& e) {
        std::cerr << "[" << agentflow::to_string(e.code()) << "] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << std::endl;
        return 1;
    }
}
