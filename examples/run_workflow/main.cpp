// main.cpp
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/engine.h"
#include "common/config/engine_config.h"
#include "common/llm/llama_backend.h"
#include "modules/parser/graph_loader.h"

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <workflow.yaml|.json|.md> [options]\n"
              << "  --config <file>        engine config (JSON or YAML)\n"
              << "  --batch-folder <dir>   run once per item found in <dir>\n"
              << "  --max-concurrency <n>  dispatch up to n ready blocks together\n"
              << "  --trace <file>         write the last run's trace as JSON\n"
              << "  --echo                 answer every block with its resolved prompt\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string graph_path = argv[1];
    std::string config_path;
    std::string batch_folder;
    std::string trace_path;
    long max_concurrency = 0;
    bool echo = false;

    for (int i = 2; i < argc; ++i) {
        auto needs_value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << flag << " needs a value\n";
                std::exit(1);
            }
            return argv[++i];
        };
        if (std::strcmp(argv[i], "--config") == 0) {
            config_path = needs_value("--config");
        } else if (std::strcmp(argv[i], "--batch-folder") == 0) {
            batch_folder = needs_value("--batch-folder");
        } else if (std::strcmp(argv[i], "--max-concurrency") == 0) {
            max_concurrency = std::strtol(needs_value("--max-concurrency"), nullptr, 10);
        } else if (std::strcmp(argv[i], "--trace") == 0) {
            trace_path = needs_value("--trace");
        } else if (std::strcmp(argv[i], "--echo") == 0) {
            echo = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        // 1. Config and graph
        canvasflow::EngineConfig config = config_path.empty()
            ? canvasflow::parse_engine_config(nlohmann::json::object())
            : canvasflow::load_engine_config(config_path);
        if (max_concurrency > 0) {
            config.max_concurrency = static_cast<size_t>(max_concurrency);
        }

        canvasflow::GraphLoader loader;
        canvasflow::Graph graph = loader.parse_from_file(graph_path);

        // 2. Generation backends
        auto dispatcher = std::make_shared<canvasflow::RoutingDispatcher>();
        if (echo) {
            auto echo_backend = [](const canvasflow::GenerationRequest& request, const canvasflow::ExecutionOptions&) {
                return "[" + request.block_number + "] " + request.prompt;
            };
            dispatcher->register_backend(canvasflow::BlockKind::TEXT, echo_backend);
            dispatcher->register_backend(canvasflow::BlockKind::IMAGE, echo_backend);
            dispatcher->register_backend(canvasflow::BlockKind::VIDEO, echo_backend);
        } else if (!config.llm.model_path.empty()) {
            auto adapter = std::make_shared<canvasflow::LlamaAdapter>(config.llm);
            dispatcher->register_backend(canvasflow::BlockKind::TEXT,
                canvasflow::make_llama_text_backend(adapter, canvasflow::PromptBuilder(config.prompt_templates)));
        }

        // 3. Engine
        auto engine = canvasflow::WorkflowEngine::from_config(config, dispatcher);

        // 4. Execute
        nlohmann::json output;
        bool ok = true;
        if (!batch_folder.empty()) {
            canvasflow::ExecutionOptions options = engine->default_options();
            canvasflow::BatchInputSource source;
            source.type = canvasflow::BatchSourceType::FOLDER;
            source.path = batch_folder;
            options.batch_input = source;

            output = nlohmann::json::array();
            for (const auto& result : engine->execute_batch(graph, options)) {
                ok = ok && result.status == canvasflow::ExecutionStatus::COMPLETED;
                output.push_back(nlohmann::json(result));
            }
        } else {
            auto result = engine->execute_workflow(graph);
            ok = result.status == canvasflow::ExecutionStatus::COMPLETED;
            output = result;
        }
        std::cout << output.dump(2) << std::endl;

        // 5. Export trace
        if (!trace_path.empty()) {
            std::ofstream trace_file(trace_path);
            if (!trace_file) {
                throw std::runtime_error("Cannot write trace file: " + trace_path);
            }
            auto traces = engine->get_last_traces();
            trace_file << nlohmann::json(traces).dump(2) << std::endl;
            std::cerr << "Trace exported to " << trace_path << " (" << traces.size() << " records)\n";
        }
        return ok ? 0 : 2;

    } catch (const canvasflow::WorkflowValidationError& e) {
        std::cerr << "[INVALID] " << nlohmann::json(e.result()).dump(2) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
