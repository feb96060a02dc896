// tests/test_trace.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/engine.h"
#include "modules/trace/trace_exporter.h"
#include "test_helpers.h"

using namespace canvasflow;
using namespace canvasflow::testing;

TEST_CASE("Block start and end form one record", "[trace]") {
    TraceExporter exporter("exec_1_1");
    auto block = make_block("a", "A01", "prompt", BlockKind::IMAGE);

    exporter.on_block_start(block, 2);
    REQUIRE(exporter.get_traces().front().status == "running");

    BlockResult result;
    result.block_id = "a";
    result.block_number = "A01";
    result.status = BlockStatus::FAILED;
    result.error = "boom";
    result.retry_count = 1;
    exporter.on_block_end("a", result, {"Z01"}, std::string("resolved"));

    auto traces = exporter.get_traces();
    REQUIRE(traces.size() == 1);
    const auto& record = traces.front();
    REQUIRE(record.trace_id == "exec_1_1");
    REQUIRE(record.kind == "image");
    REQUIRE(record.wave == 2);
    REQUIRE(record.status == "failed");
    REQUIRE(record.error == std::optional<std::string>("boom"));
    REQUIRE(record.retry_count == 1);
    REQUIRE(record.inputs == std::vector<BlockNumber>{"Z01"});
    REQUIRE(record.resolved_prompt == std::optional<std::string>("resolved"));
    REQUIRE(record.end_time >= record.start_time);

    exporter.clear_traces();
    REQUIRE(exporter.get_traces().empty());
}

TEST_CASE("Trace exports as JSON", "[trace]") {
    TraceExporter exporter("t");
    exporter.on_block_skipped(make_block("b", "A02"), "cancelled");

    auto j = exporter.export_json();
    REQUIRE(j.is_array());
    REQUIRE(j[0]["status"] == "skipped");
    REQUIRE(j[0]["block_number"] == "A02");
    REQUIRE(j[0]["error"] == "cancelled");
    REQUIRE_FALSE(j[0].contains("resolved_prompt"));
}

TEST_CASE("Engine keeps the last run's trace", "[trace][engine]") {
    auto dispatcher = std::make_shared<ScriptedDispatcher>();
    WorkflowEngine engine(dispatcher);
    REQUIRE(engine.get_last_traces().empty());

    auto result = engine.execute_workflow(fan_out_graph());
    auto traces = engine.get_last_traces();

    REQUIRE(traces.size() == 4);
    for (const auto& record : traces) {
        REQUIRE(record.trace_id == result.execution_id);
        REQUIRE(record.status == "completed");
        REQUIRE(record.resolved_prompt.has_value());
    }
    REQUIRE(traces[3].block_number == "A03");
    REQUIRE(traces[3].inputs == std::vector<BlockNumber>{"A01", "A02", "B01"});
    REQUIRE(*traces[3].resolved_prompt == "Summarize <A02> with cover <B01>");
}

TEST_CASE("Cancelled run traces skipped blocks", "[trace][engine]") {
    auto dispatcher = std::make_shared<ScriptedDispatcher>();
    Gate gate;
    dispatcher->script("A01", Script{.gate = &gate});
    WorkflowEngine engine(dispatcher);

    auto handle = engine.start_workflow(chain_graph(3));
    REQUIRE(gate.wait_entered());
    engine.cancel_execution(handle.execution_id);
    gate.release();
    handle.result.get();

    auto traces = engine.get_last_traces();
    REQUIRE(traces.size() == 3);
    REQUIRE(traces[0].status == "completed");
    REQUIRE(traces[1].status == "skipped");
    REQUIRE(traces[2].status == "skipped");
}

TEST_CASE("Parallel waves are numbered in the trace", "[trace][concurrency]") {
    auto dispatcher = std::make_shared<ScriptedDispatcher>();
    WorkflowEngine engine(dispatcher);

    ExecutionOptions options;
    options.max_concurrency = 2;
    engine.execute_workflow(fan_out_graph(), options);

    auto traces = engine.get_last_traces();
    REQUIRE(traces.size() == 4);
    REQUIRE(traces[0].wave == 0);
    REQUIRE(traces[1].wave == 1);
    REQUIRE(traces[2].wave == 1);
    REQUIRE(traces[3].wave == 2);
}
