// tests/test_types.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/execution.h"
#include "modules/scheduler/execution_context.h"
#include "modules/scheduler/execution_registry.h"
#include "modules/scheduler/execution_session.h"
#include <set>

using namespace canvasflow;
using std::chrono::milliseconds;

TEST_CASE("Retry delay strategies", "[types][retry]") {
    RetryPolicy fixed{.max_retries = 3, .retry_delay_ms = 100};
    REQUIRE(fixed.delay_for(1) == milliseconds(100));
    REQUIRE(fixed.delay_for(3) == milliseconds(100));

    RetryPolicy exponential{.max_retries = 4, .retry_delay_ms = 100, .backoff_multiplier = 2.0};
    REQUIRE(exponential.delay_for(1) == milliseconds(100));
    REQUIRE(exponential.delay_for(2) == milliseconds(200));
    REQUIRE(exponential.delay_for(4) == milliseconds(800));

    RetryPolicy capped{.max_retries = 5, .retry_delay_ms = 100, .backoff_multiplier = 3.0, .max_delay_ms = 500};
    REQUIRE(capped.delay_for(2) == milliseconds(300));
    REQUIRE(capped.delay_for(3) == milliseconds(500));
}

TEST_CASE("Terminal statuses", "[types]") {
    REQUIRE_FALSE(is_terminal(ExecutionStatus::RUNNING));
    REQUIRE_FALSE(is_terminal(ExecutionStatus::PAUSED));
    REQUIRE(is_terminal(ExecutionStatus::COMPLETED));
    REQUIRE(is_terminal(ExecutionStatus::FAILED));
    REQUIRE(is_terminal(ExecutionStatus::CANCELLED));
    REQUIRE(to_string(ExecutionStatus::PAUSED) == "paused");
    REQUIRE(to_string(BlockStatus::SKIPPED) == "skipped");
}

TEST_CASE("Context status transitions", "[types][control]") {
    ExecutionContext context("exec_1_1", 2);

    REQUIRE(context.status() == ExecutionStatus::RUNNING);
    REQUIRE_FALSE(context.resume());
    REQUIRE(context.pause());
    REQUIRE_FALSE(context.pause());
    REQUIRE(context.resume());
    REQUIRE(context.cancel());
    REQUIRE_FALSE(context.cancel());
    REQUIRE_FALSE(context.pause());
    REQUIRE(context.is_cancelled());
    REQUIRE_FALSE(context.wait_until_runnable());
    REQUIRE_FALSE(context.wait_for_backoff(milliseconds(1000)));

    REQUIRE_THROWS_AS(context.finish(ExecutionStatus::RUNNING), std::logic_error);
    context.finish(ExecutionStatus::COMPLETED);
    REQUIRE(context.status() == ExecutionStatus::COMPLETED);
}

TEST_CASE("Backoff elapses when not cancelled", "[types][retry]") {
    ExecutionContext context("exec_1_2", 1);
    auto started = std::chrono::steady_clock::now();
    REQUIRE(context.wait_for_backoff(milliseconds(20)));
    REQUIRE(std::chrono::steady_clock::now() - started >= milliseconds(20));
}

TEST_CASE("Progress counts results by status", "[types]") {
    ExecutionContext context("exec_1_3", 3);
    context.add_result(BlockResult{"a", "A01", BlockStatus::COMPLETED});
    context.add_result(BlockResult{"b", "A02", BlockStatus::FAILED});
    context.add_result(BlockResult{"c", "A03", BlockStatus::SKIPPED});

    auto progress = context.progress();
    REQUIRE(progress.total == 3);
    REQUIRE(progress.completed == 1);
    REQUIRE(progress.failed == 1);
    REQUIRE(context.results().size() == 3);
}

TEST_CASE("Registry ids are unique and formatted", "[types]") {
    ExecutionRegistry registry;
    std::set<ExecutionId> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = registry.generate_id();
        REQUIRE(id.rfind("exec_", 0) == 0);
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);

    auto context = registry.create(2);
    REQUIRE(registry.find(context->execution_id()) == context);
    REQUIRE(registry.size() == 1);
    registry.remove(context->execution_id());
    REQUIRE(registry.find(context->execution_id()) == nullptr);
    REQUIRE(registry.list().empty());
}

TEST_CASE("Statistics average over all results", "[types]") {
    std::vector<BlockResult> results = {
        BlockResult{"a", "A01", BlockStatus::COMPLETED, "x", std::nullopt, 30},
        BlockResult{"b", "A02", BlockStatus::FAILED, std::nullopt, "e", 10},
        BlockResult{"c", "A03", BlockStatus::SKIPPED, std::nullopt, "cancelled", 0}
    };
    auto stats = ExecutionSession::calculate_statistics(results, 123);

    REQUIRE(stats.total_blocks == 3);
    REQUIRE(stats.completed_blocks == 1);
    REQUIRE(stats.failed_blocks == 1);
    REQUIRE(stats.skipped_blocks == 1);
    REQUIRE(stats.total_execution_time_ms == 123);
    REQUIRE(stats.average_block_time_ms == 40.0 / 3.0);
}
