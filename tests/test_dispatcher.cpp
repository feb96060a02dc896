// tests/test_dispatcher.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/dispatch/generation_dispatcher.h"

using namespace canvasflow;

namespace {

GenerationRequest request_for(BlockKind kind) {
    GenerationRequest request;
    request.block_id = "b";
    request.block_number = "A01";
    request.kind = kind;
    request.prompt = "hello";
    request.parameters = {{"size", "512x512"}};
    return request;
}

} // namespace

TEST_CASE("Requests are routed by kind", "[dispatch]") {
    RoutingDispatcher dispatcher;
    dispatcher.register_backend(BlockKind::TEXT, [](const GenerationRequest& r, const ExecutionOptions&) {
        return "text:" + r.prompt;
    });
    dispatcher.register_backend(BlockKind::IMAGE, [](const GenerationRequest& r, const ExecutionOptions&) {
        return "image:" + r.parameters["size"].get<std::string>();
    });

    ExecutionOptions options;
    REQUIRE(dispatcher.generate(request_for(BlockKind::TEXT), options) == "text:hello");
    REQUIRE(dispatcher.generate(request_for(BlockKind::IMAGE), options) == "image:512x512");
    REQUIRE(dispatcher.has_backend(BlockKind::TEXT));
    REQUIRE_FALSE(dispatcher.has_backend(BlockKind::VIDEO));
    REQUIRE(dispatcher.list_backends() == std::vector<BlockKind>{BlockKind::TEXT, BlockKind::IMAGE});
}

TEST_CASE("Missing backend reports the unsupported kind", "[dispatch]") {
    RoutingDispatcher dispatcher;
    try {
        dispatcher.generate(request_for(BlockKind::VIDEO), ExecutionOptions{});
        FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == "Unsupported block type: video");
    }
}

TEST_CASE("Backend failures are wrapped with the kind", "[dispatch]") {
    RoutingDispatcher dispatcher;
    dispatcher.register_backend(BlockKind::TEXT, [](const GenerationRequest&, const ExecutionOptions&) -> std::string {
        throw std::runtime_error("quota exceeded");
    });

    try {
        dispatcher.generate(request_for(BlockKind::TEXT), ExecutionOptions{});
        FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == "Text generation failed: quota exceeded");
    }
}
