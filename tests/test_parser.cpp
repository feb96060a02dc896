// tests/test_parser.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/parser/graph_loader.h"
#include "common/utils/yaml_json.h"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace canvasflow;

TEST_CASE("YAML graph document", "[parser]") {
    std::string yaml = R"(
blocks:
  - id: outline
    number: A01
    kind: text
    prompt: "Outline {data}"
  - id: cover
    number: B01
    kind: image
    prompt: "Cover for [A01]"
    parameters:
      size: "1024x1024"
      steps: 30
connections:
  - id: c1
    from: outline
    to: cover
  - from: cover
    to: outline
)";

    GraphLoader loader;
    Graph graph = loader.parse_from_string(yaml);

    REQUIRE(graph.blocks.size() == 2);
    REQUIRE(graph.blocks[0].kind == BlockKind::TEXT);
    REQUIRE(graph.blocks[0].prompt_template == "Outline {data}");
    REQUIRE(graph.blocks[1].kind == BlockKind::IMAGE);
    REQUIRE(graph.blocks[1].parameters["size"] == "1024x1024");
    REQUIRE(graph.blocks[1].parameters["steps"] == 30);
    REQUIRE(graph.blocks[0].parameters.is_object());

    REQUIRE(graph.connections.size() == 2);
    REQUIRE(graph.connections[0].id == "c1");
    REQUIRE(graph.connections[1].id == "cover->outline");
    REQUIRE(graph.find_block("cover") == &graph.blocks[1]);
    REQUIRE(graph.find_block("nope") == nullptr);
}

TEST_CASE("JSON graph document", "[parser]") {
    std::string json = R"({
        "blocks": [{"id": "v", "number": "C01", "kind": "video", "prompt_template": "Clip"}]
    })";

    GraphLoader loader;
    Graph graph = loader.parse_from_string(json, GraphFormat::JSON);
    REQUIRE(graph.blocks.size() == 1);
    REQUIRE(graph.blocks[0].kind == BlockKind::VIDEO);
    REQUIRE(graph.blocks[0].prompt_template == "Clip");
    REQUIRE(graph.connections.empty());
}

TEST_CASE("Markdown with a fenced graph", "[parser]") {
    std::string markdown = R"(
# Newsletter pipeline

Notes about the workflow.

```yaml
blocks:
  - id: a
    number: A01
    prompt: Hello
```

```yaml
ignored: true
```
)";

    GraphLoader loader;
    Graph graph = loader.parse_from_string(markdown, GraphFormat::MARKDOWN);
    REQUIRE(graph.blocks.size() == 1);
    REQUIRE(graph.blocks[0].kind == BlockKind::TEXT);

    REQUIRE_THROWS_AS(loader.parse_from_string("# nothing here", GraphFormat::MARKDOWN), std::runtime_error);
}

TEST_CASE("Malformed graph documents throw", "[parser]") {
    GraphLoader loader;
    REQUIRE_THROWS_AS(loader.parse_from_string("connections: []"), std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks:\n  - id: a\n"), std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks:\n  - id: a\n    number: A01\n    kind: audio\n"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks:\n  - id: a\n    number: A01\n    parameters: [1]\n"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks: [ {id: a, number: A01} ]\nconnections:\n  - from: a\n"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("{ not json", GraphFormat::JSON), std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks: [unclosed"), std::runtime_error);
}

TEST_CASE("Graph files pick their format by extension", "[parser]") {
    REQUIRE(GraphLoader::format_for_path("flow.json") == GraphFormat::JSON);
    REQUIRE(GraphLoader::format_for_path("flow.YAML") == GraphFormat::YAML);
    REQUIRE(GraphLoader::format_for_path("flow.md") == GraphFormat::MARKDOWN);

    auto path = std::filesystem::temp_directory_path() / "canvasflow_parser_test.json";
    {
        std::ofstream out(path);
        out << R"({"blocks": [{"id": "a", "number": "A01"}], "connections": []})";
    }
    GraphLoader loader;
    Graph graph = loader.parse_from_file(path.string());
    REQUIRE(graph.blocks.size() == 1);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(loader.parse_from_file("/no/such/graph.yaml"), std::runtime_error);
}

TEST_CASE("Graph round-trips through JSON", "[parser]") {
    GraphLoader loader;
    Graph graph = loader.parse_from_string("blocks:\n  - {id: a, number: A01, prompt: hi}\n");
    nlohmann::json j = graph;
    REQUIRE(j["blocks"][0]["kind"] == "text");

    Graph again = loader.parse_from_json(j);
    REQUIRE(again.blocks[0].prompt_template == "hi");
}

TEST_CASE("YAML scalars keep their intent", "[parser][yaml]") {
    auto j = yaml_to_json(YAML::Load(R"(
quoted: "123"
number: 123
real: 1.5
flag: true
nothing: ~
word: hello
list: [1, "2"]
)"));

    REQUIRE(j["quoted"].is_string());
    REQUIRE(j["number"] == 123);
    REQUIRE(j["real"] == 1.5);
    REQUIRE(j["flag"] == true);
    REQUIRE(j["nothing"].is_null());
    REQUIRE(j["word"] == "hello");
    REQUIRE(j["list"][0] == 1);
    REQUIRE(j["list"][1] == "2");
}
