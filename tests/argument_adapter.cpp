#include "multimcp/argument_adapter.hpp"

#include <cassert>
#include <iostream>

using namespace multimcp;

int main()
{
    std::cout << "Test: plain message fills 'message'...\n";
    {
        auto merged = merge_arguments("echo", "process_message", Json::object(), "hello");
        assert(merged == (Json{{"message", "hello"}}));

        // Explicit argument wins
        merged = merge_arguments("echo", "process_message", Json{{"message", "keep"}}, "hello");
        assert(merged["message"] == "keep");

        // No message leaves the arguments alone
        merged = merge_arguments("echo", "process_message", Json{{"a", 1}}, std::nullopt);
        assert(merged == (Json{{"a", 1}}));
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: JSON object message is merged...\n";
    {
        auto merged = merge_arguments("calc", "add", Json{{"a", 10}}, R"({"a": 1, "b": 2})");
        assert(merged["a"] == 10);
        assert(merged["b"] == 2);
        assert(!merged.contains("message"));

        // A JSON array is not an argument object
        merged = merge_arguments("calc", "add", Json::object(), "[1, 2]");
        assert(merged["message"] == "[1, 2]");

        // Broken JSON is passed through as text
        merged = merge_arguments("calc", "add", Json::object(), "{oops");
        assert(merged["message"] == "{oops");
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: fetch takes the message as url...\n";
    {
        auto merged = merge_arguments("fetch", "fetch", Json::object(), "https://example.com");
        assert(merged == (Json{{"url", "https://example.com"}}));

        // Only the fetch tool of the fetch server is special
        merged = merge_arguments("other", "fetch", Json::object(), "https://example.com");
        assert(merged.contains("message"));
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: filesystem directory becomes path...\n";
    {
        auto merged = merge_arguments("filesystem", "list_directory", Json{{"directory", "/tmp"}},
                                      std::nullopt);
        assert(merged == (Json{{"path", "/tmp"}}));

        merged = merge_arguments("filesystem", "list_directory",
                                 Json{{"directory", "/a"}, {"path", "/b"}}, std::nullopt);
        assert(merged["path"] == "/b");
        assert(merged["directory"] == "/a");

        merged = merge_arguments("other", "list_directory", Json{{"directory", "/tmp"}},
                                 std::nullopt);
        assert(merged.contains("directory"));
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: default tool...\n";
    assert(default_tool("fetch") == "fetch");
    assert(default_tool("echo") == "process_message");
    std::cout << "  [PASS]\n";

    std::cout << "\nAll argument adapter tests passed!\n";
    return 0;
}
