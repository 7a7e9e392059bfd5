#include "multimcp/classifier.hpp"

#include <cassert>
#include <iostream>

int main()
{
    using namespace multimcp;

    auto stdio = ServerConfig::from_json(Json{{"type", "stdio"}, {"command", "srv"}});
    auto stdio_no_command = ServerConfig::from_json(Json{{"type", "stdio"}});
    auto stdio_with_url =
        ServerConfig::from_json(Json{{"type", "stdio"}, {"command", "srv"}, {"url", "http://h/sse"}});
    auto remote = ServerConfig::from_json(Json{{"url", "http://localhost:8000/sse"}});
    auto socket = ServerConfig::from_json(Json{{"type", "websocket"}, {"port", 9000}});

    std::cout << "Test: launchable stdio servers are pipe-bound...\n";
    assert(is_local_pipe_server(stdio, false, false));
    assert(is_local_pipe_server(stdio, true, true));
    std::cout << "  [PASS]\n";

    std::cout << "Test: stdio without a command depends on what we know of it...\n";
    assert(!is_local_pipe_server(stdio_no_command, false, false));
    assert(is_local_pipe_server(stdio_no_command, true, false));
    assert(is_local_pipe_server(stdio_no_command, false, true));
    std::cout << "  [PASS]\n";

    std::cout << "Test: servers reachable by url are left running...\n";
    assert(!is_local_pipe_server(stdio_with_url, true, true));
    assert(!is_local_pipe_server(remote, true, true));
    assert(!is_local_pipe_server(socket, true, true));
    std::cout << "  [PASS]\n";

    std::cout << "\nAll classifier tests passed!\n";
    return 0;
}
