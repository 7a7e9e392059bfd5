#include "multimcp/client/client.hpp"
#include "multimcp/logging.hpp"
#include "multimcp/transport_selector.hpp"

namespace multimcp::client
{

namespace
{
/// Split "scheme://host:port/path?q" into origin and path (path keeps its query)
std::pair<std::string, std::string> split_url(const std::string& url)
{
    auto scheme_pos = url.find("://");
    size_t host_start = scheme_pos == std::string::npos ? 0 : scheme_pos + 3;
    auto path_pos = url.find('/', host_start);
    if (path_pos == std::string::npos)
        return {url, "/"};
    return {url.substr(0, path_pos), url.substr(path_pos)};
}
} // namespace

std::unique_ptr<ITransport> make_transport(const TransportDescriptor& descriptor)
{
    switch (descriptor.kind)
    {
    case TransportKind::Stdio:
    {
        auto argv = descriptor.argv();
        if (argv.empty() || argv.front().empty())
            throw ConnectionError("stdio transport has no command");
        std::vector<std::string> args(argv.begin() + 1, argv.end());
        log::logger()->debug("stdio transport: {} ({} args)", argv.front(), args.size());
        return std::make_unique<StdioTransport>(argv.front(), std::move(args), descriptor.env,
                                                descriptor.session_log);
    }
    case TransportKind::Sse:
    {
        auto [origin, path] = split_url(descriptor.url);
        log::logger()->debug("SSE transport: {} {}", origin, path);
        return std::make_unique<SseClientTransport>(origin, path, "/messages", descriptor.headers);
    }
    case TransportKind::StreamableHttp:
    {
        auto [origin, path] = split_url(descriptor.url);
        log::logger()->debug("streamable HTTP transport: {} {}", origin, path);
        return std::make_unique<StreamableHttpTransport>(origin, path, descriptor.headers);
    }
    case TransportKind::WebSocket:
        log::logger()->debug("websocket transport: {}", descriptor.url);
        return std::make_unique<WebSocketTransport>(descriptor.url);
    }
    throw ConnectionError("unknown transport kind");
}

std::unique_ptr<Client> make_client(const TransportDescriptor& descriptor)
{
    return std::make_unique<Client>(make_transport(descriptor));
}

} // namespace multimcp::client
