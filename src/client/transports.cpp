#include "multimcp/client/transports.hpp"

#include "internal/process.hpp"
#include "multimcp/exceptions.hpp"
#include "multimcp/logging.hpp"
#include "multimcp/util/json.hpp"

#include <chrono>
#include <easywsclient.hpp>
#include <httplib.h>
#include <sstream>
#include <thread>

namespace multimcp::client
{

namespace
{
struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port;
    bool is_https;
};

struct ParsedUrlWithPath
{
    ParsedUrl base;
    std::string path; // includes leading '/'
};

ParsedUrl parse_url(const std::string& base)
{
    ParsedUrl result;
    std::string remaining = base;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        result.scheme = remaining.substr(0, scheme_pos);
        remaining = remaining.substr(scheme_pos + 3);
    }
    else
    {
        result.scheme = "http";
    }

    if (result.scheme != "http" && result.scheme != "https")
    {
        throw TransportError("Unsupported URL scheme: " + result.scheme +
                             " (only http and https are allowed)");
    }

    result.is_https = (result.scheme == "https");

    auto slash_pos = remaining.find('/');
    if (slash_pos != std::string::npos)
        remaining = remaining.substr(0, slash_pos);

    auto colon_pos = remaining.rfind(':');
    if (colon_pos != std::string::npos)
    {
        std::string port_str = remaining.substr(colon_pos + 1);
        result.host = remaining.substr(0, colon_pos);
        try
        {
            result.port = std::stoi(port_str);
        }
        catch (const std::exception&)
        {
            result.port = result.is_https ? 443 : 80;
        }
    }
    else
    {
        result.host = remaining;
        result.port = result.is_https ? 443 : 80;
    }

    return result;
}

ParsedUrlWithPath parse_url_with_path(const std::string& url)
{
    ParsedUrlWithPath out;
    out.base = parse_url(url);

    auto scheme_pos = url.find("://");
    size_t host_start = (scheme_pos == std::string::npos) ? 0 : (scheme_pos + 3);
    auto path_pos = url.find('/', host_start);
    if (path_pos == std::string::npos)
        out.path = "/";
    else
        out.path = url.substr(path_pos);

    if (out.path.empty() || out.path[0] != '/')
        out.path.insert(out.path.begin(), '/');

    return out;
}

std::string origin_of(const ParsedUrl& url)
{
    return url.scheme + "://" + url.host + ":" + std::to_string(url.port);
}

bool is_redirect_status(int status)
{
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::pair<std::string, std::string> resolve_redirect_target(const std::string& current_full_url,
                                                            const std::string& current_path,
                                                            const std::string& location)
{
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0)
    {
        auto parsed = parse_url_with_path(location);
        return {origin_of(parsed.base), parsed.path};
    }

    if (!location.empty() && location[0] == '/')
        return {current_full_url, location};

    // Relative redirect - resolve against current path
    std::string base_dir = "/";
    auto last_slash = current_path.rfind('/');
    if (last_slash != std::string::npos)
        base_dir = current_path.substr(0, last_slash + 1);
    return {current_full_url, base_dir + location};
}

Json make_request(int64_t id, const std::string& method, const Json& params)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

Json make_notification(const std::string& method, const Json& params)
{
    return Json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
}

/// Reply to a server-initiated request. Only ping is answered; sampling,
/// elicitation and roots are not offered by this client.
Json make_server_reply(const Json& message)
{
    Json reply = {{"jsonrpc", "2.0"}, {"id", message.at("id")}};
    std::string method = message.value("method", "");
    if (method == "ping")
        reply["result"] = Json::object();
    else
        reply["error"] = {{"code", -32601}, {"message", "Method not handled: " + method}};
    return reply;
}

/// Unwrap a JSON-RPC response envelope
Json unwrap_response(const Json& rpc_response)
{
    if (rpc_response.contains("error"))
    {
        const auto& error = rpc_response["error"];
        std::string message =
            error.is_object() ? error.value("message", "Unknown error") : error.dump();
        throw TransportError("JSON-RPC error: " + message);
    }
    if (rpc_response.contains("result"))
        return rpc_response["result"];
    return Json::object();
}

bool id_matches(const Json& message, int64_t id)
{
    if (!message.contains("id"))
        return false;
    const auto& v = message["id"];
    if (v.is_number_integer())
        return v.get<int64_t>() == id;
    if (v.is_string())
        return v.get<std::string>() == std::to_string(id);
    return false;
}

void add_headers(httplib::Headers& out, const std::map<std::string, std::string>& headers)
{
    for (const auto& [key, value] : headers)
        out.emplace(key, value);
}
} // namespace

// =============================================================================
// StdioTransport implementation
// =============================================================================

StdioTransport::StdioTransport(std::string command, std::vector<std::string> args,
                               std::map<std::string, std::string> env,
                               std::optional<std::filesystem::path> log_file)
    : command_(std::move(command)), args_(std::move(args)), env_(std::move(env)),
      log_file_(std::move(log_file))
{
}

StdioTransport::~StdioTransport()
{
    close();
}

bool StdioTransport::is_running() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ && process_->is_running();
}

void StdioTransport::ensure_started()
{
    if (process_ && process_->is_running())
        return;

    process_.reset();
    stderr_log_.reset();

    process::ProcessOptions options;
    options.environment = env_;
    options.redirect_stdin = true;
    options.redirect_stdout = true;
    options.redirect_stderr = false;

    if (log_file_)
    {
        stderr_log_ = std::make_unique<process::OutputFile>();
        try
        {
            stderr_log_->open(*log_file_);
            options.stderr_file = stderr_log_.get();
        }
        catch (const process::ProcessError& e)
        {
            log::logger()->warn("{}; continuing without a session log", e.what());
            stderr_log_.reset();
        }
    }

    auto proc = std::make_unique<process::Process>();
    try
    {
        proc->spawn(command_, args_, options);
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError(std::string("Failed to start stdio server: ") + e.what());
    }

    log::logger()->debug("Started stdio session process {} (pid {})", command_, proc->pid());
    active_pid_.store(proc->pid());
    process_ = std::move(proc);
}

void StdioTransport::write_message(const Json& message)
{
    try
    {
        process_->stdin_pipe().write(message.dump() + "\n");
        process_->stdin_pipe().flush();
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError(std::string("stdio write failed: ") + e.what());
    }
}

void StdioTransport::reply_unsupported(const Json& message)
{
    write_message(make_server_reply(message));
}

Json StdioTransport::read_response(int64_t id)
{
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + read_timeout_;

    try
    {
        auto& out = process_->stdout_pipe();
        while (true)
        {
            auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
            if (remaining <= 0)
                throw TransportError("Timed out waiting for response from stdio server");

            if (!out.has_data(static_cast<int>(std::min<long long>(remaining, 200))))
            {
                if (!process_->is_running())
                {
                    auto code = process_->try_wait();
                    throw TransportError("stdio server exited with code " +
                                         std::to_string(code.value_or(-1)) +
                                         " before responding");
                }
                continue;
            }

            std::string line = out.read_line();
            if (line.empty())
                throw TransportError("stdio server closed its output");

            while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
                line.pop_back();
            if (line.empty())
                continue;

            auto message = util::json::try_parse(line);
            if (!message || !message->is_object())
            {
                log::logger()->debug("Ignoring non-JSON line from stdio server: {}", line);
                continue;
            }

            if (message->contains("method"))
            {
                if (message->contains("id"))
                    reply_unsupported(*message);
                continue;
            }

            if (id_matches(*message, id))
                return unwrap_response(*message);
        }
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError(std::string("stdio read failed: ") + e.what());
    }
}

Json StdioTransport::request(const std::string& route, const Json& payload)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_started();
    int64_t id = next_id_++;
    write_message(make_request(id, route, payload));
    return read_response(id);
}

void StdioTransport::notify(const std::string& method, const Json& params)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_started();
    write_message(make_notification(method, params));
}

void StdioTransport::abort()
{
    int pid = active_pid_.load();
    if (pid <= 0)
        return;
    try
    {
        process::kill_pid(pid);
    }
    catch (const process::ProcessError& e)
    {
        log::logger()->warn("Could not abort stdio session: {}", e.what());
    }
}

void StdioTransport::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_)
        return;

    // EOF on stdin is the MCP stdio shutdown signal; escalate if ignored
    auto wait_exit = [this](std::chrono::milliseconds budget)
    {
        auto deadline = std::chrono::steady_clock::now() + budget;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (process_->try_wait().has_value())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    };

    try
    {
        if (process_->is_running())
        {
            process_->stdin_pipe().close();
            if (!wait_exit(std::chrono::seconds(2)))
            {
                process_->terminate();
                if (!wait_exit(std::chrono::seconds(2)))
                {
                    process_->kill();
                    process_->wait();
                }
            }
        }
    }
    catch (const process::ProcessError& e)
    {
        log::logger()->debug("stdio session shutdown: {}", e.what());
    }

    process_.reset();
    stderr_log_.reset();
    active_pid_.store(0);
}

// =============================================================================
// SseClientTransport implementation
// =============================================================================

SseClientTransport::SseClientTransport(std::string base_url, std::string sse_path,
                                       std::string messages_path,
                                       std::map<std::string, std::string> headers)
    : base_url_(std::move(base_url)), sse_path_(std::move(sse_path)),
      messages_path_(std::move(messages_path)), headers_(std::move(headers))
{
    start_sse_listener();
}

SseClientTransport::~SseClientTransport()
{
    stop_sse_listener();
}

bool SseClientTransport::is_connected() const
{
    return connected_.load(std::memory_order_acquire);
}

void SseClientTransport::close()
{
    std::lock_guard<std::mutex> listener(listener_mutex_);
    stop_sse_listener();
    std::lock_guard<std::mutex> lock(endpoint_mutex_);
    endpoint_path_.clear();
}

void SseClientTransport::ensure_listening()
{
    std::lock_guard<std::mutex> listener(listener_mutex_);
    if (is_connected())
        return;
    stop_sse_listener();
    {
        std::lock_guard<std::mutex> lock(endpoint_mutex_);
        endpoint_path_.clear();
    }
    start_sse_listener();
}

void SseClientTransport::handle_sse_chunk(const std::string& event_type, const std::string& data)
{
    if (event_type == "endpoint")
    {
        std::lock_guard<std::mutex> lock(endpoint_mutex_);
        endpoint_path_ = data;
        // Absolute endpoint URLs are reduced to their path
        if (endpoint_path_.rfind("http://", 0) == 0 || endpoint_path_.rfind("https://", 0) == 0)
            endpoint_path_ = parse_url_with_path(endpoint_path_).path;
        return;
    }

    if (auto evt = util::json::try_parse(data))
        process_sse_event(*evt);
    else
        log::logger()->debug("Ignoring non-JSON SSE event: {}", data);
}

void SseClientTransport::start_sse_listener()
{
    running_.store(true, std::memory_order_release);

    auto url = parse_url(base_url_);
    auto cli = std::make_shared<httplib::Client>(origin_of(url));
    cli->set_connection_timeout(10, 0);
    cli->set_read_timeout(300, 0); // Long timeout for SSE stream (5 minutes)
    cli->set_keep_alive(true);

    sse_thread_ = std::make_unique<std::thread>(
        [this, cli]()
        {
            std::string buffer;
            auto content_receiver = [this, &buffer](const char* data, size_t len)
            {
                if (!running_.load(std::memory_order_acquire))
                    return false;

                buffer.append(data, len);

                size_t pos = 0;
                while (true)
                {
                    // Both \n\n and \r\n\r\n separate events
                    size_t sep = buffer.find("\n\n", pos);
                    size_t sep_len = 2;
                    size_t crlf = buffer.find("\r\n\r\n", pos);
                    if (crlf != std::string::npos && (sep == std::string::npos || crlf < sep))
                    {
                        sep = crlf;
                        sep_len = 4;
                    }
                    if (sep == std::string::npos)
                        break;

                    std::string chunk = buffer.substr(pos, sep - pos);
                    pos = sep + sep_len;

                    std::string event_type;
                    std::string aggregated;
                    std::istringstream lines(chunk);
                    std::string line;
                    while (std::getline(lines, line))
                    {
                        if (!line.empty() && line.back() == '\r')
                            line.pop_back();

                        if (line.rfind("event:", 0) == 0)
                        {
                            event_type = line.substr(6);
                            if (!event_type.empty() && event_type[0] == ' ')
                                event_type.erase(0, 1);
                        }
                        else if (line.rfind("data:", 0) == 0)
                        {
                            std::string data_part = line.substr(5);
                            if (!data_part.empty() && data_part[0] == ' ')
                                data_part.erase(0, 1);
                            aggregated += data_part;
                        }
                    }

                    if (!aggregated.empty())
                        handle_sse_chunk(event_type, aggregated);
                }

                if (pos > 0)
                    buffer.erase(0, pos);

                return running_.load(std::memory_order_acquire);
            };

            auto response_handler = [this](const httplib::Response& r)
            {
                if (r.status >= 200 && r.status < 300)
                {
                    connected_.store(true, std::memory_order_release);
                    return true;
                }
                return false;
            };

            httplib::Headers headers = {{"Accept", "text/event-stream"}};
            add_headers(headers, headers_);
            for (int attempt = 0; attempt < 50 && running_.load(std::memory_order_acquire);
                 ++attempt)
            {
                auto res = cli->Get(sse_path_, headers, response_handler, content_receiver);
                if (res)
                    break;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

            connected_.store(false, std::memory_order_release);
        });

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        stop_client_ = cli;
    }

    // Wait for the stream and the endpoint announcement
    for (int i = 0; i < 50 && !is_connected(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    for (int i = 0; i < 50 && is_connected(); ++i)
    {
        {
            std::lock_guard<std::mutex> lock(endpoint_mutex_);
            if (!endpoint_path_.empty())
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!is_connected())
    {
        stop_sse_listener();
        throw TransportError("Failed to open SSE stream at " + base_url_ + sse_path_);
    }
}

void SseClientTransport::fail_pending(const std::string& reason)
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto& [id, promise] : pending_requests_)
        promise.set_exception(std::make_exception_ptr(TransportError(reason)));
    pending_requests_.clear();
}

void SseClientTransport::abort()
{
    fail_pending("SSE request aborted");
}

void SseClientTransport::stop_sse_listener()
{
    running_.store(false, std::memory_order_release);

    fail_pending("SSE connection closed");

    std::shared_ptr<httplib::Client> cli;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        cli = std::move(stop_client_);
    }
    if (cli)
        cli->stop();

    if (sse_thread_ && sse_thread_->joinable())
        sse_thread_->join();
    sse_thread_.reset();
}

void SseClientTransport::process_sse_event(const Json& event)
{
    if (!event.is_object() || !event.contains("id"))
        return;

    if (event.contains("method"))
    {
        // Runs on the listener thread; a failed reply must not end the stream
        try
        {
            post_message(make_server_reply(event), "reply");
        }
        catch (const TransportError& e)
        {
            log::logger()->warn("SSE reply failed: {}", e.what());
        }
        return;
    }

    const Json& id_val = event.at("id");
    std::optional<int64_t> numeric_id;
    if (id_val.is_number_integer())
    {
        numeric_id = id_val.get<int64_t>();
    }
    else if (id_val.is_string())
    {
        try
        {
            numeric_id = std::stoll(id_val.get<std::string>());
        }
        catch (const std::exception&)
        {
            return;
        }
    }

    if (!numeric_id)
        return;

    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_requests_.find(*numeric_id);
    if (it != pending_requests_.end())
    {
        it->second.set_value(event);
        pending_requests_.erase(it);
    }
}

std::string SseClientTransport::post_path() const
{
    std::lock_guard<std::mutex> lock(endpoint_mutex_);
    return endpoint_path_.empty() ? messages_path_ : endpoint_path_;
}

void SseClientTransport::post_message(const Json& message, const std::string& what)
{
    auto url = parse_url(base_url_);
    httplib::Client cli(origin_of(url));
    cli.set_connection_timeout(5, 0);
    cli.set_read_timeout(30, 0);

    httplib::Headers headers;
    add_headers(headers, headers_);
    auto path = post_path();
    auto res = cli.Post(path, headers, message.dump(), "application/json");
    if (!res)
        throw TransportError("Failed to send " + what + " to " + path);
    if (res->status < 200 || res->status >= 300)
        throw TransportError("HTTP error: " + std::to_string(res->status));
}

Json SseClientTransport::request(const std::string& route, const Json& payload)
{
    ensure_listening();

    int64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);

    std::promise<Json> response_promise;
    std::future<Json> response_future = response_promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_requests_[id] = std::move(response_promise);
    }

    try
    {
        post_message(make_request(id, route, payload), "request");
    }
    catch (const TransportError&)
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_requests_.erase(id);
        throw;
    }

    if (response_future.wait_for(std::chrono::minutes(5)) == std::future_status::timeout)
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_requests_.erase(id);
        throw TransportError("Request timeout waiting for SSE response");
    }

    return unwrap_response(response_future.get());
}

void SseClientTransport::notify(const std::string& method, const Json& params)
{
    ensure_listening();
    post_message(make_notification(method, params), "notification");
}

// =============================================================================
// StreamableHttpTransport implementation
// =============================================================================

StreamableHttpTransport::StreamableHttpTransport(std::string base_url, std::string mcp_path,
                                                 std::map<std::string, std::string> headers)
    : base_url_(std::move(base_url)), mcp_path_(std::move(mcp_path)), headers_(std::move(headers))
{
}

StreamableHttpTransport::~StreamableHttpTransport() = default;

Json StreamableHttpTransport::parse_response(const std::string& body,
                                             const std::string& content_type)
{
    if (content_type.find("text/event-stream") == std::string::npos)
        return util::json::parse(body);

    // SSE reply: the message carrying an id is the response, the rest are
    // notifications
    Json response;
    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.rfind("data:", 0) != 0)
            continue;

        std::string data_part = line.substr(5);
        if (!data_part.empty() && data_part[0] == ' ')
            data_part.erase(0, 1);
        auto msg = util::json::try_parse(data_part);
        if (!msg || !msg->is_object())
            continue;
        if (msg->contains("id") && !msg->contains("method"))
            response = std::move(*msg);
        else
            log::logger()->debug("Streamable HTTP notification: {}", data_part);
    }
    return response;
}

StreamableHttpTransport::Reply StreamableHttpTransport::post(const Json& message)
{
    auto url = parse_url(base_url_);
    std::string full_url = origin_of(url);

    httplib::Headers request_headers = {{"Accept", "application/json, text/event-stream"}};
    add_headers(request_headers, headers_);
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (!session_id_.empty())
            request_headers.emplace("Mcp-Session-Id", session_id_);
    }

    std::string path = mcp_path_.empty() ? "/mcp" : mcp_path_;
    if (path[0] != '/')
        path.insert(path.begin(), '/');

    // Follow redirects explicitly so the scheme cannot be downgraded silently
    httplib::Result res;
    for (int redirects = 0; redirects <= 5; ++redirects)
    {
        auto cli = std::make_shared<httplib::Client>(full_url);
        cli->set_connection_timeout(10, 0);
        cli->set_read_timeout(300, 0);
        cli->set_keep_alive(true);
        cli->set_follow_location(false);
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            if (aborted_)
                throw TransportError("StreamableHttp request aborted");
            active_client_ = cli;
        }

        res = cli->Post(path, request_headers, message.dump(), "application/json");
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            active_client_.reset();
            if (aborted_)
                throw TransportError("StreamableHttp request aborted");
        }
        if (!res)
            throw TransportError("StreamableHttp request failed: " + httplib::to_string(res.error()));

        if (!is_redirect_status(res->status))
            break;

        if (!res->has_header("Location"))
            throw TransportError("StreamableHttp redirect without Location header");
        auto next = resolve_redirect_target(full_url, path, res->get_header_value("Location"));
        full_url = std::move(next.first);
        path = std::move(next.second);
    }

    if (is_redirect_status(res->status))
        throw TransportError("StreamableHttp redirect limit exceeded");
    if (res->status < 200 || res->status >= 300)
        throw TransportError("StreamableHttp error: " + std::to_string(res->status));

    if (res->has_header("Mcp-Session-Id"))
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_id_ = res->get_header_value("Mcp-Session-Id");
    }

    Reply reply;
    reply.status = res->status;
    reply.body = res->body;
    reply.content_type = res->has_header("Content-Type") ? res->get_header_value("Content-Type")
                                                         : std::string("application/json");
    return reply;
}

Json StreamableHttpTransport::request(const std::string& route, const Json& payload)
{
    int64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
    auto reply = post(make_request(id, route, payload));
    if (reply.body.empty())
        throw TransportError("StreamableHttp: empty response to " + route);

    Json rpc_response;
    try
    {
        rpc_response = parse_response(reply.body, reply.content_type);
    }
    catch (const Json::parse_error& e)
    {
        throw TransportError(std::string("StreamableHttp: invalid JSON response: ") + e.what());
    }
    return unwrap_response(rpc_response);
}

void StreamableHttpTransport::notify(const std::string& method, const Json& params)
{
    post(make_notification(method, params));
}

void StreamableHttpTransport::abort()
{
    std::shared_ptr<httplib::Client> cli;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        aborted_ = true;
        cli = active_client_;
    }
    if (cli)
        cli->stop();
}

void StreamableHttpTransport::close()
{
    std::string session;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session.swap(session_id_);
        aborted_ = false;
    }
    if (session.empty())
        return;

    // Session termination is advisory; servers may answer 405
    auto url = parse_url(base_url_);
    httplib::Client cli(origin_of(url));
    cli.set_connection_timeout(5, 0);
    cli.set_read_timeout(5, 0);
    httplib::Headers headers = {{"Mcp-Session-Id", session}};
    add_headers(headers, headers_);
    auto res = cli.Delete(mcp_path_.empty() ? "/mcp" : mcp_path_, headers);
    if (!res)
        log::logger()->debug("Session DELETE failed: {}", httplib::to_string(res.error()));
}

// =============================================================================
// WebSocketTransport implementation
// =============================================================================

WebSocketTransport::WebSocketTransport(std::string url) : url_(std::move(url)) {}

WebSocketTransport::~WebSocketTransport()
{
    close();
}

void WebSocketTransport::ensure_connected()
{
    using easywsclient::WebSocket;
    if (ws_ && ws_->getReadyState() != WebSocket::CLOSED)
        return;

    ws_.reset(WebSocket::from_url(url_));
    if (!ws_)
        throw TransportError("WS connect failed: " + url_);
}

Json WebSocketTransport::request(const std::string& route, const Json& payload)
{
    using easywsclient::WebSocket;
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_connected();

    int64_t id = next_id_++;
    ws_->send(make_request(id, route, payload).dump());

    std::vector<std::string> frames;
    auto onmsg = [&](const std::string& msg) { frames.push_back(msg); };

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (aborted_.load())
            throw TransportError("WS request aborted");
        ws_->poll(50);
        frames.clear();
        ws_->dispatch(onmsg);

        for (const auto& frame : frames)
        {
            auto message = util::json::try_parse(frame);
            if (!message || !message->is_object())
                continue;
            if (message->contains("method"))
            {
                if (message->contains("id"))
                    ws_->send(make_server_reply(*message).dump());
                continue;
            }
            if (id_matches(*message, id))
                return unwrap_response(*message);
        }

        if (ws_->getReadyState() == WebSocket::CLOSED)
            throw TransportError("WS connection closed before response");
    }
    throw TransportError("WS no response");
}

void WebSocketTransport::notify(const std::string& method, const Json& params)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_connected();
    ws_->send(make_notification(method, params).dump());
    ws_->poll(0);
}

void WebSocketTransport::abort()
{
    aborted_.store(true);
}

void WebSocketTransport::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    aborted_.store(false);
    if (!ws_)
        return;
    ws_->close();
    ws_->poll(0);
    ws_.reset();
}

} // namespace multimcp::client
