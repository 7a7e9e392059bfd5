/// @file tests/test_helpers.hpp
/// @brief Shared helpers for multimcp tests
#pragma once

#include "multimcp/client/client.hpp"
#include "multimcp/config.hpp"
#include "multimcp/exceptions.hpp"
#include "multimcp/settings.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace multimcp_test
{

using multimcp::Json;

/// Path of the echo server built next to the tests
inline std::string echo_server_path()
{
#ifdef MULTIMCP_ECHO_SERVER
    return MULTIMCP_ECHO_SERVER;
#else
    return "./multimcp_echo_server";
#endif
}

/// Scratch directory removed on scope exit
class TempDir
{
  public:
    explicit TempDir(const std::string& tag)
    {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("multimcp_" + tag + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const
    {
        return path_;
    }

  private:
    std::filesystem::path path_;
};

/// Settings rooted in a scratch directory with short timeouts
inline multimcp::Settings test_settings(const std::filesystem::path& state_dir)
{
    multimcp::Settings s;
    s.state_dir = state_dir;
    s.launch_grace = std::chrono::milliseconds(300);
    s.stop_timeout = std::chrono::milliseconds(2000);
    s.stop_poll_interval = std::chrono::milliseconds(100);
    s.request_timeout = std::chrono::milliseconds(10000);
    return s;
}

/// stdio config that runs the echo server with extra arguments
inline multimcp::ServerConfig echo_config(const std::vector<std::string>& args = {},
                                          const Json& extra = Json::object())
{
    Json j = {{"type", "stdio"}, {"command", echo_server_path()}, {"args", args}};
    for (auto& [key, value] : extra.items())
        j[key] = value;
    return multimcp::ServerConfig::from_json(j);
}

/// Poll until pred holds or the timeout expires
inline bool wait_for(const std::function<bool()>& pred,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

/// Scripted client: advertises a fixed tool list and records every call
class MockClient : public multimcp::client::Client
{
  public:
    struct Calls
    {
        std::mutex mutex;
        int initialize{0};
        int close{0};
        std::vector<std::pair<std::string, Json>> tool_calls;
    };

    explicit MockClient(std::vector<std::string> tools, std::shared_ptr<Calls> calls)
        : tools_(std::move(tools)), calls_(std::move(calls))
    {
    }

    /// Make call_tool throw this instead of answering
    std::function<void()> fail_with;

    multimcp::client::InitializeResult initialize() override
    {
        std::lock_guard<std::mutex> lock(calls_->mutex);
        ++calls_->initialize;
        initialized_ = multimcp::client::InitializeResult{};
        return *initialized_;
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(calls_->mutex);
        ++calls_->close;
        initialized_.reset();
    }

    std::vector<multimcp::client::ToolInfo> list_tools() override
    {
        std::vector<multimcp::client::ToolInfo> out;
        for (const auto& name : tools_)
        {
            multimcp::client::ToolInfo t;
            t.name = name;
            t.inputSchema = Json{{"type", "object"}};
            out.push_back(t);
        }
        return out;
    }

    multimcp::client::CallToolResult call_tool(const std::string& name, const Json& arguments,
                                               std::chrono::milliseconds) override
    {
        {
            std::lock_guard<std::mutex> lock(calls_->mutex);
            calls_->tool_calls.emplace_back(name, arguments);
        }
        if (fail_with)
            fail_with();
        multimcp::client::CallToolResult r;
        r.content.push_back(multimcp::client::TextContent{"text", "ok:" + name});
        return r;
    }

  private:
    std::vector<std::string> tools_;
    std::shared_ptr<Calls> calls_;
};

} // namespace multimcp_test
