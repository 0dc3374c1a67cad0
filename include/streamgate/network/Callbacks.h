#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace streamgate {
namespace network {

class TcpConnection;
class Buffer;

using Timestamp = std::chrono::system_clock::time_point;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
using WriteCompleteCallback = std::function<void(const TcpConnectionPtr&)>;
using MessageCallback = std::function<void(const TcpConnectionPtr&, Buffer*, Timestamp)>;
using HighWaterMarkCallback = std::function<void(const TcpConnectionPtr&, size_t)>;

using TimerCallback = std::function<void()>;

} // namespace network
} // namespace streamgate
