#pragma once

#include "streamgate/common/noncopyable.h"
#include "streamgate/network/TcpServer.h"
#include "streamgate/protocol/HttpContext.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace streamgate {
namespace protocol {

class HttpRequest;
class HttpResponse;

// A request whose response is produced asynchronously. While one is in
// flight on a connection, later pipelined requests stay buffered.
class HttpExchange {
public:
    virtual ~HttpExchange() = default;
    // The connection's output buffer drained completely.
    virtual void OnWritable() {}
    // The peer went away before the exchange completed.
    virtual void OnPeerClosed() = 0;
};

using HttpExchangePtr = std::shared_ptr<HttpExchange>;

class HttpServer : streamgate::common::noncopyable {
public:
    // Invoked on the connection's loop when the response is finished.
    // closeConnection shuts the connection down after pending output.
    using CompletionCallback = std::function<void(bool closeConnection)>;
    // Either completes synchronously (calls done before returning, may return
    // nullptr) or returns the exchange that will call done later, exactly once.
    using RequestHandler = std::function<HttpExchangePtr(const streamgate::network::TcpConnectionPtr&,
                                                         const HttpRequest&,
                                                         const CompletionCallback& done)>;

    HttpServer(streamgate::network::EventLoop* loop,
               const streamgate::network::InetAddress& listenAddr,
               const std::string& name,
               streamgate::network::TcpServer::Option option = streamgate::network::TcpServer::kNoReusePort);

    streamgate::network::EventLoop* getLoop() const { return server_.getLoop(); }
    streamgate::network::TcpServer& tcpServer() { return server_; }

    void setRequestHandler(RequestHandler handler) { handler_ = std::move(handler); }
    void setThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }

    void start();

    static void SendResponse(const streamgate::network::TcpConnectionPtr& conn, const HttpResponse& response);

private:
    struct ConnectionState {
        HttpContext context;
        HttpExchangePtr active;
        uint64_t generation{0};
        bool busy{false};
        bool dispatching{false};
        bool closing{false};
    };
    using ConnectionStatePtr = std::shared_ptr<ConnectionState>;

    void onConnection(const streamgate::network::TcpConnectionPtr& conn);
    void onMessage(const streamgate::network::TcpConnectionPtr& conn,
                   streamgate::network::Buffer* buf,
                   streamgate::network::Timestamp receiveTime);
    void onWriteComplete(const streamgate::network::TcpConnectionPtr& conn);

    void processInput(const streamgate::network::TcpConnectionPtr& conn, const ConnectionStatePtr& state);
    void complete(const streamgate::network::TcpConnectionPtr& conn, const ConnectionStatePtr& state,
                  uint64_t generation, bool closeConnection);
    static ConnectionStatePtr stateOf(const streamgate::network::TcpConnectionPtr& conn);

    streamgate::network::TcpServer server_;
    RequestHandler handler_;
};

} // namespace protocol
} // namespace streamgate
