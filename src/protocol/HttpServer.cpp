#include "streamgate/protocol/HttpServer.h"
#include "streamgate/protocol/HttpRequest.h"
#include "streamgate/protocol/HttpResponse.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/common/Logger.h"

namespace streamgate {
namespace protocol {

using streamgate::network::Buffer;
using streamgate::network::TcpConnectionPtr;

namespace {
// Pipelined input buffered behind a busy exchange before reading pauses.
const size_t kMaxBufferedInput = 64 * 1024;
}

HttpServer::HttpServer(streamgate::network::EventLoop* loop,
                       const streamgate::network::InetAddress& listenAddr,
                       const std::string& name,
                       streamgate::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option) {
    server_.SetConnectionCallback([this](const TcpConnectionPtr& conn) { onConnection(conn); });
    server_.SetMessageCallback([this](const TcpConnectionPtr& conn, Buffer* buf, streamgate::network::Timestamp t) {
        onMessage(conn, buf, t);
    });
    server_.SetWriteCompleteCallback([this](const TcpConnectionPtr& conn) { onWriteComplete(conn); });
}

void HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.hostport();
    server_.Start();
}

void HttpServer::SendResponse(const TcpConnectionPtr& conn, const HttpResponse& response) {
    Buffer buf;
    response.appendToBuffer(&buf);
    conn->Send(buf.Peek(), buf.ReadableBytes());
}

HttpServer::ConnectionStatePtr HttpServer::stateOf(const TcpConnectionPtr& conn) {
    auto* state = std::any_cast<ConnectionStatePtr>(conn->GetMutableContext());
    return state ? *state : ConnectionStatePtr();
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(std::make_shared<ConnectionState>());
        return;
    }
    ConnectionStatePtr state = stateOf(conn);
    if (!state) return;
    state->closing = true;
    HttpExchangePtr active = std::move(state->active);
    state->busy = false;
    if (active) {
        active->OnPeerClosed();
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn, Buffer* buf, streamgate::network::Timestamp receiveTime) {
    ConnectionStatePtr state = stateOf(conn);
    if (!state) return;
    (void)receiveTime;
    if (state->busy) {
        if (buf->ReadableBytes() > kMaxBufferedInput) {
            // Hangups are still reported through EPOLLHUP/EPOLLERR while reading is paused.
            conn->StopRead();
        }
        return;
    }
    processInput(conn, state);
}

void HttpServer::onWriteComplete(const TcpConnectionPtr& conn) {
    ConnectionStatePtr state = stateOf(conn);
    if (state && state->active) {
        HttpExchangePtr active = state->active;
        active->OnWritable();
    }
}

void HttpServer::processInput(const TcpConnectionPtr& conn, const ConnectionStatePtr& state) {
    Buffer* buf = conn->inputBuffer();
    while (!state->busy && !state->closing && conn->connected()) {
        if (!state->context.parseRequest(buf, std::chrono::system_clock::now())) {
            LOG_DEBUG << "HttpServer[" << server_.name() << "] bad request from " << conn->peerAddress().toIpPort();
            HttpResponse bad(true);
            bad.setStatus(HttpResponse::k400BadRequest);
            bad.setContentType("text/plain");
            bad.setBody("Bad Request\n");
            SendResponse(conn, bad);
            state->closing = true;
            conn->Shutdown();
            return;
        }
        if (!state->context.gotAll()) {
            return;
        }

        HttpRequest request;
        request.swap(state->context.request());
        state->context.reset();

        const uint64_t generation = ++state->generation;
        std::weak_ptr<streamgate::network::TcpConnection> weakConn(conn);
        CompletionCallback done = [this, weakConn, state, generation](bool closeConnection) {
            TcpConnectionPtr c = weakConn.lock();
            if (c) complete(c, state, generation, closeConnection);
        };

        state->busy = true;
        state->dispatching = true;
        HttpExchangePtr exchange;
        if (handler_) {
            exchange = handler_(conn, request, done);
        } else {
            HttpResponse notFound(request.wantsClose());
            notFound.setStatus(HttpResponse::k404NotFound);
            SendResponse(conn, notFound);
            done(notFound.closeConnection());
        }
        state->dispatching = false;

        if (state->busy) {
            if (exchange) {
                state->active = std::move(exchange);
            } else {
                LOG_ERROR << "HttpServer[" << server_.name() << "] handler neither completed nor returned an exchange";
                state->busy = false;
                state->closing = true;
                conn->ForceClose();
            }
        }
    }
}

void HttpServer::complete(const TcpConnectionPtr& conn, const ConnectionStatePtr& state,
                          uint64_t generation, bool closeConnection) {
    if (!conn->getLoop()->IsInLoopThread()) {
        conn->getLoop()->RunInLoop([this, conn, state, generation, closeConnection] {
            complete(conn, state, generation, closeConnection);
        });
        return;
    }
    if (state->generation != generation || !state->busy) return;

    state->busy = false;
    state->active.reset();
    if (closeConnection || !conn->connected()) {
        state->closing = true;
        conn->Shutdown();
        return;
    }
    conn->StartRead();
    if (!state->dispatching && conn->inputBuffer()->ReadableBytes() > 0) {
        processInput(conn, state);
    }
}

} // namespace protocol
} // namespace streamgate
