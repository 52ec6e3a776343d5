#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

/**
 * One request as the server saw it. Header names are lowercased.
 */
struct RecordedRequest
{
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;
    std::string body;

    std::optional<std::string> header(const std::string &name) const
    {
        auto it = headers.find(name);
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }
};

/**
 * Raw bytes to send back.
 */
struct CannedResponse
{
    std::string raw;

    // Keep the connection open after `raw` until the client hangs up
    bool holdOpen = false;
};

/**
 * Build an HTTP/1.1 response. Adds Content-Length (unless given) and
 * "Connection: close".
 */
inline CannedResponse httpResponse(int status, const std::string &reason,
                                   const std::vector<std::pair<std::string, std::string>> &headers = {},
                                   const std::string &body = {})
{
    std::string raw = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
    bool hasLength = false;
    for (const auto &[name, value] : headers)
    {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        hasLength = hasLength || lower == "content-length";
        raw += name + ": " + value + "\r\n";
    }
    if (!hasLength)
    {
        raw += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    raw += "Connection: close\r\n\r\n";
    raw += body;
    return {raw, false};
}

/**
 * Single-threaded HTTP/1.1 server on 127.0.0.1 with an ephemeral port.
 * Serves one connection at a time and records every request.
 */
class LoopbackServer
{
public:
    using Handler = std::function<CannedResponse(const RecordedRequest &)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler))
    {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0)
        {
            throw std::runtime_error(std::string("socket: ") + std::strerror(errno));
        }

        int reuse = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;

        socklen_t length = sizeof(address);
        if (::bind(listenFd_, reinterpret_cast<sockaddr *>(&address), sizeof(address)) != 0 ||
            ::listen(listenFd_, 8) != 0 ||
            ::getsockname(listenFd_, reinterpret_cast<sockaddr *>(&address), &length) != 0)
        {
            std::string error = std::strerror(errno);
            ::close(listenFd_);
            throw std::runtime_error("loopback server: " + error);
        }
        port_ = ntohs(address.sin_port);

        thread_ = std::thread([this]
                              { acceptLoop(); });
    }

    ~LoopbackServer()
    {
        stopping_ = true;
        ::shutdown(listenFd_, SHUT_RDWR);
        ::close(listenFd_);
        thread_.join();
    }

    LoopbackServer(const LoopbackServer &) = delete;
    LoopbackServer &operator=(const LoopbackServer &) = delete;

    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }
    std::string url(const std::string &path) const { return baseUrl() + path; }

    std::vector<RecordedRequest> requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void acceptLoop()
    {
        while (!stopping_)
        {
            int client = ::accept(listenFd_, nullptr, nullptr);
            if (client < 0)
            {
                if (errno == EINTR && !stopping_)
                {
                    continue;
                }
                return;
            }
            serve(client);
            ::close(client);
        }
    }

    void serve(int client)
    {
        // 1. Read until the end of the header block
        std::string data;
        std::size_t headerEnd = std::string::npos;
        char buffer[4096];
        while ((headerEnd = data.find("\r\n\r\n")) == std::string::npos)
        {
            ssize_t received = ::recv(client, buffer, sizeof(buffer), 0);
            if (received <= 0)
            {
                return;
            }
            data.append(buffer, static_cast<std::size_t>(received));
        }

        // 2. Request line and headers
        RecordedRequest request;
        std::size_t lineEnd = data.find("\r\n");
        std::string requestLine = data.substr(0, lineEnd);
        std::size_t firstSpace = requestLine.find(' ');
        std::size_t secondSpace = requestLine.find(' ', firstSpace + 1);
        request.method = requestLine.substr(0, firstSpace);
        request.target = requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);

        std::size_t pos = lineEnd + 2;
        while (pos < headerEnd)
        {
            std::size_t end = data.find("\r\n", pos);
            std::string line = data.substr(pos, end - pos);
            pos = end + 2;

            std::size_t colon = line.find(':');
            if (colon == std::string::npos)
            {
                continue;
            }
            std::string name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            std::size_t valueStart = line.find_first_not_of(' ', colon + 1);
            request.headers[name] = valueStart == std::string::npos ? std::string() : line.substr(valueStart);
        }

        // 3. Body, if announced
        request.body = data.substr(headerEnd + 4);
        if (auto expect = request.header("expect"); expect && *expect == "100-continue")
        {
            sendAll(client, "HTTP/1.1 100 Continue\r\n\r\n");
        }
        if (auto length = request.header("content-length"))
        {
            std::size_t expected = std::stoul(*length);
            while (request.body.size() < expected)
            {
                ssize_t received = ::recv(client, buffer, sizeof(buffer), 0);
                if (received <= 0)
                {
                    return;
                }
                request.body.append(buffer, static_cast<std::size_t>(received));
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }

        // 4. Answer
        CannedResponse response = handler_(request);
        sendAll(client, response.raw);
        if (response.holdOpen)
        {
            while (::recv(client, buffer, sizeof(buffer), 0) > 0)
            {
            }
        }
    }

    static void sendAll(int client, const std::string &bytes)
    {
        std::size_t sent = 0;
        while (sent < bytes.size())
        {
            ssize_t n = ::send(client, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
            {
                return;
            }
            sent += static_cast<std::size_t>(n);
        }
    }

    Handler handler_;
    int listenFd_ = -1;
    unsigned short port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<RecordedRequest> requests_;
};
