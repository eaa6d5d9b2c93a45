#pragma once

#include "network/resp_protocol.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace notes::test {

// In-process RESP server speaking just enough Redis for RedisBackend:
// AUTH, SELECT, PING, GET, SET [EX n], SCAN cursor MATCH pattern COUNT n
// (MATCH is a Redis glob).
//
// Runs on its own io_context thread.  SCAN pages through the sorted key set
// two keys at a time and repeats the last key of the previous page, so
// clients see the duplicates real SCAN is allowed to return.
//
// In Silent mode every connection is accepted and read from, but nothing is
// ever written back.  set_disconnect() makes Normal-mode connections close
// around a reply.
class FakeRedisServer {
public:
    enum class Mode { Normal, Silent };

    // When a Normal-mode connection is closed by the server.
    enum class Disconnect {
        Never,
        AfterReply,   // answer one command, then close (idle timeout)
        BeforeReply,  // read one command, close without answering
    };

    explicit FakeRedisServer(Mode mode = Mode::Normal, std::string password = {});
    ~FakeRedisServer();

    FakeRedisServer(const FakeRedisServer&)            = delete;
    FakeRedisServer& operator=(const FakeRedisServer&) = delete;

    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    // Store a raw value (bypassing the protocol).
    void put(const std::string& key, const std::string& value);

    [[nodiscard]] std::optional<std::string> value(const std::string& key) const;

    // Seconds passed with EX on the last SET of `key`, if any.
    [[nodiscard]] std::optional<std::string> expiry(const std::string& key) const;

    // Applies to commands received from now on, on every connection.
    void set_disconnect(Disconnect d) noexcept { disconnect_.store(d); }

    // Every command received, in arrival order.
    [[nodiscard]] std::vector<std::vector<std::string>> commands() const;

private:
    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> serve(boost::asio::ip::tcp::socket socket);

    [[nodiscard]] network::RespReply execute(const std::vector<std::string>& args,
                                             bool& authenticated);
    [[nodiscard]] network::RespReply scan(const std::vector<std::string>& args);

    Mode                    mode_;
    std::string             password_;
    std::atomic<Disconnect> disconnect_{Disconnect::Never};

    boost::asio::io_context        ioc_{1};
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t                       port_ = 0;

    mutable std::mutex                        mutex_;
    std::map<std::string, std::string>        data_;
    std::map<std::string, std::string>        expiry_;
    std::vector<std::vector<std::string>>     commands_;

    std::thread thread_;
};

} // namespace notes::test
