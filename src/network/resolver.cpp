#include "network/resolver.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <memory>
#include <optional>
#include <utility>

namespace notes::network {

namespace {

constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

using tcp = boost::asio::ip::tcp;

// Outlives resolve() when the deadline wins; the lookup handler keeps it.
struct PendingLookup {
    explicit PendingLookup(const boost::asio::any_io_executor& ex)
        : resolver(ex), deadline(ex) {}

    tcp::resolver             resolver;
    boost::asio::steady_timer deadline;

    std::optional<std::pair<boost::system::error_code, tcp::resolver::results_type>> outcome;
};

} // anonymous namespace

boost::asio::awaitable<ResolveResult>
resolve(std::string host, std::string port, std::chrono::milliseconds timeout) {
    auto pending = std::make_shared<PendingLookup>(co_await boost::asio::this_coro::executor);

    pending->deadline.expires_after(timeout);
    pending->resolver.async_resolve(
        host, port,
        [pending](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            pending->outcome.emplace(ec, std::move(results));
            pending->deadline.cancel();
        });

    // Completes on expiry, or with operation_aborted once the lookup is done.
    auto [wait_ec] = co_await pending->deadline.async_wait(use_awaitable);
    (void)wait_ec;

    if (!pending->outcome) {
        pending->resolver.cancel();
        co_return ClientError{"resolve " + host + " timed out after " +
                              std::to_string(timeout.count()) + "ms"};
    }

    auto& [ec, results] = *pending->outcome;
    if (ec) {
        co_return ClientError{"resolve " + host + " failed: " + ec.message()};
    }
    co_return std::move(results);
}

} // namespace notes::network
