#pragma once

#include "response_collector.h"
#include "../common/asio_compat.h"
#include "../common/clock.h"
#include "../common/logger.h"
#include "../common/types.h"
#include "../network/endpoint_set.h"
#include "../protocol/sddp_message.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace c4::sddp::discovery {

struct SearchOptions {
    std::string search_target = "*";
    std::chrono::milliseconds wait_time = kDefaultResponseWaitTime;
    std::size_t max_responses = 0;        // 0 = no count limit
    bool include_error_responses = false;
    ResponseFilter filter;                // empty = accept all
    std::size_t max_queue_size = 1000;
};

/// An accepted response and the local endpoint it arrived on.
struct SearchResponse {
    protocol::SddpMessage message;
    HostAndPort local_address;
};

// ---------------------------------------------------------------------------
// One discovery query. begin() multicasts a SEARCH from every endpoint; next()
// then yields accepted responses in arrival order until the wait time has
// elapsed, max_responses were accepted, or cancel() is called. A finished
// session cannot be restarted.
//
// next() runs the io_context itself and must not be called from a handler
// executing on that io_context.
// ---------------------------------------------------------------------------
class SearchSession : public std::enable_shared_from_this<SearchSession> {
public:
    using Ptr = std::shared_ptr<SearchSession>;

    static Ptr create(boost::asio::io_context& io_ctx,
                      std::unique_ptr<network::EndpointSet> endpoints,
                      SearchOptions options = {});

    ~SearchSession();

    SearchSession(const SearchSession&) = delete;
    SearchSession& operator=(const SearchSession&) = delete;

    /// Send the SEARCH datagrams and arm the deadline. Throws std::logic_error
    /// if called twice.
    void begin();

    /// Next accepted response, or std::nullopt once the session is over.
    /// Calls begin() if it has not been called yet.
    std::optional<SearchResponse> next();

    /// Drain every remaining response.
    std::vector<SearchResponse> collect();

    /// Stop immediately; queued responses are discarded.
    void cancel();

    bool started() const { return state_ != State::Idle; }
    bool finished() const;
    std::size_t yielded() const { return yielded_; }
    std::size_t searchesSent() const { return searches_sent_; }
    std::size_t droppedResponses() const { return dropped_; }
    Clock::SteadyTime deadline() const { return deadline_; }
    const SearchOptions& options() const { return options_; }
    const network::EndpointSet& endpoints() const { return *endpoints_; }

private:
    enum class State : std::uint8_t {
        Idle,
        Running,
        Terminated,
        Cancelled
    };

    SearchSession(boost::asio::io_context& io_ctx,
                  std::unique_ptr<network::EndpointSet> endpoints,
                  SearchOptions options);

    void onMessage(network::MulticastEndpoint& endpoint, const protocol::SddpMessage& message);
    void terminate(const char* reason);
    void shutdownEndpoints();

    boost::asio::io_context& io_ctx_;
    std::unique_ptr<network::EndpointSet> endpoints_;
    SearchOptions options_;
    ResponseCollector collector_;

    boost::asio::steady_timer deadline_timer_;
    Clock::SteadyTime deadline_{};
    std::deque<SearchResponse> queue_;

    State state_ = State::Idle;
    std::size_t yielded_ = 0;
    std::size_t searches_sent_ = 0;
    std::size_t dropped_ = 0;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace c4::sddp::discovery
