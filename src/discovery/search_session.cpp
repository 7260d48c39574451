#include "discovery/search_session.h"

#include <stdexcept>

namespace c4::sddp::discovery {

SearchSession::Ptr SearchSession::create(boost::asio::io_context& io_ctx,
                                         std::unique_ptr<network::EndpointSet> endpoints,
                                         SearchOptions options) {
    return Ptr(new SearchSession(io_ctx, std::move(endpoints), std::move(options)));
}

SearchSession::SearchSession(boost::asio::io_context& io_ctx,
                             std::unique_ptr<network::EndpointSet> endpoints,
                             SearchOptions options)
    : io_ctx_(io_ctx)
    , endpoints_(std::move(endpoints))
    , options_(std::move(options))
    , collector_(ResponseCollector::Options{options_.filter,
                                            options_.include_error_responses,
                                            options_.max_responses})
    , deadline_timer_(io_ctx)
    , logger_(getLogger(LogCategory::SEARCH)) {
    if (!endpoints_) {
        throw std::invalid_argument("SearchSession requires an endpoint set");
    }
}

SearchSession::~SearchSession() {
    if (state_ == State::Running) {
        state_ = State::Cancelled;
        shutdownEndpoints();
    }
}

void SearchSession::begin() {
    if (state_ != State::Idle) {
        throw std::logic_error("SearchSession::begin() called more than once");
    }
    state_ = State::Running;

    if (io_ctx_.stopped()) {
        io_ctx_.restart();
    }

    std::weak_ptr<SearchSession> weak = shared_from_this();
    endpoints_->startReceive(
        [weak](network::MulticastEndpoint& endpoint, const protocol::SddpMessage& message) {
            if (auto self = weak.lock()) {
                self->onMessage(endpoint, message);
            }
        });

    searches_sent_ = endpoints_->sendMulticast([this](const network::MulticastEndpoint& ep) {
        return protocol::SddpMessage::makeSearch(options_.search_target, ep.unicast_address());
    });

    deadline_ = Clock::steadyNow() + options_.wait_time;
    deadline_timer_.expires_at(deadline_);
    deadline_timer_.async_wait([weak](boost::system::error_code ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->terminate("wait time elapsed");
        }
    });

    logger_->info("SEARCH {} sent on {}/{} endpoint(s), waiting {} ms",
                  options_.search_target, searches_sent_, endpoints_->size(),
                  options_.wait_time.count());
}

std::optional<SearchResponse> SearchSession::next() {
    if (state_ == State::Idle) {
        begin();
    }

    while (queue_.empty() && state_ == State::Running) {
        if (Clock::steadyNow() >= deadline_) {
            terminate("wait time elapsed");
            break;
        }
        io_ctx_.run_one_until(deadline_);
        if (io_ctx_.stopped()) {
            io_ctx_.restart();
        }
    }

    if (queue_.empty()) {
        return std::nullopt;
    }
    SearchResponse response = std::move(queue_.front());
    queue_.pop_front();
    ++yielded_;
    return response;
}

std::vector<SearchResponse> SearchSession::collect() {
    std::vector<SearchResponse> result;
    while (auto response = next()) {
        result.push_back(std::move(*response));
    }
    return result;
}

void SearchSession::cancel() {
    if (state_ == State::Cancelled) return;
    bool was_running = state_ == State::Running;
    state_ = State::Cancelled;
    queue_.clear();
    if (was_running) {
        shutdownEndpoints();
        logger_->info("Search cancelled after {} response(s)", collector_.acceptedCount());
    }
}

bool SearchSession::finished() const {
    return (state_ == State::Terminated || state_ == State::Cancelled) && queue_.empty();
}

void SearchSession::onMessage(network::MulticastEndpoint& endpoint,
                              const protocol::SddpMessage& message) {
    if (state_ != State::Running) return;

    auto verdict = collector_.offer(message);
    if (verdict != ResponseCollector::Verdict::Accepted) {
        logger_->debug("Ignoring {} from {} on {}: {}", message.statement(),
                       message.sourceAddress() ? message.sourceAddress()->toString() : "?",
                       endpoint.name(), toString(verdict));
        return;
    }

    if (queue_.size() >= options_.max_queue_size) {
        ++dropped_;
        logger_->warn("Response queue full ({}), dropping response from {}",
                      options_.max_queue_size,
                      message.sourceAddress() ? message.sourceAddress()->toString() : "?");
    } else {
        logger_->debug("Accepted response from {} on {}",
                       message.sourceAddress() ? message.sourceAddress()->toString() : "?",
                       endpoint.name());
        queue_.push_back(SearchResponse{message, endpoint.unicast_address()});
    }

    if (collector_.limitReached()) {
        terminate("max responses reached");
    }
}

void SearchSession::terminate(const char* reason) {
    if (state_ != State::Running) return;
    state_ = State::Terminated;
    shutdownEndpoints();
    logger_->info("Search finished ({}): {} response(s) accepted",
                  reason, collector_.acceptedCount());
}

void SearchSession::shutdownEndpoints() {
    deadline_timer_.cancel();
    endpoints_->stopReceive();
    endpoints_->close();
}

} // namespace c4::sddp::discovery
