#include "discovery/advertising_server.h"

#include <algorithm>
#include <stdexcept>

namespace c4::sddp::discovery {

namespace {

// NOTIFY template: device headers with Max-Age filled in and From removed.
protocol::SddpMessage buildAdvertisement(const protocol::HeaderMap& device_headers) {
    protocol::HeaderMap headers;
    for (const auto& header : device_headers) {
        if (protocol::iequals(header.name, "From")) continue;
        headers.setRaw(header.name, header.raw);
    }
    if (!headers.contains("Max-Age")) {
        headers.set("Max-Age", kDefaultMaxAge);
    }
    return protocol::SddpMessage::makeNotify(std::move(headers));
}

std::chrono::milliseconds resolveInterval(const ServerOptions& options,
                                          const protocol::SddpMessage& advertisement) {
    if (options.advertise_interval) {
        if (options.advertise_interval->count() < 0) {
            throw std::invalid_argument("advertise interval must not be negative");
        }
        return std::min(*options.advertise_interval, kMaxAdvertiseInterval);
    }
    std::int64_t max_age = advertisement.maxAge().value_or(kDefaultMaxAge);
    if (max_age <= 0) max_age = kDefaultMaxAge;

    auto cap_seconds = std::chrono::duration_cast<std::chrono::seconds>(kMaxAdvertiseInterval).count();
    if (max_age >= cap_seconds / 2 * 3) {
        return kMaxAdvertiseInterval;
    }
    return std::chrono::milliseconds(max_age * 2000 / 3);
}

} // anonymous namespace

AdvertisingServer::Ptr AdvertisingServer::create(boost::asio::io_context& io_ctx,
                                                 std::unique_ptr<network::EndpointSet> endpoints,
                                                 ServerOptions options) {
    return Ptr(new AdvertisingServer(io_ctx, std::move(endpoints), std::move(options)));
}

AdvertisingServer::AdvertisingServer(boost::asio::io_context& io_ctx,
                                     std::unique_ptr<network::EndpointSet> endpoints,
                                     ServerOptions options)
    : endpoints_(std::move(endpoints))
    , options_(std::move(options))
    , advertisement_(buildAdvertisement(options_.device_headers))
    , advertise_interval_(resolveInterval(options_, advertisement_))
    , logger_(getLogger(LogCategory::SERVER)) {
    if (!endpoints_) {
        throw std::invalid_argument("AdvertisingServer requires an endpoint set");
    }
    for (std::size_t i = 0; i < endpoints_->size(); ++i) {
        timers_.push_back(std::make_unique<boost::asio::steady_timer>(io_ctx));
    }
}

AdvertisingServer::~AdvertisingServer() {
    stop();
}

void AdvertisingServer::start() {
    if (stopped_) {
        throw std::logic_error("AdvertisingServer cannot be restarted after stop()");
    }
    if (started_) return;
    started_ = true;

    std::weak_ptr<AdvertisingServer> weak = shared_from_this();
    endpoints_->startReceive(
        [weak](network::MulticastEndpoint& endpoint, const protocol::SddpMessage& message) {
            if (auto self = weak.lock()) {
                self->onMessage(endpoint, message);
            }
        });

    if (advertise_interval_.count() > 0) {
        auto now = Clock::steadyNow();
        for (std::size_t i = 0; i < timers_.size(); ++i) {
            timers_[i]->expires_at(now);
            advertise(i);
        }
        logger_->info("Advertising on {} endpoint(s) every {} ms",
                      endpoints_->size(), advertise_interval_.count());
    } else {
        logger_->info("Advertising disabled; listening on {} endpoint(s)", endpoints_->size());
    }
}

void AdvertisingServer::stop() {
    if (stopped_) return;
    stopped_ = true;

    for (auto& timer : timers_) {
        timer->cancel();
    }
    endpoints_->stopReceive();
    endpoints_->close();

    if (started_) {
        logger_->info("Server stopped: {} NOTIFY sent, {} SEARCH answered",
                      stats_.notifies_sent, stats_.responses_sent);
    }
}

protocol::HeaderMap AdvertisingServer::headersFor(const network::MulticastEndpoint& endpoint) const {
    protocol::HeaderMap headers;
    headers.set("From", endpoint.unicast_address().toString());
    for (const auto& header : advertisement_.headers()) {
        headers.setRaw(header.name, header.raw);
    }
    return headers;
}

protocol::SddpMessage AdvertisingServer::notifyFor(const network::MulticastEndpoint& endpoint) const {
    return protocol::SddpMessage::makeNotify(headersFor(endpoint));
}

protocol::SddpMessage AdvertisingServer::responseFor(const network::MulticastEndpoint& endpoint,
                                                     const protocol::SddpMessage& search) const {
    const auto& st = search.statementInfo();
    return protocol::SddpMessage::makeResponse(headersFor(endpoint), 200, "OK",
                                               st.protocol + "/" + st.version());
}

void AdvertisingServer::advertise(std::size_t index) {
    auto& endpoint = *endpoints_->endpoints()[index];
    if (endpoint.is_open()) {
        if (endpoint.send_multicast(notifyFor(endpoint))) {
            ++stats_.notifies_sent;
            logger_->debug("NOTIFY sent from {}", endpoint.name());
        } else {
            ++stats_.notify_send_errors;
        }
    }
    scheduleAdvertise(index);
}

void AdvertisingServer::scheduleAdvertise(std::size_t index) {
    auto& timer = *timers_[index];

    // Fixed cadence; after a stall, resume one interval from now.
    auto next = timer.expiry() + advertise_interval_;
    auto now = Clock::steadyNow();
    timer.expires_at(next > now ? next : now + advertise_interval_);

    std::weak_ptr<AdvertisingServer> weak = shared_from_this();
    timer.async_wait([weak, index](boost::system::error_code ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            if (!self->stopped_) {
                self->advertise(index);
            }
        }
    });
}

void AdvertisingServer::onMessage(network::MulticastEndpoint& endpoint,
                                  const protocol::SddpMessage& message) {
    if (stopped_) return;

    switch (message.kind()) {
        case protocol::MessageKind::Search:
            onSearch(endpoint, message);
            break;
        case protocol::MessageKind::Notify:
            onNotify(endpoint, message);
            break;
        case protocol::MessageKind::Response:
            break;
    }
}

void AdvertisingServer::onSearch(network::MulticastEndpoint& endpoint,
                                 const protocol::SddpMessage& message) {
    ++stats_.searches_received;
    if (!options_.respond_to_queries || !message.sourceAddress()) return;

    const auto& requester = *message.sourceAddress();
    logger_->debug("SEARCH {} from {} on {}", message.searchTarget(),
                   requester.toString(), endpoint.name());

    if (endpoint.send_unicast(responseFor(endpoint, message), requester)) {
        ++stats_.responses_sent;
    } else {
        ++stats_.response_send_errors;
    }
}

void AdvertisingServer::onNotify(network::MulticastEndpoint& endpoint,
                                 const protocol::SddpMessage& message) {
    if (isOwnMessage(message)) {
        ++stats_.own_notifies_ignored;
        return;
    }
    ++stats_.peer_notifies_received;

    if (options_.track_peers) {
        const auto& record = peers_.upsert(message, message.receivedWallTime().value_or(Clock::wallNow()));
        logger_->debug("NOTIFY from {} (key {}) on {}",
                       message.sourceAddress() ? message.sourceAddress()->toString() : "?",
                       record.key, endpoint.name());
    }

    // Handlers may add or remove handlers.
    auto handlers = notify_handlers_;
    for (const auto& entry : handlers) {
        try {
            entry.second(message, endpoint.unicast_address());
        } catch (const std::exception& ex) {
            logger_->error("Notify handler {} failed: {}", entry.first, ex.what());
        }
    }
}

bool AdvertisingServer::isOwnMessage(const protocol::SddpMessage& message) const {
    // Other servers on this host share the port, so the address alone does
    // not identify our own NOTIFY; the advertised headers must match too.
    if (message.withoutHeader("From").headers() != advertisement_.headers()) {
        return false;
    }
    auto from = message.from();
    for (const auto& endpoint : endpoints_->endpoints()) {
        const auto& own = endpoint->unicast_address();
        if (from && *from == own) return true;
        if (message.sourceAddress() && *message.sourceAddress() == own) return true;
    }
    return false;
}

std::vector<PeerRecord> AdvertisingServer::peers(Clock::WallTime now) {
    return peers_.snapshot(now);
}

std::uint64_t AdvertisingServer::addNotifyHandler(NotifyHandler handler) {
    auto id = next_handler_id_++;
    notify_handlers_.emplace(id, std::move(handler));
    return id;
}

bool AdvertisingServer::removeNotifyHandler(std::uint64_t id) {
    return notify_handlers_.erase(id) > 0;
}

} // namespace c4::sddp::discovery
