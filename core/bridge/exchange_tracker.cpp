#include "exchange_tracker.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace ccproxy {
namespace bridge {

ExchangeTracker::~ExchangeTracker() { fail_all(BridgeStatus::SHUTTING_DOWN, "Bridge destroyed"); }

void ExchangeTracker::enqueue(std::unique_ptr<PendingRequest> request) {
    LOG_DEBUG("[Bridge] Request " << request->id << " queued (" << queue_.size() << " ahead)");
    queue_.push_back(std::move(request));
}

const PendingRequest *ExchangeTracker::dispatch_next() {
    if (in_flight_ || queue_.empty()) {
        return nullptr;
    }
    in_flight_ = std::move(queue_.front());
    queue_.pop_front();
    return in_flight_.get();
}

void ExchangeTracker::on_dispatch_failed() {
    if (in_flight_) {
        orphans_.push_back(std::move(in_flight_));
    }
}

void ExchangeTracker::on_assistant(const AssistantEvent &event) {
    if (stale_replies_ > 0 || !in_flight_) {
        LOG_DEBUG("[Bridge] Discarding assistant text with no live request");
        return;
    }
    for (const auto &block : event.text_blocks) {
        in_flight_->text.append(block);
    }
}

bool ExchangeTracker::on_result(const ResultEvent &event) {
    if (stale_replies_ > 0) {
        stale_replies_--;
        LOG_INFO("[Bridge] Discarded late reply of a timed-out request (" << stale_replies_ << " still owed)");
        return false;
    }
    if (!in_flight_) {
        LOG_DEBUG("[Bridge] Discarding result with no live request");
        return false;
    }

    std::unique_ptr<PendingRequest> request = std::move(in_flight_);

    BridgeReply reply;
    reply.status = BridgeStatus::OK;
    reply.text = !request->text.empty() ? std::move(request->text) : event.result.value_or("");
    reply.worker_error = event.is_error;

    LOG_DEBUG("[Bridge] Request " << request->id << " completed (" << reply.text.size() << " bytes"
                                  << (reply.worker_error ? ", worker reported error" : "") << ")");
    request->promise.set_value(std::move(reply));
    completed_++;
    return true;
}

void ExchangeTracker::fail_timeout(PendingRequest &request) {
    timed_out_++;
    LOG_WARN("[Bridge] Request " << request.id << " timed out");
    request.promise.set_value(BridgeReply::failure(BridgeStatus::TIMEOUT, "Worker reply timeout"));
}

size_t ExchangeTracker::expire(Clock::time_point now) {
    size_t expired = 0;

    if (in_flight_ && now >= in_flight_->deadline) {
        fail_timeout(*in_flight_);
        in_flight_.reset();
        stale_replies_++;
        expired++;
    }

    for (auto it = queue_.begin(); it != queue_.end();) {
        if (now >= (*it)->deadline) {
            fail_timeout(**it);
            it = queue_.erase(it);
            expired++;
        } else {
            ++it;
        }
    }

    for (auto it = orphans_.begin(); it != orphans_.end();) {
        if (now >= (*it)->deadline) {
            fail_timeout(**it);
            it = orphans_.erase(it);
            expired++;
        } else {
            ++it;
        }
    }

    return expired;
}

void ExchangeTracker::on_worker_lost() {
    if (in_flight_) {
        LOG_WARN("[Bridge] Worker lost while request " << in_flight_->id << " was in flight");
        orphans_.push_back(std::move(in_flight_));
    }
    stale_replies_ = 0;
}

void ExchangeTracker::fail_all(BridgeStatus status, const std::string &message) {
    auto fail = [&](std::unique_ptr<PendingRequest> &request) {
        if (request) {
            request->promise.set_value(BridgeReply::failure(status, message));
            request.reset();
        }
    };

    fail(in_flight_);
    for (auto &request : queue_) {
        fail(request);
    }
    for (auto &request : orphans_) {
        fail(request);
    }
    queue_.clear();
    orphans_.clear();
    stale_replies_ = 0;
}

std::optional<ExchangeTracker::Clock::time_point> ExchangeTracker::next_deadline() const {
    std::optional<Clock::time_point> earliest;
    auto consider = [&earliest](const std::unique_ptr<PendingRequest> &request) {
        if (request && (!earliest || request->deadline < *earliest)) {
            earliest = request->deadline;
        }
    };

    consider(in_flight_);
    for (const auto &request : queue_) {
        consider(request);
    }
    for (const auto &request : orphans_) {
        consider(request);
    }
    return earliest;
}

}  // namespace bridge
}  // namespace ccproxy
