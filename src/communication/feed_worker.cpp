#include "communication/feed_worker.h"
#include "common/logger.h"
#include <stdexcept>

namespace skyview {
namespace comm {

FeedWorker::FeedWorker(const DataSourceConfig& config,
                       std::shared_ptr<IFeedClient> client,
                       std::shared_ptr<FeedSnapshot> snapshot,
                       std::chrono::milliseconds period,
                       std::chrono::milliseconds retry_backoff)
    : PeriodicTask(period)
    , config_(config)
    , client_(std::move(client))
    , snapshot_(std::move(snapshot))
    , retry_backoff_(retry_backoff) {

    if (!client_ || !snapshot_) {
        throw std::invalid_argument("Feed worker needs a client and a snapshot");
    }
}

FeedWorker::~FeedWorker() {
    // Join before members go away; the base destructor runs too late
    stop();
}

void FeedWorker::execute() {
    try {
        if (!ensureConnected()) {
            return;
        }

        if (!client_->processNext()) {
            Logger::getInstance().warning("Feed " + config_.name + " connection closed, retrying in " +
                                          std::to_string(retry_backoff_.count()) + " ms");
            connected_ = false;
            ConnectionState state = client_->connectionState();
            if (state.isConnected()) {
                state = ConnectionState::disconnected();
            }
            backOff(state);
            return;
        }

        snapshot_->publish(client_->currentAircraft(), client_->connectionState());

    } catch (const std::exception& e) {
        Logger::getInstance().error("Feed " + config_.name + " error: " + e.what());
        connected_ = false;
        backOff(ConnectionState::error(e.what()));
    }
}

bool FeedWorker::ensureConnected() {
    if (connected_) {
        return true;
    }

    snapshot_->publishState(ConnectionState::connecting());
    Logger::getInstance().log("Connecting feed " + config_.name + " to " + config_.endpoint);

    if (!client_->connect()) {
        ConnectionState state = client_->connectionState();
        if (state.status != ConnectionStatus::ERROR) {
            state = ConnectionState::error("connect failed");
        }
        Logger::getInstance().warning("Feed " + config_.name + " failed to connect: " + state.message);
        backOff(state);
        return false;
    }

    connected_ = true;
    connect_count_++;
    snapshot_->publishState(client_->connectionState());
    Logger::getInstance().log("Feed " + config_.name + " connected");
    return true;
}

void FeedWorker::backOff(const ConnectionState& state) {
    snapshot_->publishState(state);
    if (!waitFor(retry_backoff_)) {
        Logger::getInstance().debug("Feed " + config_.name + " stopped during backoff");
    }
}

} // namespace comm
} // namespace skyview
