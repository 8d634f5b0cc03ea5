/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "pathprobe/results.hpp"

namespace pathprobe {

struct ProgressEvent {
    StepId step = StepId::Dns;
    StepStatus status = StepStatus::Pending;
    std::string message;
    std::optional<nlohmann::json> data;
};

namespace detail {
struct ChannelState;
}

// Send-only end. Rejects any per-step status regression with std::logic_error.
class EventPublisher {
    std::shared_ptr<detail::ChannelState> state_;

   public:
    explicit EventPublisher(std::shared_ptr<detail::ChannelState> state)
        : state_(std::move(state)) {}

    void publish(ProgressEvent event);
};

// Receive-only end. Sees only events published after it was created.
class EventSubscription {
    std::shared_ptr<detail::ChannelState> state_;
    std::size_t slot_;

   public:
    EventSubscription(std::shared_ptr<detail::ChannelState> state, std::size_t slot)
        : state_(std::move(state)), slot_(slot) {}

    // Blocks until an event arrives. Returns nullopt once the channel is
    // closed and every queued event has been delivered.
    std::optional<ProgressEvent> next();
    std::optional<ProgressEvent> next_for(std::chrono::milliseconds timeout);
    std::optional<ProgressEvent> try_next();
};

class EventChannel {
    std::shared_ptr<detail::ChannelState> state_;

   public:
    EventChannel();

    [[nodiscard]] EventPublisher publisher() const;
    [[nodiscard]] EventSubscription subscribe();

    // Wakes every blocked subscriber; later publishes throw.
    void close();
    [[nodiscard]] bool closed() const;

    [[nodiscard]] StepStatus last_status(StepId step) const;
};

}  // namespace pathprobe
