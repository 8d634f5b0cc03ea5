/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/events.hpp"

#include <array>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <stdexcept>

namespace pathprobe {

namespace detail {

struct ChannelState {
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::deque<ProgressEvent>> queues;
    std::array<StepStatus, kAllSteps.size()> last{};
    bool closed = false;
};

}  // namespace detail

namespace {

std::size_t index_of(StepId step) {
    return static_cast<std::size_t>(step);
}

std::optional<ProgressEvent> pop_front(std::deque<ProgressEvent>& q) {
    if (q.empty()) return std::nullopt;
    ProgressEvent ev = std::move(q.front());
    q.pop_front();
    return ev;
}

}  // namespace

void EventPublisher::publish(ProgressEvent event) {
    {
        std::lock_guard lock(state_->mutex);
        if (state_->closed) {
            throw std::logic_error(
                std::format("publish on closed channel ({} {})", to_string(event.step), to_string(event.status)));
        }

        auto& last = state_->last[index_of(event.step)];
        // running -> running is a progress update; every other repeat is rejected.
        bool regression = is_terminal(last) || status_rank(event.status) < status_rank(last) ||
                          (event.status == StepStatus::Pending && last == StepStatus::Pending);
        if (regression) {
            throw std::logic_error(std::format("step {}: illegal transition {} -> {}",
                                               to_string(event.step),
                                               to_string(last),
                                               to_string(event.status)));
        }
        last = event.status;

        for (auto& q : state_->queues) {
            q.push_back(event);
        }
    }
    state_->cv.notify_all();
}

std::optional<ProgressEvent> EventSubscription::next() {
    std::unique_lock lock(state_->mutex);
    auto& q = state_->queues[slot_];
    state_->cv.wait(lock, [&] { return !q.empty() || state_->closed; });
    return pop_front(q);
}

std::optional<ProgressEvent> EventSubscription::next_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(state_->mutex);
    auto& q = state_->queues[slot_];
    state_->cv.wait_for(lock, timeout, [&] { return !q.empty() || state_->closed; });
    return pop_front(q);
}

std::optional<ProgressEvent> EventSubscription::try_next() {
    std::lock_guard lock(state_->mutex);
    return pop_front(state_->queues[slot_]);
}

EventChannel::EventChannel() : state_(std::make_shared<detail::ChannelState>()) {
    state_->last.fill(StepStatus::Pending);
}

EventPublisher EventChannel::publisher() const {
    return EventPublisher(state_);
}

EventSubscription EventChannel::subscribe() {
    std::lock_guard lock(state_->mutex);
    state_->queues.emplace_back();
    return EventSubscription(state_, state_->queues.size() - 1);
}

void EventChannel::close() {
    {
        std::lock_guard lock(state_->mutex);
        state_->closed = true;
    }
    state_->cv.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard lock(state_->mutex);
    return state_->closed;
}

StepStatus EventChannel::last_status(StepId step) const {
    std::lock_guard lock(state_->mutex);
    return state_->last[index_of(step)];
}

}  // namespace pathprobe
