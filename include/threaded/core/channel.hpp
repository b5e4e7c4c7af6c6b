#pragma once

/**
 * @file channel.hpp
 * @brief Unbounded, thread-safe MPMC channel with sender/receiver ends
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace threaded {

/**
 * @brief Channel statistics for diagnostics
 */
struct ChannelStats {
    std::uint64_t send_count{0};
    std::uint64_t recv_count{0};
    std::uint64_t recv_blocked_count{0};
    std::size_t current_size{0};
    std::size_t high_watermark{0};
};

template<typename T>
class Sender;

template<typename T>
class Receiver;

namespace detail {

/**
 * @brief State shared by every end of one channel
 *
 * The channel is disconnected once every sender or every receiver has
 * been dropped, or once a sender closes it explicitly. Messages already
 * queued stay receivable after disconnection.
 */
template<typename T>
class ChannelState {
public:
    ChannelState() = default;

    ChannelState(const ChannelState&) = delete;
    ChannelState& operator=(const ChannelState&) = delete;

    bool send(T& value) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (disconnected_locked()) {
            return false;
        }

        buffer_.push_back(std::move(value));
        stats_.send_count++;
        if (buffer_.size() > stats_.high_watermark) {
            stats_.high_watermark = buffer_.size();
        }

        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> recv() {
        std::unique_lock<std::mutex> lock(mutex_);

        if (buffer_.empty() && !no_more_input_locked()) {
            stats_.recv_blocked_count++;
            not_empty_.wait(lock, [this] {
                return !buffer_.empty() || no_more_input_locked();
            });
        }

        return take_locked();
    }

    std::optional<T> try_recv() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (buffer_.empty() && !no_more_input_locked()) {
            stats_.recv_blocked_count++;
            if (!not_empty_.wait_for(lock, timeout, [this] {
                return !buffer_.empty() || no_more_input_locked();
            })) {
                return std::nullopt;
            }
        }

        return take_locked();
    }

    template<typename Factory>
    bool close_with(std::size_t count, Factory& make) {
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (disconnected_locked()) {
                return false;
            }

            for (std::size_t i = 0; i < count; i++) {
                buffer_.push_back(make());
                stats_.send_count++;
            }
            if (buffer_.size() > stats_.high_watermark) {
                stats_.high_watermark = buffer_.size();
            }
            closed_ = true;
        }
        not_empty_.notify_all();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    void add_sender() {
        std::lock_guard<std::mutex> lock(mutex_);
        senders_++;
    }

    void remove_sender() {
        bool last = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last = --senders_ == 0;
        }
        if (last) {
            not_empty_.notify_all();
        }
    }

    void add_receiver() {
        std::lock_guard<std::mutex> lock(mutex_);
        receivers_++;
    }

    void remove_receiver() {
        std::lock_guard<std::mutex> lock(mutex_);
        receivers_--;
    }

    [[nodiscard]] bool is_disconnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return disconnected_locked();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

    [[nodiscard]] ChannelStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.current_size = buffer_.size();
        return s;
    }

private:
    // Receivers stop waiting once no sender can produce another message.
    bool no_more_input_locked() const {
        return closed_ || senders_ == 0;
    }

    bool disconnected_locked() const {
        return closed_ || senders_ == 0 || receivers_ == 0;
    }

    std::optional<T> take_locked() {
        if (buffer_.empty()) {
            return std::nullopt;
        }

        T value = std::move(buffer_.front());
        buffer_.pop_front();
        stats_.recv_count++;
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;

    std::deque<T> buffer_;
    std::size_t senders_{0};
    std::size_t receivers_{0};
    bool closed_{false};

    ChannelStats stats_;
};

} // namespace detail

/**
 * @brief Sending end of a channel
 *
 * Copies share the same channel. Sending never blocks: the channel has
 * no capacity limit.
 */
template<typename T>
class Sender {
public:
    /**
     * @brief Create a sender attached to no channel; every send fails
     */
    Sender() = default;

    Sender(const Sender& other)
        : state_(other.state_) {
        if (state_) {
            state_->add_sender();
        }
    }

    Sender(Sender&& other) noexcept
        : state_(std::move(other.state_)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Sender() {
        if (state_) {
            state_->remove_sender();
        }
    }

    /**
     * @brief Enqueue a message
     * @param value Message to send, moved from only on success
     * @return false if the channel is disconnected
     */
    [[nodiscard]] bool send(T&& value) {
        return state_ && state_->send(value);
    }

    /**
     * @brief Enqueue final messages and disconnect in one step
     *
     * No other send can land between the final messages and the close:
     * once this returns, every send fails. Receivers still drain what is
     * queued, the final messages last.
     *
     * @param count Number of final messages
     * @param make Called once per final message to build it
     * @return false if the channel was already disconnected
     */
    template<typename Factory>
    [[nodiscard]] bool close_with(std::size_t count, Factory make) {
        return state_ && state_->close_with(count, make);
    }

    /**
     * @brief Disconnect the channel for every sender and receiver
     */
    void close() {
        if (state_) {
            state_->close();
        }
    }

    [[nodiscard]] bool is_disconnected() const {
        return !state_ || state_->is_disconnected();
    }

    [[nodiscard]] std::size_t size() const {
        return state_ ? state_->size() : 0;
    }

    [[nodiscard]] ChannelStats stats() const {
        return state_ ? state_->stats() : ChannelStats{};
    }

private:
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> make_channel();

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {
        state_->add_sender();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * @brief Receiving end of a channel
 *
 * Copies share the same channel; every message is delivered to exactly
 * one receiver.
 */
template<typename T>
class Receiver {
public:
    Receiver(const Receiver& other)
        : state_(other.state_) {
        if (state_) {
            state_->add_receiver();
        }
    }

    Receiver(Receiver&& other) noexcept
        : state_(std::move(other.state_)) {}

    Receiver& operator=(Receiver other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Receiver() {
        if (state_) {
            state_->remove_receiver();
        }
    }

    /**
     * @brief Dequeue a message, blocking while the channel is empty
     * @return Message, or nullopt once the channel is empty and disconnected
     */
    [[nodiscard]] std::optional<T> recv() {
        if (!state_) {
            return std::nullopt;
        }
        return state_->recv();
    }

    /**
     * @brief Dequeue without blocking
     * @return Message if one is queued, nullopt otherwise
     */
    [[nodiscard]] std::optional<T> try_recv() {
        if (!state_) {
            return std::nullopt;
        }
        return state_->try_recv();
    }

    /**
     * @brief Dequeue with timeout
     * @param timeout Maximum wait duration
     * @return Message, or nullopt on timeout or when empty and disconnected
     */
    template<typename Rep, typename Period>
    [[nodiscard]] std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
        if (!state_) {
            return std::nullopt;
        }
        return state_->recv_for(timeout);
    }

    [[nodiscard]] bool is_disconnected() const {
        return !state_ || state_->is_disconnected();
    }

    [[nodiscard]] std::size_t size() const {
        return state_ ? state_->size() : 0;
    }

    [[nodiscard]] bool empty() const {
        return size() == 0;
    }

private:
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> make_channel();

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {
        state_->add_receiver();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * @brief Create a connected, unbounded channel
 */
template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace threaded
