#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace shardrent::upload {

// Blocking multi-producer, multi-consumer channel.
//
// With capacity 0 the channel is a rendezvous point: send() returns only once
// a receiver has taken the value. close() marks permanent exhaustion; after
// it, receive() drains what is left and then yields std::nullopt, so callers
// can tell "nothing yet" from "nothing ever again".
//
// Receivers may be registered up front. Once every registered receiver has
// left, send() stops waiting and reports that the value was not delivered.
template <typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false when all registered receivers are gone. Throws
    // std::logic_error when called after close().
    bool send(T value) {
        std::unique_lock lock(mutex_);
        const auto slots = capacity_ == 0 ? std::size_t{1} : capacity_;
        writable_.wait(lock, [&] { return closed_ || abandoned() || items_.size() < slots; });
        if (closed_) {
            throw std::logic_error("send on closed channel");
        }
        if (abandoned()) {
            return false;
        }

        items_.push_back(std::move(value));
        const auto ticket = ++sent_;
        readable_.notify_one();

        if (capacity_ > 0) {
            return true;
        }

        writable_.wait(lock, [&] { return received_ >= ticket || abandoned(); });
        return received_ >= ticket;
    }

    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        readable_.wait(lock, [&] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        ++received_;
        writable_.notify_all();
        return value;
    }

    void close() {
        std::scoped_lock lock(mutex_);
        closed_ = true;
        readable_.notify_all();
        writable_.notify_all();
    }

    bool closed() const {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

    void add_receiver() {
        std::scoped_lock lock(mutex_);
        ++registered_receivers_;
        ++active_receivers_;
    }

    void remove_receiver() {
        std::scoped_lock lock(mutex_);
        if (active_receivers_ > 0) {
            --active_receivers_;
        }
        writable_.notify_all();
    }

private:
    bool abandoned() const { return registered_receivers_ > 0 && active_receivers_ == 0; }

    mutable std::mutex mutex_;
    std::condition_variable readable_;
    std::condition_variable writable_;
    std::deque<T> items_;
    std::size_t capacity_;
    std::uint64_t sent_{0};
    std::uint64_t received_{0};
    std::size_t registered_receivers_{0};
    std::size_t active_receivers_{0};
    bool closed_{false};
};

}  // namespace shardrent::upload
