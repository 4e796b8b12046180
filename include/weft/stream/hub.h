#pragma once
#include <weft/stream/stream.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace weft::stream {

namespace detail {

// Subscriber list shared by Hub and Signal.
template<typename T>
class Broadcast : public std::enable_shared_from_this<Broadcast<T>> {
public:
    using MailboxPtr = std::shared_ptr<Mailbox<T>>;

    // Pushing under the lock keeps emission order identical for every
    // subscriber, whichever thread publishes. `produce` runs under the same
    // lock so a Signal's current value and its emissions never disagree;
    // it must not call back into the source. Every subscriber is drained
    // even when one fails; the first failure is rethrown afterwards.
    template<typename Produce>
    void publish(Produce&& produce) {
        std::vector<MailboxPtr> targets;
        {
            std::lock_guard lock(mutex_);
            T value = produce();
            targets.reserve(subscribers_.size());
            for (auto& [id, mailbox] : subscribers_) {
                mailbox->push(value);
                targets.push_back(mailbox);
            }
        }
        std::exception_ptr failure;
        for (auto& mailbox : targets) {
            try {
                mailbox->drain();
            } catch (...) {
                if (!failure) failure = std::current_exception();
            }
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    // `current` is read under the subscriber lock and, when it yields a
    // value, that value is delivered first.
    template<typename Current>
    Subscription attach(typename Stream<T>::Observer observer, ErrorHandler on_error,
                        Current&& current) {
        auto mailbox = std::make_shared<Mailbox<T>>(std::move(observer), std::move(on_error));
        std::uint64_t id;
        {
            std::lock_guard lock(mutex_);
            id = next_id_++;
            if (std::optional<T> initial = current()) {
                mailbox->push(std::move(*initial));
            }
            subscribers_.emplace_back(id, mailbox);
        }
        std::weak_ptr<Broadcast> weak = this->weak_from_this();
        Subscription subscription([weak, id, mailbox]() {
            if (auto self = weak.lock()) {
                self->detach(id);
            }
            mailbox->close();
        });
        mailbox->drain();
        return subscription;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return subscribers_.size();
    }

private:
    void detach(std::uint64_t id) {
        std::lock_guard lock(mutex_);
        std::erase_if(subscribers_, [id](const auto& entry) { return entry.first == id; });
    }

    mutable std::mutex mutex_;
    std::vector<std::pair<std::uint64_t, MailboxPtr>> subscribers_;
    std::uint64_t next_id_ = 1;
};

} // namespace detail

// Multicast source: every published value goes to every current subscriber.
template<typename T>
class Hub {
public:
    Hub() : broadcast_(std::make_shared<detail::Broadcast<T>>()) {}

    void publish(const T& value) {
        broadcast_->publish([&value]() { return value; });
    }

    Stream<T> stream() const {
        auto broadcast = broadcast_;
        return Stream<T>([broadcast](typename Stream<T>::Observer observer, ErrorHandler on_error) {
            return broadcast->attach(std::move(observer), std::move(on_error),
                                     []() { return std::optional<T>(); });
        });
    }

    size_t subscriber_count() const { return broadcast_->size(); }

private:
    std::shared_ptr<detail::Broadcast<T>> broadcast_;
};

} // namespace weft::stream
