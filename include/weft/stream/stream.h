#pragma once
#include <weft/stream/mailbox.h>
#include <weft/stream/subscription.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace weft::stream {

// Lazy push-based sequence. Nothing happens until subscribe(); each
// subscription gets its own delivery in emission order.
template<typename T>
class Stream {
public:
    using value_type = T;
    using Observer = std::function<void(const T&)>;
    using SubscribeFn = std::function<Subscription(Observer, ErrorHandler)>;

    explicit Stream(SubscribeFn subscribe) : subscribe_(std::move(subscribe)) {}

    // `on_error` sees failures of the observer and of every operator between
    // it and the source; delivery of later values continues. Without it a
    // failure propagates to whoever pushed the value.
    Subscription subscribe(Observer observer, ErrorHandler on_error = {}) const {
        return subscribe_(std::move(observer), std::move(on_error));
    }

    // Emits every value synchronously on subscription, then stays silent.
    static Stream of(std::vector<T> values) {
        return Stream([values = std::move(values)](Observer observer, ErrorHandler on_error) {
            auto mailbox = std::make_shared<Mailbox<T>>(std::move(observer), std::move(on_error));
            for (const auto& value : values) {
                mailbox->push(value);
            }
            mailbox->drain();
            return Subscription([mailbox]() { mailbox->close(); });
        });
    }

    static Stream empty() {
        return of({});
    }

    template<typename F>
    auto map(F transform) const -> Stream<std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        auto source = subscribe_;
        return Stream<U>([source, transform](typename Stream<U>::Observer observer, ErrorHandler on_error) {
            return source([transform, observer](const T& value) { observer(transform(value)); },
                          std::move(on_error));
        });
    }

    template<typename Predicate>
    Stream filter(Predicate predicate) const {
        auto source = subscribe_;
        return Stream([source, predicate](Observer observer, ErrorHandler on_error) {
            return source([predicate, observer](const T& value) {
                if (predicate(value)) observer(value);
            }, std::move(on_error));
        });
    }

    // Drops values equal to the previous one of the same subscription.
    Stream changes() const {
        auto source = subscribe_;
        return Stream([source](Observer observer, ErrorHandler on_error) {
            auto last = std::make_shared<std::optional<T>>();
            return source([last, observer](const T& value) {
                if (*last && **last == value) return;
                *last = value;
                observer(value);
            }, std::move(on_error));
        });
    }

private:
    SubscribeFn subscribe_;
};

// Values of both streams as they arrive. Deliveries from the two sources
// are serialized; there is no ordering between them beyond arrival.
template<typename T>
Stream<T> merge(Stream<T> first, Stream<T> second) {
    return Stream<T>([first, second](typename Stream<T>::Observer observer, ErrorHandler on_error) {
        auto mailbox = std::make_shared<Mailbox<T>>(std::move(observer), on_error);
        auto forward = [mailbox](const T& value) { mailbox->deliver(value); };
        Subscription a = first.subscribe(forward, on_error);
        Subscription b = second.subscribe(forward, on_error);
        return Subscription([mailbox, a, b]() mutable {
            a.cancel();
            b.cancel();
            mailbox->close();
        });
    });
}

} // namespace weft::stream
