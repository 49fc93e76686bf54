#pragma once
#include <functional>
#include <utility>
namespace peerdrop::protocol {

/// Move-only handle that runs its cancel action once, on Cancel() or destruction.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel)
        : cancel_(std::move(cancel)) {}

    Subscription(Subscription&& other) noexcept
        : cancel_(std::exchange(other.cancel_, nullptr)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            Cancel();
            cancel_ = std::exchange(other.cancel_, nullptr);
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    ~Subscription() { Cancel(); }

    void Cancel() noexcept {
        if (auto cancel = std::exchange(cancel_, nullptr)) {
            cancel();
        }
    }

    [[nodiscard]] bool IsActive() const noexcept { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};
}
