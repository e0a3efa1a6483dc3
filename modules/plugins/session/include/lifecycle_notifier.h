#ifndef LIFECYCLE_NOTIFIER_H
#define LIFECYCLE_NOTIFIER_H

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

enum class AppTransition {
    ENTERED_BACKGROUND,
    ENTERED_FOREGROUND
};

const char* app_transition_to_string(AppTransition transition);

// Process-wide background/foreground notifications, injected as a dependency
class ILifecycleNotifier {
public:
    using Callback = std::function<void(AppTransition)>;

    virtual ~ILifecycleNotifier() = default;

    // Returns a token for unsubscribe()
    virtual int subscribe(Callback callback) = 0;
    // Once this returns the callback is not running and is never called again
    virtual void unsubscribe(int token) = 0;
};

// In-process notifier; post() delivers synchronously on the caller's thread.
// unsubscribe() blocks until deliveries of that token on other threads end;
// a subscriber may unsubscribe itself from inside its own callback.
class LifecycleNotifier : public ILifecycleNotifier {
public:
    int subscribe(Callback callback) override;
    void unsubscribe(int token) override;

    void post(AppTransition transition);
    size_t subscriberCount() const;

private:
    struct Subscriber {
        Callback callback;
        int in_flight = 0;
    };

    mutable std::mutex m_mutex;
    std::condition_variable m_delivered_cv;
    std::map<int, std::shared_ptr<Subscriber>> m_subscribers;
    int m_next_token{1};
};

#endif // LIFECYCLE_NOTIFIER_H
