#include "lifecycle_notifier.h"
#include "logger.h"
#include <vector>

namespace {
    // Token whose callback is running on this thread, 0 when none
    thread_local int t_delivering_token = 0;
}

const char* app_transition_to_string(AppTransition transition) {
    switch (transition) {
        case AppTransition::ENTERED_BACKGROUND: return "BACKGROUND";
        case AppTransition::ENTERED_FOREGROUND: return "FOREGROUND";
    }
    return "?";
}

int LifecycleNotifier::subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const int token = m_next_token++;
    auto subscriber = std::make_shared<Subscriber>();
    subscriber->callback = std::move(callback);
    m_subscribers.emplace(token, std::move(subscriber));
    return token;
}

void LifecycleNotifier::unsubscribe(int token) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto it = m_subscribers.find(token);
    if (it == m_subscribers.end()) {
        return;
    }
    std::shared_ptr<Subscriber> subscriber = it->second;
    m_subscribers.erase(it);

    // The calling thread's own delivery cannot finish while we wait for it
    const int own = t_delivering_token == token ? 1 : 0;
    m_delivered_cv.wait(lock, [&subscriber, own] { return subscriber->in_flight <= own; });
}

void LifecycleNotifier::post(AppTransition transition) {
    std::vector<int> tokens;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_subscribers) {
            tokens.push_back(entry.first);
        }
    }
    LOG_DEBUG(std::string("Lifecycle: ") + app_transition_to_string(transition) +
              " -> " + std::to_string(tokens.size()) + " subscriber(s)");

    for (int token : tokens) {
        std::shared_ptr<Subscriber> subscriber;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_subscribers.find(token);
            if (it == m_subscribers.end()) {
                continue;   // unsubscribed while an earlier callback ran
            }
            subscriber = it->second;
            subscriber->in_flight++;
        }

        // Ends the delivery even if the callback throws
        struct DeliveryGuard {
            LifecycleNotifier& notifier;
            Subscriber& subscriber;
            int outer_token;
            ~DeliveryGuard() {
                t_delivering_token = outer_token;
                {
                    std::lock_guard<std::mutex> lock(notifier.m_mutex);
                    subscriber.in_flight--;
                }
                notifier.m_delivered_cv.notify_all();
            }
        } guard{*this, *subscriber, t_delivering_token};

        t_delivering_token = token;
        subscriber->callback(transition);
    }
}

size_t LifecycleNotifier::subscriberCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscribers.size();
}
