// src/notify/notifier.cpp

#include "optwatch/notify/notifier.hpp"
#include "optwatch/core/logger.hpp"

namespace optwatch {

CompositeNotifier::CompositeNotifier(std::vector<std::shared_ptr<Notifier>> notifiers) {
    for (auto& notifier : notifiers) {
        add(std::move(notifier));
    }
}

void CompositeNotifier::add(std::shared_ptr<Notifier> notifier) {
    if (notifier) {
        notifiers_.push_back(std::move(notifier));
    }
}

Result<void> CompositeNotifier::notify(const TradeSummary& summary) {
    if (notifiers_.empty()) {
        return Result<void>();
    }

    size_t delivered = 0;
    std::string failures;
    for (const auto& notifier : notifiers_) {
        auto result = notifier->notify(summary);
        if (result.is_ok()) {
            ++delivered;
            continue;
        }
        ERROR("Notifier " << notifier->name() << " failed: " << result.error()->what());
        failures += (failures.empty() ? "" : "; ") + notifier->name() + ": " +
                    result.error()->what();
    }

    if (delivered == 0) {
        return make_error<void>(ErrorCode::NOTIFICATION_ERROR,
                                "All notifiers failed: " + failures, "CompositeNotifier");
    }
    return Result<void>();
}

}  // namespace optwatch
