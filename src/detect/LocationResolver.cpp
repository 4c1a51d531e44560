#include "detect/LocationResolver.h"

#include "core/Log.h"
#include "detect/DetectionStrategies.h"

#include <QElapsedTimer>

#include <exception>
#include <utility>

QString toString(DetectionAttempt::Outcome outcome) {
    switch (outcome) {
    case DetectionAttempt::Found: return QStringLiteral("found");
    case DetectionAttempt::NotFound: return QStringLiteral("not_found");
    case DetectionAttempt::Error: return QStringLiteral("error");
    }
    return QStringLiteral("not_found");
}

LocationResolver::LocationResolver(QVector<DetectionStrategy> strategies)
    : strategies_(std::move(strategies)) {}

QVector<DetectionStrategy> LocationResolver::defaultStrategies(const EnvironmentSnapshot &env, DesktopTools &tools) {
    QVector<DetectionStrategy> strategies;
    strategies.append({QStringLiteral("session_bus"), 5000, [env, &tools](const QDeadlineTimer &deadline) {
        return Detection::fromSessionBus(env, tools, deadline);
    }});
    strategies.append({QStringLiteral("active_window"), 6000, [env, &tools](const QDeadlineTimer &deadline) {
        return Detection::fromActiveWindow(env, tools, deadline);
    }});
    strategies.append({QStringLiteral("fallback"), 1000, [](const QDeadlineTimer &) {
        return Detection::fromFilesystemFallback();
    }});
    return strategies;
}

void LocationResolver::record(const DetectionAttempt &attempt) {
    attempts_.append(attempt);
    debugLog(QStringLiteral("detect_attempt strategy=%1 elapsed_ms=%2 outcome=%3 path=%4 reason=%5")
                 .arg(attempt.strategy)
                 .arg(attempt.elapsedMs)
                 .arg(toString(attempt.outcome),
                      attempt.path.isEmpty() ? QStringLiteral("-") : attempt.path,
                      attempt.reason.isEmpty() ? QStringLiteral("-") : attempt.reason));
}

ValidatedPath LocationResolver::resolve() {
    attempts_.clear();
    QElapsedTimer total;
    total.start();

    for (const DetectionStrategy &strategy : strategies_) {
        DetectionAttempt attempt;
        attempt.strategy = strategy.name;
        const QDeadlineTimer deadline = strategy.budgetMs > 0 ? QDeadlineTimer(strategy.budgetMs)
                                                             : QDeadlineTimer(QDeadlineTimer::Forever);
        QElapsedTimer timer;
        timer.start();

        QString candidate;
        try {
            candidate = strategy.run ? strategy.run(deadline) : QString();
        } catch (const std::exception &e) {
            attempt.elapsedMs = timer.elapsed();
            attempt.outcome = DetectionAttempt::Error;
            attempt.reason = QString::fromLocal8Bit(e.what());
            record(attempt);
            continue;
        }
        attempt.elapsedMs = timer.elapsed();

        if (candidate.isEmpty()) {
            attempt.outcome = DetectionAttempt::NotFound;
            record(attempt);
            continue;
        }
        attempt.path = candidate;
        if (strategy.budgetMs > 0 && attempt.elapsedMs > strategy.budgetMs) {
            attempt.outcome = DetectionAttempt::Error;
            attempt.reason = QStringLiteral("timeout");
            record(attempt);
            continue;
        }

        QString reason;
        const ValidatedPath validated = validateDirectory(candidate, &reason);
        if (!validated.isValid()) {
            attempt.outcome = DetectionAttempt::Error;
            attempt.reason = reason;
            record(attempt);
            continue;
        }

        attempt.outcome = DetectionAttempt::Found;
        attempt.path = validated.path();
        record(attempt);
        logEvent(QStringLiteral("detect_found: %1 via %2 (%3ms)").arg(validated.path(), strategy.name).arg(total.elapsed()));
        return validated;
    }

    logEvent(QStringLiteral("detect_failed: no strategy produced a directory (%1ms)").arg(total.elapsed()));
    return ValidatedPath();
}
