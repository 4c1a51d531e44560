#pragma once

#include "detect/DesktopTools.h"
#include "detect/EnvironmentProbe.h"
#include "safety/PathSafety.h"

#include <QDeadlineTimer>
#include <QString>
#include <QVector>

#include <functional>

struct DetectionAttempt {
    enum Outcome {
        Found,
        NotFound,
        Error
    };

    QString strategy;
    qint64 elapsedMs = 0;
    Outcome outcome = NotFound;
    QString path;
    QString reason;
};

QString toString(DetectionAttempt::Outcome outcome);

struct DetectionStrategy {
    QString name;
    int budgetMs = 0;
    std::function<QString(const QDeadlineTimer &deadline)> run;
};

class LocationResolver {
public:
    explicit LocationResolver(QVector<DetectionStrategy> strategies);

    // Fixed order: session bus, active window, filesystem fallback.
    static QVector<DetectionStrategy> defaultStrategies(const EnvironmentSnapshot &env, DesktopTools &tools);

    // Runs strategies in order and returns the first candidate that validates.
    // An invalid result means every strategy failed.
    ValidatedPath resolve();

    QVector<DetectionAttempt> attempts() const { return attempts_; }

private:
    void record(const DetectionAttempt &attempt);

    QVector<DetectionStrategy> strategies_;
    QVector<DetectionAttempt> attempts_;
};
