#ifndef VERIFICATIONAGGREGATOR_H
#define VERIFICATIONAGGREGATOR_H

#include <QString>
#include <QVector>

#include "detection/Detection.h"

enum class VerificationStatus {
    Verified,
    Unverified,
    InProgress,
    NoDetections
};

struct VerificationSummary
{
    VerificationStatus status = VerificationStatus::NoDetections;
    int total = 0;
    int verified = 0;

    qreal percentVerified() const;

    // "Verified", "Unverified", "No Detections" or "25.0% In Progress"
    QString displayLabel() const;
};

/**
 * @brief Derives a per-image status from individual detection statuses.
 *
 * Deleted detections are ignored.
 */
class VerificationAggregator
{
public:
    static VerificationStatus aggregate(const QVector<Detection>& detections);
    static VerificationSummary summarize(const QVector<Detection>& detections);

    // verified, unverified, in_progress, no_detections
    static QString statusToString(VerificationStatus status);

private:
    VerificationAggregator() = delete;
};

#endif // VERIFICATIONAGGREGATOR_H
