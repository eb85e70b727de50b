#include "detection/VerificationAggregator.h"

qreal VerificationSummary::percentVerified() const
{
    if (total <= 0) {
        return 0.0;
    }
    return 100.0 * verified / total;
}

QString VerificationSummary::displayLabel() const
{
    switch (status) {
    case VerificationStatus::Verified:
        return QStringLiteral("Verified");
    case VerificationStatus::Unverified:
        return QStringLiteral("Unverified");
    case VerificationStatus::NoDetections:
        return QStringLiteral("No Detections");
    case VerificationStatus::InProgress:
        if (total > 0) {
            return QStringLiteral("%1% In Progress").arg(percentVerified(), 0, 'f', 1);
        }
        return QStringLiteral("In Progress");
    }
    return QString();
}

VerificationSummary VerificationAggregator::summarize(const QVector<Detection>& detections)
{
    VerificationSummary summary;
    for (const Detection& detection : detections) {
        if (detection.isDeleted()) {
            continue;
        }
        ++summary.total;
        if (detection.isVerified()) {
            ++summary.verified;
        }
    }

    if (summary.total == 0) {
        summary.status = VerificationStatus::NoDetections;
    } else if (summary.verified == summary.total) {
        summary.status = VerificationStatus::Verified;
    } else if (summary.verified == 0) {
        summary.status = VerificationStatus::Unverified;
    } else {
        summary.status = VerificationStatus::InProgress;
    }
    return summary;
}

VerificationStatus VerificationAggregator::aggregate(const QVector<Detection>& detections)
{
    return summarize(detections).status;
}

QString VerificationAggregator::statusToString(VerificationStatus status)
{
    switch (status) {
    case VerificationStatus::Verified:
        return QStringLiteral("verified");
    case VerificationStatus::Unverified:
        return QStringLiteral("unverified");
    case VerificationStatus::InProgress:
        return QStringLiteral("in_progress");
    case VerificationStatus::NoDetections:
        return QStringLiteral("no_detections");
    }
    return QString();
}
