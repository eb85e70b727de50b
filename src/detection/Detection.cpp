#include "detection/Detection.h"

namespace {

struct StatusName {
    DetectionStatus status;
    const char* name;
};

constexpr StatusName kStatusNames[] = {
    {DetectionStatus::ModelGenerated, "model_generated"},
    {DetectionStatus::UserCreated, "user_created"},
    {DetectionStatus::UserConfirmed, "user_confirmed"},
    {DetectionStatus::UserEdited, "user_edited"},
    {DetectionStatus::UserEditedConfirmed, "user_edited_confirmed"},
    {DetectionStatus::Deleted, "deleted"},
};

} // namespace

void Detection::setRect(const BoxRect& rect)
{
    xMin = rect.xMin;
    yMin = rect.yMin;
    xMax = rect.xMax;
    yMax = rect.yMax;
}

bool Detection::isDeleted() const
{
    return status == DetectionStatus::Deleted || !deletedAt.isNull();
}

bool Detection::isVerified() const
{
    return isVerifiedStatus(status);
}

bool Detection::operator==(const Detection& other) const
{
    return id == other.id
        && uploadId == other.uploadId
        && label == other.label
        && originalLabel == other.originalLabel
        && confidence == other.confidence
        && originalConfidence == other.originalConfidence
        && xMin == other.xMin
        && yMin == other.yMin
        && xMax == other.xMax
        && yMax == other.yMax
        && status == other.status
        && createdAt == other.createdAt
        && updatedAt == other.updatedAt
        && createdById == other.createdById
        && lastModifiedById == other.lastModifiedById
        && deletedAt == other.deletedAt;
}

QStringList DetectionLabels::all()
{
    return {
        QStringLiteral("instar_1"),
        QStringLiteral("instar_2"),
        QStringLiteral("instar_3"),
        QStringLiteral("pupa"),
        QStringLiteral("adult")
    };
}

bool DetectionLabels::isKnown(const QString& label)
{
    return all().contains(label);
}

QString DetectionLabels::defaultDrawLabel()
{
    return QStringLiteral("instar_1");
}

QString detectionStatusToString(DetectionStatus status)
{
    for (const StatusName& entry : kStatusNames) {
        if (entry.status == status) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QString();
}

std::optional<DetectionStatus> detectionStatusFromString(const QString& value)
{
    for (const StatusName& entry : kStatusNames) {
        if (value == QLatin1String(entry.name)) {
            return entry.status;
        }
    }
    return std::nullopt;
}

bool isVerifiedStatus(DetectionStatus status)
{
    return status == DetectionStatus::UserConfirmed
        || status == DetectionStatus::UserEditedConfirmed;
}
