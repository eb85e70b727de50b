#ifndef DETECTION_H
#define DETECTION_H

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "region/BoxGeometry.h"

/**
 * @brief Review state of a single detection.
 *
 * Verified means UserConfirmed or UserEditedConfirmed.
 */
enum class DetectionStatus {
    ModelGenerated,
    UserCreated,
    UserConfirmed,
    UserEdited,
    UserEditedConfirmed,
    Deleted
};

/**
 * @brief A labeled rectangular region over one image.
 *
 * Coordinates are in the image's natural pixel space. Audit fields are
 * carried through untouched by the geometry engine.
 */
struct Detection
{
    QString id;
    QString uploadId;
    QString label;
    QString originalLabel;
    std::optional<qreal> confidence;          // Empty for user-drawn boxes
    std::optional<qreal> originalConfidence;

    qreal xMin = 0.0;
    qreal yMin = 0.0;
    qreal xMax = 0.0;
    qreal yMax = 0.0;

    DetectionStatus status = DetectionStatus::ModelGenerated;

    QDateTime createdAt;
    QDateTime updatedAt;
    QString createdById;
    QString lastModifiedById;
    QDateTime deletedAt;                      // Null unless soft-deleted

    BoxRect rect() const { return BoxRect{xMin, yMin, xMax, yMax}; }
    void setRect(const BoxRect& rect);

    bool isDeleted() const;
    bool isVerified() const;

    bool operator==(const Detection& other) const;
    bool operator!=(const Detection& other) const { return !(*this == other); }
};

/**
 * @brief Partial update applied by DetectionStore::update().
 */
struct DetectionPatch
{
    std::optional<QString> label;
    std::optional<std::optional<qreal>> confidence;
    std::optional<BoxRect> rect;
    std::optional<DetectionStatus> status;
    std::optional<QString> lastModifiedById;

    bool isEmpty() const
    {
        return !label && !confidence && !rect && !status && !lastModifiedById;
    }
};

/**
 * @brief Life-stage classes a detection label is drawn from.
 */
class DetectionLabels
{
public:
    static QStringList all();
    static bool isKnown(const QString& label);
    static QString defaultDrawLabel();

private:
    DetectionLabels() = delete;
};

QString detectionStatusToString(DetectionStatus status);
std::optional<DetectionStatus> detectionStatusFromString(const QString& value);
bool isVerifiedStatus(DetectionStatus status);

Q_DECLARE_METATYPE(Detection)

#endif // DETECTION_H
