#ifndef ANNOTATIONEDITORSETTINGSMANAGER_H
#define ANNOTATIONEDITORSETTINGSMANAGER_H

#include <QString>

#include "detection/StatusPromotionPolicy.h"
#include "navigation/NavigationGuard.h"

class AnnotationEditorSettingsManager
{
public:
    static AnnotationEditorSettingsManager& instance();

    qreal loadMinBoxSize() const;
    void saveMinBoxSize(qreal size);

    int loadDrawSuppressionMs() const;
    void saveDrawSuppressionMs(int delayMs);

    QString loadDefaultDrawLabel() const;
    void saveDefaultDrawLabel(const QString& label);

    int loadHandleHitSize() const;
    void saveHandleHitSize(int size);

    StatusPromotion::Mode loadStatusPromotionMode() const;
    void saveStatusPromotionMode(StatusPromotion::Mode mode);

    NavigationGuard::NavigateOnSave loadNavigateOnSave() const;
    void saveNavigateOnSave(NavigationGuard::NavigateOnSave mode);

    static constexpr qreal kDefaultMinBoxSize = 20.0;
    static constexpr int kDefaultDrawSuppressionMs = 100;
    static constexpr int kDefaultHandleHitSize = 16;
    static constexpr StatusPromotion::Mode kDefaultStatusPromotionMode =
        StatusPromotion::Mode::KeepStatus;
    static constexpr NavigationGuard::NavigateOnSave kDefaultNavigateOnSave =
        NavigationGuard::NavigateOnSave::Always;

private:
    AnnotationEditorSettingsManager() = default;
    ~AnnotationEditorSettingsManager() = default;
    AnnotationEditorSettingsManager(const AnnotationEditorSettingsManager&) = delete;
    AnnotationEditorSettingsManager& operator=(const AnnotationEditorSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyMinBoxSize =
        "annotationEditor/minBoxSize";
    static constexpr const char* kSettingsKeyDrawSuppressionMs =
        "annotationEditor/drawSuppressionMs";
    static constexpr const char* kSettingsKeyDefaultDrawLabel =
        "annotationEditor/defaultDrawLabel";
    static constexpr const char* kSettingsKeyHandleHitSize =
        "annotationEditor/handleHitSize";
    static constexpr const char* kSettingsKeyStatusPromotionMode =
        "annotationEditor/statusPromotionMode";
    static constexpr const char* kSettingsKeyNavigateOnSave =
        "annotationEditor/navigateOnSave";
};

#endif // ANNOTATIONEDITORSETTINGSMANAGER_H
