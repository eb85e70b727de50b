#include "settings/AnnotationEditorSettingsManager.h"
#include "settings/Settings.h"
#include "detection/Detection.h"
#include "Constants.h"

#include <QtGlobal>

namespace {

qreal clampMinBoxSize(qreal size)
{
    return qBound(BoxEdit::Interaction::kMinBoxSizeLowerBound, size,
                  BoxEdit::Interaction::kMinBoxSizeUpperBound);
}

int clampDrawSuppressionMs(int delayMs)
{
    return qBound(0, delayMs, BoxEdit::Timer::kMaxDrawClickSuppression);
}

int clampHandleHitSize(int size)
{
    return qBound(BoxEdit::Interaction::kHandleHitSizeMin, size,
                  BoxEdit::Interaction::kHandleHitSizeMax);
}

QString sanitizeDrawLabel(const QString& label)
{
    return DetectionLabels::isKnown(label) ? label : DetectionLabels::defaultDrawLabel();
}

StatusPromotion::Mode clampStatusPromotionMode(int rawMode)
{
    const int bounded = qBound(0, rawMode, 1);
    return static_cast<StatusPromotion::Mode>(bounded);
}

NavigationGuard::NavigateOnSave clampNavigateOnSave(int rawMode)
{
    const int bounded = qBound(0, rawMode, 1);
    return static_cast<NavigationGuard::NavigateOnSave>(bounded);
}

} // namespace

AnnotationEditorSettingsManager& AnnotationEditorSettingsManager::instance()
{
    static AnnotationEditorSettingsManager instance;
    return instance;
}

qreal AnnotationEditorSettingsManager::loadMinBoxSize() const
{
    auto settings = BoxEdit::getSettings();
    const qreal stored = settings.value(kSettingsKeyMinBoxSize, kDefaultMinBoxSize).toDouble();
    return clampMinBoxSize(stored);
}

void AnnotationEditorSettingsManager::saveMinBoxSize(qreal size)
{
    auto settings = BoxEdit::getSettings();
    settings.setValue(kSettingsKeyMinBoxSize, clampMinBoxSize(size));
}

int AnnotationEditorSettingsManager::loadDrawSuppressionMs() const
{
    auto settings = BoxEdit::getSettings();
    const int stored = settings.value(kSettingsKeyDrawSuppressionMs, kDefaultDrawSuppressionMs).toInt();
    return clampDrawSuppressionMs(stored);
}

void AnnotationEditorSettingsManager::saveDrawSuppressionMs(int delayMs)
{
    auto settings = BoxEdit::getSettings();
    settings.setValue(kSettingsKeyDrawSuppressionMs, clampDrawSuppressionMs(delayMs));
}

QString AnnotationEditorSettingsManager::loadDefaultDrawLabel() const
{
    auto settings = BoxEdit::getSettings();
    const QString stored = settings.value(kSettingsKeyDefaultDrawLabel,
                                          DetectionLabels::defaultDrawLabel()).toString();
    return sanitizeDrawLabel(stored);
}

void AnnotationEditorSettingsManager::saveDefaultDrawLabel(const QString& label)
{
    auto settings = BoxEdit::getSettings();
    settings.setValue(kSettingsKeyDefaultDrawLabel, sanitizeDrawLabel(label));
}

int AnnotationEditorSettingsManager::loadHandleHitSize() const
{
    auto settings = BoxEdit::getSettings();
    const int stored = settings.value(kSettingsKeyHandleHitSize, kDefaultHandleHitSize).toInt();
    return clampHandleHitSize(stored);
}

void AnnotationEditorSettingsManager::saveHandleHitSize(int size)
{
    auto settings = BoxEdit::getSettings();
    settings.setValue(kSettingsKeyHandleHitSize, clampHandleHitSize(size));
}

StatusPromotion::Mode AnnotationEditorSettingsManager::loadStatusPromotionMode() const
{
    auto settings = BoxEdit::getSettings();
    const int stored = settings.value(kSettingsKeyStatusPromotionMode,
                                      static_cast<int>(kDefaultStatusPromotionMode)).toInt();
    return clampStatusPromotionMode(stored);
}

void AnnotationEditorSettingsManager::saveStatusPromotionMode(StatusPromotion::Mode mode)
{
    auto settings = BoxEdit::getSettings();
    settings.setValue(kSettingsKeyStatusPromotionMode,
                      static_cast<int>(clampStatusPromotionMode(static_cast<int>(mode))));
}

NavigationGuard::NavigateOnSave AnnotationEditorSettingsManager::loadNavigateOnSave() const
{
    auto settings = BoxEdit::getSettings();
    const int stored = settings.value(kSettingsKeyNavigateOnSave,
                                      static_cast<int>(kDefaultNavigateOnSave)).toInt();
    return clampNavigateOnSave(stored);
}

void AnnotationEditorSettingsManager::saveNavigateOnSave(NavigationGuard::NavigateOnSave mode)
{
    auto settings = BoxEdit::getSettings();
    settings.setValue(kSettingsKeyNavigateOnSave,
                      static_cast<int>(clampNavigateOnSave(static_cast<int>(mode))));
}
