#ifndef NAVIGATIONGUARD_H
#define NAVIGATIONGUARD_H

#include <QObject>
#include <QPointer>
#include <QVector>
#include <functional>

#include "detection/Detection.h"
#include "detection/IDetectionRepository.h"

class DetectionStore;

/**
 * @brief Prevents leaving the editor with unsaved detections.
 *
 * The guard compares the store's live list with its baseline snapshot.
 * Navigation requested through guard() is held back while dirty until the
 * user resolves it with leave(), saveAndLeave() or stay(). Attaching to a
 * host window also blocks its close event while dirty.
 */
class NavigationGuard : public QObject
{
    Q_OBJECT

public:
    enum class NavigateOnSave {
        Always,         // Navigate once the save settles, even if it failed
        OnlyOnSuccess
    };
    Q_ENUM(NavigateOnSave)

    using NavigateFn = std::function<void()>;
    using SaveOperation = std::function<void(const SaveCallback& done)>;

    explicit NavigationGuard(DetectionStore* store, QObject* parent = nullptr);
    ~NavigationGuard() override;

    // Order-sensitive field comparison
    static bool hasUnsavedChanges(const QVector<Detection>& current, const QVector<Detection>& original);
    bool hasUnsavedChanges() const;

    // Close interception on a host window (or any QObject receiving QEvent::Close)
    void attachTo(QObject* host);
    void detach();
    QObject* host() const { return m_host.data(); }

    // Runs navigate now when clean, otherwise holds it and asks for confirmation
    void guard(const NavigateFn& navigate);
    bool hasPendingNavigation() const { return static_cast<bool>(m_pending); }

    // Resolutions of a pending confirmation
    void leave();
    void saveAndLeave();
    void stay();

    void setSaveOperation(const SaveOperation& save) { m_saveOperation = save; }
    void setNavigateOnSave(NavigateOnSave mode) { m_navigateOnSave = mode; }
    NavigateOnSave navigateOnSave() const { return m_navigateOnSave; }
    bool isSaving() const { return m_saving; }

signals:
    void unsavedChangesChanged(bool dirty);
    void confirmationRequested();
    void closeBlocked();
    void navigationCancelled();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private slots:
    void refreshDirtyState();

private:
    void runPending();
    void onSaveSettled(bool success, const QString& error);

    DetectionStore* m_store;
    QPointer<QObject> m_host;
    NavigateFn m_pending;
    SaveOperation m_saveOperation;
    NavigateOnSave m_navigateOnSave = NavigateOnSave::Always;
    bool m_dirty = false;
    bool m_saving = false;
};

#endif // NAVIGATIONGUARD_H
