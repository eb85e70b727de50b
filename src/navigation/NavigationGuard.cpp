#include "navigation/NavigationGuard.h"
#include "detection/DetectionStore.h"

#include <QDebug>
#include <QEvent>

NavigationGuard::NavigationGuard(DetectionStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    if (m_store) {
        connect(m_store, &DetectionStore::detectionsChanged, this, &NavigationGuard::refreshDirtyState);
        connect(m_store, &DetectionStore::baselineChanged, this, &NavigationGuard::refreshDirtyState);
        m_dirty = hasUnsavedChanges();
    }
}

NavigationGuard::~NavigationGuard()
{
    detach();
}

bool NavigationGuard::hasUnsavedChanges(const QVector<Detection>& current, const QVector<Detection>& original)
{
    if (current.size() != original.size()) {
        return true;
    }
    for (int i = 0; i < current.size(); ++i) {
        if (current[i] != original[i]) {
            return true;
        }
    }
    return false;
}

bool NavigationGuard::hasUnsavedChanges() const
{
    if (!m_store) {
        return false;
    }
    return hasUnsavedChanges(m_store->detections(), m_store->baseline());
}

void NavigationGuard::refreshDirtyState()
{
    const bool dirty = hasUnsavedChanges();
    if (dirty == m_dirty) {
        return;
    }
    m_dirty = dirty;
    emit unsavedChangesChanged(m_dirty);
}

void NavigationGuard::attachTo(QObject* host)
{
    if (m_host == host) {
        return;
    }
    detach();
    if (!host) {
        return;
    }
    m_host = host;
    m_host->installEventFilter(this);
}

void NavigationGuard::detach()
{
    if (m_host) {
        m_host->removeEventFilter(this);
    }
    m_host.clear();
}

bool NavigationGuard::eventFilter(QObject* watched, QEvent* event)
{
    if (watched == m_host && event->type() == QEvent::Close && hasUnsavedChanges()) {
        event->ignore();
        qDebug() << "NavigationGuard: Close blocked, unsaved changes";
        emit closeBlocked();
        return true;
    }
    return QObject::eventFilter(watched, event);
}

void NavigationGuard::guard(const NavigateFn& navigate)
{
    if (!navigate) {
        return;
    }
    if (!hasUnsavedChanges()) {
        navigate();
        return;
    }

    m_pending = navigate;
    emit confirmationRequested();
}

void NavigationGuard::leave()
{
    if (m_store) {
        m_store->resetToBaseline();
    }
    runPending();
}

void NavigationGuard::saveAndLeave()
{
    if (m_saving) {
        return;
    }
    if (!m_saveOperation) {
        qWarning() << "NavigationGuard: No save operation configured";
        onSaveSettled(false, QStringLiteral("No save operation configured"));
        return;
    }

    m_saving = true;
    QPointer<NavigationGuard> guardPtr(this);
    m_saveOperation([guardPtr](bool success, const QString& error) {
        if (guardPtr) {
            guardPtr->onSaveSettled(success, error);
        }
    });
}

void NavigationGuard::onSaveSettled(bool success, const QString& error)
{
    m_saving = false;
    if (!success) {
        qWarning() << "NavigationGuard: Save before leaving failed:" << error;
        if (m_navigateOnSave == NavigateOnSave::OnlyOnSuccess) {
            stay();
            return;
        }
    }
    runPending();
}

void NavigationGuard::stay()
{
    const bool hadPending = static_cast<bool>(m_pending);
    m_pending = nullptr;
    if (hadPending) {
        emit navigationCancelled();
    }
}

void NavigationGuard::runPending()
{
    NavigateFn navigate = std::move(m_pending);
    m_pending = nullptr;
    if (navigate) {
        navigate();
    }
}
