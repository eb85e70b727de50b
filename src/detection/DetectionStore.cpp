#include "detection/DetectionStore.h"
#include "region/BoxGeometry.h"

#include <QDateTime>
#include <QDebug>
#include <QSet>
#include <QUuid>

DetectionStore::DetectionStore(QObject* parent)
    : QObject(parent)
{
}

void DetectionStore::setAll(const QVector<Detection>& detections)
{
    m_detections = detections;
    m_baseline = detections;
    applySelection(QString());
    emit detectionsReset();
    emit detectionsChanged();
    emit baselineChanged();
}

void DetectionStore::clear()
{
    setAll(QVector<Detection>());
}

int DetectionStore::indexOf(const QString& id) const
{
    if (id.isEmpty()) {
        return -1;
    }
    for (int i = 0; i < m_detections.size(); ++i) {
        if (m_detections[i].id == id) {
            return i;
        }
    }
    return -1;
}

std::optional<Detection> DetectionStore::detection(const QString& id) const
{
    const int index = indexOf(id);
    if (index < 0) {
        return std::nullopt;
    }
    return m_detections[index];
}

int DetectionStore::activeCount() const
{
    int n = 0;
    for (const Detection& d : m_detections) {
        if (!d.isDeleted()) {
            ++n;
        }
    }
    return n;
}

bool DetectionStore::isPersisted(const QString& id) const
{
    for (const Detection& d : m_baseline) {
        if (d.id == id) {
            return true;
        }
    }
    return false;
}

bool DetectionStore::isAcceptableRect(const BoxRect& rect) const
{
    if (!rect.isValid()) {
        return false;
    }
    if (m_imageSize.width() > 0.0 && m_imageSize.height() > 0.0) {
        return BoxGeometry::isInsideBounds(rect, m_imageSize);
    }
    return true;
}

QString DetectionStore::add(const Detection& detection)
{
    Detection entry = detection;
    if (entry.id.isEmpty()) {
        entry.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    } else if (contains(entry.id)) {
        qWarning() << "DetectionStore: Duplicate detection id" << entry.id;
        return QString();
    }

    if (!isAcceptableRect(entry.rect())) {
        qWarning() << "DetectionStore: Rejected detection with invalid rectangle"
                   << entry.xMin << entry.yMin << entry.xMax << entry.yMax;
        return QString();
    }

    m_detections.push_back(entry);
    emit detectionAdded(entry.id);
    emit detectionsChanged();
    applySelection(entry.id);
    return entry.id;
}

bool DetectionStore::update(const QString& id, const DetectionPatch& patch)
{
    const int index = indexOf(id);
    if (index < 0) {
        qWarning() << "DetectionStore: Cannot update unknown detection" << id;
        return false;
    }
    if (patch.rect && !isAcceptableRect(*patch.rect)) {
        return false;
    }
    if (patch.label && patch.label->isEmpty()) {
        return false;
    }

    Detection updated = m_detections[index];
    if (patch.label) {
        updated.label = *patch.label;
    }
    if (patch.confidence) {
        updated.confidence = *patch.confidence;
    }
    if (patch.rect) {
        updated.setRect(*patch.rect);
    }
    if (patch.status) {
        updated.status = *patch.status;
    }
    if (patch.lastModifiedById) {
        updated.lastModifiedById = *patch.lastModifiedById;
    }

    if (updated == m_detections[index]) {
        return true;
    }

    m_detections[index] = updated;
    emit detectionUpdated(id);
    emit detectionsChanged();
    return true;
}

bool DetectionStore::remove(const QString& id)
{
    const int index = indexOf(id);
    if (index < 0) {
        qWarning() << "DetectionStore: Cannot remove unknown detection" << id;
        return false;
    }

    Detection& target = m_detections[index];
    if (target.isDeleted()) {
        return false;
    }
    target.status = DetectionStatus::Deleted;
    target.deletedAt = QDateTime::currentDateTimeUtc();

    if (m_selectedId == id) {
        applySelection(QString());
    }
    emit detectionRemoved(id);
    emit detectionsChanged();
    return true;
}

bool DetectionStore::purge(const QString& id)
{
    const int index = indexOf(id);
    if (index < 0 || isPersisted(id)) {
        return false;
    }

    m_detections.removeAt(index);
    if (m_selectedId == id) {
        applySelection(QString());
    }
    emit detectionRemoved(id);
    emit detectionsChanged();
    return true;
}

bool DetectionStore::select(const QString& id)
{
    if (id.isEmpty()) {
        clearSelection();
        return true;
    }

    const int index = indexOf(id);
    if (index < 0 || m_detections[index].isDeleted()) {
        return false;
    }
    if (m_locked) {
        qDebug() << "DetectionStore: Selection ignored while locked";
        return false;
    }

    setSelectMode(true);
    applySelection(id);
    return true;
}

void DetectionStore::clearSelection()
{
    applySelection(QString());
}

void DetectionStore::applySelection(const QString& id)
{
    if (m_selectedId == id) {
        return;
    }
    m_selectedId = id;
    emit selectionChanged(m_selectedId);
}

std::optional<Detection> DetectionStore::selectedDetection() const
{
    return detection(m_selectedId);
}

int DetectionStore::verifyAll()
{
    int changed = 0;
    for (Detection& d : m_detections) {
        if (d.isDeleted() || d.status == DetectionStatus::UserConfirmed) {
            continue;
        }
        d.status = DetectionStatus::UserConfirmed;
        ++changed;
        emit detectionUpdated(d.id);
    }

    if (changed > 0) {
        emit detectionsChanged();
    }
    return changed;
}

void DetectionStore::resetToBaseline()
{
    m_detections = m_baseline;
    applySelection(QString());
    emit detectionsReset();
    emit detectionsChanged();
}

void DetectionStore::commitBaseline()
{
    commitBaseline(m_detections);
}

void DetectionStore::commitBaseline(const QVector<Detection>& saved)
{
    // Soft-deleted records are gone once persisted
    QVector<Detection> committed;
    committed.reserve(saved.size());
    QSet<QString> persistedDeletes;
    for (const Detection& d : saved) {
        if (d.isDeleted()) {
            persistedDeletes.insert(d.id);
        } else {
            committed.push_back(d);
        }
    }

    QVector<Detection> live;
    live.reserve(m_detections.size());
    for (const Detection& d : m_detections) {
        if (!(d.isDeleted() && persistedDeletes.contains(d.id))) {
            live.push_back(d);
        }
    }

    const bool listChanged = live.size() != m_detections.size();
    m_detections = live;
    m_baseline = committed;
    if (!m_selectedId.isEmpty() && !contains(m_selectedId)) {
        applySelection(QString());
    }
    if (listChanged) {
        emit detectionsReset();
        emit detectionsChanged();
    }
    emit baselineChanged();
}

bool DetectionStore::hasUnsavedChanges() const
{
    return m_detections != m_baseline;
}

void DetectionStore::setLocked(bool locked)
{
    if (m_locked == locked) {
        return;
    }
    if (locked) {
        applySelection(QString());
        setDrawMode(false);
        setSelectMode(false);
    }
    m_locked = locked;
    emit lockedChanged(m_locked);
}

void DetectionStore::setDrawMode(bool enabled)
{
    if (enabled && m_locked) {
        qDebug() << "DetectionStore: Draw mode ignored while locked";
        return;
    }
    if (m_drawMode == enabled) {
        return;
    }

    m_drawMode = enabled;
    if (enabled) {
        applySelection(QString());
        if (m_selectMode) {
            m_selectMode = false;
            emit selectModeChanged(false);
        }
    }
    emit drawModeChanged(m_drawMode);
}

void DetectionStore::setSelectMode(bool enabled)
{
    if (enabled && m_locked) {
        return;
    }
    if (m_selectMode == enabled) {
        return;
    }

    m_selectMode = enabled;
    if (enabled && m_drawMode) {
        m_drawMode = false;
        emit drawModeChanged(false);
    }
    emit selectModeChanged(m_selectMode);
}

void DetectionStore::setFilterCriteria(const DetectionFilter::Criteria& criteria)
{
    m_criteria = criteria;
    emit filterChanged();
}

void DetectionStore::setDisplayFilter(DetectionFilter::DisplayFilter filter)
{
    if (m_criteria.display == filter) {
        return;
    }
    m_criteria.display = filter;
    emit filterChanged();
}

void DetectionStore::setClassFilter(const QSet<QString>& classes)
{
    if (m_criteria.classes == classes) {
        return;
    }
    m_criteria.classes = classes;
    emit filterChanged();
}

void DetectionStore::setViewMode(DetectionFilter::ViewMode mode)
{
    if (m_criteria.viewMode == mode) {
        return;
    }
    m_criteria.viewMode = mode;
    emit filterChanged();
}

QVector<Detection> DetectionStore::visibleDetections() const
{
    return DetectionFilter::apply(m_detections, m_criteria);
}
