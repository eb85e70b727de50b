#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>
#include <QImage>
#include <QMessageBox>
#include <QUuid>

#include "editor/AnnotationCanvas.h"
#include "editor/AnnotationEditorSession.h"
#include "editor/InMemoryDetectionRepository.h"
#include "navigation/NavigationGuard.h"
#include "version.h"

namespace {

// A few unverified boxes so the verification workflow can be tried out
QVector<Detection> sampleDetections(const QString& uploadId, const QSize& imageSize)
{
    const QStringList labels = DetectionLabels::all();
    const qreal w = imageSize.width();
    const qreal h = imageSize.height();
    const QVector<QRectF> boxes = {
        QRectF(w * 0.10, h * 0.10, w * 0.20, h * 0.20),
        QRectF(w * 0.45, h * 0.30, w * 0.15, h * 0.25),
        QRectF(w * 0.70, h * 0.60, w * 0.20, h * 0.20)
    };

    QVector<Detection> detections;
    for (int i = 0; i < boxes.size(); ++i) {
        Detection detection;
        detection.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        detection.uploadId = uploadId;
        detection.label = labels[i % labels.size()];
        detection.originalLabel = detection.label;
        detection.confidence = 0.9 - 0.1 * i;
        detection.originalConfidence = detection.confidence;
        detection.setRect(BoxRect::fromRectF(boxes[i]));
        detection.status = DetectionStatus::ModelGenerated;
        detections.push_back(detection);
    }
    return detections;
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName(BOXEDIT_APP_NAME);
    app.setApplicationVersion(BOXEDIT_APP_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Draw, move and resize detection boxes over an image."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("image"), QObject::tr("Image file to annotate."));
    QCommandLineOption uploadIdOption(QStringLiteral("upload-id"),
                                      QObject::tr("Identifier of the image (defaults to the file name)."),
                                      QStringLiteral("id"));
    QCommandLineOption sampleOption(QStringLiteral("sample-detections"),
                                    QObject::tr("Start with a few model-generated detections."));
    parser.addOption(uploadIdOption);
    parser.addOption(sampleOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }

    const QString imagePath = positional.first();
    const QImage image(imagePath);
    if (image.isNull()) {
        qCritical() << "BoxEdit: Failed to load image" << imagePath;
        return 1;
    }

    const QString uploadId = parser.isSet(uploadIdOption)
        ? parser.value(uploadIdOption)
        : QFileInfo(imagePath).completeBaseName();

    InMemoryDetectionRepository repository;
    if (parser.isSet(sampleOption)) {
        repository.setDetections(uploadId, sampleDetections(uploadId, image.size()));
    }

    AnnotationEditorSession session(&repository);
    session.loadSettings();
    if (!session.loadImage(uploadId, QSizeF(image.size()))) {
        return 1;
    }

    AnnotationCanvas canvas(&session);
    canvas.resize(1024, 768);
    QObject::connect(&canvas, &AnnotationCanvas::statusMessageChanged, &canvas,
                     [&canvas, uploadId](const QString& message) {
                         canvas.setWindowTitle(QStringLiteral("%1 - %2 - %3")
                                                   .arg(uploadId, message, QStringLiteral(BOXEDIT_APP_NAME)));
                     });
    canvas.setImage(image);

    NavigationGuard* guard = session.navigationGuard();
    guard->attachTo(&canvas);

    // Confirmation runs outside the close event that triggered it
    QObject::connect(guard, &NavigationGuard::closeBlocked, &canvas, [guard, &canvas]() {
        guard->guard([guard, &canvas]() {
            // Resolved already; the second close must not be intercepted
            guard->detach();
            canvas.close();
        });
    }, Qt::QueuedConnection);

    QObject::connect(guard, &NavigationGuard::confirmationRequested, &canvas, [guard, &canvas]() {
        const auto choice = QMessageBox::question(
            &canvas, QObject::tr("Unsaved changes"),
            QObject::tr("There are unsaved detection changes. Save them before leaving?"),
            QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
            QMessageBox::Save);
        if (choice == QMessageBox::Save) {
            guard->saveAndLeave();
        } else if (choice == QMessageBox::Discard) {
            guard->leave();
        } else {
            guard->stay();
        }
    });

    QObject::connect(&session, &AnnotationEditorSession::saveFinished, &canvas,
                     [&canvas](bool success, const QString& error) {
                         if (!success) {
                             QMessageBox::warning(&canvas, QObject::tr("Save failed"), error);
                         }
                     });

    canvas.show();
    return app.exec();
}
