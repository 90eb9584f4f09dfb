#include "platform/qt/qt_clipboard_backend.hpp"

#include <QBuffer>
#include <QClipboard>
#include <QGuiApplication>
#include <QImage>
#include <QMimeData>
#include <QDebug>

namespace cliped::platform {

QString image_to_data_url(const QImage& image, int max_dim) {
    if (image.isNull()) return {};

    QImage scaled = image;
    if (max_dim > 0 && (image.width() > max_dim || image.height() > max_dim)) {
        scaled = image.scaled(max_dim, max_dim, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }

    const bool alpha = scaled.hasAlphaChannel();
    const QString mime = alpha ? QStringLiteral("image/png") : QStringLiteral("image/jpeg");

    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly)) return {};

    const bool saved = alpha ? scaled.save(&buffer, "PNG") : scaled.save(&buffer, "JPG", 85);
    if (!saved) return {};

    return QStringLiteral("data:%1;base64,%2")
        .arg(mime, QString::fromLatin1(bytes.toBase64()));
}

QtClipboardBackend::QtClipboardBackend(QObject* parent)
    : app::ClipboardBackend(parent)
    , clipboard_(QGuiApplication::clipboard())
{
    if (clipboard_) {
        connect(clipboard_, &QClipboard::dataChanged, this, &QtClipboardBackend::onDataChanged);
    } else {
        qWarning() << "Clipboard: no system clipboard available";
    }
}

QString QtClipboardBackend::text() const {
    return clipboard_ ? clipboard_->text() : QString{};
}

void QtClipboardBackend::set_text(const QString& text) {
    if (clipboard_) {
        clipboard_->setText(text);
    }
}

void QtClipboardBackend::onDataChanged() {
    const auto* mime = clipboard_->mimeData();
    if (!mime) return;

    if (mime->hasImage()) {
        const auto url = image_to_data_url(clipboard_->image());
        if (url.isEmpty()) {
            qWarning() << "Clipboard: failed to encode image";
            return;
        }
        emit imageChanged(url);
        return;
    }
    if (mime->hasText()) {
        emit textChanged(mime->text());
    }
}

} // namespace cliped::platform
