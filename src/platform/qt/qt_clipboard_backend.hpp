#pragma once

#include "app/clipboard_backend.hpp"

class QClipboard;
class QImage;

namespace cliped::platform {

/**
 * QtClipboardBackend - ClipboardBackend over QGuiApplication::clipboard().
 *
 * Needs a QGuiApplication. Images are downscaled and reported as
 * base64 data URLs.
 */
class QtClipboardBackend : public app::ClipboardBackend {
    Q_OBJECT

public:
    explicit QtClipboardBackend(QObject* parent = nullptr);

    [[nodiscard]] QString text() const override;
    void set_text(const QString& text) override;

private slots:
    void onDataChanged();

private:
    QClipboard* clipboard_ = nullptr;
};

// Exposed for tests.
[[nodiscard]] QString image_to_data_url(const QImage& image, int max_dim = 1600);

} // namespace cliped::platform
