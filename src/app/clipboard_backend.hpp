#pragma once

#include <QObject>
#include <QString>

namespace cliped::app {

/**
 * ClipboardBackend - The system clipboard as seen by the core.
 *
 * Implementations report every text change through textChanged(),
 * including changes made through set_text(). Images are reported as
 * data URLs.
 */
class ClipboardBackend : public QObject {
    Q_OBJECT

public:
    using QObject::QObject;
    ~ClipboardBackend() override = default;

    [[nodiscard]] virtual QString text() const = 0;
    virtual void set_text(const QString& text) = 0;

signals:
    void textChanged(const QString& text);
    void imageChanged(const QString& dataUrl);
};

} // namespace cliped::app
