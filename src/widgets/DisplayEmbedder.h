#ifndef DISPLAYEMBEDDER_H
#define DISPLAYEMBEDDER_H

#include <QObject>
#include <QPointer>
#include <QList>

class QWidget;

namespace CamCtl {

/**
 * @brief Places the display sink's widget inside the preview container
 *
 * embed() is idempotent. It may run several times for the same widget
 * (right after pipeline construction and again once the pipeline plays).
 */
class DisplayEmbedder : public QObject {
    Q_OBJECT

public:
    /**
     * @param appWindow Application top-level window
     * @param container Preview area. Must have a layout.
     */
    DisplayEmbedder(QWidget* appWindow, QWidget* container, QObject* parent = nullptr);

    /**
     * @brief Number of widgets currently embedded
     */
    int embeddedCount() const;

public slots:
    /**
     * @brief Move widget into the container and make it visible
     *
     * A foreign top-level window hosting the widget is hidden first.
     */
    void embed(QWidget* widget);

    /**
     * @brief Remove widget from the container without deleting it
     */
    void detach(QWidget* widget);

    /**
     * @brief Detach every embedded widget
     */
    void clear();

private:
    QPointer<QWidget> m_appWindow;
    QPointer<QWidget> m_container;
    QList<QPointer<QWidget>> m_embedded;
};

} // namespace CamCtl

#endif // DISPLAYEMBEDDER_H
