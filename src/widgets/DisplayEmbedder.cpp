#include "DisplayEmbedder.h"
#include <QWidget>
#include <QLayout>
#include <QDebug>

namespace CamCtl {

DisplayEmbedder::DisplayEmbedder(QWidget* appWindow, QWidget* container, QObject* parent)
    : QObject(parent)
    , m_appWindow(appWindow)
    , m_container(container)
{
}

int DisplayEmbedder::embeddedCount() const {
    int count = 0;
    for (const QPointer<QWidget>& widget : m_embedded) {
        if (widget && widget->parentWidget() == m_container) {
            ++count;
        }
    }
    return count;
}

void DisplayEmbedder::embed(QWidget* widget) {
    if (!widget || !m_container) {
        return;
    }

    // Sink-created default window
    QWidget* topLevel = widget->window();
    if (topLevel != widget && topLevel != m_appWindow && topLevel != m_container->window()
        && topLevel->isVisible()) {
        qDebug() << "DisplayEmbedder: Hiding foreign window" << topLevel;
        topLevel->hide();
    }

    QWidget* parent = widget->parentWidget();
    if (parent && parent != m_container) {
        qDebug() << "DisplayEmbedder: Detaching from" << parent;
        if (parent->layout()) {
            parent->layout()->removeWidget(widget);
        }
        widget->setParent(nullptr);
    }

    if (!widget->parentWidget()) {
        if (m_container->layout()) {
            m_container->layout()->addWidget(widget);
        } else {
            widget->setParent(m_container);
        }
        qDebug() << "DisplayEmbedder: Embedded" << widget;
    }

    if (!m_embedded.contains(widget)) {
        m_embedded.append(widget);
    }

    widget->show();
}

void DisplayEmbedder::detach(QWidget* widget) {
    if (!widget) {
        return;
    }

    m_embedded.removeAll(widget);

    if (m_container && widget->parentWidget() == m_container) {
        widget->hide();
        if (m_container->layout()) {
            m_container->layout()->removeWidget(widget);
        }
        widget->setParent(nullptr);
        qDebug() << "DisplayEmbedder: Detached" << widget;
    }
}

void DisplayEmbedder::clear() {
    const QList<QPointer<QWidget>> embedded = m_embedded;
    for (const QPointer<QWidget>& widget : embedded) {
        if (widget) {
            detach(widget);
        }
    }
    m_embedded.clear();
}

} // namespace CamCtl
