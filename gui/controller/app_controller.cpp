#include "app_controller.hpp"

#include "../view/mainwindow.hpp"
#include "../view/cf_loader_widget.hpp"
#include "../model/image_pipeline.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QImage>
#include <QObject>

#include <string>

AppController::AppController(MainWindow* view)
    : m_view(view)
    , m_loader(view ? view->loaderWidget() : nullptr)
{
    qDebug() << "[Ctl][Ctor] view=" << static_cast<void*>(view);
    initViewConnections();
}

AppController::~AppController()
{
    qDebug() << "[Ctl][dtor]";
}

void AppController::initViewConnections()
{
    if (!m_view || !m_loader) {
        qWarning() << "[Ctl][WRN] no view to wire";
        return;
    }

    QObject::connect(m_view, &MainWindow::progressRequested,
                     m_view, [this](int v) { setProgress(v); });
    QObject::connect(m_view, &MainWindow::fileDropped,
                     m_view, [this](const QString& p) { loadImage(p); });
    QObject::connect(m_view, &MainWindow::recycleRequested,
                     m_view, [this]() { recycle(); });
    QObject::connect(m_loader, &CfLoaderWidget::progressChanged,
                     m_view, [this](int v) { m_view->setProgressValue(v); });
}

bool AppController::loadImage(const QString& path)
{
    qDebug() << "[Ctl][loadImage]" << path;

    QImage img;
    std::string why;
    if (!cfl::loadImageFile(path, &img, &why)) {
        qWarning() << "[Ctl][loadImage][ERR]" << path << "->" << QString::fromStdString(why);
        if (m_view) m_view->showStatus(QObject::tr("Could not load %1: %2")
                                           .arg(QFileInfo(path).fileName(),
                                                QString::fromStdString(why)), 4000);
        return false;
    }

    m_imagePath = path;
    if (m_view) m_view->setImage(img, QFileInfo(path).fileName());
    return true;
}

void AppController::setProgress(int value)
{
    if (!m_loader) return;
    m_loader->setProgress(value);
    qDebug() << "[Ctl][setProgress]" << value << "->" << m_loader->loader().description();
}

void AppController::recycle()
{
    if (!m_loader) return;
    m_loader->recycle();

    // rebind: same as a list row being reused for the same item
    cfl::CircularLoader& l = m_loader->loader();
    l.onActivate();
    l.onVisibilityChange(m_loader->isVisible());
    if (m_view) m_view->showStatus(QObject::tr("Recycled"));
}

void AppController::show()
{
    qDebug() << "[Ctl][show]";
    if (m_view) m_view->setProgressValue(m_loader ? m_loader->loader().progress() : 0);
}
