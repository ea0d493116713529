#include "mainwindow.hpp"
#include "cf_loader_widget.hpp"
#include "../src/build_info.hpp"

#include <QAction>
#include <QContextMenuEvent>
#include <QDebug>
#include <QDragEnterEvent>
#include <QDragMoveEvent>
#include <QDropEvent>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QLabel>
#include <QMenu>
#include <QMessageBox>
#include <QMimeData>
#include <QSignalBlocker>
#include <QSlider>
#include <QStatusBar>
#include <QUrl>
#include <QVBoxLayout>

#include <memory>

MainWindow::MainWindow(const cfl::LoaderOptions& opts, QWidget* parent)
    : QMainWindow(parent)
{
    qDebug() << "[View][Ctor] start";
    setAcceptDrops(true);
    buildUi(opts);
    qDebug() << "[View][Ctor] end";
}

MainWindow::~MainWindow()
{
    qDebug() << "[View][dtor] MainWindow";
}

void MainWindow::buildUi(const cfl::LoaderOptions& opts)
{
    qDebug() << "[View][buildUi]";
    setCentralWidget(createCentralArea(opts));
    resize(420, 500);
    statusBar()->showMessage(tr("Drop an image onto the loader"), 4000);
}

QWidget* MainWindow::createCentralArea(const cfl::LoaderOptions& opts)
{
    auto* central = new QWidget(this);
    auto* vlay    = new QVBoxLayout(central);
    vlay->setContentsMargins(12, 12, 12, 12);
    vlay->setSpacing(8);

    m_loader = new CfLoaderWidget(opts, central);
    m_loader->setMinimumSize(120, 120);
    vlay->addWidget(m_loader, 1);

    auto* row  = new QWidget(central);
    auto* hlay = new QHBoxLayout(row);
    hlay->setContentsMargins(0, 0, 0, 0);
    hlay->setSpacing(8);

    m_progressSlider = new QSlider(Qt::Horizontal, row);
    m_progressSlider->setRange(0, 100);
    m_progressSlider->setValue(m_loader->loader().progress());

    m_valueLabel = new QLabel(row);
    m_valueLabel->setMinimumWidth(40);
    m_valueLabel->setText(QString::number(m_progressSlider->value()));

    hlay->addWidget(m_progressSlider, 1);
    hlay->addWidget(m_valueLabel, 0);
    vlay->addWidget(row, 0);

    connect(m_progressSlider, &QSlider::valueChanged,
            this, &MainWindow::onSliderValueChanged);
    return central;
}

void MainWindow::setImage(const QImage& img, const QString& sourceName)
{
    qDebug() << "[View][setImage]" << sourceName << img.size();
    m_loader->setImage(img);
    showStatus(tr("Image: %1").arg(sourceName));
}

void MainWindow::setProgressValue(int value)
{
    const QSignalBlocker block(m_progressSlider);
    m_progressSlider->setValue(value);
    m_valueLabel->setText(QString::number(m_progressSlider->value()));
}

void MainWindow::showStatus(const QString& msg, int timeoutMs)
{
    if (statusBar()) statusBar()->showMessage(msg, timeoutMs);
}

void MainWindow::onSliderValueChanged(int v)
{
    m_valueLabel->setText(QString::number(v));
    emit progressRequested(v);
}

// ---------------------------------------------------------------------------
// Drag & drop
// ---------------------------------------------------------------------------
bool MainWindow::isAcceptableUrl(const QUrl& url) const
{
    if (!url.isLocalFile()) return false;
    const QFileInfo fi(url.toLocalFile());
    if (!fi.isFile()) return false;
    const QString ext = fi.suffix().toLower();
    const bool ok = m_okExts.contains(ext);
    qDebug() << "[DnD][Check] ext=" << ext << " ok=" << ok;
    return ok;
}

void MainWindow::dragEnterEvent(QDragEnterEvent* ev)
{
    const QMimeData* md = ev->mimeData();
    if (md && md->hasUrls()) {
        for (const QUrl& u : md->urls()) {
            if (isAcceptableUrl(u)) {
                ev->acceptProposedAction();
                return;
            }
        }
    }
    ev->ignore();
}

void MainWindow::dragMoveEvent(QDragMoveEvent* ev)
{
    const QMimeData* md = ev->mimeData();
    if (md && md->hasUrls()) {
        for (const QUrl& u : md->urls()) {
            if (isAcceptableUrl(u)) {
                ev->acceptProposedAction();
                return;
            }
        }
    }
    ev->ignore();
}

void MainWindow::dropEvent(QDropEvent* ev)
{
    const QMimeData* md = ev->mimeData();
    if (!md || !md->hasUrls()) {
        ev->ignore();
        return;
    }
    for (const QUrl& u : md->urls()) {
        if (!isAcceptableUrl(u)) continue;
        const QString path = u.toLocalFile();
        qDebug() << "[DnD] dropEvent: picked path =" << path;
        emit fileDropped(path);
        ev->acceptProposedAction();
        return;
    }
    qDebug() << "[DnD] dropEvent: nothing acceptable";
    ev->ignore();
}

// ---------------------------------------------------------------------------
// Context menu
// ---------------------------------------------------------------------------
void MainWindow::contextMenuEvent(QContextMenuEvent* ev)
{
    CtxMenuActions acts;
    std::unique_ptr<QMenu> menu(buildContextMenu(acts));

    QAction* chosen = menu->exec(ev->globalPos());
    if (!chosen) {
        qDebug() << "[UI][Menu] dismissed";
        return;
    }
    applyContextSelection(chosen, acts);
}

QMenu* MainWindow::buildContextMenu(CtxMenuActions& out)
{
    const cfl::CircularLoader& l = m_loader->loader();
    auto* menu = new QMenu(this);

    out.wave = menu->addAction(tr("Wave"));
    out.wave->setCheckable(true);
    out.wave->setChecked(l.isWaveEnabled());

    out.progressText = menu->addAction(tr("Progress text"));
    out.progressText->setCheckable(true);
    out.progressText->setChecked(l.textState().showProgressText);

    out.autoSize = menu->addAction(tr("Auto-size text"));
    out.autoSize->setCheckable(true);
    out.autoSize->setChecked(l.autoSizeState().enabled);

    menu->addSeparator();
    out.recycle = menu->addAction(tr("Recycle"));
    out.about   = menu->addAction(tr("About"));
    return menu;
}

void MainWindow::applyContextSelection(QAction* chosen, const CtxMenuActions& acts)
{
    cfl::CircularLoader& l = m_loader->loader();

    if (chosen == acts.wave) {
        qDebug() << "[UI][Menu] wave ->" << chosen->isChecked();
        l.setWaveEnabled(chosen->isChecked());
    } else if (chosen == acts.progressText) {
        qDebug() << "[UI][Menu] progress text ->" << chosen->isChecked();
        l.setShowProgressText(chosen->isChecked());
    } else if (chosen == acts.autoSize) {
        qDebug() << "[UI][Menu] auto-size ->" << chosen->isChecked();
        l.setAutoSizeText(chosen->isChecked());
    } else if (chosen == acts.recycle) {
        qDebug() << "[UI][Menu] recycle";
        emit recycleRequested();
    } else if (chosen == acts.about) {
        showAboutDialog();
    }
}

void MainWindow::showAboutDialog()
{
    const QString text = tr("<p><b>CfLoader demo</b></p>"
                            "<p>Circular image loader with a wave fill.</p>"
                            "<p>Version %1 (%2)<br>Compiler %3 %4<br>Qt %5</p>")
                             .arg(QStringLiteral(CFL_VERSION_STR),
                                  QStringLiteral(CFL_BUILD_TYPE_STR),
                                  QStringLiteral(CFL_COMPILER_ID_STR),
                                  QStringLiteral(CFL_COMPILER_VERSION_STR),
                                  QStringLiteral(CFL_QT_BUILD_VERSION_STR));
    QMessageBox::about(this, tr("About CfLoader"), text);
}
