#include "cf_loader_widget.hpp"

#include <QDebug>
#include <QHideEvent>
#include <QPaintEvent>
#include <QPainter>
#include <QResizeEvent>
#include <QShowEvent>
#include <QSizePolicy>
#include <QTimer>

namespace {
    constexpr int kFrameIntervalMs = 16;
}

CfLoaderWidget::CfLoaderWidget(QWidget* parent)
    : QWidget(parent)
    , m_loader(std::make_unique<cfl::CircularLoader>())
{
    init();
}

CfLoaderWidget::CfLoaderWidget(const cfl::LoaderOptions& opts, QWidget* parent)
    : QWidget(parent)
    , m_loader(std::make_unique<cfl::CircularLoader>(opts))
{
    init();
}

CfLoaderWidget::~CfLoaderWidget()
{
    // the loader calls back into this widget; drop the sink before teardown
    m_loader->setRedrawRequest(nullptr);
    qDebug() << "[View][dtor] CfLoaderWidget";
}

void CfLoaderWidget::init()
{
    qDebug() << "[View][CfLoaderWidget] init";
    QSizePolicy sp(QSizePolicy::Preferred, QSizePolicy::Preferred);
    sp.setHeightForWidth(true);
    setSizePolicy(sp);
    setAttribute(Qt::WA_OpaquePaintEvent, false);

    m_frameTimer = new QTimer(this);
    m_frameTimer->setTimerType(Qt::PreciseTimer);
    m_frameTimer->setInterval(kFrameIntervalMs);
    connect(m_frameTimer, &QTimer::timeout, this, &CfLoaderWidget::onFrame);

    m_loader->setRedrawRequest([this]() { onRedrawRequested(); });
    m_loader->resize(size());
    m_lastDescription = m_loader->description();
    setAccessibleDescription(m_lastDescription);
    syncFrameTimer();
}

QSize CfLoaderWidget::sizeHint() const
{
    return QSize(200, 200);
}

void CfLoaderWidget::setImage(const QImage& img)
{
    qDebug() << "[View][CfLoaderWidget] setImage" << img.size();
    m_loader->setImage(img);
}

void CfLoaderWidget::setProgress(int value, int durationMs)
{
    m_loader->setProgress(value, durationMs);
    emit progressChanged(m_loader->progress());
}

void CfLoaderWidget::recycle()
{
    qDebug() << "[View][CfLoaderWidget] recycle";
    m_loader->recycle();
    syncFrameTimer();
    update();
}

void CfLoaderWidget::onRedrawRequested()
{
    const QString desc = m_loader->description();
    if (desc != m_lastDescription) {
        m_lastDescription = desc;
        setAccessibleDescription(desc);
    }
    syncFrameTimer();
    update();
}

void CfLoaderWidget::syncFrameTimer()
{
    if (!m_frameTimer) return;
    const bool want = m_loader->isAnimating();
    if (want && !m_frameTimer->isActive()) {
        m_frameTimer->start();
    } else if (!want && m_frameTimer->isActive()) {
        m_frameTimer->stop();
    }
}

void CfLoaderWidget::onFrame()
{
    m_loader->advance();
    syncFrameTimer();
}

void CfLoaderWidget::paintEvent(QPaintEvent* ev)
{
    Q_UNUSED(ev);
    QPainter p(this);
    m_loader->render(p);
}

void CfLoaderWidget::resizeEvent(QResizeEvent* ev)
{
    QWidget::resizeEvent(ev);
    m_loader->resize(ev->size());
}

void CfLoaderWidget::showEvent(QShowEvent* ev)
{
    QWidget::showEvent(ev);
    qDebug() << "[View][CfLoaderWidget] show";
    m_loader->onActivate();
    m_loader->onVisibilityChange(true);
    syncFrameTimer();
}

void CfLoaderWidget::hideEvent(QHideEvent* ev)
{
    QWidget::hideEvent(ev);
    qDebug() << "[View][CfLoaderWidget] hide";
    m_loader->onVisibilityChange(false);
    m_loader->onDeactivate();
    syncFrameTimer();
}
