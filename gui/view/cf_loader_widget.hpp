#pragma once
#include <QImage>
#include <QWidget>

#include <memory>

#include "../model/circular_loader.hpp"

class QTimer;
class QPaintEvent;
class QResizeEvent;
class QShowEvent;
class QHideEvent;

// QWidget host for cfl::CircularLoader: forwards size, visibility and paint,
// and drives the frame tick with a QTimer that only runs while animating.
class CfLoaderWidget : public QWidget
{
    Q_OBJECT
public:
    explicit CfLoaderWidget(QWidget* parent = nullptr);
    explicit CfLoaderWidget(const cfl::LoaderOptions& opts, QWidget* parent = nullptr);
    ~CfLoaderWidget() override;

    cfl::CircularLoader&       loader()       { return *m_loader; }
    const cfl::CircularLoader& loader() const { return *m_loader; }

    void setImage(const QImage& img);
    void setProgress(int value, int durationMs = cfl::kDefaultProgressAnimMs);
    void recycle();

    QSize sizeHint() const override;
    bool  hasHeightForWidth() const override { return true; }
    int   heightForWidth(int w) const override { return w; }

signals:
    void progressChanged(int value);

protected:
    void paintEvent(QPaintEvent* ev) override;
    void resizeEvent(QResizeEvent* ev) override;
    void showEvent(QShowEvent* ev) override;
    void hideEvent(QHideEvent* ev) override;

private slots:
    void onFrame();

private:
    void init();
    void onRedrawRequested();
    void syncFrameTimer();

    std::unique_ptr<cfl::CircularLoader> m_loader;
    QTimer*                              m_frameTimer = nullptr;   // ~60 Hz while animating
    QString                              m_lastDescription;
};
