#pragma once
#include <QMainWindow>
#include <QStringList>
#include <QImage>

#include "../model/loader_options.hpp"

class CfLoaderWidget;
class QSlider;
class QLabel;
class QContextMenuEvent;
class QDragEnterEvent;
class QDragMoveEvent;
class QDropEvent;
class QUrl;
class QMenu;
class QAction;

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(const cfl::LoaderOptions& opts = cfl::LoaderOptions(),
                        QWidget* parent = nullptr);
    ~MainWindow() override;

    CfLoaderWidget* loaderWidget() const { return m_loader; }

    void setImage(const QImage& img, const QString& sourceName);
    void setProgressValue(int value);   // moves the slider without emitting
    void showStatus(const QString& msg, int timeoutMs = 2000);

signals:
    void progressRequested(int value);
    void fileDropped(const QString& path);
    void recycleRequested();

protected:
    void contextMenuEvent(QContextMenuEvent* ev) override;
    void dragEnterEvent(QDragEnterEvent* ev) override;
    void dragMoveEvent(QDragMoveEvent* ev) override;
    void dropEvent(QDropEvent* ev) override;

private slots:
    void onSliderValueChanged(int v);

private:
    void     buildUi(const cfl::LoaderOptions& opts);
    QWidget* createCentralArea(const cfl::LoaderOptions& opts);

    bool isAcceptableUrl(const QUrl& url) const;

    struct CtxMenuActions {
        QAction* wave         = nullptr;
        QAction* progressText = nullptr;
        QAction* autoSize     = nullptr;
        QAction* recycle      = nullptr;
        QAction* about        = nullptr;
    };
    QMenu* buildContextMenu(CtxMenuActions& out);
    void   applyContextSelection(QAction* chosen, const CtxMenuActions& acts);
    void   showAboutDialog();

    CfLoaderWidget* m_loader         = nullptr;
    QSlider*        m_progressSlider = nullptr;
    QLabel*         m_valueLabel     = nullptr;

    const QStringList m_okExts{
        QStringLiteral("png"),
        QStringLiteral("jpg"),
        QStringLiteral("jpeg"),
        QStringLiteral("bmp"),
        QStringLiteral("tif"),
        QStringLiteral("tiff"),
        QStringLiteral("webp")
    };
};
