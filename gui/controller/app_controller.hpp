#pragma once

#include <QString>

class MainWindow;
class CfLoaderWidget;

// Wires the demo window to the loader: slider -> progress, dropped files ->
// image, recycle -> recycle + rebind.
class AppController {
public:
    explicit AppController(MainWindow* view);
    ~AppController();

    bool loadImage(const QString& path);
    void setProgress(int value);
    void recycle();
    void show();

private:
    void initViewConnections();

    MainWindow*     m_view   = nullptr;
    CfLoaderWidget* m_loader = nullptr;
    QString         m_imagePath;
};
