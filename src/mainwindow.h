#pragma once
#include "controller.h"
#include "gridview.h"
#include "csvimport.h"
#include <QMainWindow>
#include <QLabel>

namespace tbx {

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);

private slots:
    void importCsv();
    void clearGrid();
    void toggleBold();
    void toggleItalic();
    void toggleUnderline();
    void chooseFillColor();
    void chooseTextColor();
    void updateStatus();

private:
    void createMenus();
    bool askCsvOptions(CsvOptions* opts);

    GridController* m_ctrl   = nullptr;
    GridView*       m_view   = nullptr;
    QLabel*         m_status = nullptr;
};

} // namespace tbx
