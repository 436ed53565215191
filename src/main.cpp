#include "mainwindow.h"
#include <QApplication>
#include <QMenuBar>
#include <QStatusBar>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QColorDialog>
#include <QDialog>
#include <QDialogButtonBox>
#include <QCheckBox>
#include <QFormLayout>
#include <QSpinBox>
#include <QSettings>

namespace tbx {

template < typename...Args >
inline QAction* Qt5Qt6AddAction(QMenu* menu, const QString &text, const QKeySequence &shortcut, Args&&...args)
{
    QAction *result = menu->addAction(text);
    if (!shortcut.isEmpty())
        result->setShortcut(shortcut);
    QObject::connect(result, &QAction::triggered, std::forward<Args>(args)...);
    return result;
}

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
{
    setWindowTitle("Tabulix");
    resize(1200, 800);

    m_ctrl = new GridController(GridConfig::load(), this);
    m_view = new GridView(m_ctrl, this);
    setCentralWidget(m_view);

    m_status = new QLabel(this);
    statusBar()->addWidget(m_status, 1);
    connect(m_ctrl, &GridController::selectionChanged, this, &MainWindow::updateStatus);
    connect(m_ctrl, &GridController::cellsChanged,     this, &MainWindow::updateStatus);

    createMenus();
    updateStatus();
}

void MainWindow::createMenus() {
    // File
    auto* file = menuBar()->addMenu("&File");
    Qt5Qt6AddAction(file, "&Import CSV...", QKeySequence::Open, this, &MainWindow::importCsv);
    Qt5Qt6AddAction(file, "&Clear Grid", QKeySequence::UnknownKey, this, &MainWindow::clearGrid);
    file->addSeparator();
    Qt5Qt6AddAction(file, "E&xit", QKeySequence::Quit, this, &QMainWindow::close);

    // Edit
    auto* edit = menuBar()->addMenu("&Edit");
    Qt5Qt6AddAction(edit, "&Copy",  QKeySequence::Copy,  m_ctrl, [this]() { m_ctrl->copy(); });
    Qt5Qt6AddAction(edit, "Cu&t",   QKeySequence::Cut,   m_ctrl, [this]() { m_ctrl->cut(); });
    Qt5Qt6AddAction(edit, "&Paste", QKeySequence::Paste, m_ctrl, [this]() { m_ctrl->paste(); });
    Qt5Qt6AddAction(edit, "Cancel C&lipboard", QKeySequence::UnknownKey, m_ctrl, &GridController::cancelClipboard);
    edit->addSeparator();
    Qt5Qt6AddAction(edit, "Fill &Down",  QKeySequence(Qt::CTRL | Qt::Key_D), m_ctrl, [this]() { m_ctrl->fillDown(); });
    Qt5Qt6AddAction(edit, "Fill &Right", QKeySequence(Qt::CTRL | Qt::Key_R), m_ctrl, [this]() { m_ctrl->fillRight(); });
    edit->addSeparator();
    Qt5Qt6AddAction(edit, "Add 100 &Rows",   QKeySequence::UnknownKey, m_ctrl, [this]() { m_ctrl->addRows(100); });
    Qt5Qt6AddAction(edit, "Add 10 C&olumns", QKeySequence::UnknownKey, m_ctrl, [this]() { m_ctrl->addColumns(10); });

    // Format
    auto* format = menuBar()->addMenu("F&ormat");
    Qt5Qt6AddAction(format, "&Bold",      QKeySequence::Bold,      this, &MainWindow::toggleBold);
    Qt5Qt6AddAction(format, "&Italic",    QKeySequence::Italic,    this, &MainWindow::toggleItalic);
    Qt5Qt6AddAction(format, "&Underline", QKeySequence::Underline, this, &MainWindow::toggleUnderline);
    format->addSeparator();
    auto* align = format->addMenu("&Align");
    const std::pair<const char*, TextAlign> aligns[] = {
        {"&Left", TextAlign::Left}, {"&Center", TextAlign::Center}, {"&Right", TextAlign::Right},
    };
    for (const auto& a : aligns) {
        const TextAlign value = a.second;
        align->addAction(a.first, m_ctrl, [this, value]() {
            CellFormatting patch;
            patch.textAlign = value;
            m_ctrl->format(patch);
        });
    }
    Qt5Qt6AddAction(format, "&Fill Color...", QKeySequence::UnknownKey, this, &MainWindow::chooseFillColor);
    Qt5Qt6AddAction(format, "&Text Color...", QKeySequence::UnknownKey, this, &MainWindow::chooseTextColor);
    format->addSeparator();

    auto* dates = format->addMenu("&Date Format");
    for (const QString& pattern : fmt::dateFormatPatterns()) {
        dates->addAction(pattern, m_ctrl, [this, pattern]() {
            CellFormatting patch;
            patch.dateFormat = pattern;
            m_ctrl->format(patch);
        });
    }

    Qt5Qt6AddAction(format, "&Reset Row and Column Sizes", QKeySequence::UnknownKey, m_ctrl,
                     [this]() { m_ctrl->resetAllSizes(); });
    format->addSeparator();

    auto* types = format->addMenu("Cell &Type");
    for (const auto& m : kTypeMeta) {
        const CellType t = m.type;
        types->addAction(QString::fromLatin1(m.displayName), m_ctrl,
                         [this, t]() { m_ctrl->setSelectedCellType(t); });
    }
}

// ── Formatting toggles ──

void MainWindow::toggleBold() {
    CellFormatting patch;
    patch.bold = !m_ctrl->selectedFormatting().value_or(CellFormatting{}).isBold();
    m_ctrl->format(patch);
}

void MainWindow::toggleItalic() {
    CellFormatting patch;
    patch.italic = !m_ctrl->selectedFormatting().value_or(CellFormatting{}).italic.value_or(false);
    m_ctrl->format(patch);
}

void MainWindow::toggleUnderline() {
    CellFormatting patch;
    patch.underline = !m_ctrl->selectedFormatting().value_or(CellFormatting{}).underline.value_or(false);
    m_ctrl->format(patch);
}

void MainWindow::chooseFillColor() {
    QColor c = QColorDialog::getColor(Qt::white, this, "Fill Color");
    if (!c.isValid()) return;
    CellFormatting patch;
    patch.fillColor = c;
    m_ctrl->format(patch);
}

void MainWindow::chooseTextColor() {
    QColor c = QColorDialog::getColor(Qt::black, this, "Text Color");
    if (!c.isValid()) return;
    CellFormatting patch;
    patch.textColor = c;
    m_ctrl->format(patch);
}

void MainWindow::updateStatus() {
    auto p = m_ctrl->activeCell();
    if (!p) {
        m_status->clear();
        return;
    }
    QString text = fmt::columnLabel(p->col) + QString::number(p->row + 1);
    if (auto t = m_ctrl->selectedCellType())
        text += QStringLiteral("  ") + typeDisplayName(*t);
    m_status->setText(text);
}

// ── File ──

void MainWindow::clearGrid() {
    if (QMessageBox::question(this, "Clear Grid", "Remove every cell and table?")
        != QMessageBox::Yes)
        return;
    m_ctrl->clear();
}

bool MainWindow::askCsvOptions(CsvOptions* opts) {
    QSettings s("Tabulix", "Tabulix");

    QDialog dlg(this);
    dlg.setWindowTitle("Import CSV");
    auto* form = new QFormLayout(&dlg);
    auto* header = new QCheckBox(&dlg);
    header->setChecked(s.value("csv/hasHeader", true).toBool());
    auto* style = new QCheckBox(&dlg);
    style->setChecked(s.value("csv/applyTableStyle", true).toBool());
    auto* detect = new QCheckBox(&dlg);
    detect->setChecked(s.value("csv/autoDetect", true).toBool());
    auto* trim = new QCheckBox(&dlg);
    trim->setChecked(s.value("csv/trimValues", true).toBool());
    auto* row = new QSpinBox(&dlg);
    row->setRange(1, 1000000);
    auto* col = new QSpinBox(&dlg);
    col->setRange(1, 100000);
    if (auto p = m_ctrl->activeCell()) {
        row->setValue(p->row + 1);
        col->setValue(p->col + 1);
    }
    form->addRow("First row is header", header);
    form->addRow("Format as table", style);
    form->addRow("Detect delimiter", detect);
    form->addRow("Trim values", trim);
    form->addRow("Start row", row);
    form->addRow("Start column", col);
    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, &dlg);
    form->addRow(buttons);
    connect(buttons, &QDialogButtonBox::accepted, &dlg, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, &dlg, &QDialog::reject);

    if (dlg.exec() != QDialog::Accepted)
        return false;

    opts->hasHeader       = header->isChecked();
    opts->applyTableStyle = style->isChecked();
    opts->autoDetect      = detect->isChecked();
    opts->trimValues      = trim->isChecked();
    opts->startRow        = row->value() - 1;
    opts->startCol        = col->value() - 1;

    s.setValue("csv/hasHeader", opts->hasHeader);
    s.setValue("csv/applyTableStyle", opts->applyTableStyle);
    s.setValue("csv/autoDetect", opts->autoDetect);
    s.setValue("csv/trimValues", opts->trimValues);
    return true;
}

void MainWindow::importCsv() {
    QSettings s("Tabulix", "Tabulix");
    const QString path = QFileDialog::getOpenFileName(this, "Import CSV",
        s.value("csv/lastDir").toString(), "Delimited text (*.csv *.tsv *.txt);;All Files (*)");
    if (path.isEmpty()) return;
    s.setValue("csv/lastDir", QFileInfo(path).absolutePath());

    CsvOptions opts;
    if (!askCsvOptions(&opts)) return;

    CsvReadResult file = readCsvFile(path);
    if (!file.ok) {
        QMessageBox::warning(this, "Import CSV", file.error);
        return;
    }
    CsvImportResult parsed = parseCsv(file.content, opts, m_ctrl->valueServices().parse);
    m_ctrl->importCells(parsed.cells, true, parsed.region);
    statusBar()->showMessage(QStringLiteral("Imported %1 rows x %2 columns from %3")
        .arg(parsed.rowCount).arg(parsed.colCount).arg(QFileInfo(path).fileName()), 5000);
}

} // namespace tbx

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("Tabulix");
    app.setOrganizationName("Tabulix");
    app.setStyle("Fusion");

    tbx::MainWindow window;
    window.show();
    return app.exec();
}
