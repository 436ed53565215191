#include <QtTest/QTest>
#include "core.h"

using namespace tbx;

static const QDateTime kStamp(QDate(2024, 3, 5), QTime(9, 7, 4));

class TestFormat : public QObject {
    Q_OBJECT
private slots:
    void testColumnLabel() {
        QCOMPARE(fmt::columnLabel(0),   QString("A"));
        QCOMPARE(fmt::columnLabel(25),  QString("Z"));
        QCOMPARE(fmt::columnLabel(26),  QString("AA"));
        QCOMPARE(fmt::columnLabel(701), QString("ZZ"));
        QCOMPARE(fmt::columnLabel(702), QString("AAA"));
    }

    void testFormatNumber() {
        QCOMPARE(fmt::formatNumber(42),    QString("42"));
        QCOMPARE(fmt::formatNumber(-7),    QString("-7"));
        QCOMPARE(fmt::formatNumber(3.25),  QString("3.25"));
        QCOMPARE(fmt::formatNumber(0.1),   QString("0.1"));
        QCOMPARE(fmt::formatNumber(1e6),   QString("1000000"));
    }

    void testFormatDatePatterns() {
        QCOMPARE(fmt::formatDate(kStamp, "YYYY-MM-DD", false),        QString("2024-03-05"));
        QCOMPARE(fmt::formatDate(kStamp, "DD/MM/YYYY", false),        QString("05/03/2024"));
        QCOMPARE(fmt::formatDate(kStamp, "MM/DD/YYYY", false),        QString("03/05/2024"));
        QCOMPARE(fmt::formatDate(kStamp, "DD MMM YYYY", false),       QString("05 Mar 2024"));
        QCOMPARE(fmt::formatDate(kStamp, "DD-MMM-YYYY", false),       QString("05-Mar-2024"));
        QCOMPARE(fmt::formatDate(kStamp, "MMM DD YYYY HH:mm", true),  QString("Mar 05 2024 09:07"));
    }

    void testFormatDateFallsBackToIso() {
        QCOMPARE(fmt::formatDate(kStamp, QString(), false), QString("2024-03-05"));
        QCOMPARE(fmt::formatDate(kStamp, "nonsense", true),  QString("2024-03-05 09:07"));
        QVERIFY(fmt::formatDate(QDateTime(), "YYYY-MM-DD", false).isEmpty());
    }

    void testDateFormatPatternList() {
        const QStringList p = fmt::dateFormatPatterns();
        QCOMPARE(p.size(), 10);
        QVERIFY(p.contains("YYYY-MM-DD"));
        QVERIFY(p.contains("DD MMM YYYY HH:mm"));
    }

    void testDisplayByType() {
        QCOMPARE(fmt::displayString(infer::inferValue("true")),      QString("TRUE"));
        QCOMPARE(fmt::displayString(infer::inferValue("12.5%")),     QString("12.5%"));
        QCOMPARE(fmt::displayString(infer::inferValue("$1,234.5")),  QString("$1234.50"));
        QCOMPARE(fmt::displayString(infer::inferValue("007")),       QString("7"));
        QCOMPARE(fmt::displayString(infer::inferValue("hello")),     QString("hello"));
        QVERIFY(fmt::displayString(CellValue{}).isEmpty());
    }

    void testDisplayDateUsesFormatting() {
        CellValue v = infer::inferValue("2024-03-15");
        CellFormatting f;
        f.dateFormat = QString("DD MMM YYYY");
        QCOMPARE(fmt::displayString(v, &f), QString("15 Mar 2024"));
        QCOMPARE(fmt::displayString(v),     QString("2024-03-15"));
    }

    void testDisplayNumberFormat() {
        CellFormatting f;
        f.numberFormat = QString("#,##0");
        QCOMPARE(fmt::displayString(infer::inferValue("1234567"), &f), QString("1,234,567"));
        f.numberFormat = QString("0.00");
        QCOMPARE(fmt::displayString(infer::inferValue("3.14159"), &f), QString("3.14"));
        f.numberFormat = QString("#,##0.0");
        QCOMPARE(fmt::displayString(infer::inferValue("-9876.54"), &f), QString("-9,876.5"));
    }

    void testDefaultServices() {
        ValueServices svc = ValueServices::defaults();
        Cell c;
        c.value = svc.parse("50%");
        QCOMPARE(c.value.type, CellType::Percentage);
        QCOMPARE(svc.displayOf(c), QString("50%"));
    }

    void testFormattingMerge() {
        CellFormatting base;
        base.bold = true;
        base.fillColor = QColor(Qt::red);
        CellFormatting patch;
        patch.italic = true;
        patch.fillColor = QColor(Qt::blue);
        base.merge(patch);
        QVERIFY(base.isBold());
        QCOMPARE(base.italic, std::optional<bool>(true));
        QCOMPARE(*base.fillColor, QColor(Qt::blue));
    }

    void testCellKeyPacking() {
        const quint64 k = cellKey(123456, 789);
        QCOMPARE(keyRow(k), 123456);
        QCOMPARE(keyCol(k), 789);
        QVERIFY(cellKey(1, 0) != cellKey(0, 1));
    }
};

QTEST_MAIN(TestFormat)
#include "test_format.moc"
