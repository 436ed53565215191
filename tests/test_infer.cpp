#include <QtTest/QTest>
#include "core.h"

using namespace tbx;

class TestInfer : public QObject {
    Q_OBJECT
private slots:
    void testEmpty() {
        CellValue v = infer::inferValue("   ");
        QCOMPARE(v.type, CellType::Text);
        QVERIFY(v.value.toString().isEmpty());
    }

    void testNumber() {
        CellValue v = infer::inferValue("42");
        QCOMPARE(v.type, CellType::Number);
        QCOMPARE(v.value.toDouble(), 42.0);
        QCOMPARE(v.rawText, QString("42"));

        QCOMPARE(infer::inferValue("-3.14").type, CellType::Number);
        QCOMPARE(infer::inferValue("1234567").type, CellType::Number);
    }

    void testBoolean() {
        CellValue t = infer::inferValue("TRUE");
        QCOMPARE(t.type, CellType::Boolean);
        QCOMPARE(t.value.toBool(), true);
        CellValue f = infer::inferValue("false");
        QCOMPARE(f.type, CellType::Boolean);
        QCOMPARE(f.value.toBool(), false);
    }

    void testIsoDate() {
        CellValue v = infer::inferValue("2024-03-15");
        QCOMPARE(v.type, CellType::Date);
        QCOMPARE(v.value.toDateTime().date(), QDate(2024, 3, 15));
        QCOMPARE(v.detectedFormat, QString("YYYY-MM-DD"));
    }

    void testIsoDateTime() {
        CellValue v = infer::inferValue("2024-03-15 14:30");
        QCOMPARE(v.type, CellType::DateTime);
        QCOMPARE(v.value.toDateTime(), QDateTime(QDate(2024, 3, 15), QTime(14, 30)));
        QCOMPARE(v.detectedFormat, QString("YYYY-MM-DD HH:mm"));
    }

    void testDayFirstDate() {
        CellValue v = infer::inferValue("15/03/2024");
        QCOMPARE(v.type, CellType::Date);
        QCOMPARE(v.value.toDateTime().date(), QDate(2024, 3, 15));
        QCOMPARE(v.detectedFormat, QString("DD/MM/YYYY"));
    }

    void testNamedMonthDates() {
        CellValue a = infer::inferValue("Mar 15, 2024");
        QCOMPARE(a.type, CellType::Date);
        QCOMPARE(a.value.toDateTime().date(), QDate(2024, 3, 15));
        QCOMPARE(a.detectedFormat, QString("MMM DD YYYY"));

        CellValue b = infer::inferValue("15 March 2024");
        QCOMPARE(b.type, CellType::Date);
        QCOMPARE(b.detectedFormat, QString("DD MMM YYYY"));

        CellValue c = infer::inferValue("15-Mar-2024");
        QCOMPARE(c.type, CellType::Date);
        QCOMPARE(c.detectedFormat, QString("DD-MMM-YYYY"));

        CellValue d = infer::inferValue("15 Mar 2024 09:05");
        QCOMPARE(d.type, CellType::DateTime);
        QCOMPARE(d.value.toDateTime().time(), QTime(9, 5));
    }

    void testImpossibleDateIsText() {
        QCOMPARE(infer::inferValue("31/02/2024").type, CellType::Text);
        QVERIFY(infer::inferValue("2024-13-01").type != CellType::Date);
    }

    void testPercentageAndCurrency() {
        CellValue p = infer::inferValue("50%");
        QCOMPARE(p.type, CellType::Percentage);
        QCOMPARE(p.value.toDouble(), 50.0);

        CellValue c = infer::inferValue("$1,234.50");
        QCOMPARE(c.type, CellType::Currency);
        QCOMPARE(c.value.toDouble(), 1234.5);
    }

    void testDurationAndTime() {
        QCOMPARE(infer::inferValue("14:30").type, CellType::Duration);
        QCOMPARE(infer::inferValue("1:02:03").type, CellType::Duration);
        QCOMPARE(infer::inferValue("2:30 PM").type, CellType::Time);
    }

    void testStringKinds() {
        QCOMPARE(infer::inferValue("someone@example.com").type, CellType::Email);
        QCOMPARE(infer::inferValue("https://example.com/a?b=c").type, CellType::Uri);
        QCOMPARE(infer::inferValue("123e4567-e89b-12d3-a456-426614174000").type, CellType::Guid);
        QCOMPARE(infer::inferValue("+1 555 123 4567").type, CellType::Phone);
        QCOMPARE(infer::inferValue("(555) 123-4567").type, CellType::Phone);
        QCOMPARE(infer::inferValue("hello world").type, CellType::Text);
    }

    void testTextKeepsRawInput() {
        CellValue v = infer::inferValue("  padded ");
        QCOMPARE(v.type, CellType::Text);
        QCOMPARE(v.value.toString(), QString("  padded "));
        QCOMPARE(v.rawText, QString("  padded "));
    }

    void testDetectDateFormat() {
        QCOMPARE(infer::detectDateFormat("2024-01-02"), QString("YYYY-MM-DD"));
        QCOMPARE(infer::detectDateFormat("02-01-2024"), QString("DD-MM-YYYY"));
        QCOMPARE(infer::detectDateFormat("Jan 2 2024 10:00"), QString("MMM DD YYYY HH:mm"));
        QVERIFY(infer::detectDateFormat("not a date").isEmpty());
    }

    void testTypeNames() {
        QCOMPARE(QString(typeToString(CellType::DateTime)), QString("datetime"));
        QCOMPARE(typeDisplayName(CellType::Uri), QString("URI"));
        QVERIFY(isNumericType(CellType::Percentage));
        QVERIFY(isTemporalType(CellType::Date));
        QVERIFY(!isTemporalType(CellType::Time));
    }
};

QTEST_MAIN(TestInfer)
#include "test_infer.moc"
