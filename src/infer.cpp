#include "core.h"
#include <QRegularExpression>
#include <QDate>
#include <QTime>
#include <cmath>

namespace tbx::infer {

// ── Type inference ─────────────────────────────────────────────────────
//
// Classifies a raw input string into one of the CellType variants.
// Checks run in a fixed order; the first match wins:
//
//   empty -> boolean -> guid -> email -> uri -> ISO datetime -> ISO date
//   -> named-month / D-M-Y dates -> phone -> percentage -> currency
//   -> duration -> time -> number -> text
//
// "14:30" is therefore a Duration; a Time needs an AM/PM suffix.

static int monthNumber(const QString& name) {
    static const QHash<QString, int> kMonths = {
        {"jan", 1},  {"january", 1},
        {"feb", 2},  {"february", 2},
        {"mar", 3},  {"march", 3},
        {"apr", 4},  {"april", 4},
        {"may", 5},
        {"jun", 6},  {"june", 6},
        {"jul", 7},  {"july", 7},
        {"aug", 8},  {"august", 8},
        {"sep", 9},  {"sept", 9}, {"september", 9},
        {"oct", 10}, {"october", 10},
        {"nov", 11}, {"november", 11},
        {"dec", 12}, {"december", 12},
    };
    return kMonths.value(name.toLower(), 0);
}

// Builds a local date-time, rejecting rolled-over dates like 31 Feb.
static bool makeDateTime(int y, int m, int d, int hh, int mm, int ss, QDateTime* out) {
    QDate date(y, m, d);
    QTime time(hh, mm, ss);
    if (!date.isValid() || !time.isValid()) return false;
    *out = QDateTime(date, time);
    return true;
}

static CellValue make(CellType type, const QVariant& v, const QString& raw,
                      const QString& detected = {}) {
    CellValue cv;
    cv.type = type;
    cv.value = v;
    cv.rawText = raw;
    cv.detectedFormat = detected;
    return cv;
}

QString detectDateFormat(const QString& text) {
    const QString t = text.trimmed();

    static const QRegularExpression isoDateTime(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}\\s+\\d{1,2}:\\d{2}$"));
    static const QRegularExpression isoDate(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}$"));
    static const QRegularExpression slashDmy(QStringLiteral("^\\d{1,2}/\\d{1,2}/\\d{4}$"));
    static const QRegularExpression dashDmy(QStringLiteral("^\\d{1,2}-\\d{1,2}-\\d{4}$"));
    static const QRegularExpression dayMonTime(QStringLiteral("^\\d{1,2}\\s+[A-Za-z]{3,}\\s+\\d{4}\\s+\\d{1,2}:\\d{2}$"));
    static const QRegularExpression monDayTime(QStringLiteral("^[A-Za-z]{3,}\\s+\\d{1,2},?\\s+\\d{4}\\s+\\d{1,2}:\\d{2}$"));
    static const QRegularExpression dayMon(QStringLiteral("^\\d{1,2}(?:\\s+|-\\s?)[A-Za-z]{3,}(?:\\s+|-\\s?)\\d{4}$"));
    static const QRegularExpression monDay(QStringLiteral("^[A-Za-z]{3,}\\s+\\d{1,2},?\\s+\\d{4}$"));

    if (isoDateTime.match(t).hasMatch()) return QStringLiteral("YYYY-MM-DD HH:mm");
    if (isoDate.match(t).hasMatch())     return QStringLiteral("YYYY-MM-DD");
    if (slashDmy.match(t).hasMatch())    return QStringLiteral("DD/MM/YYYY");
    if (dashDmy.match(t).hasMatch())     return QStringLiteral("DD-MM-YYYY");
    if (dayMonTime.match(t).hasMatch())  return QStringLiteral("DD MMM YYYY HH:mm");
    if (monDayTime.match(t).hasMatch())  return QStringLiteral("MMM DD YYYY HH:mm");
    if (dayMon.match(t).hasMatch())
        return t.contains('-') ? QStringLiteral("DD-MMM-YYYY") : QStringLiteral("DD MMM YYYY");
    if (monDay.match(t).hasMatch())      return QStringLiteral("MMM DD YYYY");
    return {};
}

// Named-month and day-first numeric dates. Returns false when nothing matches
// or the calendar date does not exist.
static bool parseLooseDate(const QString& t, CellType* type, QDateTime* out) {
    static const QRegularExpression dayMonTime(
        QStringLiteral("^(\\d{1,2})\\s+([A-Za-z]{3,})\\s+(\\d{4})\\s+(\\d{1,2}):(\\d{2})(?::(\\d{2}))?$"));
    static const QRegularExpression monDayTime(
        QStringLiteral("^([A-Za-z]{3,})\\s+(\\d{1,2}),?\\s+(\\d{4})\\s+(\\d{1,2}):(\\d{2})(?::(\\d{2}))?$"));
    static const QRegularExpression monDay(
        QStringLiteral("^([A-Za-z]{3,})\\s+(\\d{1,2}),?\\s+(\\d{4})$"));
    static const QRegularExpression dayMon(
        QStringLiteral("^(\\d{1,2})(?:\\s+|-\\s?)([A-Za-z]{3,})(?:\\s+|-\\s?)(\\d{4})$"));
    static const QRegularExpression dmy(
        QStringLiteral("^(\\d{1,2})[/-](\\d{1,2})[/-](\\d{4})$"));

    auto m = dayMonTime.match(t);
    if (m.hasMatch()) {
        int mon = monthNumber(m.captured(2));
        if (mon && makeDateTime(m.captured(3).toInt(), mon, m.captured(1).toInt(),
                                m.captured(4).toInt(), m.captured(5).toInt(),
                                m.captured(6).toInt(), out)) {
            *type = CellType::DateTime;
            return true;
        }
    }
    m = monDayTime.match(t);
    if (m.hasMatch()) {
        int mon = monthNumber(m.captured(1));
        if (mon && makeDateTime(m.captured(3).toInt(), mon, m.captured(2).toInt(),
                                m.captured(4).toInt(), m.captured(5).toInt(),
                                m.captured(6).toInt(), out)) {
            *type = CellType::DateTime;
            return true;
        }
    }
    m = monDay.match(t);
    if (m.hasMatch()) {
        int mon = monthNumber(m.captured(1));
        if (mon && makeDateTime(m.captured(3).toInt(), mon, m.captured(2).toInt(), 0, 0, 0, out)) {
            *type = CellType::Date;
            return true;
        }
    }
    m = dayMon.match(t);
    if (m.hasMatch()) {
        int mon = monthNumber(m.captured(2));
        if (mon && makeDateTime(m.captured(3).toInt(), mon, m.captured(1).toInt(), 0, 0, 0, out)) {
            *type = CellType::Date;
            return true;
        }
    }
    m = dmy.match(t);
    if (m.hasMatch()) {
        if (makeDateTime(m.captured(3).toInt(), m.captured(2).toInt(), m.captured(1).toInt(),
                         0, 0, 0, out)) {
            *type = CellType::Date;
            return true;
        }
    }
    return false;
}

// Phone numbers need a real separator or a leading '+', and 7..15 digits,
// so plain integers and decimals stay numbers.
static bool looksLikePhone(const QString& t) {
    static const QRegularExpression phone(QStringLiteral(
        "^\\+?\\(?[0-9]{1,4}\\)?[-\\s.]?\\(?[0-9]{1,4}\\)?[-\\s.]?[0-9]{1,4}[-\\s.]?[0-9]{1,9}$"));
    QString compact = t;
    compact.remove(QRegularExpression(QStringLiteral("\\s")));
    if (!phone.match(compact).hasMatch()) return false;

    int digits = 0;
    for (QChar c : compact)
        if (c.isDigit()) digits++;
    if (digits < 7 || digits > 15) return false;

    return t.startsWith('+') || t.contains('(') || t.contains('-') || t.contains(' ');
}

CellValue inferValue(const QString& rawText) {
    const QString t = rawText.trimmed();

    if (t.isEmpty())
        return make(CellType::Text, QString(), rawText);

    if (t.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0)
        return make(CellType::Boolean, true, rawText);
    if (t.compare(QLatin1String("false"), Qt::CaseInsensitive) == 0)
        return make(CellType::Boolean, false, rawText);

    static const QRegularExpression guid(
        QStringLiteral("^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$"),
        QRegularExpression::CaseInsensitiveOption);
    if (guid.match(t).hasMatch())
        return make(CellType::Guid, t, rawText);

    static const QRegularExpression email(QStringLiteral("^[^\\s@]+@[^\\s@]+\\.[^\\s@]+$"));
    if (email.match(t).hasMatch())
        return make(CellType::Email, t, rawText);

    static const QRegularExpression uri(QStringLiteral("^(https?|ftp)://[^\\s/$.?#].[^\\s]*$"),
                                        QRegularExpression::CaseInsensitiveOption);
    if (uri.match(t).hasMatch())
        return make(CellType::Uri, t, rawText);

    static const QRegularExpression isoDateTime(
        QStringLiteral("^(\\d{4})-(\\d{2})-(\\d{2})[T\\s](\\d{2}):(\\d{2})(?::(\\d{2}))?$"));
    auto m = isoDateTime.match(t);
    if (m.hasMatch()) {
        QDateTime dt;
        if (makeDateTime(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt(),
                         m.captured(4).toInt(), m.captured(5).toInt(), m.captured(6).toInt(), &dt))
            return make(CellType::DateTime, dt, rawText, detectDateFormat(t));
    }

    static const QRegularExpression isoDate(QStringLiteral("^(\\d{4})-(\\d{2})-(\\d{2})$"));
    m = isoDate.match(t);
    if (m.hasMatch()) {
        QDateTime dt;
        if (makeDateTime(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt(),
                         0, 0, 0, &dt))
            return make(CellType::Date, dt, rawText, detectDateFormat(t));
    }

    {
        CellType type;
        QDateTime dt;
        if (parseLooseDate(t, &type, &dt))
            return make(type, dt, rawText, detectDateFormat(t));
    }

    if (looksLikePhone(t))
        return make(CellType::Phone, t, rawText);

    static const QRegularExpression percentage(QStringLiteral("^-?\\d+\\.?\\d*%$"));
    if (percentage.match(t).hasMatch()) {
        QString num = t;
        num.chop(1);
        return make(CellType::Percentage, num.toDouble(), rawText);
    }

    static const QRegularExpression currency(
        QString::fromUtf8("^[$€]\\s?-?\\d+(?:,\\d{3})*(?:\\.\\d+)?$"));
    if (currency.match(t).hasMatch()) {
        QString num = t;
        num.remove(QRegularExpression(QString::fromUtf8("[$€,\\s]")));
        return make(CellType::Currency, num.toDouble(), rawText);
    }

    static const QRegularExpression duration(QStringLiteral("^(\\d{1,2}):(\\d{2})(?::(\\d{2}))?$"));
    if (duration.match(t).hasMatch())
        return make(CellType::Duration, t, rawText);

    static const QRegularExpression time(QStringLiteral("^(\\d{1,2}):(\\d{2})(?::(\\d{2}))?\\s?(AM|PM)?$"),
                                         QRegularExpression::CaseInsensitiveOption);
    if (time.match(t).hasMatch())
        return make(CellType::Time, t, rawText);

    bool ok = false;
    double num = t.toDouble(&ok);
    if (ok && std::isfinite(num))
        return make(CellType::Number, num, rawText);

    return make(CellType::Text, rawText, rawText);
}

} // namespace tbx::infer
