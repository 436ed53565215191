#include "core.h"
#include <QLocale>
#include <cmath>

namespace tbx::fmt {

static const char* const kMonthShort[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

static QString pad2(int v) { return QString::number(v).rightJustified(2, '0'); }

QStringList dateFormatPatterns() {
    return {
        QStringLiteral("YYYY-MM-DD"),
        QStringLiteral("DD/MM/YYYY"),
        QStringLiteral("MM/DD/YYYY"),
        QStringLiteral("DD-MM-YYYY"),
        QStringLiteral("MMM DD YYYY"),
        QStringLiteral("DD MMM YYYY"),
        QStringLiteral("DD-MMM-YYYY"),
        QStringLiteral("YYYY-MM-DD HH:mm"),
        QStringLiteral("DD MMM YYYY HH:mm"),
        QStringLiteral("MMM DD YYYY HH:mm"),
    };
}

// ── Dates ──

// Expands YYYY / MMM / MM / DD / HH / mm / ss tokens; everything else is
// copied through. Unknown patterns fall back to ISO text.
QString formatDate(const QDateTime& dt, const QString& pattern, bool includeTime) {
    if (!dt.isValid()) return {};

    if (pattern.isEmpty() || !dateFormatPatterns().contains(pattern)) {
        return includeTime ? dt.toString(QStringLiteral("yyyy-MM-dd HH:mm"))
                           : dt.toString(QStringLiteral("yyyy-MM-dd"));
    }

    const QDate d = dt.date();
    const QTime t = dt.time();
    QString out;
    int i = 0;
    while (i < pattern.size()) {
        QStringView rest = QStringView(pattern).mid(i);
        if (rest.startsWith(QLatin1String("YYYY"))) {
            out += QString::number(d.year()).rightJustified(4, '0');
            i += 4;
        } else if (rest.startsWith(QLatin1String("MMM"))) {
            out += QLatin1String(kMonthShort[d.month() - 1]);
            i += 3;
        } else if (rest.startsWith(QLatin1String("MM"))) {
            out += pad2(d.month());
            i += 2;
        } else if (rest.startsWith(QLatin1String("DD"))) {
            out += pad2(d.day());
            i += 2;
        } else if (rest.startsWith(QLatin1String("HH"))) {
            out += pad2(t.hour());
            i += 2;
        } else if (rest.startsWith(QLatin1String("mm"))) {
            out += pad2(t.minute());
            i += 2;
        } else if (rest.startsWith(QLatin1String("ss"))) {
            out += pad2(t.second());
            i += 2;
        } else {
            out += pattern.at(i);
            i += 1;
        }
    }
    return out;
}

// ── Numbers ──

// Shortest round-trip text, integral values without exponent.
QString formatNumber(double v) {
    if (!std::isfinite(v)) return QString::number(v);
    if (v == std::floor(v) && std::fabs(v) < 1e15)
        return QString::number(qint64(v));
    return QString::number(v, 'g', QLocale::FloatingPointShortest);
}

// "0.00" -> 2 decimals, "#,##0" -> thousands grouping
static QString applyNumberFormat(double v, const QString& pattern) {
    int dot = pattern.indexOf('.');
    int decimals = dot < 0 ? 0 : int(pattern.size() - dot - 1);
    QString s = QString::number(v, 'f', decimals);
    if (!pattern.contains(','))
        return s;

    bool neg = s.startsWith('-');
    if (neg) s.remove(0, 1);
    int intEnd = s.indexOf('.');
    if (intEnd < 0) intEnd = s.size();
    for (int p = intEnd - 3; p > 0; p -= 3)
        s.insert(p, ',');
    return neg ? QStringLiteral("-") + s : s;
}

QString columnLabel(int col) {
    QString label;
    int n = col;
    do {
        label.prepend(QChar('A' + n % 26));
        n = n / 26 - 1;
    } while (n >= 0);
    return label;
}

// ── Display string ──

QString displayString(const CellValue& value, const CellFormatting* formatting) {
    if (!value.value.isValid() || value.value.isNull())
        return {};

    const QString numberPattern = formatting && formatting->numberFormat
        ? *formatting->numberFormat : QString();
    const QString datePattern = formatting && formatting->dateFormat
        ? *formatting->dateFormat : QString();
    const bool isDouble = value.value.userType() == QMetaType::Double;

    switch (value.type) {
    case CellType::Date:
    case CellType::DateTime:
        if (value.value.userType() == QMetaType::QDateTime)
            return formatDate(value.value.toDateTime(), datePattern,
                              value.type == CellType::DateTime);
        return value.value.toString();
    case CellType::Boolean:
        return value.value.toBool() ? QStringLiteral("TRUE") : QStringLiteral("FALSE");
    case CellType::Number:
        if (!isDouble) return value.value.toString();
        if (!numberPattern.isEmpty())
            return applyNumberFormat(value.value.toDouble(), numberPattern);
        return formatNumber(value.value.toDouble());
    case CellType::Percentage:
        if (!isDouble) return value.value.toString();
        return formatNumber(value.value.toDouble()) + QLatin1Char('%');
    case CellType::Currency:
        if (!isDouble) return value.value.toString();
        return QLatin1Char('$') + QString::number(value.value.toDouble(), 'f', 2);
    default:
        return value.value.toString();
    }
}

} // namespace tbx::fmt

namespace tbx {

ValueServices ValueServices::defaults() {
    ValueServices svc;
    svc.parse   = &infer::inferValue;
    svc.display = [](const CellValue& v, const CellFormatting* f) { return fmt::displayString(v, f); };
    return svc;
}

} // namespace tbx
