#include "engine/PdfStamp.hpp"
#include <cstring>

namespace QtPdfTemplate::engine {

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }
bool isHex(char c) { return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }

bool allDigits(const QByteArray &s, qsizetype from, qsizetype count) {
    if(from + count > s.size()) return false;
    for(qsizetype i = from; i < from + count; ++i) if(!isDigit(s.at(i))) return false;
    return true;
}

int stampDates(QByteArray &pdf) {
    static const QByteArray marker("(D:");
    const qsizetype digits = static_cast<qsizetype>(std::strlen(kFixedPdfDate));
    int count = 0;
    for(qsizetype pos = pdf.indexOf(marker); pos >= 0; pos = pdf.indexOf(marker, pos + 1)) {
        const qsizetype start = pos + marker.size();
        if(!allDigits(pdf, start, digits)) continue;
        pdf.replace(start, digits, QByteArray(kFixedPdfDate));
        // Optional offset +hh'mm'
        const qsizetype tz = start + digits;
        if(tz + 7 <= pdf.size() && (pdf.at(tz) == '+' || pdf.at(tz) == '-')
           && allDigits(pdf, tz + 1, 2) && pdf.at(tz + 3) == '\'' && allDigits(pdf, tz + 4, 2)) {
            pdf.replace(tz, 6, QByteArray("+00'00"));
        }
        ++count;
    }
    return count;
}

int stampId(QByteArray &pdf, const QByteArray &idHex) {
    if(idHex.isEmpty()) return 0;
    qsizetype pos = pdf.lastIndexOf("/ID");
    if(pos < 0) return 0;
    const qsizetype close = pdf.indexOf(']', pos);
    if(close < 0) return 0;
    int count = 0;
    qsizetype cursor = pdf.indexOf('[', pos);
    while(cursor >= 0 && cursor < close) {
        const qsizetype open = pdf.indexOf('<', cursor);
        if(open < 0 || open > close) break;
        const qsizetype end = pdf.indexOf('>', open);
        if(end < 0 || end > close) break;
        for(qsizetype i = open + 1; i < end; ++i) {
            if(isHex(pdf.at(i))) pdf[i] = idHex.at((i - open - 1) % idHex.size());
        }
        ++count;
        cursor = end + 1;
    }
    return count;
}

} // namespace

int stampDeterministicFields(QByteArray &pdf, const QByteArray &idHex) {
    return stampDates(pdf) + stampId(pdf, idHex);
}

} // namespace QtPdfTemplate::engine
