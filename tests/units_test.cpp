// Units and page geometry: length parsing, named sizes, orientation swap, margin fallbacks
#include "layout/Units.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace QtPdfTemplate::layout;

static bool near(double a, double b) { return std::fabs(a - b) < 0.01; }

int main() {
    // Lengths: bare numbers and unsuffixed strings are millimetres
    {
        assert(near(*toPoints(QJsonValue(10)), 28.35));
        assert(near(*toPoints(QJsonValue("10")), 28.35));
        assert(near(*toPoints(QJsonValue("20mm")), 56.69));
        assert(near(*toPoints(QJsonValue(" 1in ")), 72.0));
        assert(near(*toPoints(QJsonValue("2cm")), 56.69));
        assert(near(*toPoints(QJsonValue("12pt")), 12.0));
        assert(!toPoints(QJsonValue("wide")).has_value());
        assert(!toPoints(QJsonValue(true)).has_value());
        assert(near(toPoints(QJsonValue(), 5.0), 5.0));
        assert(near(toPoints(QJsonValue("bad"), 5.0), 5.0));
    }
    // Named page sizes, case-insensitive, A4 fallback
    {
        assert(pageSizeFromName("letter") == PageSizeId::Letter);
        assert(pageSizeFromName(" LEGAL ") == PageSizeId::Legal);
        assert(!pageSizeFromName("A5").has_value());
        const QSizeF a4 = pageSizePoints(PageSizeId::A4);
        assert(near(a4.width(), 595.28) && near(a4.height(), 841.89));
        assert(pageSizePoints(PageSizeId::Letter) == QSizeF(612, 792));
        assert(pageSizePoints(PageSizeId::Legal) == QSizeF(612, 1008));
    }
    // Geometry: landscape swap, default margins, unknown size
    {
        PageGeometry g = resolveGeometry("Letter", "landscape", QJsonValue(), QJsonValue(), QJsonValue(), QJsonValue());
        assert(g.landscape);
        assert(g.pageSize == QSizeF(792, 612));
        assert(near(g.margins.left(), mm(20)) && near(g.margins.bottom(), mm(20)));

        g = resolveGeometry("Tabloid", "portrait", QJsonValue("10mm"), QJsonValue(15), QJsonValue("1in"), QJsonValue("0"));
        assert(g.pageSizeName == "A4");
        assert(near(g.margins.top(), mm(10)));
        assert(near(g.margins.bottom(), mm(15)));
        assert(near(g.margins.left(), 72.0));
        assert(near(g.margins.right(), 0.0));
        assert(near(g.frame().width(), g.pageSize.width() - 72.0));
    }
    // Margins leaving less than an inch of frame fall back to the defaults
    {
        const PageGeometry g = resolveGeometry("A4", "portrait", QJsonValue(), QJsonValue(), QJsonValue(100), QJsonValue(100));
        assert(near(g.margins.left(), mm(20)) && near(g.margins.right(), mm(20)));
    }
    std::cout << "units_test passed" << std::endl;
    return 0;
}
