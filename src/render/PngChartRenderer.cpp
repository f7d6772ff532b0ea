#include "render/PngChartRenderer.h"
#include "common/logging.h"
#include <QtGui/QFont>
#include <QtGui/QImage>
#include <QtGui/QPainter>
#include <QtGui/QPainterPath>
#include <QtGui/QPen>
#include <cmath>
namespace {
constexpr int kTicks = 6;
constexpr int kMarginLeft = 120;
constexpr int kMarginRight = 50;
constexpr int kMarginTop = 110;
constexpr int kMarginBottom = 100;
struct Range { double lo; double hi; };
Range padded(double lo, double hi, double pad) { return lo == hi ? Range{lo - pad, hi + pad} : Range{lo, hi}; }
}
namespace nf {
PngChartRenderer::PngChartRenderer(QString path, QStringList title, QSize size)
    : path_(std::move(path)), title_(std::move(title)), size_(size) {}
bool PngChartRenderer::render(const QVector<FrequencyRecord>& records) {
    QVector<QPointF> points;
    for (const FrequencyRecord& r : records) {
        if (r.samples > 0 && !std::isnan(r.average)) points.push_back(QPointF(r.frequencyMhz, r.average));
    }
    if (points.isEmpty()) { error_ = QStringLiteral("no data to plot"); return false; }

    double xlo = points.first().x(), xhi = xlo, ylo = points.first().y(), yhi = ylo;
    for (const QPointF& p : points) {
        xlo = qMin(xlo, p.x()); xhi = qMax(xhi, p.x());
        ylo = qMin(ylo, p.y()); yhi = qMax(yhi, p.y());
    }
    const Range xr = padded(xlo, xhi, 0.5);
    const Range yr = padded(std::floor(ylo - 1.0), std::ceil(yhi + 1.0), 1.0);

    QImage image(size_, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::white);
    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);
    const QRectF plot(kMarginLeft, kMarginTop, size_.width() - kMarginLeft - kMarginRight, size_.height() - kMarginTop - kMarginBottom);
    auto mapX = [&](double x) { return plot.left() + (x - xr.lo) / (xr.hi - xr.lo) * plot.width(); };
    auto mapY = [&](double y) { return plot.bottom() - (y - yr.lo) / (yr.hi - yr.lo) * plot.height(); };

    QFont font = painter.font();
    font.setPixelSize(22);
    painter.setFont(font);
    painter.setPen(Qt::black);
    painter.drawText(QRectF(0, 10, size_.width(), kMarginTop - 20), Qt::AlignCenter, title_.join(QLatin1Char('\n')));

    font.setPixelSize(16);
    painter.setFont(font);
    QPen grid(QColor(200, 200, 200));
    grid.setStyle(Qt::DashLine);
    for (int i = 0; i <= kTicks; ++i) {
        const double xv = xr.lo + (xr.hi - xr.lo) * i / kTicks;
        const double yv = yr.lo + (yr.hi - yr.lo) * i / kTicks;
        const double px = mapX(xv);
        const double py = mapY(yv);
        painter.setPen(grid);
        painter.drawLine(QPointF(px, plot.top()), QPointF(px, plot.bottom()));
        painter.drawLine(QPointF(plot.left(), py), QPointF(plot.right(), py));
        painter.setPen(Qt::black);
        painter.drawText(QRectF(px - 60, plot.bottom() + 8, 120, 24), Qt::AlignHCenter | Qt::AlignTop, QString::number(xv, 'f', 3));
        painter.drawText(QRectF(0, py - 12, kMarginLeft - 10, 24), Qt::AlignRight | Qt::AlignVCenter, QString::number(yv, 'f', 1));
    }
    painter.drawRect(plot);
    painter.drawText(QRectF(plot.left(), plot.bottom() + 40, plot.width(), 30), Qt::AlignCenter, QStringLiteral("Frequency (MHz)"));
    painter.save();
    painter.translate(24, plot.center().y());
    painter.rotate(-90);
    painter.drawText(QRectF(-plot.height() / 2, -14, plot.height(), 28), Qt::AlignCenter, QStringLiteral("Noise Floor (avg)"));
    painter.restore();

    QPen line(QColor(31, 119, 180));
    line.setWidthF(2.5);
    painter.setPen(line);
    if (points.size() == 1) {
        painter.setBrush(line.color());
        painter.drawEllipse(QPointF(mapX(points.first().x()), mapY(points.first().y())), 4, 4);
    } else {
        QPainterPath path(QPointF(mapX(points.first().x()), mapY(points.first().y())));
        for (int i = 1; i < points.size(); ++i) path.lineTo(mapX(points[i].x()), mapY(points[i].y()));
        painter.drawPath(path);
    }
    painter.end();

    if (!image.save(path_, "PNG")) {
        error_ = QStringLiteral("cannot write %1").arg(path_);
        return false;
    }
    rendered_ = true;
    qCInfo(lcOutput) << "chart saved to" << path_;
    return true;
}
}
