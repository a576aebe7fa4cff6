#include "rtfwriter.h"
#include "rtfutils.h"

#include <QBuffer>
#include <QDebug>
#include <QImageWriter>
#include <QPainter>
#include <QtEndian>

#include <type_traits>

static constexpr quint32 kEmrHeader = 1;
static constexpr quint32 kEmfSignature = 0x464D4520; // " EMF"

RtfWriter::RtfWriter(const PageGeometry &geometry)
    : m_geometry(geometry)
{
}

void RtfWriter::begin()
{
    m_out.clear();
    m_error.clear();
    m_blocks = 0;
    m_skippedCharts = 0;
    m_open = true;

    m_out.append("{\\rtf1\\ansi\\ansicpg1252\\deff0\n");
    m_out.append("{\\fonttbl{\\f0\\fswiss\\fcharset0 Helvetica;}}\n");
    m_out.append("{\\colortbl;\\red0\\green0\\blue0;}\n");
    const QByteArray margin = QByteArray::number(RtfUtils::toTwips(m_geometry.inset));
    m_out.append("\\paperw" + QByteArray::number(RtfUtils::toTwips(m_geometry.pageSize.width()))
                 + "\\paperh" + QByteArray::number(RtfUtils::toTwips(m_geometry.pageSize.height()))
                 + "\\margl" + margin + "\\margr" + margin
                 + "\\margt" + margin + "\\margb" + margin + '\n');
    m_out.append("\\viewkind4\\uc1\n");
}

void RtfWriter::writeParagraph(const QString &text, const QByteArray &format)
{
    m_out.append("\\pard\\plain\\f0");
    m_out.append(format);
    m_out.append(' ');
    m_out.append(RtfUtils::escapeText(text));
    m_out.append("\\par\n");
}

void RtfWriter::appendDocument(const Report::Document &document,
                               const QList<Report::ChartImage> &charts)
{
    if (!m_open)
        begin();

    for (const auto &block : document.blocks()) {
        ++m_blocks;
        std::visit([&](const auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, Report::Heading>) {
                const int size = RtfUtils::toHalfPoints(b.level <= 1 ? 13.0 : 11.0);
                writeParagraph(b.text, "\\sb200\\sa80\\b\\fs" + QByteArray::number(size));
            } else if constexpr (std::is_same_v<T, Report::Paragraph>) {
                QByteArray fmt;
                if (b.alignment.testFlag(Qt::AlignHCenter))
                    fmt += "\\qc";
                switch (b.role) {
                case Report::ParagraphRole::Title:
                    fmt += "\\sa160\\b\\fs" + QByteArray::number(RtfUtils::toHalfPoints(16.0));
                    break;
                case Report::ParagraphRole::Meta:
                    fmt += "\\fs" + QByteArray::number(RtfUtils::toHalfPoints(9.0));
                    break;
                case Report::ParagraphRole::Caption:
                    fmt += "\\i\\fs" + QByteArray::number(RtfUtils::toHalfPoints(10.0));
                    break;
                case Report::ParagraphRole::Body:
                    fmt += "\\fs" + QByteArray::number(RtfUtils::toHalfPoints(10.0));
                    break;
                }
                writeParagraph(b.text, fmt);
            } else if constexpr (std::is_same_v<T, Report::BulletItem>) {
                writeParagraph(b.text, "\\li160\\fs" + QByteArray::number(RtfUtils::toHalfPoints(10.0)));
            } else if constexpr (std::is_same_v<T, Report::ImagePlaceholder>) {
                writePicture(b, charts);
            } else if constexpr (std::is_same_v<T, Report::PageBreak>) {
                m_out.append("\\page\n");
            }
        }, block);
    }
}

void RtfWriter::writePicture(const Report::ImagePlaceholder &image,
                             const QList<Report::ChartImage> &charts)
{
    writeParagraph(image.caption,
                   "\\qc\\i\\fs" + QByteArray::number(RtfUtils::toHalfPoints(10.0)));

    if (image.chartIndex < 0 || image.chartIndex >= charts.size()) {
        qWarning() << "RtfWriter: no chart" << image.chartIndex << "- skipped";
        ++m_skippedCharts;
        return;
    }

    const Report::ChartImage &chart = charts.at(image.chartIndex);
    const std::optional<Blip> blip = encodeChart(chart);
    if (!blip) {
        qWarning() << "RtfWriter: could not encode chart" << chart.title << "- skipped";
        ++m_skippedCharts;
        return;
    }

    // Same size the PDF draws at
    QSizeF pointSize = image.pointSize.isEmpty() ? chart.pointSize : image.pointSize;
    pointSize = pointSize.isEmpty() ? m_geometry.chartDisplaySize(blip->pixelSize)
                                    : m_geometry.fitChartSize(pointSize);

    m_out.append("\\pard\\plain\\qc ");
    m_out.append(pictureGroup(*blip, pointSize));
    m_out.append("\\par\n");
}

QByteArray RtfWriter::finish()
{
    if (!m_open)
        begin();
    if (m_blocks == 0)
        m_error = QStringLiteral("nothing to serialize");
    m_out.append("}\n");
    m_open = false;
    return m_out;
}

bool RtfWriter::isEmf(const QByteArray &data, QSize *bounds)
{
    // ENHMETAHEADER: iType, nSize, rclBounds (4 x int32), rclFrame, dSignature at 40
    if (data.size() < 88)
        return false;
    const auto *p = reinterpret_cast<const uchar *>(data.constData());
    if (qFromLittleEndian<quint32>(p) != kEmrHeader)
        return false;
    if (qFromLittleEndian<quint32>(p + 40) != kEmfSignature)
        return false;

    if (bounds) {
        const qint32 left = qFromLittleEndian<qint32>(p + 8);
        const qint32 top = qFromLittleEndian<qint32>(p + 12);
        const qint32 right = qFromLittleEndian<qint32>(p + 16);
        const qint32 bottom = qFromLittleEndian<qint32>(p + 20);
        *bounds = QSize(right - left + 1, bottom - top + 1);
    }
    return true;
}

static int dotsPerInch(const QImage &image)
{
    const int dpi = qRound(image.dotsPerMeterX() * 0.0254);
    return dpi > 0 ? dpi : 96;
}

static bool writeImage(const QImage &image, const char *format, int quality,
                       QByteArray *out)
{
    out->clear();
    QBuffer buffer(out);
    if (!buffer.open(QIODevice::WriteOnly))
        return false;
    QImageWriter writer(&buffer, format);
    if (quality >= 0)
        writer.setQuality(quality);
    return writer.write(image);
}

std::optional<RtfWriter::Blip> RtfWriter::encodeChart(const Report::ChartImage &chart)
{
    QSize emfBounds;
    if (!chart.emf.isEmpty() && isEmf(chart.emf, &emfBounds)) {
        Blip blip;
        blip.kind = BlipKind::Emf;
        blip.data = chart.emf;
        blip.pixelSize = chart.image.isNull() ? emfBounds : chart.image.size();
        blip.unitsPerInch = chart.image.isNull() ? 96 : dotsPerInch(chart.image);
        if (!blip.pixelSize.isEmpty())
            return blip;
    }

    if (chart.image.isNull())
        return std::nullopt;

    // JPEG has no alpha; flatten onto white first
    QImage flat(chart.image.size(), QImage::Format_RGB32);
    flat.fill(Qt::white);
    {
        QPainter painter(&flat);
        painter.drawImage(0, 0, chart.image);
    }

    Blip blip;
    blip.pixelSize = chart.image.size();
    blip.unitsPerInch = dotsPerInch(chart.image);

    if (writeImage(flat, "jpeg", 85, &blip.data) && !blip.data.isEmpty()) {
        blip.kind = BlipKind::Jpeg;
        return blip;
    }
    if (writeImage(chart.image, "png", -1, &blip.data) && !blip.data.isEmpty()) {
        blip.kind = BlipKind::Png;
        return blip;
    }
    return std::nullopt;
}

QByteArray RtfWriter::pictureGroup(const Blip &blip, const QSizeF &pointSize)
{
    QByteArray out("{\\pict");
    switch (blip.kind) {
    case BlipKind::Emf:  out += "\\emfblip"; break;
    case BlipKind::Jpeg: out += "\\jpegblip"; break;
    case BlipKind::Png:  out += "\\pngblip"; break;
    }
    out += "\\picw" + QByteArray::number(blip.pixelSize.width());
    out += "\\pich" + QByteArray::number(blip.pixelSize.height());
    out += "\\picwgoal" + QByteArray::number(RtfUtils::toTwips(pointSize.width()));
    out += "\\pichgoal" + QByteArray::number(RtfUtils::toTwips(pointSize.height()));
    out += "\\picscalex100\\picscaley100";
    out += "\\blipupi" + QByteArray::number(blip.unitsPerInch);
    out += '\n';
    out += RtfUtils::hexDump(blip.data);
    out += "}";
    return out;
}
