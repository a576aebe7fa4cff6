#ifndef VISITREPORT_RTFWRITER_H
#define VISITREPORT_RTFWRITER_H

#include <QByteArray>
#include <QList>
#include <QSize>
#include <QSizeF>
#include <QString>

#include <optional>

#include "pagegeometry.h"
#include "reportdocument.h"
#include "reportmodel.h"

// Serializes Report documents to 7-bit RTF in one pass.
// begin() writes the header, each appendDocument() adds blocks, finish()
// closes the group; charts are embedded inline as hex-encoded pictures.

class RtfWriter
{
public:
    enum class BlipKind {
        Emf,
        Jpeg,
        Png,
    };

    struct Blip {
        BlipKind kind = BlipKind::Png;
        QByteArray data;
        QSize pixelSize;
        int unitsPerInch = 96;
    };

    explicit RtfWriter(const PageGeometry &geometry = PageGeometry());

    void begin();
    void appendDocument(const Report::Document &document,
                        const QList<Report::ChartImage> &charts = {});
    QByteArray finish();

    // Non-empty after finish() when nothing could be serialized.
    QString errorString() const { return m_error; }
    int skippedCharts() const { return m_skippedCharts; }

    // Vector form first, then JPEG at quality 85, then PNG.
    static std::optional<Blip> encodeChart(const Report::ChartImage &chart);

    // Single-page EMF: header record with the " EMF" signature.
    static bool isEmf(const QByteArray &data, QSize *bounds = nullptr);

    // Complete {\pict ...} group for blip displayed at pointSize.
    static QByteArray pictureGroup(const Blip &blip, const QSizeF &pointSize);

private:
    void writeParagraph(const QString &text, const QByteArray &format);
    void writePicture(const Report::ImagePlaceholder &image,
                      const QList<Report::ChartImage> &charts);

    PageGeometry m_geometry;
    QByteArray m_out;
    QString m_error;
    int m_blocks = 0;
    int m_skippedCharts = 0;
    bool m_open = false;
};

#endif // VISITREPORT_RTFWRITER_H
