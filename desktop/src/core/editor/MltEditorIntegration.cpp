#include "MltEditorIntegration.hpp"
#include "../common/Logger.hpp"
#include "../subtitles/Timecode.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QRegularExpression>
#include <QtCore/QSaveFile>
#include <QtCore/QStandardPaths>

namespace MomentNav {

QString editorErrorToString(EditorError error) {
    switch (error) {
        case EditorError::UnknownEditor: return "Unknown editor";
        case EditorError::NotReady: return "Editor executable not found";
        case EditorError::MediaNotFound: return "Media file not found";
        case EditorError::InvalidClipRange: return "Clip out point precedes its in point";
        case EditorError::FrameRateUnavailable: return "Frame rate could not be detected";
        case EditorError::WriteFailed: return "Failed to write clip file";
        case EditorError::StartFailed: return "Failed to start editor";
    }
    return "Unknown editor error";
}

MltEditorIntegration::MltEditorIntegration(const QString& executableOverride, const QString& clipDirectory)
    : executableOverride_(executableOverride)
    , clipDirectory_(clipDirectory)
    , starter_([](const QString& program, const QStringList& arguments) {
          return QProcess::startDetached(program, arguments);
      })
    , probe_(&MediaProbe::frameRate) {
}

QString MltEditorIntegration::resolveExecutable() const {
    if (!executableOverride_.isEmpty()) {
        const QFileInfo info(executableOverride_);
        if (info.isAbsolute()) {
            return info.exists() ? info.absoluteFilePath() : QString();
        }
        return QStandardPaths::findExecutable(executableOverride_);
    }
    
    for (const QString& candidate : executableNames()) {
        const QString located = QStandardPaths::findExecutable(candidate);
        if (!located.isEmpty()) {
            return located;
        }
    }
    return QString();
}

bool MltEditorIntegration::isReady() const {
    return !resolveExecutable().isEmpty();
}

Expected<void, EditorError> MltEditorIntegration::importMedia(const QString& mediaPath) {
    if (!QFileInfo::exists(mediaPath)) {
        return makeUnexpected(EditorError::MediaNotFound);
    }
    return launch(QFileInfo(mediaPath).absoluteFilePath());
}

Expected<QString, EditorError> MltEditorIntegration::importClip(const ClipRequest& clip) {
    if (!QFileInfo::exists(clip.mediaPath)) {
        return makeUnexpected(EditorError::MediaNotFound);
    }
    if (clip.inTime < 0 || clip.outTime < clip.inTime) {
        return makeUnexpected(EditorError::InvalidClipRange);
    }
    
    auto rate = detectFrameRate(clip.mediaPath);
    if (rate.hasError()) {
        return makeUnexpected(rate.error());
    }
    
    const qint64 inFrame = Timecode::toFrame(clip.inTime, rate.value().value());
    const qint64 outFrame = qMax(inFrame, Timecode::toFrame(clip.outTime, rate.value().value()));
    
    QString baseName = QFileInfo(clip.mediaPath).completeBaseName();
    baseName.replace(QRegularExpression("[^A-Za-z0-9._-]+"), "_");
    const QString outputPath = QDir(clipDirectory_).absoluteFilePath(
        QString("%1_%2-%3.mlt").arg(baseName).arg(inFrame).arg(outFrame));
    
    auto written = writeClipDocument(outputPath, clip, rate.value(), inFrame, outFrame);
    if (written.hasError()) {
        return makeUnexpected(written.error());
    }
    
    auto launched = launch(outputPath);
    if (launched.hasError()) {
        return makeUnexpected(launched.error());
    }
    return outputPath;
}

Expected<FrameRate, EditorError> MltEditorIntegration::detectFrameRate(const QString& mediaPath) const {
    auto rate = probe_(mediaPath);
    if (rate.hasError()) {
        MOMENTNAV_WARN("Frame rate detection failed for {}: {}", mediaPath.toStdString(),
                       probeErrorToString(rate.error()).toStdString());
        return makeUnexpected(rate.error() == ProbeError::FileNotFound
                              ? EditorError::MediaNotFound
                              : EditorError::FrameRateUnavailable);
    }
    return rate.value();
}

void MltEditorIntegration::writeProperty(QXmlStreamWriter& xml, const QString& name, const QString& value) {
    xml.writeStartElement("property");
    xml.writeAttribute("name", name);
    xml.writeCharacters(value);
    xml.writeEndElement();
}

Expected<void, EditorError> MltEditorIntegration::launch(const QString& path) {
    const QString executable = resolveExecutable();
    if (executable.isEmpty()) {
        MOMENTNAV_ERROR("{} is not installed or not configured", displayName().toStdString());
        return makeUnexpected(EditorError::NotReady);
    }
    
    const QStringList args = importArguments(path);
    MOMENTNAV_INFO("Executing: {} {}", executable.toStdString(), args.join(' ').toStdString());
    if (!starter_(executable, args)) {
        return makeUnexpected(EditorError::StartFailed);
    }
    return {};
}

Expected<void, EditorError> MltEditorIntegration::writeClipDocument(const QString& outputPath,
                                                                  const ClipRequest& clip,
                                                                  const FrameRate& rate, qint64 inFrame,
                                                                  qint64 outFrame) const {
    if (!QDir().mkpath(QFileInfo(outputPath).absolutePath())) {
        return makeUnexpected(EditorError::WriteFailed);
    }
    
    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        MOMENTNAV_ERROR("Cannot write {}: {}", outputPath.toStdString(), file.errorString().toStdString());
        return makeUnexpected(EditorError::WriteFailed);
    }
    
    const QString in = QString::number(inFrame);
    const QString out = QString::number(outFrame);
    
    QXmlStreamWriter xml(&file);
    xml.setAutoFormatting(true);
    xml.writeStartDocument();
    xml.writeStartElement("mlt");
    xml.writeAttribute("LC_NUMERIC", "C");
    xml.writeAttribute("producer", "main_bin");
    if (!clip.label.isEmpty()) {
        xml.writeAttribute("title", clip.label);
    }
    
    xml.writeStartElement("profile");
    xml.writeAttribute("frame_rate_num", QString::number(rate.numerator));
    xml.writeAttribute("frame_rate_den", QString::number(rate.denominator));
    xml.writeEndElement();
    
    xml.writeStartElement("producer");
    xml.writeAttribute("id", "producer0");
    xml.writeAttribute("in", in);
    xml.writeAttribute("out", out);
    writeProperty(xml, "resource", QFileInfo(clip.mediaPath).absoluteFilePath());
    writeProperty(xml, "mlt_service", "avformat");
    writeProducerProperties(xml, clip);
    xml.writeEndElement();
    
    xml.writeStartElement("playlist");
    xml.writeAttribute("id", "main_bin");
    writeProperty(xml, "xml_retain", "1");
    xml.writeStartElement("entry");
    xml.writeAttribute("producer", "producer0");
    xml.writeAttribute("in", in);
    xml.writeAttribute("out", out);
    xml.writeEndElement();
    xml.writeEndElement();
    
    xml.writeEndElement();
    xml.writeEndDocument();
    
    if (xml.hasError() || !file.commit()) {
        MOMENTNAV_ERROR("Failed to save clip file {}", outputPath.toStdString());
        return makeUnexpected(EditorError::WriteFailed);
    }
    
    MOMENTNAV_DEBUG("Wrote clip {} [{}-{}]", outputPath.toStdString(), inFrame, outFrame);
    return {};
}

QStringList ShotcutIntegration::executableNames() const {
    return {"shotcut", "Shotcut"};
}

QStringList ShotcutIntegration::importArguments(const QString& path) const {
    return {path};
}

void ShotcutIntegration::writeProducerProperties(QXmlStreamWriter& xml, const ClipRequest& clip) const {
    if (!clip.label.isEmpty()) {
        writeProperty(xml, "shotcut:caption", clip.label);
    }
}

QStringList KdenliveIntegration::executableNames() const {
    return {"kdenlive"};
}

// -i adds the files to the project bin instead of opening them as a project
QStringList KdenliveIntegration::importArguments(const QString& path) const {
    return {"-i", path};
}

void KdenliveIntegration::writeProducerProperties(QXmlStreamWriter& xml, const ClipRequest& clip) const {
    if (!clip.label.isEmpty()) {
        writeProperty(xml, "kdenlive:clipname", clip.label);
    }
}

} // namespace MomentNav
