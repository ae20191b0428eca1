#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QXmlStreamWriter>
#include <functional>

#include "EditorIntegration.hpp"

namespace MomentNav {

/**
 * @brief Base for editors built on the MLT framework
 *
 * Clips are handed over as a small MLT XML document holding one producer
 * with in/out points at the detected frame rate.
 */
class MltEditorIntegration : public EditorIntegration {
public:
    using ProcessStarter = std::function<bool(const QString& program, const QStringList& arguments)>;
    using FrameRateProbe = std::function<Expected<FrameRate, ProbeError>(const QString& mediaPath)>;
    
    MltEditorIntegration(const QString& executableOverride, const QString& clipDirectory);
    
    bool isReady() const override;
    Expected<void, EditorError> importMedia(const QString& mediaPath) override;
    Expected<QString, EditorError> importClip(const ClipRequest& clip) override;
    Expected<FrameRate, EditorError> detectFrameRate(const QString& mediaPath) const override;
    
    QString resolveExecutable() const;
    QString clipDirectory() const { return clipDirectory_; }
    
    // Test hooks
    void setProcessStarter(ProcessStarter starter) { starter_ = std::move(starter); }
    void setFrameRateProbe(FrameRateProbe probe) { probe_ = std::move(probe); }

protected:
    virtual QStringList executableNames() const = 0;
    virtual QStringList importArguments(const QString& path) const = 0;
    
    // Editor specific producer properties, e.g. the clip caption
    virtual void writeProducerProperties(QXmlStreamWriter& xml, const ClipRequest& clip) const = 0;
    
    static void writeProperty(QXmlStreamWriter& xml, const QString& name, const QString& value);

private:
    Expected<void, EditorError> launch(const QString& path);
    Expected<void, EditorError> writeClipDocument(const QString& outputPath, const ClipRequest& clip,
                                                  const FrameRate& rate, qint64 inFrame, qint64 outFrame) const;
    
    QString executableOverride_;
    QString clipDirectory_;
    ProcessStarter starter_;
    FrameRateProbe probe_;
};

class ShotcutIntegration : public MltEditorIntegration {
public:
    using MltEditorIntegration::MltEditorIntegration;
    
    QString name() const override { return "shotcut"; }
    QString displayName() const override { return "Shotcut"; }

protected:
    QStringList executableNames() const override;
    QStringList importArguments(const QString& path) const override;
    void writeProducerProperties(QXmlStreamWriter& xml, const ClipRequest& clip) const override;
};

class KdenliveIntegration : public MltEditorIntegration {
public:
    using MltEditorIntegration::MltEditorIntegration;
    
    QString name() const override { return "kdenlive"; }
    QString displayName() const override { return "Kdenlive"; }

protected:
    QStringList executableNames() const override;
    QStringList importArguments(const QString& path) const override;
    void writeProducerProperties(QXmlStreamWriter& xml, const ClipRequest& clip) const override;
};

} // namespace MomentNav
