#include "EditorRegistry.hpp"
#include "MltEditorIntegration.hpp"
#include "../common/Logger.hpp"

namespace MomentNav {

std::unique_ptr<EditorRegistry> EditorRegistry::createDefault(const Config::EditorSettings& settings,
                                                              const QString& clipDirectory) {
    auto registry = std::make_unique<EditorRegistry>();
    
    // The executable override only applies to the configured editor
    const QString selected = settings.editor.trimmed().toLower();
    auto overrideFor = [&](const QString& name) {
        return name == selected ? settings.executablePath : QString();
    };
    
    registry->registerEditor(std::make_unique<ShotcutIntegration>(overrideFor("shotcut"), clipDirectory));
    registry->registerEditor(std::make_unique<KdenliveIntegration>(overrideFor("kdenlive"), clipDirectory));
    return registry;
}

void EditorRegistry::registerEditor(std::unique_ptr<EditorIntegration> integration) {
    if (!integration) {
        return;
    }
    const QString key = integration->name().toLower();
    MOMENTNAV_DEBUG("Registered editor integration: {}", key.toStdString());
    editors_[key] = std::move(integration);
}

EditorIntegration* EditorRegistry::lookup(const QString& name) const {
    auto it = editors_.find(name.trimmed().toLower());
    return it != editors_.end() ? it->second.get() : nullptr;
}

QStringList EditorRegistry::names() const {
    QStringList result;
    for (const auto& entry : editors_) {
        result.append(entry.first);
    }
    return result;
}

QStringList EditorRegistry::readyEditors() const {
    QStringList result;
    for (const auto& entry : editors_) {
        if (entry.second->isReady()) {
            result.append(entry.first);
        }
    }
    return result;
}

} // namespace MomentNav
