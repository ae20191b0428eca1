#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <map>
#include <memory>

#include "../common/Config.hpp"
#include "EditorIntegration.hpp"

namespace MomentNav {

/**
 * @brief Lookup table from editor name to its integration
 */
class EditorRegistry {
public:
    // Shotcut and Kdenlive, clip files written below clipDirectory
    static std::unique_ptr<EditorRegistry> createDefault(const Config::EditorSettings& settings,
                                                         const QString& clipDirectory);
    
    // Replaces an existing integration with the same name
    void registerEditor(std::unique_ptr<EditorIntegration> integration);
    
    // Case-insensitive, nullptr for unknown names
    EditorIntegration* lookup(const QString& name) const;
    
    QStringList names() const;
    QStringList readyEditors() const;

private:
    std::map<QString, std::unique_ptr<EditorIntegration>> editors_;
};

} // namespace MomentNav
