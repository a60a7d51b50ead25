// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace codegrader::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_DATA_HOME/codegrader, else ~/.local/share/codegrader. */
    static std::filesystem::path GetDataHome();
    /** @brief $XDG_CONFIG_HOME/codegrader, else ~/.config/codegrader. */
    static std::filesystem::path GetConfigHome();

    /** @brief Absolute paths are kept; relative ones are placed under base. */
    static std::filesystem::path ResolveUnder(const std::filesystem::path& base, const std::string& configured);

    /** @brief Drops spaces, maps path separators to '_' and truncates to maxLength bytes. */
    static std::string SanitizeFileComponent(const std::string& text, size_t maxLength);
};

} // namespace codegrader::infrastructure
