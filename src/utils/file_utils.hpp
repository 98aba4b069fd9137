#pragma once
#include <string>

namespace gitstack::utils {

class FileUtils {
public:
    static std::string readFile(const std::string& filePath);

    static bool writeFile(const std::string& filePath, const std::string& content);

    /**
     * Write `content` to a temporary file next to `filePath`, flush it to
     * disk and rename it over the target. Readers see the old or the new
     * file, never a partial one.
     * @throws std::runtime_error on any I/O failure; the target is untouched
     */
    static void writeFileAtomic(const std::string& filePath, const std::string& content);

    static bool fileExists(const std::string& filePath);

    static void ensureDirectory(const std::string& directory);

    static std::string getEnvVar(const std::string& name);

    // $<envName> if set, else $HOME/<homeFallback>, with "/git-stack" appended.
    static std::string xdgDirectory(const std::string& envName, const std::string& homeFallback);
};

}
