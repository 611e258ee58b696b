#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "CEED.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace CEED {

/**
 * @brief INI-style configuration reader
 *
 * Configures a complete run or ensemble from a single text file:
 *
 *   [SECTION]
 *   key = value        # inline comment
 *
 * Lines starting with # or ; are comments. Lists are comma separated.
 * Missing keys keep the defaults of RunConfig / EnsembleConfig.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Load configuration text (same syntax as a file)
    bool loadString(const std::string& text);

    // =========================================================================
    // Parsing into configuration structures
    // =========================================================================

    bool parseRunConfig(RunConfig& config) const;
    bool parseEnsembleConfig(EnsembleConfig& config) const;
    std::vector<PlanetaryBody> parsePlanetaryBodies() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    std::uint64_t getUInt64(const std::string& section, const std::string& key,
                            std::uint64_t default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;
    std::vector<std::string> getStringArray(const std::string& section,
                                            const std::string& key) const;

    // Set or replace a single value (command-line overrides)
    void set(const std::string& section, const std::string& key, const std::string& value);

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static bool generateTemplate(const std::string& filename);
    static void writeTemplate(std::ostream& os);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    void parse(std::istream& is);
    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;

    bool parseDistribution(const std::string& key, ParameterDistribution& dist) const;
    bool readSubsystemArray(const std::string& section, const std::string& prefix,
                            SubsystemArray& values) const;
};

} // namespace CEED

#endif // CONFIG_READER_HPP
