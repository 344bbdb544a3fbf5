#ifndef SECURITYCONFIG_HPP
#define SECURITYCONFIG_HPP

#include <QJsonObject>
#include <QString>

#include "../errors/securityerror.hpp"
#include "../inputsanitizer.hpp"
#include "../limits/resourcelimiter.hpp"
#include "../parser/sandboxedparser.hpp"
#include "../pathvalidator.hpp"

namespace Kalkan::Core {

/**
 * @brief Settings for every component of a SecurityContext
 *
 * Sizes are in bytes and times in milliseconds. Keys missing from a
 * loaded document keep their defaults; unknown keys are ignored.
 */
struct SecurityConfig {
    PathValidatorOptions pathValidator;
    SanitizerOptions inputSanitizer;
    ResourceLimits resourceLimiter;
    ParserOptions sandboxedParser;

    /**
     * @brief Builds a configuration from a JSON object
     * @return InvalidInput (INVALID_CONFIG) naming the offending "section.key"
     */
    static Result<SecurityConfig> fromJson(const QJsonObject& root);

    /**
     * @brief Reads and parses a JSON configuration file
     */
    static Result<SecurityConfig> loadFile(const QString& path);

    QJsonObject toJson() const;
};

} // namespace Kalkan::Core

#endif // SECURITYCONFIG_HPP
