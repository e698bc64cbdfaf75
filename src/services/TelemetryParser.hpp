/**
 * @file TelemetryParser.hpp
 * @brief smartctl JSON report -> RawTelemetry
 */

#pragma once

#include "models/RawTelemetry.hpp"
#include "util/Error.hpp"

#include <json/json.h>

#include <expected>
#include <string_view>

/**
 * @class TelemetryParser
 * @brief Parses tool output and extracts the typed fields the normalizer needs
 *
 * extract() is total: any JSON value (arrays, strings, wrongly typed members)
 * produces a RawTelemetry, with unusable fields left absent.
 */
class TelemetryParser {
public:
    /**
     * @brief Parse tool output into a JSON object
     * @param text Raw stdout of the tool
     * @return Root object, or an error if the text is not a JSON object
     */
    [[nodiscard]] static auto parse_report(std::string_view text)
        -> std::expected<Json::Value, util::Error>;

    /**
     * @brief Extract typed fields from a parsed report
     */
    [[nodiscard]] static auto extract(const Json::Value& report) -> RawTelemetry;

    /**
     * @brief Minimal validity predicate for a device report
     * @return true if the report names a model, a serial number or a device type
     */
    [[nodiscard]] static auto is_usable(const RawTelemetry& telemetry) -> bool;

private:
    [[nodiscard]] static auto extract_nvme_log(const Json::Value& log) -> NvmeHealthLog;
    [[nodiscard]] static auto extract_ata_attributes(const Json::Value& report)
        -> std::vector<AtaAttribute>;
};
