/**
 * @file AttributeNormalizer.cpp
 * @brief RawTelemetry -> canonical DriveRecord
 */

#include "services/AttributeNormalizer.hpp"

#include "util/JsonFields.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <initializer_list>
#include <span>
#include <vector>

namespace {

struct TypeTag {
    std::string_view tag;
    DriveType type;
    bool prefix_match;  ///< "sat" also covers "sat,12", "sat,auto"
};

// device.type values reported by smartctl
constexpr std::array TYPE_TAGS{
    TypeTag{.tag = "nvme", .type = DriveType::NVME, .prefix_match = false},
    TypeTag{.tag = "sntasmedia", .type = DriveType::NVME, .prefix_match = true},
    TypeTag{.tag = "sntjmicron", .type = DriveType::NVME, .prefix_match = true},
    TypeTag{.tag = "sntrealtek", .type = DriveType::NVME, .prefix_match = true},
    TypeTag{.tag = "ata", .type = DriveType::ATA, .prefix_match = false},
    TypeTag{.tag = "sat", .type = DriveType::ATA, .prefix_match = true},
    TypeTag{.tag = "usbcypress", .type = DriveType::ATA, .prefix_match = true},
    TypeTag{.tag = "usbjmicron", .type = DriveType::ATA, .prefix_match = true},
    TypeTag{.tag = "usbprolific", .type = DriveType::ATA, .prefix_match = true},
    TypeTag{.tag = "usbsunplus", .type = DriveType::ATA, .prefix_match = true},
    TypeTag{.tag = "scsi", .type = DriveType::SCSI, .prefix_match = false},
};

// device.protocol, consulted when the tag itself is not recognized
constexpr std::array PROTOCOL_TAGS{
    TypeTag{.tag = "nvme", .type = DriveType::NVME, .prefix_match = false},
    TypeTag{.tag = "ata", .type = DriveType::ATA, .prefix_match = false},
    TypeTag{.tag = "scsi", .type = DriveType::SCSI, .prefix_match = false},
};

// Remaining-life attributes, in priority order
constexpr std::array LIFE_ATTRIBUTE_IDS{
    231,  // SSD_Life_Left
    202,  // Percent_Lifetime_Remain
    177,  // Wear_Leveling_Count
};
constexpr std::array<std::string_view, 3> LIFE_NAME_KEYWORDS{"wear", "life", "percent"};

// Total LBAs written
constexpr std::array LBAS_WRITTEN_IDS{241, 242};
constexpr std::string_view LBAS_WRITTEN_KEYWORD = "written";

// Temperature_Celsius, then Airflow_Temperature_Cel
constexpr std::array TEMPERATURE_ATTRIBUTE_IDS{194, 190};

// ATA raw temperature values often pack min/max into the upper bytes
constexpr double MIN_PLAUSIBLE_CELSIUS = -273.0;
constexpr double MAX_PLAUSIBLE_CELSIUS = 200.0;

// NVMe Kelvin readings outside this range are "not reported" (0) or garbage
constexpr double MIN_PLAUSIBLE_KELVIN = 0.0;
constexpr double MAX_PLAUSIBLE_KELVIN = 500.0;

auto lowercase(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto contains_ci(std::string_view haystack, std::string_view needle) -> bool {
    return lowercase(haystack).find(lowercase(needle)) != std::string::npos;
}

auto match_tag(std::string_view value, std::span<const TypeTag> table) -> std::optional<DriveType> {
    const auto lowered = lowercase(value);
    for (const auto& entry : table) {
        if (lowered == entry.tag || (entry.prefix_match && lowered.starts_with(entry.tag))) {
            return entry.type;
        }
    }
    return std::nullopt;
}

auto find_attribute(const std::vector<AtaAttribute>& attributes, int id) -> const AtaAttribute* {
    const auto it = std::ranges::find(attributes, id, &AtaAttribute::id);
    return it != attributes.end() ? &*it : nullptr;
}

auto first_present(std::initializer_list<std::optional<double>> candidates)
    -> std::optional<double> {
    for (const auto& candidate : candidates) {
        if (candidate) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto first_non_empty(std::initializer_list<const std::optional<std::string>*> candidates)
    -> std::string {
    for (const auto* candidate : candidates) {
        if (*candidate && !(*candidate)->empty()) {
            return **candidate;
        }
    }
    return {};
}

auto kelvin_to_celsius(std::optional<double> kelvin) -> std::optional<int> {
    if (!kelvin || *kelvin <= MIN_PLAUSIBLE_KELVIN || *kelvin >= MAX_PLAUSIBLE_KELVIN) {
        return std::nullopt;
    }
    return static_cast<int>(std::lround(*kelvin - AttributeNormalizer::KELVIN_OFFSET));
}

auto nvme_field(const RawTelemetry& telemetry, std::optional<double> NvmeHealthLog::*field)
    -> std::optional<double> {
    if (!telemetry.nvme_log) {
        return std::nullopt;
    }
    return (*telemetry.nvme_log).*field;
}

}  // namespace

auto AttributeNormalizer::normalize(const std::string& device, const RawTelemetry& telemetry)
    -> DriveRecord {
    using util::json::to_counter;

    DriveRecord record;
    record.device = device;
    record.type = classify(telemetry);
    record.model = first_non_empty({&telemetry.model_name, &telemetry.model_family,
                                    &telemetry.scsi_model_name, &telemetry.product});
    record.serial = telemetry.serial_number.value_or("");
    record.health_percent = health_percent(telemetry, record.type);
    record.written_gb = written_gb(telemetry, record.type);
    record.live_temperature_c = live_temperature_c(telemetry, record.type);

    const auto nvme = [&](std::optional<double> NvmeHealthLog::*field) {
        return nvme_field(telemetry, field);
    };

    record.power_on_hours =
        to_counter(first_present({telemetry.power_on_hours, nvme(&NvmeHealthLog::power_on_hours)}));
    record.power_cycles = to_counter(
        first_present({telemetry.power_cycle_count, nvme(&NvmeHealthLog::power_cycles)}));
    record.unsafe_shutdowns = to_counter(
        first_present({telemetry.unsafe_shutdowns, nvme(&NvmeHealthLog::unsafe_shutdowns)}));
    record.media_data_integrity_errors =
        to_counter(first_present({telemetry.media_errors, nvme(&NvmeHealthLog::media_errors)}));
    record.error_log_entries = to_counter(
        first_present({telemetry.error_log_entries, nvme(&NvmeHealthLog::num_err_log_entries)}));

    record.data_units_read = to_counter(nvme(&NvmeHealthLog::data_units_read));
    record.data_units_written = to_counter(nvme(&NvmeHealthLog::data_units_written));
    record.host_read_commands = to_counter(nvme(&NvmeHealthLog::host_reads));
    record.host_write_commands = to_counter(nvme(&NvmeHealthLog::host_writes));
    record.controller_busy_time_minutes = to_counter(nvme(&NvmeHealthLog::controller_busy_time));
    record.composite_temperature_k = to_counter(nvme(&NvmeHealthLog::composite_temperature_k));
    record.critical_warning = to_counter(nvme(&NvmeHealthLog::critical_warning));
    record.available_spare_percent = to_counter(nvme(&NvmeHealthLog::available_spare));
    record.available_spare_threshold = to_counter(nvme(&NvmeHealthLog::available_spare_threshold));
    record.percentage_used = to_counter(nvme(&NvmeHealthLog::percentage_used));
    record.warning_temp_time_minutes = to_counter(nvme(&NvmeHealthLog::warning_temp_time));
    record.critical_temp_time_minutes = to_counter(nvme(&NvmeHealthLog::critical_comp_time));

    return record;
}

auto AttributeNormalizer::classify(const RawTelemetry& telemetry) -> DriveType {
    if (!telemetry.device_type || telemetry.device_type->empty()) {
        return DriveType::UNKNOWN;
    }
    if (auto type = match_tag(*telemetry.device_type, TYPE_TAGS)) {
        return *type;
    }
    if (telemetry.protocol) {
        if (auto type = match_tag(*telemetry.protocol, PROTOCOL_TAGS)) {
            return *type;
        }
    }
    return DriveType::UNKNOWN;
}

auto AttributeNormalizer::written_gb(const RawTelemetry& telemetry, DriveType type) -> double {
    if (type == DriveType::NVME) {
        const auto units =
            util::json::to_counter(nvme_field(telemetry, &NvmeHealthLog::data_units_written));
        return round2(static_cast<double>(units) * BYTES_PER_NVME_DATA_UNIT / BYTES_PER_GIB);
    }

    for (const auto& attribute : telemetry.ata_attributes) {
        if (std::ranges::find(LBAS_WRITTEN_IDS, attribute.id) == LBAS_WRITTEN_IDS.end() ||
            !contains_ci(attribute.name, LBAS_WRITTEN_KEYWORD)) {
            continue;
        }
        const auto lbas = util::json::to_counter(attribute.raw_value);
        return round2(static_cast<double>(lbas) * BYTES_PER_LBA / BYTES_PER_GIB);
    }
    return 0.0;
}

auto AttributeNormalizer::health_percent(const RawTelemetry& telemetry, DriveType type)
    -> std::optional<int> {
    std::optional<double> percent;

    // 1. Wear/life-remaining signal
    if (type == DriveType::NVME) {
        if (auto used = nvme_field(telemetry, &NvmeHealthLog::percentage_used)) {
            percent = 100.0 - *used;
        }
    } else {
        for (const int id : LIFE_ATTRIBUTE_IDS) {
            const auto* attribute = find_attribute(telemetry.ata_attributes, id);
            if (attribute != nullptr && attribute->value) {
                percent = attribute->value;
                break;
            }
        }
        if (!percent) {
            for (const auto& attribute : telemetry.ata_attributes) {
                const bool named_like_life =
                    std::ranges::any_of(LIFE_NAME_KEYWORDS, [&](std::string_view keyword) {
                        return contains_ci(attribute.name, keyword);
                    });
                if (named_like_life && attribute.value) {
                    percent = attribute.value;
                    break;
                }
            }
        }
    }

    // 2. Overall pass/fail
    if (!percent && telemetry.smart_passed) {
        percent = *telemetry.smart_passed ? 100.0 : 0.0;
    }

    if (!percent) {
        return std::nullopt;
    }
    return static_cast<int>(std::clamp(std::round(*percent), 0.0, 100.0));
}

auto AttributeNormalizer::live_temperature_c(const RawTelemetry& telemetry, DriveType type)
    -> std::optional<int> {
    if (telemetry.current_temperature) {
        return static_cast<int>(std::lround(*telemetry.current_temperature));
    }

    if (type == DriveType::NVME) {
        if (auto celsius =
                kelvin_to_celsius(nvme_field(telemetry, &NvmeHealthLog::composite_temperature_k))) {
            return celsius;
        }
        return kelvin_to_celsius(nvme_field(telemetry, &NvmeHealthLog::first_sensor_temperature_k));
    }

    for (const int id : TEMPERATURE_ATTRIBUTE_IDS) {
        const auto* attribute = find_attribute(telemetry.ata_attributes, id);
        if (attribute == nullptr) {
            continue;
        }
        if (attribute->raw_value && *attribute->raw_value >= MIN_PLAUSIBLE_CELSIUS &&
            *attribute->raw_value <= MAX_PLAUSIBLE_CELSIUS) {
            return static_cast<int>(std::lround(*attribute->raw_value));
        }
        if (auto parsed = first_integer(attribute->raw_string)) {
            return parsed;
        }
    }
    return std::nullopt;
}

auto AttributeNormalizer::round2(double value) -> double {
    return std::round(value * 100.0) / 100.0;
}

auto AttributeNormalizer::first_integer(std::string_view text) -> std::optional<int> {
    const auto digit = std::ranges::find_if(
        text, [](unsigned char c) { return std::isdigit(c) != 0; });
    if (digit == text.end()) {
        return std::nullopt;
    }

    auto start = static_cast<size_t>(digit - text.begin());
    if (start > 0 && text[start - 1] == '-') {
        --start;
    }

    int value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data() + start, end, value);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return value;
}
