#include "terranoise/noise_preset.hpp"

#include <array>
#include <iostream>
#include <string_view>

namespace terranoise {

namespace {

struct ParamKey {
    std::string_view name;
    double NoiseParams::* field;
};

constexpr std::array<ParamKey, 12> kParamKeys = {{
    {"frequency", &NoiseParams::frequency},
    {"persistence", &NoiseParams::persistence},
    {"lacunarity", &NoiseParams::lacunarity},
    {"slope", &NoiseParams::slope},
    {"noise_height", &NoiseParams::noiseHeight},
    {"gain", &NoiseParams::gain},
    {"gain0", &NoiseParams::gain0},
    {"warp", &NoiseParams::warp},
    {"warp0", &NoiseParams::warp0},
    {"damp", &NoiseParams::damp},
    {"damp0", &NoiseParams::damp0},
    {"damp_scale", &NoiseParams::dampScale},
}};

bool isKnownKey(std::string_view key) {
    if (key == "model" || key == "octaves" || key == "seed" || key == "noise_width") {
        return true;
    }
    for (const auto& p : kParamKeys) {
        if (p.name == key) return true;
    }
    return false;
}

/// Log and fail if the key is present but not numeric
bool checkNumeric(const ConfigDocument& doc, std::string_view key) {
    const ConfigEntry* entry = doc.get(key);
    if (entry && !entry->value.isNumber()) {
        std::cerr << "[NoisePreset] Line " << entry->line << ": '" << key
                  << "' is not a number: '" << entry->value.asString() << "'\n";
        return false;
    }
    return true;
}

/// Log and fail if octaves is present but not a whole count in [0, kMaxOctaves]
bool checkOctaves(const ConfigDocument& doc) {
    const ConfigEntry* entry = doc.get("octaves");
    if (!entry) return true;

    const int octaves = entry->value.asInt(-1);
    if (!entry->value.isInteger() || octaves < 0 || octaves > NoisePreset::kMaxOctaves) {
        std::cerr << "[NoisePreset] Line " << entry->line << ": 'octaves' must be a whole number in [0, "
                  << NoisePreset::kMaxOctaves << "], got '" << entry->value.asString() << "'\n";
        return false;
    }
    return true;
}

/// Log and fail if seed is present but not an unsigned 64-bit integer
bool checkSeed(const ConfigDocument& doc) {
    const ConfigEntry* entry = doc.get("seed");
    if (entry && !entry->value.isUnsigned()) {
        std::cerr << "[NoisePreset] Line " << entry->line
                  << ": 'seed' must be a non-negative 64-bit integer, got '"
                  << entry->value.asString() << "'\n";
        return false;
    }
    return true;
}

}  // namespace

NoisePreset NoisePreset::defaults(NoiseModel model) {
    NoisePreset preset;
    preset.model = model;
    preset.params = defaultNoiseParams(model);
    return preset;
}

std::optional<NoisePreset> loadNoisePreset(const ConfigDocument& doc) {
    std::string_view modelName = doc.getString("model");
    if (modelName.empty()) {
        std::cerr << "[NoisePreset] Missing 'model'\n";
        return std::nullopt;
    }

    auto model = parseNoiseModel(modelName);
    if (!model) {
        std::cerr << "[NoisePreset] Unknown noise model '" << modelName << "'\n";
        return std::nullopt;
    }

    for (const auto& entry : doc) {
        if (!isKnownKey(entry.key)) {
            std::cerr << "[NoisePreset] Line " << entry.line << ": ignoring unknown key '"
                      << entry.key << "'\n";
        }
    }

    bool numeric = checkOctaves(doc);
    numeric = checkSeed(doc) && numeric;
    numeric = checkNumeric(doc, "noise_width") && numeric;
    for (const auto& p : kParamKeys) {
        numeric = checkNumeric(doc, p.name) && numeric;
    }
    if (!numeric) {
        return std::nullopt;
    }

    NoisePreset preset = NoisePreset::defaults(*model);
    preset.octaves = doc.getInt("octaves", preset.octaves);
    preset.seed = doc.getUInt64("seed", preset.seed);
    preset.noiseWidth = doc.getDouble("noise_width", preset.noiseWidth);

    for (const auto& p : kParamKeys) {
        preset.params.*p.field = doc.getDouble(p.name, preset.params.*p.field);
    }

    if (!(preset.noiseWidth > 0.0)) {
        std::cerr << "[NoisePreset] 'noise_width' must be positive (got " << preset.noiseWidth << ")\n";
        return std::nullopt;
    }

    return preset;
}

std::optional<NoisePreset> loadNoisePresetFile(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        std::cerr << "[NoisePreset] Cannot open preset file: " << path << '\n';
        return std::nullopt;
    }
    return loadNoisePreset(*doc);
}

}  // namespace terranoise
