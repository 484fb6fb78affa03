#include "passcheck/checks/CheckConfig.hpp"
#include "passcheck/core/exception.h"
#include "passcheck/core/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace passcheck {
namespace checks {

namespace {

const char* const kComponent = "CheckConfig";

template<typename T>
void readField(const YAML::Node& section, const std::string& section_name,
               const char* key, T& value) {
    const YAML::Node node = section[key];
    if (!node) {
        return;
    }
    try {
        value = node.as<T>();
    } catch (const YAML::Exception& e) {
        PASSCHECK_THROW(core::ConfigurationException,
                        "Invalid value for " + section_name + "." + key + ": " + e.what());
    }
}

void requireThreshold(const char* check, double threshold) {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        PASSCHECK_THROW(core::InvalidArgumentException,
                        std::string(check) + " threshold must be between 0.0 and 1.0");
    }
}

void requireRange(const char* check, const char* what, double low, double high) {
    if (!(low < high)) {
        PASSCHECK_THROW(core::InvalidArgumentException,
                        std::string(check) + " " + what + " range is empty or inverted");
    }
}

void requirePositive(const char* check, const char* what, double value) {
    if (!(value > 0.0)) {
        PASSCHECK_THROW(core::InvalidArgumentException,
                        std::string(check) + " " + what + " must be positive");
    }
}

void applyBrightness(const YAML::Node& n, BrightnessParams& p) {
    const std::string s = "brightness";
    readField(n, s, "threshold", p.threshold);
    readField(n, s, "min_brightness", p.min_brightness);
    readField(n, s, "max_brightness", p.max_brightness);
    readField(n, s, "falloff", p.falloff);
    readField(n, s, "overexposed_bin", p.overexposed_bin);
    readField(n, s, "underexposed_bin", p.underexposed_bin);
    readField(n, s, "exposure_warning_ratio", p.exposure_warning_ratio);
    readField(n, s, "brightness_weight", p.brightness_weight);
    readField(n, s, "extremes_weight", p.extremes_weight);
}

void applySharpness(const YAML::Node& n, SharpnessParams& p) {
    const std::string s = "sharpness";
    readField(n, s, "threshold", p.threshold);
    readField(n, s, "min_variance", p.min_variance);
    readField(n, s, "face_padding", p.face_padding);
}

void applyFacePosition(const YAML::Node& n, FacePositionParams& p) {
    const std::string s = "face_position";
    readField(n, s, "threshold", p.threshold);
    readField(n, s, "center_tolerance", p.center_tolerance);
    readField(n, s, "min_size_ratio", p.min_size_ratio);
    readField(n, s, "max_size_ratio", p.max_size_ratio);
    readField(n, s, "min_aspect", p.min_aspect);
    readField(n, s, "max_aspect", p.max_aspect);
    readField(n, s, "aspect_falloff", p.aspect_falloff);
    readField(n, s, "centering_weight", p.centering_weight);
    readField(n, s, "size_weight", p.size_weight);
    readField(n, s, "aspect_weight", p.aspect_weight);
}

void applyExpression(const YAML::Node& n, ExpressionParams& p) {
    const std::string s = "expression";
    readField(n, s, "threshold", p.threshold);
    readField(n, s, "mouth_open_ratio", p.mouth_open_ratio);
    readField(n, s, "mouth_falloff", p.mouth_falloff);
    readField(n, s, "max_eyebrow_raise", p.max_eyebrow_raise);
    readField(n, s, "eyebrow_penalty", p.eyebrow_penalty);
    readField(n, s, "min_mouth_symmetry", p.min_mouth_symmetry);
    readField(n, s, "symmetry_penalty", p.symmetry_penalty);
    readField(n, s, "neutral_feature_score", p.neutral_feature_score);
    readField(n, s, "mouth_weight", p.mouth_weight);
    readField(n, s, "feature_weight", p.feature_weight);
}

void applyEyeVisibility(const YAML::Node& n, EyeVisibilityParams& p) {
    const std::string s = "eye_visibility";
    readField(n, s, "threshold", p.threshold);
    readField(n, s, "closed_ratio", p.closed_ratio);
    readField(n, s, "acceptable_ratio", p.acceptable_ratio);
    readField(n, s, "glare_level", p.glare_level);
    readField(n, s, "heavy_glare_fraction", p.heavy_glare_fraction);
    readField(n, s, "light_glare_fraction", p.light_glare_fraction);
    readField(n, s, "coverage_warning_score", p.coverage_warning_score);
    readField(n, s, "openness_weight", p.openness_weight);
    readField(n, s, "coverage_weight", p.coverage_weight);
}

void applyReflection(const YAML::Node& n, ReflectionParams& p) {
    const std::string s = "reflection";
    readField(n, s, "threshold", p.threshold);
    readField(n, s, "bright_level", p.bright_level);
    readField(n, s, "max_bright_ratio", p.max_bright_ratio);
    readField(n, s, "min_blob_area", p.min_blob_area);
    readField(n, s, "morph_kernel", p.morph_kernel);
    readField(n, s, "tolerated_blobs", p.tolerated_blobs);
    readField(n, s, "blob_penalty", p.blob_penalty);
    readField(n, s, "multiple_blob_warning", p.multiple_blob_warning);
    readField(n, s, "ratio_weight", p.ratio_weight);
    readField(n, s, "count_weight", p.count_weight);
}

void applyShadow(const YAML::Node& n, ShadowParams& p) {
    const std::string s = "shadow";
    readField(n, s, "threshold", p.threshold);
    readField(n, s, "dark_level", p.dark_level);
    readField(n, s, "max_dark_ratio", p.max_dark_ratio);
    readField(n, s, "face_padding", p.face_padding);
    readField(n, s, "morph_kernel", p.morph_kernel);
    readField(n, s, "edge_ratio_limit", p.edge_ratio_limit);
    readField(n, s, "edge_falloff", p.edge_falloff);
    readField(n, s, "smooth_std", p.smooth_std);
    readField(n, s, "uneven_std", p.uneven_std);
    readField(n, s, "ratio_weight", p.ratio_weight);
    readField(n, s, "edge_weight", p.edge_weight);
    readField(n, s, "uniformity_weight", p.uniformity_weight);
}

void applyHeadwear(const YAML::Node& n, HeadwearParams& p) {
    const std::string s = "headwear";
    readField(n, s, "threshold", p.threshold);
    readField(n, s, "band_height", p.band_height);
    readField(n, s, "dark_level", p.dark_level);
    readField(n, s, "hat_skin_ratio", p.hat_skin_ratio);
    readField(n, s, "hat_dark_ratio", p.hat_dark_ratio);
    readField(n, s, "covered_skin_ratio", p.covered_skin_ratio);
    readField(n, s, "uniform_std", p.uniform_std);
    readField(n, s, "uniform_skin_ratio", p.uniform_skin_ratio);
    readField(n, s, "small_region_confidence", p.small_region_confidence);
}

void applyBackground(const YAML::Node& n, BackgroundParams& p) {
    const std::string s = "background";
    readField(n, s, "threshold", p.threshold);
    readField(n, s, "mask_left", p.mask_left);
    readField(n, s, "mask_top", p.mask_top);
    readField(n, s, "mask_width", p.mask_width);
    readField(n, s, "mask_height", p.mask_height);
    readField(n, s, "min_background_pixels", p.min_background_pixels);
    readField(n, s, "small_background_confidence", p.small_background_confidence);
    readField(n, s, "uniformity_weight", p.uniformity_weight);
    readField(n, s, "color_weight", p.color_weight);
    readField(n, s, "edge_weight", p.edge_weight);
}

CheckConfig fromDocument(const YAML::Node& root) {
    CheckConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        PASSCHECK_THROW(core::ConfigurationException, "Check configuration must be a YAML mapping");
    }

    if (root["brightness"]) applyBrightness(root["brightness"], config.brightness);
    if (root["sharpness"]) applySharpness(root["sharpness"], config.sharpness);
    if (root["face_position"]) applyFacePosition(root["face_position"], config.face_position);
    if (root["expression"]) applyExpression(root["expression"], config.expression);
    if (root["eye_visibility"]) applyEyeVisibility(root["eye_visibility"], config.eye_visibility);
    if (root["reflection"]) applyReflection(root["reflection"], config.reflection);
    if (root["shadow"]) applyShadow(root["shadow"], config.shadow);
    if (root["headwear"]) applyHeadwear(root["headwear"], config.headwear);
    if (root["background"]) applyBackground(root["background"], config.background);

    config.validate();
    return config;
}

} // namespace

void BrightnessParams::validate() const {
    requireThreshold("brightness", threshold);
    requireRange("brightness", "brightness", min_brightness, max_brightness);
    requirePositive("brightness", "falloff", falloff);
    if (underexposed_bin < 0 || overexposed_bin > 256 || underexposed_bin > overexposed_bin) {
        PASSCHECK_THROW(core::InvalidArgumentException, "brightness histogram tails overlap");
    }
}

void SharpnessParams::validate() const {
    requireThreshold("sharpness", threshold);
    requirePositive("sharpness", "min_variance", min_variance);
}

void FacePositionParams::validate() const {
    requireThreshold("face_position", threshold);
    requirePositive("face_position", "center_tolerance", center_tolerance);
    requireRange("face_position", "size ratio", min_size_ratio, max_size_ratio);
    requirePositive("face_position", "min_size_ratio", min_size_ratio);
    requireRange("face_position", "aspect", min_aspect, max_aspect);
}

void ExpressionParams::validate() const {
    requireThreshold("expression", threshold);
    requirePositive("expression", "mouth_falloff", mouth_falloff);
}

void EyeVisibilityParams::validate() const {
    requireThreshold("eye_visibility", threshold);
    requireRange("eye_visibility", "eye ratio", closed_ratio, acceptable_ratio);
    requirePositive("eye_visibility", "closed_ratio", closed_ratio);
    requireRange("eye_visibility", "glare fraction", light_glare_fraction, heavy_glare_fraction);
}

void ReflectionParams::validate() const {
    requireThreshold("reflection", threshold);
    requirePositive("reflection", "max_bright_ratio", max_bright_ratio);
    requirePositive("reflection", "morph_kernel", morph_kernel);
}

void ShadowParams::validate() const {
    requireThreshold("shadow", threshold);
    requirePositive("shadow", "max_dark_ratio", max_dark_ratio);
    requirePositive("shadow", "morph_kernel", morph_kernel);
    requirePositive("shadow", "edge_falloff", edge_falloff);
    requireRange("shadow", "std dev", smooth_std, uneven_std);
}

void HeadwearParams::validate() const {
    requireThreshold("headwear", threshold);
    requirePositive("headwear", "band_height", band_height);
    requireThreshold("headwear small region", small_region_confidence);
}

void BackgroundParams::validate() const {
    requireThreshold("background", threshold);
    requirePositive("background", "mask_width", mask_width);
    requirePositive("background", "mask_height", mask_height);
    requireThreshold("background small region", small_background_confidence);
}

void CheckConfig::validate() const {
    brightness.validate();
    sharpness.validate();
    face_position.validate();
    expression.validate();
    eye_visibility.validate();
    reflection.validate();
    shadow.validate();
    headwear.validate();
    background.validate();
}

std::string CheckConfig::toString() const {
    std::ostringstream oss;
    oss << "CheckConfig{thresholds: brightness=" << brightness.threshold
        << ", sharpness=" << sharpness.threshold
        << ", face_position=" << face_position.threshold
        << ", expression=" << expression.threshold
        << ", eye_visibility=" << eye_visibility.threshold
        << ", reflection=" << reflection.threshold
        << ", shadow=" << shadow.threshold
        << ", headwear=" << headwear.threshold
        << ", background=" << background.threshold << "}";
    return oss.str();
}

CheckConfig loadCheckConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        PASSCHECK_THROW(core::ConfigurationException, "Cannot open check configuration: " + path);
    }

    YAML::Node root;
    try {
        root = YAML::Load(file);
    } catch (const YAML::Exception& e) {
        PASSCHECK_THROW(core::ConfigurationException,
                        "Failed to parse " + path + ": " + e.what());
    }

    CheckConfig config = fromDocument(root);
    PASSCHECK_LOG_INFO(kComponent) << "Loaded " << path << ": " << config.toString();
    return config;
}

CheckConfig parseCheckConfig(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        PASSCHECK_THROW(core::ConfigurationException,
                        std::string("Failed to parse check configuration: ") + e.what());
    }
    return fromDocument(root);
}

} // namespace checks
} // namespace passcheck
