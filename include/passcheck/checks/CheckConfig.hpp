#pragma once

#include <string>

namespace passcheck {
namespace checks {

/**
 * @brief Exposure check parameters
 */
struct BrightnessParams {
    double threshold = 0.5;
    double min_brightness = 50.0;           ///< Lowest acceptable mean gray level
    double max_brightness = 230.0;          ///< Highest acceptable mean gray level
    double falloff = 30.0;                  ///< Gray levels over which the score drops to 0
    int overexposed_bin = 240;              ///< First histogram bin counted as overexposed
    int underexposed_bin = 15;              ///< Bins below this are underexposed
    double exposure_warning_ratio = 0.05;   ///< Tail mass reported in feedback
    double brightness_weight = 0.7;
    double extremes_weight = 0.3;

    /// @throws core::InvalidArgumentException for out-of-range values
    void validate() const;
};

/**
 * @brief Focus check parameters
 */
struct SharpnessParams {
    double threshold = 0.5;
    double min_variance = 50.0;             ///< Laplacian variance of a barely sharp image
    double face_padding = 0.1;              ///< Crop padding as fraction of min(face w, h)

    void validate() const;
};

struct FacePositionParams {
    double threshold = 0.5;
    double center_tolerance = 0.30;         ///< Allowed centre offset as image fraction
    double min_size_ratio = 0.05;           ///< Face area / image area
    double max_size_ratio = 0.70;
    double min_aspect = 0.55;               ///< Face box width / height
    double max_aspect = 1.1;
    double aspect_falloff = 2.0;            ///< Score lost per unit of aspect deviation
    double centering_weight = 0.4;
    double size_weight = 0.4;
    double aspect_weight = 0.2;

    void validate() const;
};

struct ExpressionParams {
    double threshold = 0.4;
    double mouth_open_ratio = 0.5;          ///< Mouth height / width above which the mouth is open
    double mouth_falloff = 0.3;
    double max_eyebrow_raise = 0.3;
    double eyebrow_penalty = 0.3;
    double min_mouth_symmetry = 0.7;
    double symmetry_penalty = 0.2;
    double neutral_feature_score = 0.6;     ///< Feature score below which feedback asks for a neutral face
    double mouth_weight = 0.6;
    double feature_weight = 0.4;

    void validate() const;
};

struct EyeVisibilityParams {
    double threshold = 0.4;
    double closed_ratio = 0.22;             ///< Eye aspect ratio below which an eye is closed
    double acceptable_ratio = 0.25;         ///< Eye aspect ratio of a fully open eye
    int glare_level = 240;                  ///< Gray level counted as glare inside an eye region
    double heavy_glare_fraction = 0.30;
    double light_glare_fraction = 0.15;
    double coverage_warning_score = 0.7;
    double openness_weight = 0.7;
    double coverage_weight = 0.3;

    void validate() const;
};

struct ReflectionParams {
    double threshold = 0.5;
    int bright_level = 250;                 ///< Gray level counted as a specular highlight
    double max_bright_ratio = 0.12;
    int min_blob_area = 50;                 ///< Highlights smaller than this are ignored
    int morph_kernel = 3;
    int tolerated_blobs = 2;
    double blob_penalty = 0.15;             ///< Score lost per blob above the tolerated count
    int multiple_blob_warning = 3;
    double ratio_weight = 0.6;
    double count_weight = 0.4;

    void validate() const;
};

struct ShadowParams {
    double threshold = 0.5;
    int dark_level = 35;                    ///< Gray level below which a pixel is shadow
    double max_dark_ratio = 0.20;
    double face_padding = 0.2;              ///< Region padding as fraction of face height
    int morph_kernel = 5;
    double edge_ratio_limit = 0.02;         ///< Shadow edge density without penalty
    double edge_falloff = 0.05;
    double smooth_std = 30.0;               ///< Intensity std dev of an evenly lit region
    double uneven_std = 50.0;
    double ratio_weight = 0.5;
    double edge_weight = 0.3;
    double uniformity_weight = 0.2;

    void validate() const;
};

struct HeadwearParams {
    double threshold = 0.5;
    double band_height = 0.3;               ///< Forehead band height as fraction of face height
    int dark_level = 60;
    double hat_skin_ratio = 0.3;            ///< Skin below this with dark hair-like region is a hat
    double hat_dark_ratio = 0.4;
    double covered_skin_ratio = 0.15;
    double uniform_std = 25.0;              ///< Colour std dev of a solid fabric region
    double uniform_skin_ratio = 0.4;
    double small_region_confidence = 0.8;

    void validate() const;
};

struct BackgroundParams {
    double threshold = 0.5;
    double mask_left = 0.3;                 ///< Face mask expansion, fractions of face size
    double mask_top = 0.2;
    double mask_width = 1.6;
    double mask_height = 1.8;
    int min_background_pixels = 100;
    double small_background_confidence = 0.7;
    double uniformity_weight = 0.4;
    double color_weight = 0.3;
    double edge_weight = 0.3;

    void validate() const;
};

/**
 * @brief Tunable parameters for all nine checks
 *
 * Plain value type passed into each check constructor. Defaults are the
 * production values.
 */
struct CheckConfig {
    BrightnessParams brightness;
    SharpnessParams sharpness;
    FacePositionParams face_position;
    ExpressionParams expression;
    EyeVisibilityParams eye_visibility;
    ReflectionParams reflection;
    ShadowParams shadow;
    HeadwearParams headwear;
    BackgroundParams background;

    /**
     * @brief Reject out-of-range thresholds and inverted ranges
     * @throws core::InvalidArgumentException
     */
    void validate() const;

    std::string toString() const;
};

/**
 * @brief Load a check configuration from a YAML file
 *
 * One top-level section per check, keys equal to the field names.
 * Missing sections and keys keep their defaults.
 *
 * @throws core::ConfigurationException if the file cannot be read or parsed
 * @throws core::InvalidArgumentException if the loaded values are invalid
 */
CheckConfig loadCheckConfig(const std::string& path);

/**
 * @brief Parse a check configuration from YAML text
 */
CheckConfig parseCheckConfig(const std::string& yaml_text);

} // namespace checks
} // namespace passcheck
