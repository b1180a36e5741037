/**
 * TrackSense - JSON Serialization
 *
 * Result documents and run parameters as nlohmann::json.
 */

#ifndef TRACKSENSE_SERIALIZATION_H
#define TRACKSENSE_SERIALIZATION_H

#include "tracksense/types.h"
#include <nlohmann/json.hpp>

namespace tracksense {

void to_json(nlohmann::json& j, const AnalysisParameters& params);
void to_json(nlohmann::json& j, const Segment& segment);
void to_json(nlohmann::json& j, const BoundaryDetection& detection);
void to_json(nlohmann::json& j, const GlobalFeatures& global);
void to_json(nlohmann::json& j, const FrameFeatures& frames);
void to_json(nlohmann::json& j, const FeatureBundle& bundle);
void to_json(nlohmann::json& j, const VisualizationTrace& trace);
void to_json(nlohmann::json& j, const AnalysisMetadata& metadata);
void to_json(nlohmann::json& j, const AnalysisResult& result);

/**
 * Overlay the keys present in `j` onto the defaults. Unknown keys are ignored;
 * a wrongly typed value or a non-object document is an Input error.
 * The result is not validated.
 */
Result<AnalysisParameters> parameters_from_json(const nlohmann::json& j);

/**
 * Parse `text` and load parameters from it.
 */
Result<AnalysisParameters> parameters_from_string(const std::string& text);

/**
 * Load parameters from a JSON file.
 */
Result<AnalysisParameters> parameters_from_file(const std::string& path);

std::string to_json_string(const AnalysisResult& result, int indent = -1);

} // namespace tracksense

#endif // TRACKSENSE_SERIALIZATION_H
