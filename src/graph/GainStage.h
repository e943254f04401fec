#pragma once

#include <string>

namespace AutoScrub {

// Audio label the concat stage writes when a volume stage follows it
inline constexpr const char* kPreGainAudioLabel = "[an]";
// Final audio label handed to -map
inline constexpr const char* kFinalAudioLabel = "[a]";
inline constexpr const char* kFinalVideoLabel = "[v]";

// Gain (dB) that brings measured integrated loudness to the target
double computeGain(double measuredDb, double targetDb);

// True when the gain is large enough to need a volume stage at all
bool needsVolumeStage(double gainDb);

// Label the concat stage must use for its audio output
const char* concatAudioOutputLabel(bool gainPending);

/**
 * @brief Volume stage appended after the concat stage
 * @return "\n[an] volume=<gain>dB [a];" or an empty string for zero gain
 */
std::string buildVolumeStage(double gainDb);

} // namespace AutoScrub
