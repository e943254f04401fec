#include "GainStage.h"
#include "core/NumberFormat.h"

namespace AutoScrub {

double computeGain(double measuredDb, double targetDb) {
    return targetDb - measuredDb;
}

bool needsVolumeStage(double gainDb) {
    return gainDb != 0.0;
}

const char* concatAudioOutputLabel(bool gainPending) {
    return gainPending ? kPreGainAudioLabel : kFinalAudioLabel;
}

std::string buildVolumeStage(double gainDb) {
    if (!needsVolumeStage(gainDb)) {
        return "";
    }
    return std::string("\n") + kPreGainAudioLabel + " volume=" + formatNumber(gainDb) + "dB " +
           kFinalAudioLabel + ";";
}

} // namespace AutoScrub
