#ifndef UTTERANCE_RECORDER_HPP
#define UTTERANCE_RECORDER_HPP

#include <vector>

// Energy-based utterance segmentation over mono float PCM.
class UtteranceRecorder {
public:
    struct Config {
        int sampleRate = 16000;

        float vadStartRms = 0.014f;
        float vadStopRms = 0.011f;
        int startHangMs = 80;
        int stopHangMs = 550;

        int maxUtteranceMs = 12000;
        int preRollMs = 250;
    };

    explicit UtteranceRecorder(Config config);

    // Blocks may have any length. Returns true once the utterance is complete.
    bool feed(const float* samples, int count);

    bool isListening() const { return listening_; }
    bool hasUtterance() const { return finished_; }

    const std::vector<float>& utterance() const { return utterance_; }

    void reset();

private:
    int toSamples(int ms) const;
    float rms(const float* x, int n) const;
    void pushPreRoll(const float* x, int n);

    Config config_;

    bool listening_ = false;
    bool finished_ = false;

    int speechSamples_ = 0;
    int silenceSamples_ = 0;

    std::vector<float> preRoll_;
    std::vector<float> utterance_;
};

#endif
