#include "moodcam/emotion_types.hpp"

#include <cctype>

namespace moodcam {

namespace {
std::string canonical(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}
}  // namespace

const char* emotion_to_string(Emotion e) {
    switch (e) {
        case Emotion::ANGRY: return "angry";
        case Emotion::DISGUST: return "disgust";
        case Emotion::FEAR: return "fear";
        case Emotion::HAPPY: return "happy";
        case Emotion::SAD: return "sad";
        case Emotion::SURPRISE: return "surprise";
        case Emotion::NEUTRAL: return "neutral";
    }
    return "neutral";
}

std::optional<Emotion> emotion_from_string(const std::string& label) {
    const std::string c = canonical(label);
    for (Emotion e : kAllEmotions) {
        if (c == emotion_to_string(e)) return e;
    }
    return std::nullopt;
}

std::string capitalize_label(const std::string& label) {
    std::string out = canonical(label);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

}  // namespace moodcam
