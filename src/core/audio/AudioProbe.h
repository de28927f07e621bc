#pragma once

#include <QString>
#include <optional>

class AudioProbe {
public:
    // Container duration in seconds, or nullopt if the file cannot be probed.
    static std::optional<double> durationSeconds(const QString& filePath);
};
