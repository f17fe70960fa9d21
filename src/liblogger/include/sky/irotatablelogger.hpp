#pragma once

#include <cstddef>
#include <string>

namespace sky {

enum class RotationType { NONE, SIZE };

struct RotationConfig {
  bool enabled = false;
  RotationType type = RotationType::NONE;
  std::size_t maxFileSizeBytes = 0;  // Размер файла, при превышении которого
                                     // выполняется ротация
  std::size_t maxBackups = 3;        // Хранится <file>.1 ... <file>.N

  RotationConfig() = default;
};

class IRotatableLogger {
    public:
        virtual void setRotationConfig(const RotationConfig& config) = 0;
        virtual RotationConfig getRotationConfig() const = 0;
        virtual ~IRotatableLogger() = default;
};

}  // namespace sky
