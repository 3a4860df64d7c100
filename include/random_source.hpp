#pragma once

#include <cstdint>
#include <random>

namespace dice {

// Источник случайных бросков.
// Реализации обязаны возвращать значения, равномерно распределённые на [1, faces].
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Бросок одного кубика с указанным числом граней (faces >= 1)
    virtual int roll(int faces) = 0;
};

// Источник на основе std::mt19937
class MersenneRandomSource final : public RandomSource {
public:
    // Инициализация из std::random_device
    MersenneRandomSource();

    // Инициализация фиксированным зерном (воспроизводимые броски)
    explicit MersenneRandomSource(std::uint32_t seed);

    int roll(int faces) override;

    // Переинициализация генератора новым зерном
    void reseed(std::uint32_t seed);

private:
    std::mt19937 gen;
};

// Общий для процесса источник бросков
MersenneRandomSource& defaultRandomSource();

} // namespace dice
