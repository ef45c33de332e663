#pragma once

namespace pulseplot
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}
};

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{0.839f, 0.153f, 0.157f};
inline constexpr Color blue{0.122f, 0.467f, 0.706f};
inline constexpr Color gray{0.5f, 0.5f, 0.5f};
inline constexpr Color light_gray{0.85f, 0.85f, 0.85f};
inline constexpr Color dark_gray{0.25f, 0.25f, 0.25f};
}   // namespace colors

}   // namespace pulseplot
